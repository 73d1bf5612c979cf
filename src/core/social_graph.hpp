#ifndef LSNP_CORE_SOCIAL_GRAPH_HPP
#define LSNP_CORE_SOCIAL_GRAPH_HPP

#include <map>
#include <mutex>
#include <set>
#include <string>

namespace lsnp {
namespace core {

/*
  SocialGraph
  --------------------------------
  Directed follow edges (follower -> followee) as seen by this node: our own follows
  plus the FOLLOW/UNFOLLOW notices other peers sent us. Adding an existing edge or
  removing a missing one is a no-op, so repeated messages are harmless.
*/

class SocialGraph
{
public:
    // Returns true if the edge was added
    bool Follow(const std::string &follower, const std::string &followee)
    {
        if (follower == followee) {
            return false;
        }
        std::lock_guard<std::mutex> lock(m_mutex);
        bool added = m_following[follower].insert(followee).second;
        m_followers[followee].insert(follower);
        return added;
    }

    // Returns true if the edge existed
    bool Unfollow(const std::string &follower, const std::string &followee)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        bool removed = eraseEdge(m_following, follower, followee);
        eraseEdge(m_followers, followee, follower);
        return removed;
    }

    bool IsFollowing(const std::string &follower, const std::string &followee) const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_following.find(follower);
        return it != m_following.end() && it->second.count(followee) > 0;
    }

    std::set<std::string> Following(const std::string &user) const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_following.find(user);
        return it == m_following.end() ? std::set<std::string>() : it->second;
    }

    std::set<std::string> Followers(const std::string &user) const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_followers.find(user);
        return it == m_followers.end() ? std::set<std::string>() : it->second;
    }

private:
    using Adjacency = std::map<std::string, std::set<std::string>>;

    static bool eraseEdge(Adjacency &adj, const std::string &from, const std::string &to)
    {
        auto it = adj.find(from);
        if (it == adj.end()) {
            return false;
        }
        bool removed = it->second.erase(to) > 0;
        if (it->second.empty()) {
            adj.erase(it);
        }
        return removed;
    }

    mutable std::mutex m_mutex;
    Adjacency m_following;
    Adjacency m_followers;
};

} // namespace core
} // namespace lsnp

#endif // LSNP_CORE_SOCIAL_GRAPH_HPP
