#ifndef LSNP_CORE_LIKE_INDEX_HPP
#define LSNP_CORE_LIKE_INDEX_HPP

#include <map>
#include <mutex>
#include <set>
#include <string>

namespace lsnp {
namespace core {

/*
  LikeIndex
  --------------------------------
  post identifier -> set of user_ids that liked it.
  A post is identified by its author and the TIMESTAMP of the POST message,
  see PostKey(). Liking twice (or unliking twice) leaves the set unchanged.
*/

class LikeIndex
{
public:
    static std::string PostKey(const std::string &author, const std::string &postTimestamp)
    {
        return author + ":" + postTimestamp;
    }

    // Returns true if liker was not in the set yet
    bool Like(const std::string &postKey, const std::string &liker)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_likes[postKey].insert(liker).second;
    }

    bool Unlike(const std::string &postKey, const std::string &liker)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_likes.find(postKey);
        if (it == m_likes.end()) {
            return false;
        }
        bool removed = it->second.erase(liker) > 0;
        if (it->second.empty()) {
            m_likes.erase(it);
        }
        return removed;
    }

    std::set<std::string> Likers(const std::string &postKey) const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_likes.find(postKey);
        return it == m_likes.end() ? std::set<std::string>() : it->second;
    }

    size_t Count(const std::string &postKey) const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_likes.find(postKey);
        return it == m_likes.end() ? 0 : it->second.size();
    }

private:
    mutable std::mutex m_mutex;
    std::map<std::string, std::set<std::string>> m_likes;
};

} // namespace core
} // namespace lsnp

#endif // LSNP_CORE_LIKE_INDEX_HPP
