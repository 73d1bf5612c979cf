#ifndef LSNP_CORE_POST_FEED_HPP
#define LSNP_CORE_POST_FEED_HPP

#include <algorithm>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace lsnp {
namespace core {

struct Post
{
    std::string author;
    std::string messageId;
    std::string content;
    uint64_t timestamp = 0; // unix seconds, as carried in the POST
    uint64_t ttl = 0;       // seconds; 0 never expires

    bool IsExpired(uint64_t now) const { return ttl != 0 && timestamp + ttl <= now; }
};

/*
  PostFeed
  --------------------------------
  Posts grouped by author, oldest first. Expired posts are hidden from queries and
  dropped by Prune(), which the housekeeping tick calls. A post with a MESSAGE_ID
  already present for that author is not stored twice.
*/

class PostFeed
{
public:
    bool Add(const Post &post)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto &posts = m_posts[post.author];
        if (!post.messageId.empty()) {
            for (const auto &p : posts) {
                if (p.messageId == post.messageId) {
                    return false;
                }
            }
        }
        posts.push_back(post);
        return true;
    }

    std::vector<Post> PostsBy(const std::string &author, uint64_t now) const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::vector<Post> out;
        auto it = m_posts.find(author);
        if (it == m_posts.end()) {
            return out;
        }
        for (const auto &p : it->second) {
            if (!p.IsExpired(now)) {
                out.push_back(p);
            }
        }
        return out;
    }

    // Every live post, newest first
    std::vector<Post> Timeline(uint64_t now) const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::vector<Post> out;
        for (const auto &kv : m_posts) {
            for (const auto &p : kv.second) {
                if (!p.IsExpired(now)) {
                    out.push_back(p);
                }
            }
        }
        std::stable_sort(out.begin(), out.end(),
                         [](const Post &a, const Post &b) { return a.timestamp > b.timestamp; });
        return out;
    }

    // Returns how many posts were removed
    size_t Prune(uint64_t now)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        size_t removed = 0;
        for (auto it = m_posts.begin(); it != m_posts.end();) {
            auto &posts = it->second;
            auto before = posts.size();
            posts.erase(std::remove_if(posts.begin(), posts.end(),
                                       [now](const Post &p) { return p.IsExpired(now); }),
                        posts.end());
            removed += before - posts.size();
            if (posts.empty()) {
                it = m_posts.erase(it);
            } else {
                ++it;
            }
        }
        return removed;
    }

private:
    mutable std::mutex m_mutex;
    std::map<std::string, std::vector<Post>> m_posts;
};

} // namespace core
} // namespace lsnp

#endif // LSNP_CORE_POST_FEED_HPP
