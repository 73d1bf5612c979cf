#ifndef LSNP_UTIL_RECENT_MESSAGE_CACHE_HPP
#define LSNP_UTIL_RECENT_MESSAGE_CACHE_HPP

#include <cstddef>
#include <list>
#include <mutex>
#include <string>
#include <unordered_map>

/**
 * @file recent_message_cache.hpp
 * @brief Bounded set of recently processed message keys, used to drop UDP duplicates.
 *
 * Insertion order is kept in a list; once the capacity is exceeded the oldest key is
 * forgotten. A capacity of 0 disables the cache (every key is reported as new).
 */

namespace lsnp {
namespace util {

class RecentMessageCache
{
public:
    explicit RecentMessageCache(size_t capacity)
        : capacity_(capacity)
    {
    }

    /**
     * @brief Record key if unseen.
     * @return true if the key was not present (caller should process the message),
     *         false if it is a duplicate.
     */
    bool insertIfAbsent(const std::string &key)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (capacity_ == 0) {
            return true;
        }
        auto it = index_.find(key);
        if (it != index_.end()) {
            // refresh so a burst of retransmits keeps the key alive
            order_.splice(order_.begin(), order_, it->second);
            return false;
        }
        order_.push_front(key);
        index_[key] = order_.begin();
        if (index_.size() > capacity_) {
            index_.erase(order_.back());
            order_.pop_back();
        }
        return true;
    }

    bool contains(const std::string &key) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return index_.count(key) > 0;
    }

    size_t size() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return index_.size();
    }

    size_t capacity() const { return capacity_; }

private:
    size_t capacity_;
    std::list<std::string> order_;
    std::unordered_map<std::string, std::list<std::string>::iterator> index_;
    mutable std::mutex mutex_;
};

} // namespace util
} // namespace lsnp

#endif // LSNP_UTIL_RECENT_MESSAGE_CACHE_HPP
