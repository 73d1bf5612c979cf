#ifndef LSNP_CORE_DM_STORE_HPP
#define LSNP_CORE_DM_STORE_HPP

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace lsnp {
namespace core {

enum class DmDirection {
    INBOUND,
    OUTBOUND
};

struct DmEntry
{
    DmDirection direction = DmDirection::INBOUND;
    std::string from;
    uint64_t timestamp = 0;
    std::string content;
    std::string messageId;
};

/*
  DmStore
  --------------------------------
  Direct message threads. A thread belongs to an unordered pair of user_ids, so
  Thread("alice", "bob") and Thread("bob", "alice") are the same sequence.
  Entries keep arrival order.
*/

class DmStore
{
public:
    void Append(const std::string &userA, const std::string &userB, const DmEntry &entry)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_threads[key(userA, userB)].push_back(entry);
    }

    std::vector<DmEntry> Thread(const std::string &userA, const std::string &userB) const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_threads.find(key(userA, userB));
        return it == m_threads.end() ? std::vector<DmEntry>() : it->second;
    }

    size_t ThreadCount() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_threads.size();
    }

private:
    using PairKey = std::pair<std::string, std::string>;

    static PairKey key(const std::string &a, const std::string &b)
    {
        return a < b ? PairKey(a, b) : PairKey(b, a);
    }

    mutable std::mutex m_mutex;
    std::map<PairKey, std::vector<DmEntry>> m_threads;
};

} // namespace core
} // namespace lsnp

#endif // LSNP_CORE_DM_STORE_HPP
