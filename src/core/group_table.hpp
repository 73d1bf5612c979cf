#ifndef LSNP_CORE_GROUP_TABLE_HPP
#define LSNP_CORE_GROUP_TABLE_HPP

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include "errors.hpp"

namespace lsnp {
namespace core {

struct GroupMessage
{
    std::string from;
    uint64_t timestamp = 0;
    std::string content;
};

struct Group
{
    std::string groupId;
    std::string name;
    std::string creator;
    std::set<std::string> members; // always contains creator
    std::vector<GroupMessage> log;

    bool IsMember(const std::string &userId) const { return members.count(userId) > 0; }
};

/*
  GroupTable
  --------------------------------
  All groups this node knows about, keyed by group_id.

  Policy:
    - The creator is always a member and can never be removed.
    - Only the creator may change membership (PermissionDenied otherwise).
    - Only members may append to the message log.
    - Groups are never deleted.
*/

class GroupTable
{
public:
    // Local creation. Throws std::runtime_error if the id is taken.
    Group Create(const std::string &groupId, const std::string &name, const std::string &creator,
                 const std::set<std::string> &members)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_groups.count(groupId) > 0) {
            throw std::runtime_error("group already exists: " + groupId);
        }
        Group g = makeGroup(groupId, name, creator, members);
        m_groups[groupId] = g;
        return g;
    }

    /*
      Inbound GROUP_CREATE.
      - unknown id: created, returns true
      - same creator: name and members replaced, returns false
      - different creator: PermissionDenied
    */
    bool ApplyRemoteCreate(const std::string &groupId, const std::string &name,
                           const std::string &creator, const std::set<std::string> &members)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_groups.find(groupId);
        if (it == m_groups.end()) {
            m_groups[groupId] = makeGroup(groupId, name, creator, members);
            return true;
        }
        if (it->second.creator != creator) {
            throw PermissionDenied(creator + " cannot redefine group " + groupId + " owned by " +
                                   it->second.creator);
        }
        Group replaced = makeGroup(groupId, name, creator, members);
        replaced.log = std::move(it->second.log);
        it->second = std::move(replaced);
        return false;
    }

    /*
      Add and remove members on behalf of actor. Removing the creator is ignored.
      Returns the updated group.
    */
    Group UpdateMembers(const std::string &groupId, const std::string &actor,
                        const std::set<std::string> &add, const std::set<std::string> &remove)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        Group &g = findOrThrow(groupId);
        if (g.creator != actor) {
            throw PermissionDenied(actor + " is not the creator of group " + groupId);
        }
        for (const auto &m : add) {
            g.members.insert(m);
        }
        for (const auto &m : remove) {
            if (m != g.creator) {
                g.members.erase(m);
            }
        }
        return g;
    }

    // Appends to the group log; sender must be a member.
    void AppendMessage(const std::string &groupId, const GroupMessage &msg)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        Group &g = findOrThrow(groupId);
        if (!g.IsMember(msg.from)) {
            throw PermissionDenied(msg.from + " is not a member of group " + groupId);
        }
        g.log.push_back(msg);
    }

    std::optional<Group> Find(const std::string &groupId) const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_groups.find(groupId);
        if (it == m_groups.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    // Ids of every group userId belongs to
    std::vector<std::string> GroupsOf(const std::string &userId) const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::vector<std::string> out;
        for (const auto &kv : m_groups) {
            if (kv.second.IsMember(userId)) {
                out.push_back(kv.first);
            }
        }
        return out;
    }

    size_t Size() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_groups.size();
    }

private:
    static Group makeGroup(const std::string &groupId, const std::string &name,
                           const std::string &creator, const std::set<std::string> &members)
    {
        Group g;
        g.groupId = groupId;
        g.name = name.empty() ? groupId : name;
        g.creator = creator;
        g.members = members;
        g.members.insert(creator);
        return g;
    }

    Group &findOrThrow(const std::string &groupId)
    {
        auto it = m_groups.find(groupId);
        if (it == m_groups.end()) {
            throw GroupNotFound(groupId);
        }
        return it->second;
    }

    mutable std::mutex m_mutex;
    std::map<std::string, Group> m_groups;
};

} // namespace core
} // namespace lsnp

#endif // LSNP_CORE_GROUP_TABLE_HPP
