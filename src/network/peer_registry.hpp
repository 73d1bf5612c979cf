#ifndef LSNP_NETWORK_PEER_REGISTRY_HPP
#define LSNP_NETWORK_PEER_REGISTRY_HPP

#include <algorithm>
#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "transport.hpp"
#include "util/logger.hpp"

/**
 * @file peer_registry.hpp
 * @brief Thread-safe table of live peers keyed by user_id.
 *
 * DESIGN:
 *   - One entry per user_id. The local user is never stored.
 *   - last_seen uses the monotonic clock; every mutating call takes the "now" to use so
 *     tests can drive liveness without sleeping.
 *   - sweep(now) evicts entries whose age exceeds the inactivity timeout.
 *   - Listeners are told about PEER_JOINED (first insert) and PEER_LEFT (eviction).
 *     They are invoked after the registry lock is released, so a listener may call
 *     back into the registry.
 *
 * SAMPLE USAGE:
 *   @code
 *   PeerRegistry registry("alice@10.0.0.1", std::chrono::minutes(5));
 *   registry.addListener([](PeerChange c, const Peer &p) { ... });
 *   registry.upsert("bob@10.0.0.2", {"10.0.0.2", 9001}, PeerRegistry::Clock::now());
 *   auto peers = registry.snapshot();
 *   @endcode
 */

namespace lsnp {
namespace network {

struct PeerProfile
{
    std::string displayName;
    std::string status;
    bool hasAvatar = false;
    std::string avatarType;
};

struct Peer
{
    std::string userId;
    Endpoint endpoint;
    std::chrono::steady_clock::time_point lastSeen;
    PeerProfile profile;
};

enum class PeerChange {
    JOINED,
    LEFT
};

class PeerRegistry
{
public:
    using Clock = std::chrono::steady_clock;
    using Listener = std::function<void(PeerChange, const Peer&)>;

    PeerRegistry(const std::string &selfUserId, std::chrono::milliseconds timeout)
        : selfUserId_(selfUserId)
        , timeout_(timeout)
    {
    }

    const std::string& selfUserId() const { return selfUserId_; }
    std::chrono::milliseconds timeout() const { return timeout_; }

    void addListener(Listener listener)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        listeners_.push_back(std::move(listener));
    }

    /**
     * @brief Insert or refresh a peer.
     * @return true if the peer was not known before (a PEER_JOINED was raised).
     */
    bool upsert(const std::string &userId, const Endpoint &endpoint, Clock::time_point now)
    {
        if (userId.empty() || userId == selfUserId_) {
            return false;
        }

        Peer joined;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = peers_.find(userId);
            if (it != peers_.end()) {
                if (it->second.endpoint != endpoint) {
                    lsnp::util::logger::info("[PeerRegistry] " + userId + " moved from " +
                                             it->second.endpoint.ToString() + " to " +
                                             endpoint.ToString());
                }
                it->second.endpoint = endpoint;
                it->second.lastSeen = now;
                return false;
            }
            Peer peer;
            peer.userId = userId;
            peer.endpoint = endpoint;
            peer.lastSeen = now;
            peers_[userId] = peer;
            joined = peer;
        }

        lsnp::util::logger::info("[PeerRegistry] Peer joined: " + userId + " at " +
                                 endpoint.ToString());
        notify(PeerChange::JOINED, joined);
        return true;
    }

    /**
     * @brief Insert a peer reported second-hand (PEER_LIST_RESPONSE). Known peers are
     *        left untouched so a third party can never keep a silent peer alive.
     * @return true if inserted.
     */
    bool insertIfAbsent(const std::string &userId, const Endpoint &endpoint, Clock::time_point now)
    {
        if (contains(userId)) {
            return false;
        }
        return upsert(userId, endpoint, now);
    }

    /**
     * @brief Store profile data for a peer, creating the entry if needed.
     * @return true if the entry was created by this call.
     */
    bool updateProfile(const std::string &userId, const PeerProfile &profile,
                       const Endpoint &endpoint, Clock::time_point now)
    {
        if (userId.empty() || userId == selfUserId_) {
            return false;
        }
        bool created = upsert(userId, endpoint, now);
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = peers_.find(userId);
        if (it != peers_.end()) {
            it->second.profile = profile;
        }
        return created;
    }

    std::optional<Peer> lookup(const std::string &userId) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = peers_.find(userId);
        if (it == peers_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    bool contains(const std::string &userId) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return peers_.count(userId) > 0;
    }

    /// Copy of all entries, ordered by user_id.
    std::vector<Peer> snapshot() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<Peer> out;
        out.reserve(peers_.size());
        for (const auto &kv : peers_) {
            out.push_back(kv.second);
        }
        return out;
    }

    size_t size() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return peers_.size();
    }

    /**
     * @brief Remove every peer whose last_seen is older than the timeout.
     * @return user_ids removed, in user_id order.
     */
    std::vector<std::string> sweep(Clock::time_point now)
    {
        std::vector<Peer> evicted;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (auto it = peers_.begin(); it != peers_.end();) {
                if (now - it->second.lastSeen > timeout_) {
                    evicted.push_back(it->second);
                    it = peers_.erase(it);
                }
                else {
                    ++it;
                }
            }
        }

        std::vector<std::string> ids;
        for (const auto &peer : evicted) {
            lsnp::util::logger::info("[PeerRegistry] Peer timed out: " + peer.userId);
            notify(PeerChange::LEFT, peer);
            ids.push_back(peer.userId);
        }
        return ids;
    }

private:
    void notify(PeerChange change, const Peer &peer)
    {
        std::vector<Listener> listeners;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            listeners = listeners_;
        }
        for (auto &listener : listeners) {
            listener(change, peer);
        }
    }

    std::string selfUserId_;
    std::chrono::milliseconds timeout_;
    std::map<std::string, Peer> peers_;
    std::vector<Listener> listeners_;
    mutable std::mutex mutex_;
};

} // namespace network
} // namespace lsnp

#endif // LSNP_NETWORK_PEER_REGISTRY_HPP
