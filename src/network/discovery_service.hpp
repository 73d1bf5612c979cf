#ifndef LSNP_NETWORK_DISCOVERY_SERVICE_HPP
#define LSNP_NETWORK_DISCOVERY_SERVICE_HPP

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "codec.hpp"
#include "core/errors.hpp"
#include "message_builder.hpp"
#include "peer_registry.hpp"
#include "protocol_messages.hpp"
#include "transport.hpp"
#include "util/logger.hpp"

/**
 * @file discovery_service.hpp
 * @brief Presence announcements and peer list exchange on top of a PeerRegistry.
 *
 * MESSAGES:
 *   PEER_DISCOVERY      USER_ID, PORT           broadcast by announce(); on first contact
 *                                               the receiver answers with a unicast copy of
 *                                               its own announcement.
 *   PEER_LIST_REQUEST   FROM                    unicast to one peer or broadcast.
 *   PEER_LIST_RESPONSE  FROM, PEERS, COUNT      sent back to the requester's address.
 *                                               PEERS = "user;ip;port,user;ip;port".
 *
 * A peer's address is the datagram source IP together with the advertised PORT.
 */

namespace lsnp {
namespace network {

struct PeerListEntry
{
    std::string userId;
    Endpoint endpoint;
};

class DiscoveryService
{
public:
    using Clock = PeerRegistry::Clock;

    DiscoveryService(Transport &transport, const Codec &codec, PeerRegistry &registry,
                     const MessageBuilder &builder)
        : transport_(transport)
        , codec_(codec)
        , registry_(registry)
        , builder_(builder)
    {
    }

    /// Broadcast our presence. Returns false if the transport could not send.
    bool announce()
    {
        bool ok = transport_.SendBroadcast(codec_.encode(makeDiscovery()));
        lsnp::util::logger::debug("[Discovery] Announced presence" +
                                  std::string(ok ? "" : " (send failed)"));
        return ok;
    }

    /**
     * @brief Apply an inbound PEER_DISCOVERY.
     * @return true if the sender was not known before.
     * @throw InvalidMessageFormat if USER_ID is missing or PORT is malformed.
     */
    bool handleDiscovery(const Message &msg, const Endpoint &from, Clock::time_point now)
    {
        const std::string &userId = msg.Require(field::USER_ID);
        if (userId == registry_.selfUserId()) {
            return false;
        }

        Endpoint peerEndpoint = from;
        if (msg.Has(field::PORT)) {
            uint64_t port = msg.RequireUInt(field::PORT);
            if (port == 0 || port > 65535) {
                throw core::InvalidMessageFormat("PEER_DISCOVERY with out-of-range PORT " +
                                                 std::to_string(port));
            }
            peerEndpoint.port = static_cast<uint16_t>(port);
        }

        bool isNew = registry_.upsert(userId, peerEndpoint, now);
        if (isNew) {
            // Let the newcomer learn about us without waiting for our next announce.
            if (!transport_.SendUnicast(codec_.encode(makeDiscovery()), peerEndpoint)) {
                lsnp::util::logger::warn("[Discovery] Could not answer discovery from " + userId);
            }
        }
        return isNew;
    }

    /**
     * @brief Ask one known peer (or everyone, when target is empty) for its peer list.
     * @throw RecipientUnknown if target names a peer that is not in the registry.
     */
    bool requestPeerList(const std::optional<std::string> &target = std::nullopt)
    {
        Message req = builder_.Create(msgtype::PEER_LIST_REQUEST);
        std::string bytes = codec_.encode(req);
        if (!target) {
            return transport_.SendBroadcast(bytes);
        }
        auto peer = registry_.lookup(*target);
        if (!peer) {
            throw core::RecipientUnknown(*target);
        }
        return transport_.SendUnicast(bytes, peer->endpoint);
    }

    /// Answer a PEER_LIST_REQUEST at the datagram's source address.
    bool handlePeerListRequest(const Message &msg, const Endpoint &from)
    {
        const std::string &requester = msg.Require(field::FROM);
        if (requester == registry_.selfUserId()) {
            return false;
        }

        std::vector<PeerListEntry> entries;
        for (const auto &peer : registry_.snapshot()) {
            if (peer.userId != requester) {
                entries.push_back(PeerListEntry{peer.userId, peer.endpoint});
            }
        }

        Message resp = builder_.Create(msgtype::PEER_LIST_RESPONSE);
        resp.Set(field::PEERS, formatPeers(entries));
        resp.Set(field::COUNT, static_cast<uint64_t>(entries.size()));

        lsnp::util::logger::debug("[Discovery] Sending " + std::to_string(entries.size()) +
                                  " peers to " + requester);
        return transport_.SendUnicast(codec_.encode(resp), from);
    }

    /**
     * @brief Learn peers from a PEER_LIST_RESPONSE. Only unknown entries are inserted.
     * @return number of peers added.
     */
    size_t handlePeerListResponse(const Message &msg, Clock::time_point now)
    {
        size_t added = 0;
        for (const auto &entry : parsePeers(msg.GetOr(field::PEERS, ""))) {
            if (entry.userId == registry_.selfUserId()) {
                continue;
            }
            if (registry_.insertIfAbsent(entry.userId, entry.endpoint, now)) {
                ++added;
            }
        }
        if (added > 0) {
            lsnp::util::logger::info("[Discovery] Learned " + std::to_string(added) +
                                     " peer(s) from " + msg.Sender());
        }
        return added;
    }

    static std::string formatPeers(const std::vector<PeerListEntry> &entries)
    {
        std::vector<std::string> parts;
        for (const auto &e : entries) {
            parts.push_back(e.userId + ";" + e.endpoint.ip + ";" + std::to_string(e.endpoint.port));
        }
        return JoinList(parts);
    }

    /// Malformed entries are skipped with a warning.
    static std::vector<PeerListEntry> parsePeers(const std::string &value)
    {
        std::vector<PeerListEntry> out;
        for (const auto &item : SplitList(value)) {
            auto parts = SplitList(item, ';');
            if (parts.size() != 3 || parts[2].empty() || parts[2].size() > 5 ||
                parts[2].find_first_not_of("0123456789") != std::string::npos) {
                lsnp::util::logger::warn("[Discovery] Skipping malformed peer entry: " + item);
                continue;
            }
            unsigned long port = std::stoul(parts[2]);
            if (port == 0 || port > 65535) {
                lsnp::util::logger::warn("[Discovery] Skipping peer entry with bad port: " + item);
                continue;
            }
            PeerListEntry entry;
            entry.userId = parts[0];
            entry.endpoint.ip = parts[1];
            entry.endpoint.port = static_cast<uint16_t>(port);
            out.push_back(entry);
        }
        return out;
    }

private:
    Message makeDiscovery() const
    {
        Message msg = builder_.Create(msgtype::PEER_DISCOVERY);
        msg.Set(field::PORT, static_cast<uint64_t>(transport_.LocalEndpoint().port));
        return msg;
    }

    Transport &transport_;
    const Codec &codec_;
    PeerRegistry &registry_;
    const MessageBuilder &builder_;
};

} // namespace network
} // namespace lsnp

#endif // LSNP_NETWORK_DISCOVERY_SERVICE_HPP
