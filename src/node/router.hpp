#ifndef LSNP_NODE_ROUTER_HPP
#define LSNP_NODE_ROUTER_HPP

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "core/dm_store.hpp"
#include "core/game_table.hpp"
#include "core/group_table.hpp"
#include "core/like_index.hpp"
#include "core/post_feed.hpp"
#include "core/social_graph.hpp"
#include "events.hpp"
#include "network/codec.hpp"
#include "network/discovery_service.hpp"
#include "network/message_builder.hpp"
#include "network/peer_registry.hpp"
#include "network/transport.hpp"
#include "security/token_verifier.hpp"

namespace lsnp {
namespace node {

struct Avatar
{
    std::string mimeType;
    std::vector<uint8_t> data; // raw bytes, base64 encoded on the wire
};

/*
  Router
  --------------------------------
  Interprets every decoded message by TYPE and owns the per-node social state
  (follow graph, groups, likes, DM threads, post feed, games).

  Inbound:  Dispatch(msg, from) runs the token verifier, then the type's handler.
            A rejected or malformed message is logged and dropped; Dispatch never
            throws for protocol reasons and reports whether the message was applied.

  Outbound: the intent methods (Post, SendDm, Follow, ...) validate first and throw
            RecipientUnknown / InvalidMove / GameNotFound / PermissionDenied /
            GroupNotFound / PayloadTooLarge before any packet leaves the node.
            Their bool/count results report what the transport accepted.
*/

class Router {
  public:
    Router(network::Transport& transport, const network::Codec& codec,
           network::PeerRegistry& registry, network::DiscoveryService& discovery,
           const network::MessageBuilder& builder, uint64_t defaultPostTtl);

    void SetEventCallback(EventCallback callback);
    void SetTokenVerifier(std::shared_ptr<security::TokenVerifier> verifier);

    // Inbound entry point. Returns true if the message changed state or was answered.
    bool Dispatch(const network::Message& msg, const network::Endpoint& from);

    // Periodic maintenance driven by the housekeeping scheduler.
    size_t PruneExpiredPosts(uint64_t nowUnix);

    // ---- outbound intents -------------------------------------------------
    size_t Post(const std::string& content, uint64_t ttlSeconds = 0);
    bool SendDm(const std::string& to, const std::string& content);
    bool SetProfile(const std::string& displayName, const std::string& status,
                    const std::optional<Avatar>& avatar = std::nullopt);
    bool Follow(const std::string& target);
    bool Unfollow(const std::string& target);
    core::Group CreateGroup(const std::string& groupId, const std::string& name,
                            const std::vector<std::string>& members);
    core::Group UpdateGroup(const std::string& groupId, const std::vector<std::string>& add,
                            const std::vector<std::string>& remove);
    size_t SendGroupMessage(const std::string& groupId, const std::string& content);
    bool Like(const std::string& author, const std::string& postTimestamp);
    bool Unlike(const std::string& author, const std::string& postTimestamp);
    std::string InviteToGame(const std::string& opponent, char symbol = 'X',
                             std::optional<int> firstMove = std::nullopt);
    core::Outcome SubmitMove(const std::string& gameId, int position);
    bool RevokeToken(const std::string& token);

    // ---- read-only views ----------------------------------------------------
    const std::string& SelfUserId() const { return m_builder.SelfUserId(); }
    const core::SocialGraph& Graph() const { return m_graph; }
    const core::GroupTable& Groups() const { return m_groups; }
    const core::LikeIndex& Likes() const { return m_likes; }
    const core::DmStore& Dms() const { return m_dms; }
    const core::PostFeed& Feed() const { return m_feed; }
    const core::GameTable& Games() const { return m_games; }
    std::vector<core::DmEntry> DmThreadWith(const std::string& peer) const {
        return m_dms.Thread(SelfUserId(), peer);
    }

  private:
    void handlePost(const network::Message& msg);
    void handleDm(const network::Message& msg);
    void handleProfile(const network::Message& msg, const network::Endpoint& from);
    void handleFollow(const network::Message& msg, bool follow, const network::Endpoint& source);
    void handleGroupCreate(const network::Message& msg);
    void handleGroupUpdate(const network::Message& msg);
    void handleGroupMessage(const network::Message& msg);
    void handleLike(const network::Message& msg, bool like);
    void handleInvite(const network::Message& msg);
    void handleMove(const network::Message& msg);
    void handleResult(const network::Message& msg);
    void handleRevoke(const network::Message& msg);

    std::shared_ptr<security::TokenVerifier> currentVerifier() const;
    network::Peer requirePeer(const std::string& userId) const;
    bool sendTo(const network::Peer& peer, const network::Message& msg);
    bool sendEncodedTo(const network::Peer& peer, const std::string& bytes);
    size_t fanOut(const std::set<std::string>& recipients,
                  const std::function<network::Message(const std::string&)>& build);
    bool toggleLike(const std::string& author, const std::string& postTimestamp, bool like);
    bool sendFollow(const std::string& target, bool follow);

    void emit(const Event& event);
    void emitMessage(const network::Message& msg);
    void emitGame(const core::GameSession& session, const std::optional<network::Message>& msg);

    network::Transport& m_transport;
    const network::Codec& m_codec;
    network::PeerRegistry& m_registry;
    network::DiscoveryService& m_discovery;
    const network::MessageBuilder& m_builder;
    uint64_t m_defaultPostTtl;

    std::shared_ptr<security::TokenVerifier> m_verifier;
    EventCallback m_eventCallback;
    // guards m_eventCallback and m_verifier
    mutable std::mutex m_callbackMutex;

    core::SocialGraph m_graph;
    core::GroupTable m_groups;
    core::LikeIndex m_likes;
    core::DmStore m_dms;
    core::PostFeed m_feed;
    core::GameTable m_games;
};

// Decimal position "1".."9"; throws InvalidMessageFormat otherwise.
int ParsePosition(const std::string& raw);

std::string DescribeGame(const core::GameSession& session);

} // namespace node
} // namespace lsnp

#endif // LSNP_NODE_ROUTER_HPP
