#include "node/router.hpp"

#include <chrono>

#include "util/hashing.hpp"
#include "util/logger.hpp"

namespace lsnp {
namespace node {

using network::Endpoint;
using network::Message;
using network::Peer;
namespace field = network::field;
namespace msgtype = network::msgtype;

namespace {

std::set<std::string> toSet(const std::vector<std::string>& items) {
    return std::set<std::string>(items.begin(), items.end());
}

std::string resultName(core::GameResult result) {
    switch (result) {
    case core::GameResult::WIN:
        return "WIN";
    case core::GameResult::DRAW:
        return "DRAW";
    case core::GameResult::NONE:
        break;
    }
    return "NONE";
}

std::string lineToString(const std::array<int, 3>& line) {
    return std::to_string(line[0]) + "," + std::to_string(line[1]) + "," +
           std::to_string(line[2]);
}

} // namespace

int ParsePosition(const std::string& raw) {
    if (raw.size() != 1 || raw[0] < '1' || raw[0] > '9') {
        throw core::InvalidMessageFormat("POSITION must be 1-9, got '" + raw + "'");
    }
    return raw[0] - '0';
}

std::string DescribeGame(const core::GameSession& session) {
    std::string out = session.GameId() + " " + core::GameStateName(session.State());
    const core::Outcome& outcome = session.GetOutcome();
    if (outcome.result == core::GameResult::WIN) {
        out += std::string(" winner=") + outcome.winner + " line=" + lineToString(outcome.line);
    } else if (outcome.result == core::GameResult::DRAW) {
        out += " draw";
    } else {
        out += std::string(" turn=") + session.Turn();
    }
    out += " board=[" + session.GetBoard().ToString() + "]";
    return out;
}

Router::Router(network::Transport& transport, const network::Codec& codec,
               network::PeerRegistry& registry, network::DiscoveryService& discovery,
               const network::MessageBuilder& builder, uint64_t defaultPostTtl)
    : m_transport(transport), m_codec(codec), m_registry(registry), m_discovery(discovery),
      m_builder(builder), m_defaultPostTtl(defaultPostTtl),
      m_verifier(std::make_shared<security::NoopTokenVerifier>()) {}

void Router::SetEventCallback(EventCallback callback) {
    std::lock_guard<std::mutex> lock(m_callbackMutex);
    m_eventCallback = std::move(callback);
}

void Router::SetTokenVerifier(std::shared_ptr<security::TokenVerifier> verifier) {
    if (!verifier) {
        verifier = std::make_shared<security::NoopTokenVerifier>();
    }
    std::lock_guard<std::mutex> lock(m_callbackMutex);
    m_verifier = std::move(verifier);
}

std::shared_ptr<security::TokenVerifier> Router::currentVerifier() const {
    std::lock_guard<std::mutex> lock(m_callbackMutex);
    return m_verifier;
}

bool Router::Dispatch(const Message& msg, const Endpoint& from) {
    using lsnp::util::logger::Logger;
    const std::string type = msg.Type();

    std::string reason;
    if (!currentVerifier()->verify(msg, reason)) {
        Logger::getInstance().warn("[Router] Rejected " + type + " from " + msg.Sender() + ": " +
                                   reason);
        return false;
    }

    try {
        auto now = network::PeerRegistry::Clock::now();
        if (type == msgtype::PEER_DISCOVERY) {
            m_discovery.handleDiscovery(msg, from, now);
        } else if (type == msgtype::PEER_LIST_REQUEST) {
            m_discovery.handlePeerListRequest(msg, from);
        } else if (type == msgtype::PEER_LIST_RESPONSE) {
            m_discovery.handlePeerListResponse(msg, now);
        } else if (type == msgtype::POST) {
            handlePost(msg);
        } else if (type == msgtype::DM) {
            handleDm(msg);
        } else if (type == msgtype::PROFILE) {
            handleProfile(msg, from);
        } else if (type == msgtype::FOLLOW) {
            handleFollow(msg, true, from);
        } else if (type == msgtype::UNFOLLOW) {
            handleFollow(msg, false, from);
        } else if (type == msgtype::GROUP_CREATE) {
            handleGroupCreate(msg);
        } else if (type == msgtype::GROUP_UPDATE) {
            handleGroupUpdate(msg);
        } else if (type == msgtype::GROUP_MESSAGE) {
            handleGroupMessage(msg);
        } else if (type == msgtype::LIKE) {
            handleLike(msg, true);
        } else if (type == msgtype::UNLIKE) {
            handleLike(msg, false);
        } else if (type == msgtype::TICTACTOE_INVITE) {
            handleInvite(msg);
        } else if (type == msgtype::TICTACTOE_MOVE) {
            handleMove(msg);
        } else if (type == msgtype::TICTACTOE_RESULT) {
            handleResult(msg);
        } else if (type == msgtype::REVOKE) {
            handleRevoke(msg);
        } else {
            Logger::getInstance().warn("[Router] Ignoring unknown message type: " + type);
            return false;
        }
    } catch (const core::LsnpError& ex) {
        Logger::getInstance().warn("[Router] Dropped " + type + " from " + from.ToString() +
                                   ": " + ex.what());
        return false;
    }
    return true;
}

size_t Router::PruneExpiredPosts(uint64_t nowUnix) {
    size_t removed = m_feed.Prune(nowUnix);
    if (removed > 0) {
        lsnp::util::logger::debug("[Router] Pruned " + std::to_string(removed) +
                                  " expired post(s)");
    }
    return removed;
}

// ---------------------------------------------------------------------------
//  Outbound intents
// ---------------------------------------------------------------------------

size_t Router::Post(const std::string& content, uint64_t ttlSeconds) {
    uint64_t ttl = ttlSeconds == 0 ? m_defaultPostTtl : ttlSeconds;

    Message msg = m_builder.Create(msgtype::POST);
    msg.Set(field::CONTENT, content);
    msg.Set(field::TTL, ttl);
    std::string bytes = m_codec.encode(msg);

    core::Post post;
    post.author = SelfUserId();
    post.messageId = msg.MessageId();
    post.content = content;
    post.timestamp = msg.RequireUInt(field::TIMESTAMP);
    post.ttl = ttl;
    m_feed.Add(post);

    size_t sent = 0;
    for (const auto& peer : m_registry.snapshot()) {
        if (sendEncodedTo(peer, bytes)) {
            ++sent;
        }
    }
    lsnp::util::logger::info("[Router] POST delivered to " + std::to_string(sent) + " peer(s)");
    return sent;
}

bool Router::SendDm(const std::string& to, const std::string& content) {
    Peer peer = requirePeer(to);

    Message msg = m_builder.Create(msgtype::DM);
    msg.Set(field::TO, to);
    msg.Set(field::CONTENT, content);
    if (!sendTo(peer, msg)) {
        return false;
    }

    core::DmEntry entry;
    entry.direction = core::DmDirection::OUTBOUND;
    entry.from = SelfUserId();
    entry.timestamp = msg.RequireUInt(field::TIMESTAMP);
    entry.content = content;
    entry.messageId = msg.MessageId();
    m_dms.Append(SelfUserId(), to, entry);
    return true;
}

bool Router::SetProfile(const std::string& displayName, const std::string& status,
                        const std::optional<Avatar>& avatar) {
    Message msg = m_builder.Create(msgtype::PROFILE);
    msg.Set(field::DISPLAY_NAME, displayName);
    msg.Set(field::STATUS, status);
    if (avatar && !avatar->data.empty()) {
        if (avatar->data.size() > m_codec.softLimit()) {
            lsnp::util::logger::warn("[Router] Avatar is " + std::to_string(avatar->data.size()) +
                                     " bytes, peers may drop it");
        }
        msg.Set(field::AVATAR_TYPE, avatar->mimeType);
        msg.Set(field::AVATAR_ENCODING, "base64");
        msg.Set(field::AVATAR_DATA, lsnp::util::hashing::base64Encode(avatar->data));
    }
    // throws PayloadTooLarge before anything is sent
    std::string bytes = m_codec.encode(msg);
    return m_transport.SendBroadcast(bytes);
}

bool Router::Follow(const std::string& target) { return sendFollow(target, true); }

bool Router::Unfollow(const std::string& target) { return sendFollow(target, false); }

bool Router::sendFollow(const std::string& target, bool follow) {
    Peer peer = requirePeer(target);

    Message msg = m_builder.Create(follow ? msgtype::FOLLOW : msgtype::UNFOLLOW);
    msg.Set(field::TO, target);
    std::string bytes = m_codec.encode(msg);

    if (follow) {
        m_graph.Follow(SelfUserId(), target);
    } else {
        m_graph.Unfollow(SelfUserId(), target);
    }
    return sendEncodedTo(peer, bytes);
}

core::Group Router::CreateGroup(const std::string& groupId, const std::string& name,
                                const std::vector<std::string>& members) {
    if (groupId.empty()) {
        throw core::InvalidMessageFormat("group id must not be empty");
    }
    core::Group group = m_groups.Create(groupId, name, SelfUserId(), toSet(members));

    const std::string memberList = network::JoinList(group.members);
    size_t sent = fanOut(group.members, [&](const std::string& member) {
        Message msg = m_builder.Create(msgtype::GROUP_CREATE);
        msg.Set(field::TO, member);
        msg.Set(field::GROUP_ID, group.groupId);
        msg.Set(field::GROUP_NAME, group.name);
        msg.Set(field::MEMBERS, memberList);
        return msg;
    });
    lsnp::util::logger::info("[Router] Group " + groupId + " created, announced to " +
                             std::to_string(sent) + " member(s)");
    return group;
}

core::Group Router::UpdateGroup(const std::string& groupId, const std::vector<std::string>& add,
                                const std::vector<std::string>& remove) {
    auto before = m_groups.Find(groupId);
    if (!before) {
        throw core::GroupNotFound(groupId);
    }
    core::Group after = m_groups.UpdateMembers(groupId, SelfUserId(), toSet(add), toSet(remove));

    // Newcomers get the full definition, everyone else the delta.
    std::set<std::string> newcomers;
    std::set<std::string> informed;
    for (const auto& m : after.members) {
        if (before->IsMember(m)) {
            informed.insert(m);
        } else {
            newcomers.insert(m);
        }
    }
    for (const auto& m : before->members) {
        if (!after.IsMember(m)) {
            informed.insert(m);
        }
    }

    const std::string addList = network::JoinList(add);
    const std::string removeList = network::JoinList(remove);
    fanOut(informed, [&](const std::string& member) {
        Message msg = m_builder.Create(msgtype::GROUP_UPDATE);
        msg.Set(field::TO, member);
        msg.Set(field::GROUP_ID, groupId);
        msg.Set(field::ADD, addList);
        msg.Set(field::REMOVE, removeList);
        return msg;
    });

    const std::string memberList = network::JoinList(after.members);
    fanOut(newcomers, [&](const std::string& member) {
        Message msg = m_builder.Create(msgtype::GROUP_CREATE);
        msg.Set(field::TO, member);
        msg.Set(field::GROUP_ID, groupId);
        msg.Set(field::GROUP_NAME, after.name);
        msg.Set(field::MEMBERS, memberList);
        return msg;
    });
    return after;
}

size_t Router::SendGroupMessage(const std::string& groupId, const std::string& content) {
    auto group = m_groups.Find(groupId);
    if (!group) {
        throw core::GroupNotFound(groupId);
    }
    if (!group->IsMember(SelfUserId())) {
        throw core::PermissionDenied(SelfUserId() + " is not a member of group " + groupId);
    }

    core::GroupMessage entry;
    entry.from = SelfUserId();
    entry.timestamp = security::unixNow();
    entry.content = content;
    m_groups.AppendMessage(groupId, entry);

    return fanOut(group->members, [&](const std::string& member) {
        Message msg = m_builder.Create(msgtype::GROUP_MESSAGE);
        msg.Set(field::TO, member);
        msg.Set(field::GROUP_ID, groupId);
        msg.Set(field::CONTENT, content);
        return msg;
    });
}

bool Router::Like(const std::string& author, const std::string& postTimestamp) {
    return toggleLike(author, postTimestamp, true);
}

bool Router::Unlike(const std::string& author, const std::string& postTimestamp) {
    return toggleLike(author, postTimestamp, false);
}

bool Router::toggleLike(const std::string& author, const std::string& postTimestamp, bool like) {
    std::optional<Peer> peer;
    if (author != SelfUserId()) {
        peer = requirePeer(author);
    }

    const std::string key = core::LikeIndex::PostKey(author, postTimestamp);
    bool changed = like ? m_likes.Like(key, SelfUserId()) : m_likes.Unlike(key, SelfUserId());

    if (peer) {
        Message msg = m_builder.Create(like ? msgtype::LIKE : msgtype::UNLIKE);
        msg.Set(field::TO, author);
        msg.Set(field::POST_TIMESTAMP, postTimestamp);
        sendTo(*peer, msg);
    }
    return changed;
}

std::string Router::InviteToGame(const std::string& opponent, char symbol,
                                 std::optional<int> firstMove) {
    Peer peer = requirePeer(opponent);
    if (!core::IsValidSymbol(symbol)) {
        throw core::InvalidMove(std::string("symbol must be X or O, got '") + symbol + "'");
    }
    if (firstMove && symbol != 'X') {
        throw core::InvalidMove("only the X player may open the game");
    }
    if (firstMove && !core::Board::IsValidPosition(*firstMove)) {
        throw core::InvalidMove("position " + std::to_string(*firstMove) + " is outside 1-9");
    }

    const std::string gameId = m_games.NextFreeId();
    const std::string& self = SelfUserId();
    core::GameSession session(gameId, symbol == 'X' ? self : opponent,
                              symbol == 'X' ? opponent : self);
    session.Accept();
    if (firstMove) {
        session.ApplyMove(self, *firstMove);
    }

    Message msg = m_builder.Create(msgtype::TICTACTOE_INVITE);
    msg.Set(field::TO, opponent);
    msg.Set(field::GAMEID, gameId);
    msg.Set(field::SYMBOL, std::string(1, symbol));
    if (firstMove) {
        msg.Set(field::POSITION, static_cast<uint64_t>(*firstMove));
        msg.Set(field::TURN, static_cast<uint64_t>(1));
    }
    std::string bytes = m_codec.encode(msg);

    m_games.Add(session);
    sendEncodedTo(peer, bytes);
    lsnp::util::logger::info("[Router] Invited " + opponent + " to " + gameId + " as " +
                             std::string(1, symbol));
    emitGame(session, std::nullopt);
    return gameId;
}

core::Outcome Router::SubmitMove(const std::string& gameId, int position) {
    auto current = m_games.Find(gameId);
    if (!current) {
        throw core::GameNotFound(gameId);
    }
    const std::string opponent = current->Opponent(SelfUserId());
    Peer peer = requirePeer(opponent);

    core::MoveOutcome result = m_games.ApplyMove(gameId, SelfUserId(), position);
    char symbol = result.session.SymbolOf(SelfUserId());

    Message move = m_builder.Create(msgtype::TICTACTOE_MOVE);
    move.Set(field::TO, opponent);
    move.Set(field::GAMEID, gameId);
    move.Set(field::POSITION, static_cast<uint64_t>(position));
    move.Set(field::SYMBOL, std::string(1, symbol));
    move.Set(field::TURN, static_cast<uint64_t>(result.session.MoveCount()));
    sendTo(peer, move);

    if (result.outcome.IsTerminal()) {
        Message done = m_builder.Create(msgtype::TICTACTOE_RESULT);
        done.Set(field::TO, opponent);
        done.Set(field::GAMEID, gameId);
        done.Set(field::RESULT, resultName(result.outcome.result));
        done.Set(field::SYMBOL, std::string(1, symbol));
        if (result.outcome.result == core::GameResult::WIN) {
            done.Set(field::WINNING_LINE, lineToString(result.outcome.line));
        }
        sendTo(peer, done);
        lsnp::util::logger::info("[Router] Game " + DescribeGame(result.session));
    }

    emitGame(result.session, std::nullopt);
    return result.outcome;
}

bool Router::RevokeToken(const std::string& token) {
    auto parsed = security::Token::parse(token);
    if (!parsed || parsed->userId != SelfUserId()) {
        throw core::PermissionDenied("only tokens issued to " + SelfUserId() + " can be revoked");
    }
    currentVerifier()->revoke(token);

    Message msg = m_builder.Create(msgtype::REVOKE);
    msg.Set(field::TOKEN, token);
    return m_transport.SendBroadcast(m_codec.encode(msg));
}

// ---------------------------------------------------------------------------
//  Inbound handlers
// ---------------------------------------------------------------------------

void Router::handlePost(const Message& msg) {
    core::Post post;
    post.author = msg.Require(field::USER_ID);
    post.content = msg.Require(field::CONTENT);
    post.timestamp = msg.RequireUInt(field::TIMESTAMP);
    post.ttl = msg.Has(field::TTL) ? msg.RequireUInt(field::TTL) : m_defaultPostTtl;
    post.messageId = msg.MessageId();

    // only followed authors reach the feed
    if (!m_graph.IsFollowing(SelfUserId(), post.author)) {
        lsnp::util::logger::debug("[Router] POST from " + post.author +
                                  " skipped, not following");
        return;
    }
    if (m_feed.Add(post)) {
        emitMessage(msg);
    }
}

void Router::handleDm(const Message& msg) {
    const std::string& from = msg.Require(field::FROM);
    const std::string& to = msg.Require(field::TO);
    if (to != SelfUserId()) {
        lsnp::util::logger::debug("[Router] DM for " + to + " is not ours, ignoring");
        return;
    }

    core::DmEntry entry;
    entry.direction = core::DmDirection::INBOUND;
    entry.from = from;
    entry.timestamp = msg.RequireUInt(field::TIMESTAMP);
    entry.content = msg.Require(field::CONTENT);
    entry.messageId = msg.MessageId();
    m_dms.Append(SelfUserId(), from, entry);
    emitMessage(msg);
}

void Router::handleProfile(const Message& msg, const Endpoint& from) {
    const std::string& userId = msg.Require(field::USER_ID);
    if (userId == SelfUserId()) {
        return;
    }

    network::PeerProfile profile;
    profile.displayName = msg.GetOr(field::DISPLAY_NAME, userId);
    profile.status = msg.GetOr(field::STATUS, "");
    profile.avatarType = msg.GetOr(field::AVATAR_TYPE, "");
    profile.hasAvatar = !msg.GetOr(field::AVATAR_DATA, "").empty();

    Endpoint endpoint = from;
    if (auto known = m_registry.lookup(userId)) {
        endpoint = known->endpoint;
    }
    m_registry.updateProfile(userId, profile, endpoint, network::PeerRegistry::Clock::now());
    emitMessage(msg);
}

void Router::handleFollow(const Message& msg, bool follow, const Endpoint& source) {
    const std::string& from = msg.Require(field::FROM);
    const std::string& to = msg.Require(field::TO);
    if (to != SelfUserId()) {
        return;
    }
    if (follow && m_registry.insertIfAbsent(from, source, network::PeerRegistry::Clock::now())) {
        lsnp::util::logger::info("[Router] Registered follower " + from + " at " +
                                 source.ToString());
    }
    bool changed = follow ? m_graph.Follow(from, to) : m_graph.Unfollow(from, to);
    if (changed) {
        emitMessage(msg);
    }
}

void Router::handleGroupCreate(const Message& msg) {
    const std::string& from = msg.Require(field::FROM);
    const std::string& groupId = msg.Require(field::GROUP_ID);
    std::set<std::string> members = toSet(network::SplitList(msg.GetOr(field::MEMBERS, "")));
    if (members.count(SelfUserId()) == 0) {
        lsnp::util::logger::debug("[Router] GROUP_CREATE " + groupId + " does not include us");
        return;
    }
    m_groups.ApplyRemoteCreate(groupId, msg.GetOr(field::GROUP_NAME, groupId), from, members);
    emitMessage(msg);
}

void Router::handleGroupUpdate(const Message& msg) {
    const std::string& from = msg.Require(field::FROM);
    const std::string& groupId = msg.Require(field::GROUP_ID);
    auto add = toSet(network::SplitList(msg.GetOr(field::ADD, "")));
    auto remove = toSet(network::SplitList(msg.GetOr(field::REMOVE, "")));
    m_groups.UpdateMembers(groupId, from, add, remove);
    emitMessage(msg);
}

void Router::handleGroupMessage(const Message& msg) {
    const std::string& groupId = msg.Require(field::GROUP_ID);
    auto group = m_groups.Find(groupId);
    if (!group) {
        throw core::GroupNotFound(groupId);
    }
    if (!group->IsMember(SelfUserId())) {
        throw core::PermissionDenied("not a member of group " + groupId);
    }

    core::GroupMessage entry;
    entry.from = msg.Require(field::FROM);
    entry.timestamp = msg.RequireUInt(field::TIMESTAMP);
    entry.content = msg.Require(field::CONTENT);
    m_groups.AppendMessage(groupId, entry);
    emitMessage(msg);
}

void Router::handleLike(const Message& msg, bool like) {
    const std::string& from = msg.Require(field::FROM);
    const std::string& author = msg.Require(field::TO);
    const std::string key = core::LikeIndex::PostKey(author, msg.Require(field::POST_TIMESTAMP));
    bool changed = like ? m_likes.Like(key, from) : m_likes.Unlike(key, from);
    if (changed) {
        emitMessage(msg);
    }
}

void Router::handleInvite(const Message& msg) {
    const std::string& from = msg.Require(field::FROM);
    const std::string& to = msg.Require(field::TO);
    const std::string& gameId = msg.Require(field::GAMEID);
    const std::string& symbolField = msg.Require(field::SYMBOL);
    if (to != SelfUserId()) {
        return;
    }
    if (symbolField.size() != 1 || !core::IsValidSymbol(symbolField[0])) {
        throw core::InvalidMessageFormat("SYMBOL must be X or O, got '" + symbolField + "'");
    }
    if (m_games.Contains(gameId)) {
        throw core::InvalidMove("game " + gameId + " is already active, duplicate invite");
    }

    char inviterSymbol = symbolField[0];
    core::GameSession session(gameId, inviterSymbol == 'X' ? from : to,
                              inviterSymbol == 'X' ? to : from);
    session.Accept();
    if (msg.Has(field::POSITION)) {
        if (inviterSymbol != 'X') {
            throw core::InvalidMove("invite from O player carries an opening move");
        }
        session.ApplyMove(from, ParsePosition(msg.Require(field::POSITION)));
    }

    if (!m_games.Add(session)) {
        throw core::InvalidMove("game " + gameId + " is already active, duplicate invite");
    }
    lsnp::util::logger::info("[Router] Accepted game " + gameId + " from " + from);
    emitGame(session, msg);
}

void Router::handleMove(const Message& msg) {
    const std::string& from = msg.Require(field::FROM);
    const std::string& gameId = msg.Require(field::GAMEID);
    int position = ParsePosition(msg.Require(field::POSITION));
    const std::string& symbolField = msg.Require(field::SYMBOL);

    auto current = m_games.Find(gameId);
    if (!current) {
        throw core::GameNotFound(gameId);
    }
    if (symbolField.size() != 1 || current->SymbolOf(from) != symbolField[0]) {
        throw core::InvalidMove("SYMBOL '" + symbolField + "' does not belong to " + from);
    }

    core::MoveOutcome result = m_games.ApplyMove(gameId, from, position);
    emitGame(result.session, msg);
}

void Router::handleResult(const Message& msg) {
    const std::string& from = msg.Require(field::FROM);
    const std::string& gameId = msg.Require(field::GAMEID);
    const std::string& resultField = msg.Require(field::RESULT);

    auto current = m_games.Find(gameId);
    if (current && current->SymbolOf(from) == core::kEmptyCell) {
        throw core::InvalidMove(from + " is not playing in game " + gameId);
    }

    auto removed = m_games.Remove(gameId);
    if (!removed) {
        // Normal case: the final MOVE already completed and purged the session.
        lsnp::util::logger::debug("[Router] " + gameId + " finished: " + resultField);
        Event ev;
        ev.type = EventType::GAME_UPDATED;
        ev.userId = msg.Sender();
        ev.gameId = gameId;
        ev.message = msg;
        ev.detail = gameId + " COMPLETED " + resultField;
        emit(ev);
        return;
    }

    // The final MOVE was lost; take the peer's word for the outcome.
    core::Outcome outcome;
    outcome.result = resultField == "DRAW" ? core::GameResult::DRAW : core::GameResult::WIN;
    std::string symbol = msg.GetOr(field::SYMBOL, "");
    if (outcome.result == core::GameResult::WIN && symbol.size() == 1) {
        outcome.winner = symbol[0];
    }
    removed->Complete(outcome);
    emitGame(*removed, msg);
}

void Router::handleRevoke(const Message& msg) {
    const std::string& from = msg.Require(field::FROM);
    const std::string& token = msg.Require(field::TOKEN);
    auto parsed = security::Token::parse(token);
    if (!parsed) {
        throw core::InvalidMessageFormat("REVOKE carries a malformed token");
    }
    if (parsed->userId != from) {
        throw core::PermissionDenied(from + " cannot revoke a token issued to " + parsed->userId);
    }
    currentVerifier()->revoke(token);
}

// ---------------------------------------------------------------------------
//  Helpers
// ---------------------------------------------------------------------------

Peer Router::requirePeer(const std::string& userId) const {
    auto peer = m_registry.lookup(userId);
    if (!peer) {
        throw core::RecipientUnknown(userId);
    }
    return *peer;
}

bool Router::sendTo(const Peer& peer, const Message& msg) {
    return sendEncodedTo(peer, m_codec.encode(msg));
}

bool Router::sendEncodedTo(const Peer& peer, const std::string& bytes) {
    if (!m_transport.SendUnicast(bytes, peer.endpoint)) {
        lsnp::util::logger::warn("[Router] Send to " + peer.userId + " at " +
                                 peer.endpoint.ToString() + " failed");
        return false;
    }
    return true;
}

size_t Router::fanOut(const std::set<std::string>& recipients,
                      const std::function<Message(const std::string&)>& build) {
    size_t sent = 0;
    for (const auto& userId : recipients) {
        if (userId == SelfUserId()) {
            continue;
        }
        auto peer = m_registry.lookup(userId);
        if (!peer) {
            lsnp::util::logger::warn("[Router] Skipping unreachable member " + userId);
            continue;
        }
        if (sendTo(*peer, build(userId))) {
            ++sent;
        }
    }
    return sent;
}

void Router::emit(const Event& event) {
    EventCallback callback;
    {
        std::lock_guard<std::mutex> lock(m_callbackMutex);
        callback = m_eventCallback;
    }
    if (callback) {
        callback(event);
    }
}

void Router::emitMessage(const Message& msg) {
    Event ev;
    ev.type = EventType::MESSAGE_RECEIVED;
    ev.userId = msg.Sender();
    ev.message = msg;
    emit(ev);
}

void Router::emitGame(const core::GameSession& session, const std::optional<Message>& msg) {
    Event ev;
    ev.type = EventType::GAME_UPDATED;
    ev.userId = msg ? msg->Sender() : SelfUserId();
    ev.gameId = session.GameId();
    ev.message = msg;
    ev.detail = DescribeGame(session);
    emit(ev);
}

} // namespace node
} // namespace lsnp
