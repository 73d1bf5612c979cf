#ifndef LSNP_SECURITY_TOKEN_VERIFIER_HPP
#define LSNP_SECURITY_TOKEN_VERIFIER_HPP

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_set>

#include "network/protocol_messages.hpp"
#include "util/hashing.hpp"
#include "util/logger.hpp"

/**
 * @file token_verifier.hpp
 * @brief Optional capability tokens of the form "user_id|expiry_unix|scope".
 *
 * DESIGN:
 *   - TokenIssuer builds tokens for outbound messages when attachTokens is enabled.
 *   - TokenVerifier is the pluggable inbound check. NoopTokenVerifier accepts everything
 *     and is the default; ScopedTokenVerifier enforces format, owner, expiry, scope and a
 *     revocation list.
 *   - Revoked tokens are remembered by SHA-256 digest only, capped at
 *     kMaxRevocations entries (oldest forgotten first).
 *
 * Scope per message type:
 *   POST, PROFILE, LIKE, UNLIKE  -> broadcast
 *   DM                           -> chat
 *   FOLLOW, UNFOLLOW             -> follow
 *   GROUP_*                      -> group
 *   TICTACTOE_*                  -> game
 *   discovery / peer lists / REVOKE carry no scope.
 */

namespace lsnp {
namespace security {

namespace scope {
constexpr const char* CHAT = "chat";
constexpr const char* BROADCAST = "broadcast";
constexpr const char* FOLLOW = "follow";
constexpr const char* GROUP = "group";
constexpr const char* GAME = "game";
} // namespace scope

/// Empty string for message types that need no token.
inline std::string scopeForType(const std::string &type)
{
    using namespace lsnp::network;
    if (type == msgtype::POST || type == msgtype::PROFILE || type == msgtype::LIKE ||
        type == msgtype::UNLIKE) {
        return scope::BROADCAST;
    }
    if (type == msgtype::DM) {
        return scope::CHAT;
    }
    if (type == msgtype::FOLLOW || type == msgtype::UNFOLLOW) {
        return scope::FOLLOW;
    }
    if (type == msgtype::GROUP_CREATE || type == msgtype::GROUP_UPDATE ||
        type == msgtype::GROUP_MESSAGE) {
        return scope::GROUP;
    }
    if (type == msgtype::TICTACTOE_INVITE || type == msgtype::TICTACTOE_MOVE ||
        type == msgtype::TICTACTOE_RESULT) {
        return scope::GAME;
    }
    return std::string();
}

inline uint64_t unixNow()
{
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count());
}

struct Token
{
    std::string userId;
    uint64_t expiry = 0;
    std::string scope;

    std::string toString() const
    {
        return userId + "|" + std::to_string(expiry) + "|" + scope;
    }

    static std::optional<Token> parse(const std::string &text)
    {
        auto first = text.find('|');
        if (first == std::string::npos) {
            return std::nullopt;
        }
        auto second = text.find('|', first + 1);
        if (second == std::string::npos || text.find('|', second + 1) != std::string::npos) {
            return std::nullopt;
        }
        Token t;
        t.userId = text.substr(0, first);
        std::string expiry = text.substr(first + 1, second - first - 1);
        t.scope = text.substr(second + 1);
        if (t.userId.empty() || t.scope.empty() || expiry.empty() || expiry.size() > 19 ||
            expiry.find_first_not_of("0123456789") != std::string::npos) {
            return std::nullopt;
        }
        t.expiry = std::stoull(expiry);
        return t;
    }
};

class TokenIssuer
{
public:
    TokenIssuer(const std::string &userId, uint64_t ttlSeconds)
        : userId_(userId)
        , ttlSeconds_(ttlSeconds)
    {
    }

    std::string issue(const std::string &scopeName, uint64_t now) const
    {
        Token t;
        t.userId = userId_;
        t.expiry = now + ttlSeconds_;
        t.scope = scopeName;
        return t.toString();
    }

private:
    std::string userId_;
    uint64_t ttlSeconds_;
};

/**
 * @class TokenVerifier
 * @brief Inbound authorization hook consulted by the router before any state change.
 */
class TokenVerifier
{
public:
    virtual ~TokenVerifier() = default;

    /**
     * @param msg decoded inbound message
     * @param reason set to a human readable cause when the message is rejected
     * @return true if the message may be applied
     */
    virtual bool verify(const lsnp::network::Message &msg, std::string &reason) = 0;

    /// Add a token to the revocation list (no-op for verifiers without one).
    virtual void revoke(const std::string &token) { (void)token; }
};

class NoopTokenVerifier : public TokenVerifier
{
public:
    bool verify(const lsnp::network::Message &, std::string &) override { return true; }
};

class ScopedTokenVerifier : public TokenVerifier
{
public:
    static constexpr size_t kMaxRevocations = 1000;

    using NowFn = std::function<uint64_t()>;

    ScopedTokenVerifier()
        : now_(&unixNow)
    {
    }

    explicit ScopedTokenVerifier(NowFn now)
        : now_(std::move(now))
    {
    }

    bool verify(const lsnp::network::Message &msg, std::string &reason) override
    {
        const std::string required = scopeForType(msg.Type());
        if (required.empty()) {
            return true;
        }

        auto raw = msg.Get(lsnp::network::field::TOKEN);
        if (!raw || raw->empty()) {
            reason = "missing token";
            return false;
        }
        if (isRevoked(*raw)) {
            reason = "token has been revoked";
            return false;
        }
        auto token = Token::parse(*raw);
        if (!token) {
            reason = "malformed token";
            return false;
        }
        if (token->userId != msg.Sender()) {
            reason = "token owner " + token->userId + " does not match sender " + msg.Sender();
            return false;
        }
        if (token->expiry < now_()) {
            reason = "token expired";
            return false;
        }
        if (token->scope != required) {
            reason = "token scope '" + token->scope + "' does not cover " + msg.Type() +
                     " (needs '" + required + "')";
            return false;
        }
        return true;
    }

    void revoke(const std::string &token) override
    {
        const std::string digest = lsnp::util::hashing::sha256(token);
        std::lock_guard<std::mutex> lock(mutex_);
        if (!revoked_.insert(digest).second) {
            return;
        }
        order_.push_back(digest);
        if (order_.size() > kMaxRevocations) {
            revoked_.erase(order_.front());
            order_.pop_front();
        }
        lsnp::util::logger::info("[TokenVerifier] Token revoked (" + std::to_string(order_.size()) +
                                 " on list)");
    }

    bool isRevoked(const std::string &token) const
    {
        const std::string digest = lsnp::util::hashing::sha256(token);
        std::lock_guard<std::mutex> lock(mutex_);
        return revoked_.count(digest) > 0;
    }

private:
    NowFn now_;
    std::unordered_set<std::string> revoked_;
    std::deque<std::string> order_;
    mutable std::mutex mutex_;
};

} // namespace security
} // namespace lsnp

#endif // LSNP_SECURITY_TOKEN_VERIFIER_HPP
