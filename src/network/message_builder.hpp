#ifndef LSNP_NETWORK_MESSAGE_BUILDER_HPP
#define LSNP_NETWORK_MESSAGE_BUILDER_HPP

#include <memory>
#include <string>

#include "protocol_messages.hpp"
#include "security/token_verifier.hpp"
#include "util/hashing.hpp"

namespace lsnp {
namespace network {

/*
  MessageBuilder
  --------------------------------
  Starts every outbound message with the mandatory header fields:
    TYPE, the sender key (USER_ID or FROM), TIMESTAMP, MESSAGE_ID
  and a TOKEN for the type's scope when a TokenIssuer is installed.
  MESSAGE_ID is 8 random bytes in lowercase hex.
*/
class MessageBuilder {
  public:
    explicit MessageBuilder(const std::string& selfUserId) : m_selfUserId(selfUserId) {}

    void SetTokenIssuer(std::shared_ptr<const security::TokenIssuer> issuer) {
        m_issuer = std::move(issuer);
    }

    const std::string& SelfUserId() const { return m_selfUserId; }

    Message Create(const std::string& type) const {
        Message msg(type);
        msg.Set(SenderKeyFor(type), m_selfUserId);
        uint64_t now = security::unixNow();
        msg.Set(field::TIMESTAMP, now);
        msg.Set(field::MESSAGE_ID, NewMessageId());
        if (m_issuer) {
            std::string scopeName = security::scopeForType(type);
            if (!scopeName.empty()) {
                msg.Set(field::TOKEN, m_issuer->issue(scopeName, now));
            }
        }
        return msg;
    }

    static std::string NewMessageId() { return lsnp::util::hashing::randomHex(8); }

    static const char* SenderKeyFor(const std::string& type) {
        if (type == msgtype::PEER_DISCOVERY || type == msgtype::POST || type == msgtype::PROFILE) {
            return field::USER_ID;
        }
        return field::FROM;
    }

  private:
    std::string m_selfUserId;
    std::shared_ptr<const security::TokenIssuer> m_issuer;
};

} // namespace network
} // namespace lsnp

#endif // LSNP_NETWORK_MESSAGE_BUILDER_HPP
