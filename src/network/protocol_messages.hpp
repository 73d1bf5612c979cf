#ifndef LSNP_PROTOCOL_MESSAGES_HPP
#define LSNP_PROTOCOL_MESSAGES_HPP

#include <algorithm>
#include <cstdint>
#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "core/errors.hpp"

namespace lsnp {
namespace network {

/*
  protocol_messages.hpp
  --------------------------------
  The LSNP message model shared by the codec, the discovery service and the router.

  A Message is an open, ordered list of KEY -> VALUE string fields. Keys are unique;
  setting an existing key replaces its value in place so the wire order stays stable.
  Unknown keys are carried along untouched, which keeps older peers compatible with
  newer message types.

  Every message carries TYPE, MESSAGE_ID, TIMESTAMP and a sender key. The sender key is
  USER_ID for PEER_DISCOVERY, POST and PROFILE and FROM for everything else.
*/

namespace msgtype {
constexpr const char* POST = "POST";
constexpr const char* DM = "DM";
constexpr const char* PROFILE = "PROFILE";
constexpr const char* PEER_DISCOVERY = "PEER_DISCOVERY";
constexpr const char* PEER_LIST_REQUEST = "PEER_LIST_REQUEST";
constexpr const char* PEER_LIST_RESPONSE = "PEER_LIST_RESPONSE";
constexpr const char* FOLLOW = "FOLLOW";
constexpr const char* UNFOLLOW = "UNFOLLOW";
constexpr const char* GROUP_CREATE = "GROUP_CREATE";
constexpr const char* GROUP_UPDATE = "GROUP_UPDATE";
constexpr const char* GROUP_MESSAGE = "GROUP_MESSAGE";
constexpr const char* LIKE = "LIKE";
constexpr const char* UNLIKE = "UNLIKE";
constexpr const char* TICTACTOE_INVITE = "TICTACTOE_INVITE";
constexpr const char* TICTACTOE_MOVE = "TICTACTOE_MOVE";
constexpr const char* TICTACTOE_RESULT = "TICTACTOE_RESULT";
constexpr const char* REVOKE = "REVOKE";
} // namespace msgtype

namespace field {
constexpr const char* TYPE = "TYPE";
constexpr const char* MESSAGE_ID = "MESSAGE_ID";
constexpr const char* TIMESTAMP = "TIMESTAMP";
constexpr const char* USER_ID = "USER_ID";
constexpr const char* FROM = "FROM";
constexpr const char* TO = "TO";
constexpr const char* PORT = "PORT";
constexpr const char* CONTENT = "CONTENT";
constexpr const char* TTL = "TTL";
constexpr const char* TOKEN = "TOKEN";
constexpr const char* DISPLAY_NAME = "DISPLAY_NAME";
constexpr const char* STATUS = "STATUS";
constexpr const char* AVATAR_TYPE = "AVATAR_TYPE";
constexpr const char* AVATAR_ENCODING = "AVATAR_ENCODING";
constexpr const char* AVATAR_DATA = "AVATAR_DATA";
constexpr const char* PEERS = "PEERS";
constexpr const char* COUNT = "COUNT";
constexpr const char* GROUP_ID = "GROUP_ID";
constexpr const char* GROUP_NAME = "GROUP_NAME";
constexpr const char* MEMBERS = "MEMBERS";
constexpr const char* ADD = "ADD";
constexpr const char* REMOVE = "REMOVE";
constexpr const char* POST_TIMESTAMP = "POST_TIMESTAMP";
constexpr const char* GAMEID = "GAMEID";
constexpr const char* SYMBOL = "SYMBOL";
constexpr const char* POSITION = "POSITION";
constexpr const char* TURN = "TURN";
constexpr const char* RESULT = "RESULT";
constexpr const char* WINNING_LINE = "WINNING_LINE";
} // namespace field

class Message
{
  public:
    using Field = std::pair<std::string, std::string>;

    Message() = default;

    explicit Message(const std::string& type) { Set(field::TYPE, type); }

    // Replaces the value if key is present, appends otherwise.
    Message& Set(const std::string& key, const std::string& value) {
        auto it = find(key);
        if (it != m_fields.end()) {
            it->second = value;
        } else {
            m_fields.emplace_back(key, value);
        }
        return *this;
    }

    Message& Set(const std::string& key, uint64_t value) {
        return Set(key, std::to_string(value));
    }

    bool Has(const std::string& key) const { return find(key) != m_fields.end(); }

    std::optional<std::string> Get(const std::string& key) const {
        auto it = find(key);
        if (it == m_fields.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::string GetOr(const std::string& key, const std::string& fallback) const {
        auto it = find(key);
        return it == m_fields.end() ? fallback : it->second;
    }

    // Throws InvalidMessageFormat when the key is missing or empty.
    const std::string& Require(const std::string& key) const {
        auto it = find(key);
        if (it == m_fields.end() || it->second.empty()) {
            throw core::InvalidMessageFormat(GetOr(field::TYPE, "<untyped>") +
                                             " is missing mandatory field " + key);
        }
        return it->second;
    }

    // Unsigned decimal field; throws InvalidMessageFormat if absent or not a number.
    uint64_t RequireUInt(const std::string& key) const {
        const std::string& raw = Require(key);
        if (!std::all_of(raw.begin(), raw.end(), [](char c) { return c >= '0' && c <= '9'; }) ||
            raw.size() > 19) {
            throw core::InvalidMessageFormat("field " + key + " is not an unsigned integer: " + raw);
        }
        return std::stoull(raw);
    }

    bool Erase(const std::string& key) {
        auto it = find(key);
        if (it == m_fields.end()) {
            return false;
        }
        m_fields.erase(it);
        return true;
    }

    std::string Type() const { return GetOr(field::TYPE, ""); }
    std::string MessageId() const { return GetOr(field::MESSAGE_ID, ""); }

    // FROM when present, USER_ID otherwise.
    std::string Sender() const {
        auto from = Get(field::FROM);
        if (from && !from->empty()) {
            return *from;
        }
        return GetOr(field::USER_ID, "");
    }

    const std::vector<Field>& Fields() const { return m_fields; }
    size_t Size() const { return m_fields.size(); }

    bool operator==(const Message& other) const { return m_fields == other.m_fields; }
    bool operator!=(const Message& other) const { return !(*this == other); }

  private:
    std::vector<Field>::iterator find(const std::string& key) {
        return std::find_if(m_fields.begin(), m_fields.end(),
                            [&](const Field& f) { return f.first == key; });
    }
    std::vector<Field>::const_iterator find(const std::string& key) const {
        return std::find_if(m_fields.begin(), m_fields.end(),
                            [&](const Field& f) { return f.first == key; });
    }

    std::vector<Field> m_fields;
};

// Comma separated list fields (MEMBERS, ADD, REMOVE, PEERS, WINNING_LINE).
inline std::vector<std::string> SplitList(const std::string& value, char sep = ',') {
    std::vector<std::string> out;
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, sep)) {
        auto b = item.find_first_not_of(" \t");
        auto e = item.find_last_not_of(" \t");
        if (b == std::string::npos) {
            continue;
        }
        out.push_back(item.substr(b, e - b + 1));
    }
    return out;
}

template <typename Container>
std::string JoinList(const Container& items, char sep = ',') {
    std::string out;
    for (const auto& item : items) {
        if (!out.empty()) {
            out += sep;
        }
        out += item;
    }
    return out;
}

} // namespace network
} // namespace lsnp

#endif // LSNP_PROTOCOL_MESSAGES_HPP
