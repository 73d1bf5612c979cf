#ifndef LSNP_NODE_EVENTS_HPP
#define LSNP_NODE_EVENTS_HPP

#include <functional>
#include <optional>
#include <string>

#include "network/protocol_messages.hpp"

namespace lsnp {
namespace node {

/*
  Inbound event stream handed to the front end.
    PEER_JOINED / PEER_LEFT   userId set
    MESSAGE_RECEIVED          userId = sender, message = decoded message
    GAME_UPDATED              gameId set, detail = board + state, message when remote
*/

enum class EventType {
    PEER_JOINED,
    PEER_LEFT,
    MESSAGE_RECEIVED,
    GAME_UPDATED
};

struct Event
{
    EventType type = EventType::MESSAGE_RECEIVED;
    std::string userId;
    std::optional<lsnp::network::Message> message;
    std::string gameId;
    std::string detail;
};

using EventCallback = std::function<void(const Event&)>;

inline const char* EventTypeName(EventType type) {
    switch (type) {
    case EventType::PEER_JOINED:
        return "PEER_JOINED";
    case EventType::PEER_LEFT:
        return "PEER_LEFT";
    case EventType::MESSAGE_RECEIVED:
        return "MESSAGE_RECEIVED";
    case EventType::GAME_UPDATED:
        return "GAME_UPDATED";
    }
    return "UNKNOWN";
}

} // namespace node
} // namespace lsnp

#endif // LSNP_NODE_EVENTS_HPP
