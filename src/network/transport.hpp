#ifndef LSNP_NETWORK_TRANSPORT_HPP
#define LSNP_NETWORK_TRANSPORT_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

/**
 * @file transport.hpp
 * @brief Abstract datagram endpoint used by the discovery service, the router and the
 *        peer node receive loop.
 *
 * Implementations:
 *   - UdpTransport (udp_transport.hpp): real sockets.
 *   - LoopbackNetwork endpoints (test/support): in-memory delivery for multi-peer tests.
 *
 * All operations are best effort. Sends report success as a bool and never throw for
 * network conditions; Receive returns std::nullopt on timeout or a transient error.
 */

namespace lsnp {
namespace network {

struct Endpoint
{
    std::string ip;
    uint16_t port = 0;

    std::string ToString() const { return ip + ":" + std::to_string(port); }

    bool operator==(const Endpoint& other) const { return ip == other.ip && port == other.port; }
    bool operator!=(const Endpoint& other) const { return !(*this == other); }
};

struct Datagram
{
    std::string payload;
    Endpoint from;
};

class Transport
{
  public:
    virtual ~Transport() = default;

    // Acquire sockets / register with the network. Returns false on failure.
    virtual bool Open() = 0;

    // Release resources; a Receive blocked in another thread returns promptly.
    virtual void Close() = 0;

    virtual bool IsOpen() const = 0;

    // Address other peers should use to reach this one (advertised in PEER_DISCOVERY).
    virtual Endpoint LocalEndpoint() const = 0;

    virtual bool SendUnicast(const std::string& payload, const Endpoint& to) = 0;

    // Delivers to every peer listening on the well-known discovery port.
    virtual bool SendBroadcast(const std::string& payload) = 0;

    virtual std::optional<Datagram> Receive(std::chrono::milliseconds timeout) = 0;
};

} // namespace network
} // namespace lsnp

#endif // LSNP_NETWORK_TRANSPORT_HPP
