#ifndef LSNP_NETWORK_UDP_TRANSPORT_HPP
#define LSNP_NETWORK_UDP_TRANSPORT_HPP

#include <atomic>
#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "config/node_config.hpp"
#include "socket_compat.hpp"
#include "transport.hpp"

namespace lsnp {
namespace network {

/*
  UdpTransport
  --------------------------------
  Two IPv4 UDP sockets:
    - the unicast socket, bound to bindAddress:peerPort (0 = ephemeral). Every send
      leaves from it, so a peer's source port is also its listening port.
    - the discovery socket, bound to the well-known discoveryPort with address/port
      reuse so several peers on one host can share it. Failure to bind it is not fatal:
      the transport then runs unicast-only and logs a warning.

  Receive() polls both sockets with a bounded timeout. Connection resets caused by
  ICMP port-unreachable replies and other transient errors are logged and reported as
  "no datagram" so the caller's loop keeps running.

  Close() may be called from another thread while Receive() is polling; it waits for
  the in-flight poll (bounded by its timeout) before the descriptors are released.
*/
class UdpTransport : public Transport {
  public:
    static constexpr size_t kReceiveBufferSize = 65536;
    static constexpr long long kMaxPollTimeoutMs = 60000;

    explicit UdpTransport(const lsnp::config::NodeConfig& config);
    ~UdpTransport() override;

    UdpTransport(const UdpTransport&) = delete;
    UdpTransport& operator=(const UdpTransport&) = delete;

    bool Open() override;
    void Close() override;
    bool IsOpen() const override { return m_isOpen.load(); }

    Endpoint LocalEndpoint() const override;

    bool SendUnicast(const std::string& payload, const Endpoint& to) override;
    bool SendBroadcast(const std::string& payload) override;

    std::optional<Datagram> Receive(std::chrono::milliseconds timeout) override;

    bool HasDiscoverySocket() const { return m_discoverySocket != INVALID_SOCKET; }

    // Outbound interface address as seen by the routing table, "127.0.0.1" if offline.
    static std::string DetectLocalIp();

  private:
    socket_t openSocket(uint16_t port, bool sharePort, std::string& error);
    bool sendTo(const std::string& payload, const std::string& ip, uint16_t port);
    std::optional<Datagram> readFrom(socket_t sock);
    void closeSockets();

    std::string m_bindAddress;
    std::string m_advertisedIp;
    uint16_t m_requestedPort;
    uint16_t m_discoveryPort;
    std::vector<std::string> m_broadcastAddresses;

    socket_t m_unicastSocket;
    socket_t m_discoverySocket;
    uint16_t m_boundPort;
    std::atomic<bool> m_isOpen;

    std::mutex m_lifecycleMutex;
    std::mutex m_receiveMutex;
    std::mutex m_sendMutex;
};

} // namespace network
} // namespace lsnp

#endif // LSNP_NETWORK_UDP_TRANSPORT_HPP
