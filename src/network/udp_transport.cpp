#include "network/udp_transport.hpp"

#include <algorithm>
#include <cstring>

#include "util/logger.hpp"

namespace lsnp {
namespace network {

namespace {

bool fillAddress(const std::string& ip, uint16_t port, sockaddr_in& addr) {
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    return ::inet_pton(AF_INET, ip.c_str(), &addr.sin_addr) == 1;
}

std::string errorText(int err) {
    return std::to_string(err) + " (" + std::strerror(err) + ")";
}

} // namespace

UdpTransport::UdpTransport(const lsnp::config::NodeConfig& config)
    : m_bindAddress(config.bindAddress), m_advertisedIp(config.advertisedIp),
      m_requestedPort(config.peerPort), m_discoveryPort(config.discoveryPort),
      m_broadcastAddresses(config.broadcastAddresses), m_unicastSocket(INVALID_SOCKET),
      m_discoverySocket(INVALID_SOCKET), m_boundPort(0), m_isOpen(false) {
    initSockets();
}

UdpTransport::~UdpTransport() { Close(); }

bool UdpTransport::Open() {
    using lsnp::util::logger::Logger;
    std::lock_guard<std::mutex> lock(m_lifecycleMutex);

    if (m_isOpen) {
        Logger::getInstance().warn("[UdpTransport] Open called but transport is already open.");
        return true;
    }

    std::string error;
    m_unicastSocket = openSocket(m_requestedPort, false, error);
    if (m_unicastSocket == INVALID_SOCKET) {
        Logger::getInstance().error("[UdpTransport] Failed to open unicast socket on " +
                                    m_bindAddress + ":" + std::to_string(m_requestedPort) +
                                    ": " + error);
        return false;
    }

    sockaddr_in bound;
    socklen_t len = sizeof(bound);
    if (::getsockname(m_unicastSocket, reinterpret_cast<sockaddr*>(&bound), &len) != 0) {
        Logger::getInstance().error("[UdpTransport] getsockname failed: " +
                                    errorText(lastSocketError()));
        closeSocket(m_unicastSocket);
        m_unicastSocket = INVALID_SOCKET;
        return false;
    }
    m_boundPort = ntohs(bound.sin_port);

    m_discoverySocket = openSocket(m_discoveryPort, true, error);
    if (m_discoverySocket == INVALID_SOCKET) {
        Logger::getInstance().warn("[UdpTransport] Discovery port " +
                                   std::to_string(m_discoveryPort) +
                                   " unavailable, running unicast-only: " + error);
    }

    if (m_advertisedIp.empty()) {
        m_advertisedIp = DetectLocalIp();
    }

    m_isOpen = true;
    Logger::getInstance().info("[UdpTransport] Listening on " + m_bindAddress + ":" +
                               std::to_string(m_boundPort) + " (advertised " + m_advertisedIp +
                               "), discovery port " + std::to_string(m_discoveryPort));
    return true;
}

void UdpTransport::Close() {
    std::lock_guard<std::mutex> lock(m_lifecycleMutex);
    if (!m_isOpen) {
        return;
    }
    m_isOpen = false;

    // Wait out any in-flight poll/send before the descriptors go away.
    std::lock_guard<std::mutex> receiveLock(m_receiveMutex);
    std::lock_guard<std::mutex> sendLock(m_sendMutex);
    closeSockets();

    lsnp::util::logger::info("[UdpTransport] Sockets closed.");
}

Endpoint UdpTransport::LocalEndpoint() const {
    Endpoint ep;
    ep.ip = m_advertisedIp.empty() ? std::string("127.0.0.1") : m_advertisedIp;
    ep.port = m_boundPort;
    return ep;
}

bool UdpTransport::SendUnicast(const std::string& payload, const Endpoint& to) {
    std::lock_guard<std::mutex> lock(m_sendMutex);
    if (!m_isOpen) {
        lsnp::util::logger::warn("[UdpTransport] SendUnicast on a closed transport.");
        return false;
    }
    return sendTo(payload, to.ip, to.port);
}

bool UdpTransport::SendBroadcast(const std::string& payload) {
    std::lock_guard<std::mutex> lock(m_sendMutex);
    if (!m_isOpen) {
        lsnp::util::logger::warn("[UdpTransport] SendBroadcast on a closed transport.");
        return false;
    }

    bool sentToAtLeastOne = false;
    for (const auto& address : m_broadcastAddresses) {
        if (sendTo(payload, address, m_discoveryPort)) {
            sentToAtLeastOne = true;
        }
    }
    if (!sentToAtLeastOne) {
        lsnp::util::logger::warn("[UdpTransport] Broadcast reached no configured address.");
    }
    return sentToAtLeastOne;
}

std::optional<Datagram> UdpTransport::Receive(std::chrono::milliseconds timeout) {
    using lsnp::util::logger::Logger;
    std::lock_guard<std::mutex> lock(m_receiveMutex);
    if (!m_isOpen) {
        return std::nullopt;
    }

    pollfd_t fds[2];
    unsigned long count = 0;
    fds[count].fd = m_unicastSocket;
    fds[count].events = POLLIN;
    fds[count].revents = 0;
    ++count;
    if (m_discoverySocket != INVALID_SOCKET) {
        fds[count].fd = m_discoverySocket;
        fds[count].events = POLLIN;
        fds[count].revents = 0;
        ++count;
    }

    // a negative poll timeout waits forever
    auto waitMs = std::min<std::chrono::milliseconds::rep>(
        std::max<std::chrono::milliseconds::rep>(timeout.count(), 0), kMaxPollTimeoutMs);
    int ready = pollSockets(fds, count, static_cast<int>(waitMs));
    if (ready == 0) {
        return std::nullopt;
    }
    if (ready < 0) {
        int err = lastSocketError();
        if (isTransientSocketError(err)) {
            Logger::getInstance().debug("[UdpTransport] poll interrupted: " + errorText(err));
        } else {
            Logger::getInstance().error("[UdpTransport] poll failed: " + errorText(err));
        }
        return std::nullopt;
    }

    for (unsigned long i = 0; i < count; ++i) {
        if (fds[i].revents & (POLLIN | POLLERR)) {
            return readFrom(fds[i].fd);
        }
    }
    return std::nullopt;
}

std::string UdpTransport::DetectLocalIp() {
    initSockets();
    socket_t probe = ::socket(AF_INET, SOCK_DGRAM, 0);
    if (probe == INVALID_SOCKET) {
        return "127.0.0.1";
    }

    // connect() on UDP only selects a route, nothing is sent.
    std::string result = "127.0.0.1";
    sockaddr_in remote;
    if (fillAddress("8.8.8.8", 80, remote) &&
        ::connect(probe, reinterpret_cast<sockaddr*>(&remote), sizeof(remote)) == 0) {
        sockaddr_in local;
        socklen_t len = sizeof(local);
        if (::getsockname(probe, reinterpret_cast<sockaddr*>(&local), &len) == 0) {
            char ipStr[INET_ADDRSTRLEN];
            if (::inet_ntop(AF_INET, &local.sin_addr, ipStr, sizeof(ipStr)) != nullptr) {
                result = ipStr;
            }
        }
    }
    closeSocket(probe);
    if (result == "0.0.0.0") {
        result = "127.0.0.1";
    }
    return result;
}

socket_t UdpTransport::openSocket(uint16_t port, bool sharePort, std::string& error) {
    socket_t sock = ::socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP);
    if (sock == INVALID_SOCKET) {
        error = "socket() failed: " + errorText(lastSocketError());
        return INVALID_SOCKET;
    }

    int optval = 1;
    ::setsockopt(sock, SOL_SOCKET, SO_REUSEADDR, reinterpret_cast<const char*>(&optval),
                 sizeof(optval));
    ::setsockopt(sock, SOL_SOCKET, SO_BROADCAST, reinterpret_cast<const char*>(&optval),
                 sizeof(optval));
#ifdef SO_REUSEPORT
    if (sharePort) {
        ::setsockopt(sock, SOL_SOCKET, SO_REUSEPORT, reinterpret_cast<const char*>(&optval),
                     sizeof(optval));
    }
#else
    (void)sharePort;
#endif

    sockaddr_in addr;
    if (!fillAddress(m_bindAddress, port, addr)) {
        error = "invalid bind address " + m_bindAddress;
        closeSocket(sock);
        return INVALID_SOCKET;
    }
    if (::bind(sock, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
        error = "bind() failed: " + errorText(lastSocketError());
        closeSocket(sock);
        return INVALID_SOCKET;
    }
    return sock;
}

bool UdpTransport::sendTo(const std::string& payload, const std::string& ip, uint16_t port) {
    sockaddr_in addr;
    if (!fillAddress(ip, port, addr)) {
        lsnp::util::logger::warn("[UdpTransport] Invalid destination address: " + ip);
        return false;
    }
    auto sent = ::sendto(m_unicastSocket, payload.data(), static_cast<int>(payload.size()), 0,
                         reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    if (sent < 0 || static_cast<size_t>(sent) != payload.size()) {
        lsnp::util::logger::warn("[UdpTransport] sendto " + ip + ":" + std::to_string(port) +
                                 " failed: " + errorText(lastSocketError()));
        return false;
    }
    return true;
}

std::optional<Datagram> UdpTransport::readFrom(socket_t sock) {
    char buffer[kReceiveBufferSize];
    sockaddr_in from;
    socklen_t fromLen = sizeof(from);
    auto n = ::recvfrom(sock, buffer, static_cast<int>(sizeof(buffer)), 0,
                        reinterpret_cast<sockaddr*>(&from), &fromLen);
    if (n < 0) {
        int err = lastSocketError();
        if (isTransientSocketError(err)) {
            lsnp::util::logger::debug("[UdpTransport] transient receive error ignored: " +
                                      errorText(err));
        } else {
            lsnp::util::logger::warn("[UdpTransport] recvfrom failed: " + errorText(err));
        }
        return std::nullopt;
    }

    char ipStr[INET_ADDRSTRLEN];
    if (::inet_ntop(AF_INET, &from.sin_addr, ipStr, sizeof(ipStr)) == nullptr) {
        return std::nullopt;
    }

    Datagram dg;
    dg.payload.assign(buffer, static_cast<size_t>(n));
    dg.from.ip = ipStr;
    dg.from.port = ntohs(from.sin_port);
    return dg;
}

void UdpTransport::closeSockets() {
    if (m_unicastSocket != INVALID_SOCKET) {
        closeSocket(m_unicastSocket);
        m_unicastSocket = INVALID_SOCKET;
    }
    if (m_discoverySocket != INVALID_SOCKET) {
        closeSocket(m_discoverySocket);
        m_discoverySocket = INVALID_SOCKET;
    }
    m_boundPort = 0;
}

} // namespace network
} // namespace lsnp
