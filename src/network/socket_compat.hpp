#ifndef LSNP_NETWORK_SOCKET_COMPAT_HPP
#define LSNP_NETWORK_SOCKET_COMPAT_HPP

/*
  socket_compat.hpp
  --------------------------------
  Thin portability layer over BSD sockets / Winsock2 for the UDP transport.
  Provides socket_t, INVALID_SOCKET, initSockets(), closeSocket(), lastSocketError()
  and pollSockets() so the transport code itself stays free of #ifdefs.
*/

#ifdef _WIN32
#include <winsock2.h>
#include <ws2tcpip.h>
#pragma comment(lib, "ws2_32.lib")
typedef int socklen_t;
typedef SOCKET socket_t;
#else
#include <arpa/inet.h>
#include <errno.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>
typedef int socket_t;
#ifndef INVALID_SOCKET
#define INVALID_SOCKET (-1)
#endif
#endif

namespace lsnp {
namespace network {

inline bool initSockets() {
#ifdef _WIN32
    static bool initialized = false;
    if (!initialized) {
        WSADATA wsaData;
        if (WSAStartup(MAKEWORD(2, 2), &wsaData) != 0) {
            return false;
        }
        initialized = true;
    }
#endif
    return true;
}

inline void closeSocket(socket_t sock) {
#ifdef _WIN32
    ::closesocket(sock);
#else
    ::close(sock);
#endif
}

inline int lastSocketError() {
#ifdef _WIN32
    return WSAGetLastError();
#else
    return errno;
#endif
}

// Errors a UDP receive may report that do not mean the socket is broken.
// ICMP port-unreachable from an earlier send surfaces as a connection reset.
inline bool isTransientSocketError(int err) {
#ifdef _WIN32
    return err == WSAECONNRESET || err == WSAEWOULDBLOCK || err == WSAEINTR ||
           err == WSAEMSGSIZE;
#else
    return err == ECONNRESET || err == ECONNREFUSED || err == EAGAIN || err == EWOULDBLOCK ||
           err == EINTR;
#endif
}

#ifdef _WIN32
typedef WSAPOLLFD pollfd_t;
inline int pollSockets(pollfd_t* fds, unsigned long count, int timeoutMs) {
    return ::WSAPoll(fds, count, timeoutMs);
}
#else
typedef struct pollfd pollfd_t;
inline int pollSockets(pollfd_t* fds, unsigned long count, int timeoutMs) {
    return ::poll(fds, static_cast<nfds_t>(count), timeoutMs);
}
#endif

} // namespace network
} // namespace lsnp

#endif // LSNP_NETWORK_SOCKET_COMPAT_HPP
