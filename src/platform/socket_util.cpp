#include "socket_util.hpp"

#ifdef _WIN32
#  include <winsock2.h>
#  include <ws2tcpip.h>
#else
#  include <sys/socket.h>
#  include <netdb.h>
#  include <netinet/in.h>
#  include <netinet/tcp.h>
#  include <fcntl.h>
#  include <cerrno>
#  include <poll.h>
#  include <unistd.h>
#endif

#include <cstring>
#include <fmt/format.h>

namespace platform {

void init_networking() {
#ifdef _WIN32
    static bool initialized = false;
    if (!initialized) {
        WSADATA wsa;
        WSAStartup(MAKEWORD(2, 2), &wsa);
        initialized = true;
    }
#endif
}

void set_nonblocking(socket_t sock) {
#ifdef _WIN32
    u_long mode = 1;
    ioctlsocket(sock, FIONBIO, &mode);
#else
    int flags = fcntl(sock, F_GETFL, 0);
    fcntl(sock, F_SETFL, flags | O_NONBLOCK);
#endif
}

void set_blocking(socket_t sock) {
#ifdef _WIN32
    u_long mode = 0;
    ioctlsocket(sock, FIONBIO, &mode);
#else
    int flags = fcntl(sock, F_GETFL, 0);
    fcntl(sock, F_SETFL, flags & ~O_NONBLOCK);
#endif
}

int poll_socket(socket_t sock, short events, int timeout_ms) {
#ifdef _WIN32
    WSAPOLLFD pfd;
    pfd.fd = sock;
    pfd.events = events;
    pfd.revents = 0;
    int ret = WSAPoll(&pfd, 1, timeout_ms);
    return (ret > 0) ? pfd.revents : 0;
#else
    struct pollfd pfd;
    pfd.fd = sock;
    pfd.events = events;
    pfd.revents = 0;
    int ret = poll(&pfd, 1, timeout_ms);
    return (ret > 0) ? pfd.revents : 0;
#endif
}

void close_socket(socket_t sock) {
#ifdef _WIN32
    closesocket(sock);
#else
    close(sock);
#endif
}

// Try one resolved address with a non-blocking connect bounded by timeout_ms.
static bool try_connect(socket_t sock, const struct addrinfo* ai, int timeout_ms,
                        std::string& err) {
    set_nonblocking(sock);
    int ret = ::connect(sock, ai->ai_addr, static_cast<socklen_t>(ai->ai_addrlen));
    if (ret == 0) return true;
#ifdef _WIN32
    if (WSAGetLastError() != WSAEWOULDBLOCK) {
        err = "connect failed";
        return false;
    }
#else
    if (errno != EINPROGRESS) {
        err = fmt::format("connect failed: {}", std::strerror(errno));
        return false;
    }
#endif

    int revents = poll_socket(sock, POLLOUT, timeout_ms);
    if (revents == 0) {
        err = "connection timed out";
        return false;
    }
    int sock_err = 0;
    socklen_t err_len = sizeof(sock_err);
    getsockopt(sock, SOL_SOCKET, SO_ERROR, reinterpret_cast<char*>(&sock_err), &err_len);
    if (sock_err != 0) {
        err = fmt::format("connection failed: {}", std::strerror(sock_err));
        return false;
    }
    return true;
}

socket_t connect_tcp(const std::string& host, std::uint16_t port,
                     int timeout_ms, std::string& err) {
    init_networking();

    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    std::string port_str = std::to_string(port);
    struct addrinfo* res = nullptr;
    int gai = getaddrinfo(host.c_str(), port_str.c_str(), &hints, &res);
    if (gai != 0) {
        err = fmt::format("failed to resolve {}: {}", host, gai_strerror(gai));
        return SFTPOOL_INVALID_SOCKET;
    }

    socket_t sock = SFTPOOL_INVALID_SOCKET;
    for (auto* ai = res; ai != nullptr; ai = ai->ai_next) {
        sock = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (sock == SFTPOOL_INVALID_SOCKET) continue;
        if (try_connect(sock, ai, timeout_ms, err)) {
            set_blocking(sock);
            break;
        }
        close_socket(sock);
        sock = SFTPOOL_INVALID_SOCKET;
    }
    freeaddrinfo(res);

    if (sock == SFTPOOL_INVALID_SOCKET && err.empty()) {
        err = fmt::format("could not connect to {}:{}", host, port);
    }
    return sock;
}

void enable_keepalive(socket_t sock) {
    int tcp_keepalive = 1;
    setsockopt(sock, SOL_SOCKET, SO_KEEPALIVE, reinterpret_cast<const char*>(&tcp_keepalive), sizeof(tcp_keepalive));
    int keepidle = 60;
    int keepintvl = 15;
    int keepcnt = 4;
#ifdef TCP_KEEPIDLE
    setsockopt(sock, IPPROTO_TCP, TCP_KEEPIDLE, reinterpret_cast<const char*>(&keepidle), sizeof(keepidle));
#endif
#ifdef TCP_KEEPINTVL
    setsockopt(sock, IPPROTO_TCP, TCP_KEEPINTVL, reinterpret_cast<const char*>(&keepintvl), sizeof(keepintvl));
#endif
#ifdef TCP_KEEPCNT
    setsockopt(sock, IPPROTO_TCP, TCP_KEEPCNT, reinterpret_cast<const char*>(&keepcnt), sizeof(keepcnt));
#endif
    (void)keepidle; (void)keepintvl; (void)keepcnt;
}

} // namespace platform
