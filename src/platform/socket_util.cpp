#include "socket_util.hpp"
#include <chrono>
#include <cstring>
#include <cerrno>

#ifdef _WIN32
#  include <winsock2.h>
#  include <ws2tcpip.h>
#else
#  include <sys/socket.h>
#  include <netinet/in.h>
#  include <netinet/tcp.h>
#  include <netdb.h>
#  include <fcntl.h>
#  include <poll.h>
#  include <unistd.h>
#endif

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

socket_t tcp_connect(const std::string& host, int port, int timeout_ms,
                     const std::function<bool()>& should_abort,
                     std::string& error) {
    init_networking();

    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* res = nullptr;
    std::string port_str = std::to_string(port);
    int gai = getaddrinfo(host.c_str(), port_str.c_str(), &hints, &res);
    if (gai != 0 || !res) {
        error = "Failed to resolve host: " + host;
        return AVLINK_INVALID_SOCKET;
    }

    socket_t sock = socket(res->ai_family, res->ai_socktype, res->ai_protocol);
    if (sock == AVLINK_INVALID_SOCKET) {
        freeaddrinfo(res);
        error = "Failed to create socket";
        return AVLINK_INVALID_SOCKET;
    }

    set_nonblocking(sock);

    int ret = ::connect(sock, res->ai_addr, static_cast<socklen_t>(res->ai_addrlen));
    freeaddrinfo(res);
    if (ret == 0) return sock;

#ifdef _WIN32
    bool in_progress = WSAGetLastError() == WSAEWOULDBLOCK;
#else
    bool in_progress = errno == EINPROGRESS;
#endif
    if (!in_progress) {
        error = "Failed to connect: " + std::string(strerror(errno));
        close_socket(sock);
        return AVLINK_INVALID_SOCKET;
    }

    // Wait for the non-blocking connect in slices so the caller can abort
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (true) {
        if (should_abort && should_abort()) {
            error = "Connection attempt cancelled";
            close_socket(sock);
            return AVLINK_INVALID_SOCKET;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            error = "Connection timed out: " + host;
            close_socket(sock);
            return AVLINK_INVALID_SOCKET;
        }
        if (poll_socket(sock, POLLOUT, 100) != 0) break;
    }

    int sock_err = 0;
    socklen_t err_len = sizeof(sock_err);
    getsockopt(sock, SOL_SOCKET, SO_ERROR, reinterpret_cast<char*>(&sock_err), &err_len);
    if (sock_err != 0) {
        error = "Connection failed: " + std::string(strerror(sock_err));
        close_socket(sock);
        return AVLINK_INVALID_SOCKET;
    }
    return sock;
}

void enable_tcp_keepalive(socket_t sock) {
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
}

} // namespace platform
