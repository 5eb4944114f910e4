#include "socket_util.hpp"

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
#include <cerrno>
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

static std::string last_socket_error(int err) {
#ifdef _WIN32
    return fmt::format("socket error {}", err);
#else
    return std::strerror(err);
#endif
}

socket_t connect_tcp(const std::string& host, int port, int timeout_ms,
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
        error = fmt::format("Failed to resolve host {}: {}", host, gai_strerror(gai));
        return SSHEXPECT_INVALID_SOCKET;
    }

    socket_t sock = SSHEXPECT_INVALID_SOCKET;
    error.clear();

    // Try each resolved address until one connects
    for (struct addrinfo* ai = res; ai; ai = ai->ai_next) {
        sock = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (sock == SSHEXPECT_INVALID_SOCKET) {
            error = "Failed to create socket";
            continue;
        }
        set_nonblocking(sock);

        int ret = connect(sock, ai->ai_addr, ai->ai_addrlen);
        if (ret == 0) break;
#ifdef _WIN32
        int err = WSAGetLastError();
        bool in_progress = (err == WSAEWOULDBLOCK);
#else
        int err = errno;
        bool in_progress = (err == EINPROGRESS);
#endif
        if (!in_progress) {
            error = fmt::format("Failed to connect: {}", last_socket_error(err));
            close_socket(sock);
            sock = SSHEXPECT_INVALID_SOCKET;
            continue;
        }

        // Wait for non-blocking connect to complete
        int revents = poll_socket(sock, POLLOUT, timeout_ms);
        if (revents == 0) {
            error = fmt::format("Connection timed out: {}:{}", host, port);
            close_socket(sock);
            sock = SSHEXPECT_INVALID_SOCKET;
            continue;
        }
        int sock_err = 0;
        socklen_t err_len = sizeof(sock_err);
        getsockopt(sock, SOL_SOCKET, SO_ERROR, reinterpret_cast<char*>(&sock_err), &err_len);
        if (sock_err != 0) {
            error = fmt::format("Connection failed: {}", last_socket_error(sock_err));
            close_socket(sock);
            sock = SSHEXPECT_INVALID_SOCKET;
            continue;
        }
        break;
    }

    freeaddrinfo(res);
    return sock;
}

void enable_keepalive(socket_t sock, int idle_secs, int interval_secs, int count) {
    int on = 1;
    setsockopt(sock, SOL_SOCKET, SO_KEEPALIVE, reinterpret_cast<const char*>(&on), sizeof(on));
#ifdef TCP_KEEPIDLE
    setsockopt(sock, IPPROTO_TCP, TCP_KEEPIDLE, reinterpret_cast<const char*>(&idle_secs), sizeof(idle_secs));
#endif
#ifdef TCP_KEEPINTVL
    setsockopt(sock, IPPROTO_TCP, TCP_KEEPINTVL, reinterpret_cast<const char*>(&interval_secs), sizeof(interval_secs));
#endif
#ifdef TCP_KEEPCNT
    setsockopt(sock, IPPROTO_TCP, TCP_KEEPCNT, reinterpret_cast<const char*>(&count), sizeof(count));
#endif
}

} // namespace platform
