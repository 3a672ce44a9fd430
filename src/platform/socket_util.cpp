#include "socket_util.hpp"

#include <sys/socket.h>
#include <netdb.h>
#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

namespace platform {

void set_nonblocking(int sock) {
    int flags = fcntl(sock, F_GETFL, 0);
    fcntl(sock, F_SETFL, flags | O_NONBLOCK);
}

int poll_socket(int sock, short events, int timeout_ms) {
    struct pollfd pfd;
    pfd.fd = sock;
    pfd.events = events;
    pfd.revents = 0;
    int ret = poll(&pfd, 1, timeout_ms);
    return (ret > 0) ? pfd.revents : 0;
}

int connect_tcp(const std::string& host, int port, int timeout_secs, std::string& error) {
    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* res = nullptr;
    int gai = getaddrinfo(host.c_str(), std::to_string(port).c_str(), &hints, &res);
    if (gai != 0) {
        error = "Failed to resolve host " + host + ": " + gai_strerror(gai);
        return -1;
    }

    int sock = -1;
    for (struct addrinfo* ai = res; ai; ai = ai->ai_next) {
        sock = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (sock < 0) continue;
        set_nonblocking(sock);

        int ret = connect(sock, ai->ai_addr, ai->ai_addrlen);
        if (ret == 0) break;
        if (errno == EINPROGRESS) {
            int revents = poll_socket(sock, POLLOUT, timeout_secs * 1000);
            int sock_err = 0;
            socklen_t err_len = sizeof(sock_err);
            if (revents != 0 &&
                getsockopt(sock, SOL_SOCKET, SO_ERROR, &sock_err, &err_len) == 0 &&
                sock_err == 0) {
                break;
            }
            error = revents == 0 ? "Connection timed out: " + host
                                 : "Connection failed: " + std::string(strerror(sock_err));
        } else {
            error = "Failed to connect: " + std::string(strerror(errno));
        }
        close(sock);
        sock = -1;
    }
    freeaddrinfo(res);
    if (sock >= 0) error.clear();
    return sock;
}

void close_socket(int sock) {
    close(sock);
}

} // namespace platform
