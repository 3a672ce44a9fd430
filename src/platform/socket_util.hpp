#pragma once

#include <string>
#include <poll.h>

namespace platform {

// Set a socket to non-blocking mode.
void set_nonblocking(int sock);

// Poll events on a single socket. Returns revents, or 0 on timeout.
int poll_socket(int sock, short events, int timeout_ms);

// Resolve host:port and open a non-blocking TCP connection, waiting up to
// timeout_secs for it to complete. Returns the socket, or -1 with `error` set.
int connect_tcp(const std::string& host, int port, int timeout_secs, std::string& error);

void close_socket(int sock);

} // namespace platform
