#include "session.hpp"
#include <core/constants.hpp>
#include <platform/platform.hpp>
#include <platform/socket_util.hpp>
#include <libssh2.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <chrono>
#include <cstring>

namespace {

// Data passed to keyboard-interactive callback via session abstract pointer
struct KbdAuthData {
    std::string password;
};

// Answers every prompt with the configured password
void kbd_callback(const char* /*name*/, int /*name_len*/,
                  const char* /*instruction*/, int /*instruction_len*/,
                  int num_prompts,
                  const LIBSSH2_USERAUTH_KBDINT_PROMPT* /*prompts*/,
                  LIBSSH2_USERAUTH_KBDINT_RESPONSE* responses,
                  void** abstract) {
    auto* data = static_cast<KbdAuthData*>(*abstract);
    for (int i = 0; i < num_prompts; i++) {
        responses[i].text = strdup(data->password.c_str());
        responses[i].length = static_cast<unsigned int>(data->password.length());
    }
}

} // namespace

SessionManager::SessionManager(const SessionTarget& target)
    : target_(target), session_(nullptr), sock_(-1), active_(false) {
}

SessionManager::~SessionManager() {
    close();
}

void SessionManager::teardown(const char* reason) {
    if (session_) {
        libssh2_session_disconnect(session_, reason);
        libssh2_session_free(session_);
        session_ = nullptr;
    }
    if (sock_ >= 0) {
        platform::close_socket(sock_);
        sock_ = -1;
    }
}

CommandResult SessionManager::establish(StatusCallback callback) {
    if (callback) {
        callback("Connecting to " + target_.host + "...");
    }

    int rc = libssh2_init(0);
    if (rc != 0) {
        return CommandResult{-1, "", "Failed to initialize libssh2"};
    }

    std::string error;
    sock_ = platform::connect_tcp(target_.host, target_.port, target_.timeout, error);
    if (sock_ < 0) {
        return CommandResult{-1, "", error};
    }

    if (callback) callback("TCP connected, starting SSH handshake...");

    session_ = libssh2_session_init_ex(nullptr, nullptr, nullptr, nullptr);
    if (!session_) {
        teardown("Session init failed");
        return CommandResult{-1, "", "Failed to create SSH session"};
    }

    libssh2_session_set_blocking(session_, 0);

    int ret;
    while ((ret = libssh2_session_handshake(session_, sock_)) == LIBSSH2_ERROR_EAGAIN) {
        platform::sleep_ms(100);
    }
    if (ret != 0) {
        teardown("Handshake failed");
        return CommandResult{-1, "", "SSH handshake failed"};
    }

    int tcp_keepalive = 1;
    setsockopt(sock_, SOL_SOCKET, SO_KEEPALIVE, &tcp_keepalive, sizeof(tcp_keepalive));
#ifdef TCP_KEEPIDLE
    int keepidle = 60;
    setsockopt(sock_, IPPROTO_TCP, TCP_KEEPIDLE, &keepidle, sizeof(keepidle));
#endif
    libssh2_keepalive_config(session_, 1, 30);

    if (callback) callback("SSH handshake complete, authenticating...");

    auto auth_result = ssh_userauth(callback);
    if (auth_result.failed()) {
        teardown("Authentication failed");
        return auth_result;
    }

    active_ = true;
    target_str_ = target_.user + "@" + target_.host;

    if (callback) {
        callback("Connected to " + target_.host);
    }
    return CommandResult{0, "", ""};
}

CommandResult SessionManager::ssh_userauth(StatusCallback callback) {
    int ret;

    char* auth_list = nullptr;
    while ((auth_list = libssh2_userauth_list(session_, target_.user.c_str(),
                                              static_cast<unsigned int>(target_.user.length()))) == nullptr) {
        if (libssh2_session_last_errno(session_) != LIBSSH2_ERROR_EAGAIN) {
            break;
        }
        platform::sleep_ms(100);
    }
    std::string methods = auth_list ? auth_list : "";

    if (target_.ssh_key_path && methods.find("publickey") != std::string::npos) {
        if (callback) callback("Using public key auth...");
        std::string pub = *target_.ssh_key_path + ".pub";
        while ((ret = libssh2_userauth_publickey_fromfile(
                    session_, target_.user.c_str(), pub.c_str(),
                    target_.ssh_key_path->c_str(),
                    target_.password.empty() ? nullptr : target_.password.c_str()))
               == LIBSSH2_ERROR_EAGAIN) {
            platform::sleep_ms(100);
        }
        if (ret == 0) return CommandResult{0, "", ""};
        if (callback) callback("Public key rejected, trying password...");
    }

    if (methods.empty() || methods.find("password") != std::string::npos) {
        while ((ret = libssh2_userauth_password(session_,
                target_.user.c_str(), target_.password.c_str())) == LIBSSH2_ERROR_EAGAIN) {
            platform::sleep_ms(100);
        }
        if (ret == 0) return CommandResult{0, "", ""};
    }

    if (methods.find("keyboard-interactive") != std::string::npos) {
        KbdAuthData kbd_data{target_.password};
        *libssh2_session_abstract(session_) = &kbd_data;
        while ((ret = libssh2_userauth_keyboard_interactive(session_,
                target_.user.c_str(), kbd_callback)) == LIBSSH2_ERROR_EAGAIN) {
            platform::sleep_ms(100);
        }
        *libssh2_session_abstract(session_) = nullptr;
        if (ret == 0) return CommandResult{0, "", ""};
    }

    return CommandResult{-1, "", "Authentication failed for " + target_.user + "@" + target_.host};
}

CommandResult SessionManager::exec(const std::string& command, int timeout_secs) {
    std::lock_guard<std::mutex> lock(io_mutex_);
    if (!active_ || !session_) {
        return CommandResult{-1, "", "No SSH session"};
    }

    int effective_timeout = (timeout_secs > 0) ? timeout_secs : SSH_CMD_TIMEOUT_SECS;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(effective_timeout);

    // Open a new exec channel (no PTY)
    LIBSSH2_CHANNEL* ch = nullptr;
    while ((ch = libssh2_channel_open_session(session_)) == nullptr) {
        if (libssh2_session_last_errno(session_) != LIBSSH2_ERROR_EAGAIN ||
            std::chrono::steady_clock::now() >= deadline) {
            active_ = false;
            return CommandResult{-1, "", "Failed to open exec channel"};
        }
        platform::sleep_ms(10);
    }

    int rc;
    while ((rc = libssh2_channel_exec(ch, command.c_str())) == LIBSSH2_ERROR_EAGAIN) {
        platform::sleep_ms(10);
    }
    if (rc != 0) {
        libssh2_channel_free(ch);
        return CommandResult{-1, "", "Failed to exec command on channel"};
    }

    // Read stdout and stderr until the channel closes
    std::string output;
    std::string stderr_data;
    char buf[SSH_READ_BUF_SIZE];
    bool timed_out = true;
    while (std::chrono::steady_clock::now() < deadline) {
        ssize_t n = libssh2_channel_read(ch, buf, sizeof(buf));
        if (n > 0) {
            output.append(buf, static_cast<size_t>(n));
            continue;
        }
        ssize_t m = libssh2_channel_read_stderr(ch, buf, sizeof(buf));
        if (m > 0) {
            stderr_data.append(buf, static_cast<size_t>(m));
            continue;
        }
        if ((n == 0 || n == LIBSSH2_ERROR_EAGAIN) && libssh2_channel_eof(ch)) {
            timed_out = false;
            break;
        }
        if (n < 0 && n != LIBSSH2_ERROR_EAGAIN) {
            stderr_data += "SSH channel read error";
            timed_out = false;
            break;
        }
        platform::sleep_ms(10);
    }

    int exit_status = -1;
    while ((rc = libssh2_channel_close(ch)) == LIBSSH2_ERROR_EAGAIN) {
        platform::sleep_ms(10);
    }
    if (rc == 0 && !timed_out) {
        exit_status = libssh2_channel_get_exit_status(ch);
    }
    libssh2_channel_free(ch);

    if (timed_out) {
        stderr_data += "Command timed out after " + std::to_string(effective_timeout) + "s";
    }
    return CommandResult{exit_status, output, stderr_data};
}

void SessionManager::close() {
    std::lock_guard<std::mutex> lock(io_mutex_);
    active_ = false;
    teardown("Normal disconnection");
}

bool SessionManager::check_alive() {
    std::lock_guard<std::mutex> lock(io_mutex_);
    if (!active_ || !session_ || sock_ < 0) return false;

    int seconds_to_next = 0;
    if (libssh2_keepalive_send(session_, &seconds_to_next) != 0) {
        active_ = false;
        return false;
    }

    int revents = platform::poll_socket(sock_, POLLIN, 0);
    if (revents & (POLLERR | POLLHUP | POLLNVAL)) {
        active_ = false;
        return false;
    }
    return true;
}
