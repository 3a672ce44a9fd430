#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <core/types.hpp>

// libssh2 forward declarations
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;
typedef struct _LIBSSH2_CHANNEL LIBSSH2_CHANNEL;

struct SessionTarget {
    std::string host;
    std::string user;
    std::string password;
    int port = 22;
    int timeout = 30;
    std::optional<std::string> ssh_key_path;
};

// One authenticated SSH transport to a queue head node. Commands run on
// fresh exec channels, so output is binary-clean and the exit status is the
// remote command's own.
class SessionManager {
public:
    explicit SessionManager(const SessionTarget& target);
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    CommandResult establish(StatusCallback callback = nullptr);
    bool check_alive();

    // Run one command and collect stdout, stderr and the exit status.
    CommandResult exec(const std::string& command, int timeout_secs = 0);

    const std::string& get_target() const { return target_str_; }

private:
    SessionTarget target_;
    LIBSSH2_SESSION* session_;
    int sock_;
    bool active_;
    std::string target_str_;
    std::mutex io_mutex_;

    void close();
    CommandResult ssh_userauth(StatusCallback callback);
    void teardown(const char* reason);
};
