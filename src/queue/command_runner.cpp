#include "command_runner.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <platform/process.hpp>

CommandResult LocalRunner::run(const std::string& command) {
    log_debug("queue", "$ " + command);
    return platform::run_shell(command);
}

SSHRunner::SSHRunner(const QueueConfig& config) {
    target_.host = config.host;
    target_.user = config.user;
    target_.password = config.password;
    target_.port = config.port;
    target_.timeout = SSH_CONNECT_TIMEOUT_SECS;
    target_.ssh_key_path = config.ssh_key_path;
}

CommandResult SSHRunner::ensure_session() {
    if (session_ && session_->check_alive()) {
        return CommandResult{0, "", ""};
    }
    session_ = std::make_unique<SessionManager>(target_);
    auto result = session_->establish([](const std::string& msg) { log_debug("queue", msg); });
    if (result.failed()) {
        session_.reset();
        log_warning("queue", "SSH connection to " + target_.host + " failed: " + result.stderr_data);
    }
    return result;
}

CommandResult SSHRunner::run(const std::string& command) {
    auto conn = ensure_session();
    if (conn.failed()) return conn;

    log_debug("queue", session_->get_target() + " $ " + command);
    return session_->exec(command);
}

std::unique_ptr<CommandRunner> make_command_runner(const QueueConfig& config) {
    if (config.host.empty()) {
        return std::make_unique<LocalRunner>();
    }
    return std::make_unique<SSHRunner>(config);
}
