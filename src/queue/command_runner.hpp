#pragma once

#include <memory>
#include <string>
#include <core/types.hpp>
#include <ssh/session.hpp>

// Where queue commands (qsub, qstat, qdel) execute.
class CommandRunner {
public:
    virtual ~CommandRunner() = default;
    virtual CommandResult run(const std::string& command) = 0;
};

// Runs commands through the local shell.
class LocalRunner : public CommandRunner {
public:
    CommandResult run(const std::string& command) override;
};

// Runs commands on the queue head node over SSH. The session is opened on
// first use and reopened if it drops.
class SSHRunner : public CommandRunner {
public:
    explicit SSHRunner(const QueueConfig& config);

    CommandResult run(const std::string& command) override;

private:
    SessionTarget target_;
    std::unique_ptr<SessionManager> session_;

    CommandResult ensure_session();
};

// LocalRunner when queue.host is empty, SSHRunner otherwise.
std::unique_ptr<CommandRunner> make_command_runner(const QueueConfig& config);
