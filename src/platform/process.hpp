#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>

namespace platform {

// Opaque handle to a spawned child process with its stdio pipes.
class ProcessHandle {
public:
    ProcessHandle();
    ~ProcessHandle();

    ProcessHandle(ProcessHandle&& other) noexcept;
    ProcessHandle& operator=(ProcessHandle&& other) noexcept;
    ProcessHandle(const ProcessHandle&) = delete;
    ProcessHandle& operator=(const ProcessHandle&) = delete;

    // True if the process handle is valid (was successfully spawned).
    bool valid() const;

    // Feed `input` to the child's stdin, collect stdout/stderr until the
    // child closes them, then reap it. Returns exit code and output.
    CommandResult communicate(const std::string& input = "");

private:
    int pid_ = -1;
    int stdin_fd_ = -1;
    int stdout_fd_ = -1;
    int stderr_fd_ = -1;

    void close_fds();

    friend ProcessHandle spawn(const std::string& program,
                               const std::vector<std::string>& args);
};

// Spawn a child process with piped stdin/stdout/stderr.
ProcessHandle spawn(const std::string& program,
                    const std::vector<std::string>& args);

// Run `command` through /bin/sh -c, feeding `input` on stdin.
CommandResult run_shell(const std::string& command, const std::string& input = "");

} // namespace platform
