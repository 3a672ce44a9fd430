#include "process.hpp"
#include <core/constants.hpp>

#include <unistd.h>
#include <sys/wait.h>
#include <fcntl.h>
#include <poll.h>
#include <cerrno>
#include <cstring>

namespace platform {

// ── ProcessHandle ────────────────────────────────────────────

ProcessHandle::ProcessHandle() = default;

ProcessHandle::~ProcessHandle() {
    close_fds();
    if (pid_ > 0) {
        int status;
        waitpid(pid_, &status, 0);
    }
}

ProcessHandle::ProcessHandle(ProcessHandle&& other) noexcept {
    pid_ = other.pid_;
    stdin_fd_ = other.stdin_fd_;
    stdout_fd_ = other.stdout_fd_;
    stderr_fd_ = other.stderr_fd_;
    other.pid_ = -1;
    other.stdin_fd_ = other.stdout_fd_ = other.stderr_fd_ = -1;
}

ProcessHandle& ProcessHandle::operator=(ProcessHandle&& other) noexcept {
    if (this != &other) {
        close_fds();
        pid_ = other.pid_;
        stdin_fd_ = other.stdin_fd_;
        stdout_fd_ = other.stdout_fd_;
        stderr_fd_ = other.stderr_fd_;
        other.pid_ = -1;
        other.stdin_fd_ = other.stdout_fd_ = other.stderr_fd_ = -1;
    }
    return *this;
}

bool ProcessHandle::valid() const {
    return pid_ > 0;
}

void ProcessHandle::close_fds() {
    for (int* fd : {&stdin_fd_, &stdout_fd_, &stderr_fd_}) {
        if (*fd >= 0) {
            close(*fd);
            *fd = -1;
        }
    }
}

CommandResult ProcessHandle::communicate(const std::string& input) {
    if (pid_ <= 0) {
        return CommandResult{-1, "", "Process was not started"};
    }

    CommandResult result{-1, "", ""};
    size_t written = 0;
    if (input.empty() && stdin_fd_ >= 0) {
        close(stdin_fd_);
        stdin_fd_ = -1;
    }

    char buf[PIPE_READ_BUF_SIZE];
    while (stdout_fd_ >= 0 || stderr_fd_ >= 0 || stdin_fd_ >= 0) {
        struct pollfd fds[3];
        int nfds = 0;
        int out_idx = -1, err_idx = -1, in_idx = -1;
        if (stdout_fd_ >= 0) { out_idx = nfds; fds[nfds++] = {stdout_fd_, POLLIN, 0}; }
        if (stderr_fd_ >= 0) { err_idx = nfds; fds[nfds++] = {stderr_fd_, POLLIN, 0}; }
        if (stdin_fd_ >= 0)  { in_idx = nfds;  fds[nfds++] = {stdin_fd_, POLLOUT, 0}; }

        int rc = poll(fds, nfds, -1);
        if (rc < 0) {
            if (errno == EINTR) continue;
            result.stderr_data += std::string("poll failed: ") + strerror(errno);
            break;
        }

        if (in_idx >= 0 && fds[in_idx].revents) {
            ssize_t w = write(stdin_fd_, input.data() + written, input.size() - written);
            if (w > 0) written += static_cast<size_t>(w);
            if (w < 0 || written >= input.size()) {
                close(stdin_fd_);
                stdin_fd_ = -1;
            }
        }

        auto drain = [&](int idx, int& fd, std::string& sink) {
            if (idx < 0 || !fds[idx].revents) return;
            ssize_t n = read(fd, buf, sizeof(buf));
            if (n > 0) {
                sink.append(buf, static_cast<size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                close(fd);
                fd = -1;
            }
        };
        drain(out_idx, stdout_fd_, result.stdout_data);
        drain(err_idx, stderr_fd_, result.stderr_data);
    }

    close_fds();
    int status = 0;
    if (waitpid(pid_, &status, 0) == pid_) {
        result.exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    }
    pid_ = -1;
    return result;
}

// ── spawn ────────────────────────────────────────────────────

ProcessHandle spawn(const std::string& program,
                    const std::vector<std::string>& args) {
    ProcessHandle handle;

    int in_pipe[2], out_pipe[2], err_pipe[2];
    if (pipe(in_pipe) != 0) return handle;
    if (pipe(out_pipe) != 0) {
        close(in_pipe[0]); close(in_pipe[1]);
        return handle;
    }
    if (pipe(err_pipe) != 0) {
        close(in_pipe[0]); close(in_pipe[1]);
        close(out_pipe[0]); close(out_pipe[1]);
        return handle;
    }

    pid_t pid = fork();
    if (pid < 0) {
        for (int fd : {in_pipe[0], in_pipe[1], out_pipe[0], out_pipe[1], err_pipe[0], err_pipe[1]})
            close(fd);
        return handle;
    }

    if (pid == 0) {
        // Child process
        dup2(in_pipe[0], STDIN_FILENO);
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);
        for (int fd : {in_pipe[0], in_pipe[1], out_pipe[0], out_pipe[1], err_pipe[0], err_pipe[1]})
            close(fd);

        // Build argv array
        std::vector<const char*> argv;
        argv.push_back(program.c_str());
        for (const auto& a : args) argv.push_back(a.c_str());
        argv.push_back(nullptr);

        execvp(program.c_str(), const_cast<char* const*>(argv.data()));
        _exit(127);  // exec failed
    }

    // Parent
    close(in_pipe[0]);
    close(out_pipe[1]);
    close(err_pipe[1]);
    handle.pid_ = pid;
    handle.stdin_fd_ = in_pipe[1];
    handle.stdout_fd_ = out_pipe[0];
    handle.stderr_fd_ = err_pipe[0];
    return handle;
}

CommandResult run_shell(const std::string& command, const std::string& input) {
    auto proc = spawn("/bin/sh", {"-c", command});
    if (!proc.valid()) {
        return CommandResult{-1, "", "Failed to spawn /bin/sh for: " + command};
    }
    return proc.communicate(input);
}

} // namespace platform
