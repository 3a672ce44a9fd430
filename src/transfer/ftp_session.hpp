#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

enum class FtpErrorKind {
    Connection,   // could not reach or keep the server; worth retrying
    Login,        // credentials rejected
    Directory,    // directory or file missing / not accessible
    Transfer      // data transfer failed or was short
};

class FtpError : public std::runtime_error {
public:
    FtpError(FtpErrorKind kind, const std::string& msg)
        : std::runtime_error(msg), kind_(kind) {}

    FtpErrorKind kind() const { return kind_; }
    bool is_transient() const { return kind_ == FtpErrorKind::Connection; }

private:
    FtpErrorKind kind_;
};

// Called as data arrives: bytes received so far, expected total (0 if unknown).
using ProgressCallback = std::function<void(int64_t bytes_done, int64_t bytes_total)>;

// A logged-in, TLS-protected FTP session. All operations throw FtpError.
// Paths given to list/size/retrieve are relative to the directory selected
// with cwd().
class FtpSession {
public:
    virtual ~FtpSession() = default;

    // Connect, negotiate TLS and log in.
    virtual void connect() = 0;

    virtual void cwd(const std::string& dir) = 0;
    virtual std::vector<std::string> list() = 0;
    virtual int64_t size(const std::string& name) = 0;
    virtual void retrieve(const std::string& name, std::ostream& out,
                          ProgressCallback progress = nullptr) = 0;

    // Upload, then check the remote size matches the local one.
    virtual void store(const std::filesystem::path& local, const std::string& remote) = 0;
};

// Creates a fresh, unconnected session. Each download worker owns one.
using FtpSessionFactory = std::function<std::unique_ptr<FtpSession>()>;
