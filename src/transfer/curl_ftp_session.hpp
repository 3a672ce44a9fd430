#pragma once

#include <string>
#include <core/types.hpp>
#include "ftp_session.hpp"

typedef void CURL;

// FtpSession over libcurl: explicit TLS (AUTH TLS), passive mode, binary
// transfers. One easy handle is kept for the lifetime of the session so the
// control connection is reused between operations.
class CurlFtpSession : public FtpSession {
public:
    explicit CurlFtpSession(const FtpConfig& config);
    ~CurlFtpSession() override;

    CurlFtpSession(const CurlFtpSession&) = delete;
    CurlFtpSession& operator=(const CurlFtpSession&) = delete;

    void connect() override;
    void cwd(const std::string& dir) override;
    std::vector<std::string> list() override;
    int64_t size(const std::string& name) override;
    void retrieve(const std::string& name, std::ostream& out,
                  ProgressCallback progress = nullptr) override;
    void store(const std::filesystem::path& local, const std::string& remote) override;

private:
    FtpConfig config_;
    CURL* curl_;
    std::string dir_;                 // current directory, relative to the login root
    char error_buf_[256];

    void reset_handle(const std::string& url);
    std::string url_for(const std::string& name) const;
    void perform(const std::string& what);
};

// Factory producing CurlFtpSession instances for the given server.
FtpSessionFactory make_curl_ftp_factory(const FtpConfig& config);
