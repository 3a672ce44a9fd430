#include "curl_ftp_session.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <curl/curl.h>
#include <fmt/format.h>
#include <fstream>
#include <sstream>

namespace {

struct WriteTarget {
    std::ostream* out;
};

size_t write_to_stream(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* target = static_cast<WriteTarget*>(userdata);
    size_t n = size * nmemb;
    target->out->write(ptr, static_cast<std::streamsize>(n));
    return target->out->good() ? n : 0;
}

size_t read_from_stream(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* in = static_cast<std::istream*>(userdata);
    in->read(buffer, static_cast<std::streamsize>(size * nitems));
    return static_cast<size_t>(in->gcount());
}

int on_progress(void* clientp, curl_off_t dltotal, curl_off_t dlnow,
                curl_off_t /*ultotal*/, curl_off_t /*ulnow*/) {
    auto* cb = static_cast<ProgressCallback*>(clientp);
    if (cb && *cb && dlnow > 0) (*cb)(static_cast<int64_t>(dlnow), static_cast<int64_t>(dltotal));
    return 0;
}

FtpErrorKind classify(CURLcode rc) {
    switch (rc) {
    case CURLE_COULDNT_RESOLVE_HOST:
    case CURLE_COULDNT_CONNECT:
    case CURLE_OPERATION_TIMEDOUT:
    case CURLE_SSL_CONNECT_ERROR:
    case CURLE_FTP_WEIRD_SERVER_REPLY:
    case CURLE_SEND_ERROR:
    case CURLE_RECV_ERROR:
    case CURLE_GOT_NOTHING:
        return FtpErrorKind::Connection;
    case CURLE_LOGIN_DENIED:
        return FtpErrorKind::Login;
    case CURLE_REMOTE_ACCESS_DENIED:
    case CURLE_REMOTE_FILE_NOT_FOUND:
        return FtpErrorKind::Directory;
    default:
        return FtpErrorKind::Transfer;
    }
}

} // namespace

CurlFtpSession::CurlFtpSession(const FtpConfig& config)
    : config_(config), curl_(curl_easy_init()) {
    error_buf_[0] = '\0';
    if (!curl_) {
        throw FtpError(FtpErrorKind::Connection, "curl_easy_init failed");
    }
}

CurlFtpSession::~CurlFtpSession() {
    if (curl_) curl_easy_cleanup(curl_);
}

std::string CurlFtpSession::url_for(const std::string& name) const {
    std::string url = fmt::format("ftp://{}:{}/", config_.host, config_.port);
    auto append_segment = [&](const std::string& seg) {
        if (seg.empty()) return;
        char* esc = curl_easy_escape(curl_, seg.c_str(), static_cast<int>(seg.size()));
        url += esc ? esc : seg;
        curl_free(esc);
    };
    if (!dir_.empty()) {
        append_segment(dir_);
        url += "/";
    }
    append_segment(name);
    return url;
}

void CurlFtpSession::reset_handle(const std::string& url) {
    // curl_easy_reset keeps the live control connection
    curl_easy_reset(curl_);
    error_buf_[0] = '\0';
    curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_, CURLOPT_ERRORBUFFER, error_buf_);
    curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl_, CURLOPT_USERNAME, config_.username.c_str());
    curl_easy_setopt(curl_, CURLOPT_PASSWORD, config_.password.c_str());
    curl_easy_setopt(curl_, CURLOPT_USE_SSL, static_cast<long>(CURLUSESSL_ALL));
    curl_easy_setopt(curl_, CURLOPT_FTPSSLAUTH, static_cast<long>(CURLFTPAUTH_TLS));
    curl_easy_setopt(curl_, CURLOPT_SSL_VERIFYPEER, config_.verify_peer ? 1L : 0L);
    curl_easy_setopt(curl_, CURLOPT_SSL_VERIFYHOST, config_.verify_peer ? 2L : 0L);
    curl_easy_setopt(curl_, CURLOPT_TRANSFERTEXT, 0L);
    curl_easy_setopt(curl_, CURLOPT_CONNECTTIMEOUT, static_cast<long>(FTP_CONNECT_TIMEOUT_SECS));
    // Abort a stalled transfer rather than bounding the whole download
    curl_easy_setopt(curl_, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl_, CURLOPT_LOW_SPEED_TIME, static_cast<long>(config_.timeout_secs));
}

void CurlFtpSession::perform(const std::string& what) {
    CURLcode rc = curl_easy_perform(curl_);
    if (rc == CURLE_OK) return;
    std::string detail = error_buf_[0] ? error_buf_ : curl_easy_strerror(rc);
    throw FtpError(classify(rc), fmt::format("{} failed: {}", what, detail));
}

void CurlFtpSession::connect() {
    dir_.clear();
    reset_handle(url_for(""));
    curl_easy_setopt(curl_, CURLOPT_NOBODY, 1L);
    perform(fmt::format("Login to {}:{}", config_.host, config_.port));
    log_debug("ftp", fmt::format("Connected and logged in to {}", config_.host));
}

void CurlFtpSession::cwd(const std::string& dir) {
    std::string previous = dir_;
    dir_ = dir;
    reset_handle(url_for(""));
    curl_easy_setopt(curl_, CURLOPT_NOBODY, 1L);
    try {
        perform("CWD " + dir);
    } catch (const FtpError&) {
        dir_ = previous;
        throw;
    }
}

std::vector<std::string> CurlFtpSession::list() {
    std::ostringstream buf;
    WriteTarget target{&buf};
    reset_handle(url_for(""));
    curl_easy_setopt(curl_, CURLOPT_DIRLISTONLY, 1L);
    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, write_to_stream);
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &target);
    perform("NLST " + dir_);

    std::vector<std::string> names;
    std::istringstream lines(buf.str());
    std::string line;
    while (std::getline(lines, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (!line.empty()) names.push_back(line);
    }
    return names;
}

int64_t CurlFtpSession::size(const std::string& name) {
    reset_handle(url_for(name));
    curl_easy_setopt(curl_, CURLOPT_NOBODY, 1L);
    perform("SIZE " + name);

    curl_off_t length = -1;
    if (curl_easy_getinfo(curl_, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length) != CURLE_OK || length < 0) {
        throw FtpError(FtpErrorKind::Transfer, "Server reported no size for " + name);
    }
    return static_cast<int64_t>(length);
}

void CurlFtpSession::retrieve(const std::string& name, std::ostream& out,
                              ProgressCallback progress) {
    WriteTarget target{&out};
    reset_handle(url_for(name));
    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, write_to_stream);
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &target);
    if (progress) {
        curl_easy_setopt(curl_, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl_, CURLOPT_XFERINFOFUNCTION, on_progress);
        curl_easy_setopt(curl_, CURLOPT_XFERINFODATA, &progress);
    }
    perform("RETR " + name);
    out.flush();
}

void CurlFtpSession::store(const std::filesystem::path& local, const std::string& remote) {
    std::ifstream in(local, std::ios::binary);
    if (!in) {
        throw FtpError(FtpErrorKind::Transfer, "Cannot read local file " + local.string());
    }
    std::error_code ec;
    auto local_size = static_cast<int64_t>(std::filesystem::file_size(local, ec));
    if (ec) {
        throw FtpError(FtpErrorKind::Transfer, "Cannot stat " + local.string() + ": " + ec.message());
    }

    log_info("ftp", "Starting upload of " + local.filename().string());
    reset_handle(url_for(remote));
    curl_easy_setopt(curl_, CURLOPT_UPLOAD, 1L);
    curl_easy_setopt(curl_, CURLOPT_READFUNCTION, read_from_stream);
    curl_easy_setopt(curl_, CURLOPT_READDATA, static_cast<std::istream*>(&in));
    curl_easy_setopt(curl_, CURLOPT_INFILESIZE_LARGE, static_cast<curl_off_t>(local_size));
    perform("STOR " + remote);

    int64_t remote_size = size(remote);
    if (remote_size != local_size) {
        throw FtpError(FtpErrorKind::Transfer, fmt::format(
            "File sizes of local file and uploaded file on FTP server don't match ({} != {})",
            local_size, remote_size));
    }
    log_info("ftp", "Upload of " + local.filename().string() + " successful");
}

FtpSessionFactory make_curl_ftp_factory(const FtpConfig& config) {
    return [config]() -> std::unique_ptr<FtpSession> {
        return std::make_unique<CurlFtpSession>(config);
    };
}
