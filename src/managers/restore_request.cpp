#include "restore_request.hpp"
#include "retry_policy.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <filesystem>
#include <regex>

namespace fs = std::filesystem;

RestoreRequest::RestoreRequest(const DownloadConfig& config, JobStore& store,
                               RestoreService& service, FtpSessionFactory ftp_factory,
                               Notifier& notifier, std::optional<std::string> guid)
    : config_(config), store_(store), service_(service),
      ftp_factory_(std::move(ftp_factory)), notifier_(notifier), guid_(std::move(guid)) {
    if (guid_) reload();
}

RestoreRequest::~RestoreRequest() {
    // Outcomes of workers still running are dropped; their attempts stay
    // downloading and are closed as interrupted on the next spawn.
    for (auto& [name, worker] : workers_) worker->join();
}

void RestoreRequest::reload() {
    if (guid_) record_ = find_request_by_guid(store_, *guid_);
}

void RestoreRequest::mark_request(const std::string& status, const std::string& details) {
    store_.execute(Statement{
        "UPDATE requests SET status = ?, details = ?, updated_at = ? WHERE id = ?",
        {status, details, now_str(), record_->id}});
    record_->status = status;
    record_->details = details;
}

bool RestoreRequest::run() {
    if (!guid_) return request();

    reload();
    if (!record_) {
        log_warning("download", "No stored record for restore " + *guid_);
        return false;
    }

    const std::string status = record_->status;
    if (status == REQUEST_WAITING) {
        get_location();
        return true;
    }
    if (status == REQUEST_READY) {
        if (is_finished()) return false;
        if (downloads_for_request(store_, record_->id).empty()) {
            if (!get_files()) {
                reload();
                return record_ && record_->status != REQUEST_FAILED;
            }
        }
        download();
        return true;
    }

    log_info("download", fmt::format("Restore {} is {}", *guid_, status));
    return false;
}

bool RestoreRequest::request() {
    log_info("download", "Requesting restore");
    auto response = service_.request_restore();
    if (response.is_err()) {
        log_warning("restore-api", "There was a problem requesting the restore: " + response.error);
        return false;
    }
    if (response.value.empty() || response.value == RESTORE_FAIL_RESPONSE) {
        log_warning("restore-api", "Failed to receive proper GUID");
        return false;
    }

    const std::string& guid = response.value;
    if (find_request_by_guid(store_, guid)) {
        log_warning("download", fmt::format("The record with GUID = '{}' already exists", guid));
        return false;
    }

    auto now = now_str();
    store_.execute(Statement{
        "INSERT OR IGNORE INTO requests (guid, status, details, created_at, updated_at) "
        "VALUES (?, ?, ?, ?, ?)",
        {guid, std::string(REQUEST_WAITING), std::string("Newly created restore request"), now, now}});
    guid_ = guid;
    reload();
    log_info("download", "New restore " + guid);
    return true;
}

bool RestoreRequest::get_location() {
    auto response = service_.query_location(*guid_);
    if (response.is_err()) {
        log_warning("restore-api", fmt::format("Location query for {} failed: {}", *guid_, response.error));
        return false;
    }
    if (response.value != LOCATION_DONE_RESPONSE) {
        log_debug("restore-api", fmt::format("Restore {} not ready ({})", *guid_, response.value));
        return false;
    }

    store_.execute(Statement{
        "UPDATE requests SET status = ?, updated_at = ? WHERE id = ? AND status = ?",
        {std::string(REQUEST_READY), now_str(), record_->id, std::string(REQUEST_WAITING)}});
    log_info("download", "Restore " + *guid_ + " is ready");
    return true;
}

bool RestoreRequest::get_files() {
    std::unique_ptr<FtpSession> ftp;
    while (true) {
        try {
            ftp = ftp_factory_();
            ftp->connect();
            break;
        } catch (const FtpError& e) {
            if (!e.is_transient()) {
                log_error("download", fmt::format("{} FTP login failed: {}", *guid_, e.what()));
                return false;
            }
            log_warning("download", fmt::format("{} FTP connection error: {}. Waiting for retry", *guid_, e.what()));
            ftp.reset();
            platform::sleep_ms(config_.connect_retry_delay_ms);
        }
    }

    try {
        ftp->cwd(*guid_);
    } catch (const FtpError& e) {
        if (e.kind() != FtpErrorKind::Directory) {
            log_warning("download", fmt::format("{} FTP error: {}", *guid_, e.what()));
            return false;
        }
        mark_request(REQUEST_FAILED, "request directory not found");
        notifier_.notify("Restore directory missing", fmt::format(
            "The restore service reported the restore to be ready. However the restore "
            "directory does not exist on the FTP server.\nRestore GUID: {}", *guid_));
        return false;
    }

    std::regex ignore(config_.ignore_pattern);
    std::vector<Statement> batch;
    int64_t total = 0;
    try {
        auto now = now_str();
        for (const auto& name : ftp->list()) {
            if (std::regex_match(name, ignore)) {
                log_info("download", fmt::format("{} IGNORING: {}", *guid_, name));
                continue;
            }
            int64_t file_size = ftp->size(name);
            log_debug("download", fmt::format("{} got file size for {}", *guid_, name));
            total += file_size;
            batch.push_back(Statement{
                "INSERT OR IGNORE INTO downloads (request_id, remote_filename, filename, status, "
                "size, details, created_at, updated_at) VALUES (?, ?, ?, ?, ?, ?, ?, ?)",
                {record_->id, name, (fs::path(config_.staging_dir) / name).string(),
                 std::string(DOWNLOAD_NEW), file_size, std::string("Awaiting download"), now, now}});
        }
    } catch (const FtpError& e) {
        log_warning("download", fmt::format("{} could not list restore directory: {}", *guid_, e.what()));
        return false;
    }

    if (batch.empty()) {
        mark_request(REQUEST_FAILED, "no files in request directory");
        notifier_.notify("Restore directory empty", "Restore GUID: " + *guid_);
        return false;
    }

    batch.push_back(Statement{"UPDATE requests SET size = ?, updated_at = ? WHERE id = ?",
                              {total, now_str(), record_->id}});
    store_.execute(batch);
    record_->size = total;
    log_info("download", fmt::format("{} has {} files, {} bytes", *guid_, batch.size() - 1, total));
    return true;
}

void RestoreRequest::download() {
    for (const auto& outcome : outcomes_.drain()) {
        auto it = workers_.find(outcome.remote_filename);
        if (it != workers_.end()) {
            it->second->join();
            workers_.erase(it);
        }
        reconcile(outcome);
    }
    record_progress();
    spawn_workers();
}

void RestoreRequest::reconcile(const WorkerOutcome& outcome) {
    auto rows = store_.query({"SELECT * FROM downloads WHERE id = ?", {outcome.download_id}});
    if (rows.empty()) {
        log_error("download", "Download row vanished for " + outcome.remote_filename);
        return;
    }
    auto dl = DownloadRecord::from_row(rows.front());

    std::string status = outcome.status;
    std::string details = outcome.details;
    if (status == DOWNLOAD_DOWNLOADED) {
        std::error_code ec;
        auto on_disk = fs::file_size(dl.local_path, ec);
        if (ec) {
            status = DOWNLOAD_FAILED;
            details = "Does not exist: " + dl.local_path;
        } else if (static_cast<int64_t>(on_disk) != dl.size) {
            status = DOWNLOAD_FAILED;
            details = fmt::format("Size mismatch: {} bytes on disk, expected {}", on_disk, dl.size);
        }
    }
    if (status == DOWNLOAD_FAILED) {
        log_warning("download", fmt::format("{} attempt {} failed: {}", dl.remote_filename, outcome.attempt_id, details));
    }
    if (outcome.directory_missing && !missing_dir_notified_) {
        missing_dir_notified_ = true;
        notifier_.notify("Restore directory missing", fmt::format(
            "The restore directory disappeared from the FTP server while its files "
            "were being downloaded.\nRestore GUID: {}\nFile: {}", *guid_, dl.remote_filename));
    }

    auto now = now_str();
    store_.execute(std::vector<Statement>{
        {"UPDATE download_attempts SET status = ?, details = ?, updated_at = ? WHERE id = ?",
         {status, details, now, outcome.attempt_id}},
        {"UPDATE downloads SET status = ?, details = ?, updated_at = ? WHERE id = ?",
         {status, details, now, dl.id}},
    });
}

void RestoreRequest::record_progress() {
    std::vector<Statement> batch;
    auto now = now_str();
    for (const auto& [name, worker] : workers_) {
        std::string details = worker->progress();
        if (details.empty()) continue;
        batch.push_back(Statement{
            "UPDATE download_attempts SET status = ?, details = ?, updated_at = ? WHERE id = ?",
            {std::string(DOWNLOAD_DOWNLOADING), details, now, worker->task().attempt_id}});
        batch.push_back(Statement{
            "UPDATE downloads SET status = ?, details = ?, updated_at = ? WHERE id = ?",
            {std::string(DOWNLOAD_DOWNLOADING), details, now, worker->task().download_id}});
    }
    if (!batch.empty()) store_.execute(batch);
}

void RestoreRequest::spawn_workers() {
    for (const auto& dl : downloads_for_request(store_, record_->id)) {
        if (dl.status == DOWNLOAD_DOWNLOADED) continue;
        if (workers_.count(dl.remote_filename)) continue;

        auto now = now_str();
        // Attempts still marked downloading here belong to a previous process
        Statement close_orphans{
            "UPDATE download_attempts SET status = ?, details = ?, updated_at = ? "
            "WHERE download_id = ? AND (status IS NULL OR status = ?)",
            {std::string(DOWNLOAD_FAILED), std::string("Interrupted"), now, dl.id,
             std::string(DOWNLOAD_DOWNLOADING)}};

        RetryPolicy policy(attempt_count(store_, dl.id), config_.max_retries);
        if (policy.exhausted()) {
            if (dl.status != DOWNLOAD_FAILED) {
                store_.execute(std::vector<Statement>{
                    close_orphans,
                    {"UPDATE downloads SET status = ?, details = ?, updated_at = ? WHERE id = ?",
                     {std::string(DOWNLOAD_FAILED), std::string("Retry limit reached"), now, dl.id}},
                });
            }
            continue;
        }

        auto result = store_.execute(std::vector<Statement>{
            close_orphans,
            {"INSERT INTO download_attempts (download_id, status, details, created_at, updated_at) "
             "VALUES (?, ?, ?, ?, ?)",
             {dl.id, std::string(DOWNLOAD_DOWNLOADING), std::string("Starting download"), now, now}},
            {"UPDATE downloads SET status = ?, details = ?, updated_at = ? WHERE id = ?",
             {std::string(DOWNLOAD_DOWNLOADING),
              fmt::format("Attempt {} of {}", policy.attempts_used() + 1, policy.max_attempts()),
              now, dl.id}},
        });

        WorkerTask task{*guid_, dl.remote_filename, dl.local_path, dl.id, result.last_insert_id};
        auto worker = std::make_unique<DownloadWorker>(task, ftp_factory_,
                                                       config_.connect_retry_delay_ms, outcomes_);
        worker->start();
        workers_.emplace(dl.remote_filename, std::move(worker));
    }
}

bool RestoreRequest::is_finished() {
    if (!workers_.empty()) return false;

    auto downloads = downloads_for_request(store_, record_->id);
    if (downloads.empty()) return false;

    for (const auto& dl : downloads) {
        if (dl.status == DOWNLOAD_DOWNLOADING) return false;
    }

    int failed = 0;
    for (const auto& dl : downloads) {
        if (dl.status == DOWNLOAD_DOWNLOADED) continue;
        if (dl.status != DOWNLOAD_FAILED) return false;
        if (!RetryPolicy(attempt_count(store_, dl.id), config_.max_retries).exhausted()) return false;
        failed++;
    }

    if (failed == 0) {
        mark_request(REQUEST_FINISHED, "All downloads completed");
        log_info("download", "Restore " + *guid_ + " finished");
    } else {
        // Retry-exhausted downloads do not hold the Request open
        mark_request(REQUEST_FINISHED, fmt::format("{} of {} downloads failed after {} attempts",
                                                   failed, downloads.size(), config_.max_retries));
        log_warning("download", fmt::format("Restore {} finished with {} failed downloads", *guid_, failed));
    }
    return true;
}
