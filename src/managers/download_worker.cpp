#include "download_worker.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <chrono>
#include <fstream>
#include <memory>

// ── OutcomeQueue ─────────────────────────────────────────────

void OutcomeQueue::push(WorkerOutcome outcome) {
    std::lock_guard<std::mutex> lock(mutex_);
    pending_.push_back(std::move(outcome));
}

std::vector<WorkerOutcome> OutcomeQueue::drain() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<WorkerOutcome> out;
    out.swap(pending_);
    return out;
}

// ── DownloadWorker ───────────────────────────────────────────

DownloadWorker::DownloadWorker(WorkerTask task, FtpSessionFactory factory,
                               int connect_retry_delay_ms, OutcomeQueue& outcomes)
    : task_(std::move(task)), factory_(std::move(factory)),
      connect_retry_delay_ms_(connect_retry_delay_ms), outcomes_(outcomes) {
}

DownloadWorker::~DownloadWorker() {
    join();
}

void DownloadWorker::start() {
    log_info("downloader", fmt::format("Initializing downloader for {} in {}",
                                       task_.remote_filename, task_.guid));
    thread_ = std::thread(&DownloadWorker::run, this);
}

void DownloadWorker::join() {
    if (thread_.joinable()) thread_.join();
}

std::string DownloadWorker::progress() const {
    std::lock_guard<std::mutex> lock(progress_mutex_);
    return progress_;
}

void DownloadWorker::finish(const std::string& status, const std::string& details,
                            bool directory_missing) {
    if (status == DOWNLOAD_FAILED) {
        log_warning("downloader", task_.remote_filename + ": " + details);
    } else {
        log_info("downloader", task_.remote_filename + ": " + details);
    }
    outcomes_.push(WorkerOutcome{task_.download_id, task_.attempt_id,
                                 task_.remote_filename, status, details, directory_missing});
}

void DownloadWorker::run() {
    std::unique_ptr<FtpSession> session;

    // Connection problems are retried until they clear; a rejected login or
    // a missing directory ends this attempt.
    while (true) {
        try {
            session = factory_();
            session->connect();
            session->cwd(task_.guid);
            break;
        } catch (const FtpError& e) {
            if (e.kind() == FtpErrorKind::Login) {
                finish(DOWNLOAD_FAILED, fmt::format("Login failed {}: {}", task_.remote_filename, e.what()));
                return;
            }
            if (e.kind() == FtpErrorKind::Directory) {
                finish(DOWNLOAD_FAILED, fmt::format("Directory change failed {}: {}", task_.remote_filename, e.what()),
                       true);
                return;
            }
            log_warning("downloader", fmt::format("Could not connect for {}: {}. Retrying",
                                                  task_.remote_filename, e.what()));
            session.reset();
            platform::sleep_ms(connect_retry_delay_ms_);
        } catch (const std::exception& e) {
            finish(DOWNLOAD_FAILED, fmt::format("Failed: {}", e.what()));
            return;
        }
    }

    std::ofstream file(task_.local_path, std::ios::binary | std::ios::trunc);
    if (!file) {
        finish(DOWNLOAD_FAILED, "Cannot open " + task_.local_path.string() + " for writing");
        return;
    }

    log_info("downloader", fmt::format("Starting download of {} for {}", task_.remote_filename, task_.guid));
    auto start = std::chrono::steady_clock::now();
    int64_t received = 0;
    try {
        int64_t expected = session->size(task_.remote_filename);
        if (expected == 0) {
            throw FtpError(FtpErrorKind::Transfer, "File size 0");
        }

        session->retrieve(task_.remote_filename, file, [&](int64_t done, int64_t /*total*/) {
            received = done;
            double secs = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
            int64_t rate = secs > 0 ? static_cast<int64_t>(static_cast<double>(done) / secs / 1024) : 0;
            std::lock_guard<std::mutex> lock(progress_mutex_);
            progress_ = fmt::format("{} -- {}% -- {} Kb/s", done, done * 100 / expected, rate);
        });
        file.close();
        if (file.fail()) {
            throw FtpError(FtpErrorKind::Transfer, "Error writing " + task_.local_path.string());
        }

        std::error_code ec;
        auto on_disk = std::filesystem::file_size(task_.local_path, ec);
        if (!ec) received = static_cast<int64_t>(on_disk);

        double secs = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
        finish(DOWNLOAD_DOWNLOADED, fmt::format("{} bytes -- Completed in: {}", received, format_elapsed(secs)));
    } catch (const std::exception& e) {
        finish(DOWNLOAD_FAILED, fmt::format("Failed: {}", e.what()));
    }
}
