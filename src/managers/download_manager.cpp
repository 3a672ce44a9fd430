#include "download_manager.hpp"
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <store/records.hpp>
#include <fmt/format.h>
#include <chrono>

namespace fs = std::filesystem;

int64_t directory_usage(const fs::path& dir) {
    int64_t total = 0;
    std::error_code ec;
    fs::recursive_directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        log_warning("download", fmt::format("Cannot scan {}: {}", dir.string(), ec.message()));
        return 0;
    }
    for (fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            log_warning("download", fmt::format("Error while walking {}: {}", dir.string(), ec.message()));
            ec.clear();
            continue;
        }
        std::error_code fec;
        if (!it->is_regular_file(fec)) continue;
        auto size = it->file_size(fec);
        if (fec) {
            log_warning("download", fmt::format("There was an error while getting the file size: {} ({})",
                                                it->path().string(), fec.message()));
            continue;
        }
        total += static_cast<int64_t>(size);
    }
    return total;
}

DownloadManager::DownloadManager(const DownloadConfig& config, JobStore& store,
                                 RestoreService& service, FtpSessionFactory ftp_factory,
                                 Notifier& notifier)
    : config_(config), store_(store), service_(service),
      ftp_factory_(std::move(ftp_factory)), notifier_(notifier) {
}

std::unique_ptr<RestoreRequest> DownloadManager::make_request(std::optional<std::string> guid) {
    return std::make_unique<RestoreRequest>(config_, store_, service_, ftp_factory_,
                                            notifier_, std::move(guid));
}

void DownloadManager::recover() {
    for (const auto& rec : unfinished_requests(store_)) {
        restores_.push_back(make_request(rec.guid));
    }
    log_info("download", fmt::format("Recovered: {} restores", restores_.size()));
}

int64_t DownloadManager::available_space() const {
    return config_.space_to_use - directory_usage(config_.staging_dir);
}

bool DownloadManager::can_request_more() {
    if (static_cast<int>(restores_.size()) >= config_.max_restores) {
        log_info("download", fmt::format("Cannot have more than {} restores at a time.", config_.max_restores));
        return false;
    }

    int64_t total_size = 0;
    for (const auto& r : restores_) {
        if (!r->guid()) continue;
        auto rec = find_request_by_guid(store_, *r->guid());
        if (rec && rec->size) total_size += *rec->size;
    }
    log_info("download", fmt::format("Total estimated size of currently running restores: {}", total_size));
    return available_space() - total_size > 0;
}

void DownloadManager::tick() {
    if (can_request_more()) {
        auto r = make_request();
        if (r->request()) restores_.push_back(std::move(r));
    }

    for (auto it = restores_.begin(); it != restores_.end();) {
        if ((*it)->run()) {
            ++it;
        } else {
            it = restores_.erase(it);
        }
    }
    log_info("download", fmt::format("Number of running restores: {}", restores_.size()));
}

void DownloadManager::run(const std::atomic<bool>& stop) {
    recover();
    while (!stop) {
        tick();
        auto wake = std::chrono::steady_clock::now() + std::chrono::seconds(config_.poll_interval_secs);
        while (!stop && std::chrono::steady_clock::now() < wake) {
            platform::sleep_ms(200);
        }
    }
    log_info("download", "Stopping; waiting for running downloads to finish");
}
