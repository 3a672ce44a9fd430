#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <vector>
#include <core/types.hpp>
#include <store/job_store.hpp>
#include <transfer/ftp_session.hpp>
#include <transfer/restore_service.hpp>
#include <notify/notifier.hpp>
#include "restore_request.hpp"

// Total size of the regular files under `dir`. Entries that cannot be
// read are logged and skipped.
int64_t directory_usage(const std::filesystem::path& dir);

// Keeps a bounded working set of restores moving: requests new ones while
// the count and space gates allow, and advances every tracked Request once
// per tick.
class DownloadManager {
public:
    DownloadManager(const DownloadConfig& config, JobStore& store,
                    RestoreService& service, FtpSessionFactory ftp_factory,
                    Notifier& notifier);

    // Track every stored Request that is not finished.
    void recover();

    // Count gate and space gate. Reads the store and the staging directory,
    // changes nothing.
    bool can_request_more();

    // Configured quota minus what the staging directory already holds.
    int64_t available_space() const;

    void tick();

    // Tick every poll interval until `stop` is set.
    void run(const std::atomic<bool>& stop);

    size_t active_count() const { return restores_.size(); }
    const std::vector<std::unique_ptr<RestoreRequest>>& restores() const { return restores_; }

private:
    const DownloadConfig& config_;
    JobStore& store_;
    RestoreService& service_;
    FtpSessionFactory ftp_factory_;
    Notifier& notifier_;
    std::vector<std::unique_ptr<RestoreRequest>> restores_;

    std::unique_ptr<RestoreRequest> make_request(std::optional<std::string> guid = std::nullopt);
};
