#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <core/types.hpp>
#include <store/records.hpp>
#include <transfer/ftp_session.hpp>
#include <transfer/restore_service.hpp>
#include <notify/notifier.hpp>
#include "download_worker.hpp"

// One restore on the remote service, driven through
// waiting -> ready -> {finished, failed}. The store holds the truth; the
// cached record is reloaded at the start of every step.
class RestoreRequest {
public:
    RestoreRequest(const DownloadConfig& config, JobStore& store,
                   RestoreService& service, FtpSessionFactory ftp_factory,
                   Notifier& notifier,
                   std::optional<std::string> guid = std::nullopt);
    ~RestoreRequest();

    RestoreRequest(const RestoreRequest&) = delete;
    RestoreRequest& operator=(const RestoreRequest&) = delete;

    // Advance one step. Returns false once the Request should be dropped.
    bool run();

    // Ask the service for a new restore and persist it as waiting.
    // False on transport failure, "fail", or an already-known guid.
    bool request();

    // Flip waiting -> ready once the service reports "done".
    bool get_location();

    // List the restore directory and create the Download rows.
    bool get_files();

    // Reconcile finished workers, then spawn workers for pending files.
    void download();

    // Mark the Request finished if its Downloads allow it.
    bool is_finished();

    const std::optional<std::string>& guid() const { return guid_; }
    const std::optional<RequestRecord>& record() const { return record_; }
    size_t live_workers() const { return workers_.size(); }

private:
    const DownloadConfig& config_;
    JobStore& store_;
    RestoreService& service_;
    FtpSessionFactory ftp_factory_;
    Notifier& notifier_;
    std::optional<std::string> guid_;
    std::optional<RequestRecord> record_;

    // Declared before workers_: running workers push into it until joined.
    OutcomeQueue outcomes_;
    std::map<std::string, std::unique_ptr<DownloadWorker>> workers_;   // by remote_filename
    bool missing_dir_notified_ = false;

    void reload();
    void reconcile(const WorkerOutcome& outcome);
    void record_progress();
    void spawn_workers();
    void mark_request(const std::string& status, const std::string& details);
};
