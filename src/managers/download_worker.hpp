#pragma once

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <transfer/ftp_session.hpp>

struct WorkerOutcome {
    int64_t download_id = 0;
    int64_t attempt_id = 0;
    std::string remote_filename;
    std::string status;       // DOWNLOAD_DOWNLOADED or DOWNLOAD_FAILED
    std::string details;
    bool directory_missing = false;
};

// Result channel shared by the workers of one Request. Workers push exactly
// one outcome each, as their last action.
class OutcomeQueue {
public:
    void push(WorkerOutcome outcome);
    std::vector<WorkerOutcome> drain();

private:
    std::mutex mutex_;
    std::vector<WorkerOutcome> pending_;
};

struct WorkerTask {
    std::string guid;                 // remote directory
    std::string remote_filename;
    std::filesystem::path local_path;
    int64_t download_id = 0;
    int64_t attempt_id = 0;
};

// Fetches one remote file on its own thread. Never cancelled; the
// destructor waits for the thread.
class DownloadWorker {
public:
    DownloadWorker(WorkerTask task, FtpSessionFactory factory,
                   int connect_retry_delay_ms, OutcomeQueue& outcomes);
    ~DownloadWorker();

    DownloadWorker(const DownloadWorker&) = delete;
    DownloadWorker& operator=(const DownloadWorker&) = delete;

    void start();
    void join();

    // "<bytes> -- <percent>% -- <rate> Kb/s" while transferring
    std::string progress() const;

    const WorkerTask& task() const { return task_; }

private:
    WorkerTask task_;
    FtpSessionFactory factory_;
    int connect_retry_delay_ms_;
    OutcomeQueue& outcomes_;
    std::thread thread_;
    mutable std::mutex progress_mutex_;
    std::string progress_;

    void run();
    void finish(const std::string& status, const std::string& details,
                bool directory_missing = false);
};
