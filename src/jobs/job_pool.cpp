#include "job_pool.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <managers/retry_policy.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <chrono>
#include <regex>
#include <stdexcept>

namespace fs = std::filesystem;

JobPool::JobPool(const JobsConfig& config, QueueManager& queue, ResultUploader& uploader)
    : config_(config), queue_(queue), uploader_(uploader) {
}

SearchJob* JobPool::add_job(std::vector<std::string> datafiles) {
    auto job = std::make_unique<SearchJob>(std::move(datafiles));
    if (job->status() == to_lower(JOB_DELETED)) {
        return nullptr;
    }
    jobs_.push_back(std::move(job));
    return jobs_.back().get();
}

void JobPool::discover() {
    std::regex pattern(config_.rawdata_pattern);
    std::vector<std::string> datafiles;

    std::error_code ec;
    fs::recursive_directory_iterator it(config_.rawdata_dir, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        log_error("jobpool", fmt::format("Cannot scan {}: {}", config_.rawdata_dir, ec.message()));
        return;
    }
    for (fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            log_warning("jobpool", "Error while walking raw data: " + ec.message());
            ec.clear();
            continue;
        }
        std::error_code fec;
        if (!it->is_regular_file(fec)) continue;
        if (std::regex_match(it->path().filename().string(), pattern)) {
            datafiles.push_back(it->path().string());
        }
    }
    std::sort(datafiles.begin(), datafiles.end());

    for (const auto& d : datafiles) {
        try {
            add_job({d});
        } catch (const std::invalid_argument& e) {
            log_warning("jobpool", fmt::format("Skipping {}: {}", d, e.what()));
        }
    }
    log_info("jobpool", fmt::format("Created {} job(s) from {} datafile(s)", jobs_.size(), datafiles.size()));
}

std::map<std::string, int> JobPool::demand() const {
    std::map<std::string, int> counts;
    for (const auto& job : jobs_) {
        std::string status = job->status();
        bool needed = status == to_lower(JOB_SUBMITTED) ||
                      status == to_lower(JOB_PROCESSING) ||
                      status == to_lower(JOB_PROCESSING_OK) ||
                      status == to_lower(JOB_NEW);
        if (status == to_lower(JOB_PROCESSING_FAILED)) {
            needed = !RetryPolicy(job->count_status(JOB_PROCESSING_FAILED), config_.max_attempts).exhausted();
        }
        if (!needed) continue;
        for (const auto& d : job->datafiles()) counts[d]++;
    }
    return counts;
}

bool JobPool::is_in_demand(const SearchJob& job) const {
    auto counts = demand();
    for (const auto& d : job.datafiles()) {
        auto it = counts.find(d);
        if (it != counts.end() && it->second > 0) return true;
    }
    return false;
}

fs::path JobPool::results_dir_for(const SearchJob& job) const {
    return fs::path(config_.results_dir) / fs::path(job.name()).filename();
}

std::string JobPool::status_summary() const {
    return fmt::format("Jobs in the Pool: {}", jobs_.size());
}

void JobPool::rotate() {
    for (auto& job : jobs_) job->refresh();

    auto queue_status = queue_.status();
    if (queue_status.is_err()) {
        log_error("jobpool", "Cannot read queue status, skipping pass: " + queue_status.error);
        return;
    }
    bool cansubmit = queue_status.value.queued == 0;

    std::vector<SearchJob*> finished;
    std::vector<SearchJob*> dropped;
    for (auto& job : jobs_) {
        std::string status = job->status();
        if (status == to_lower(JOB_SUBMITTED) || status == to_lower(JOB_PROCESSING)) {
            continue;
        } else if (status == to_lower(JOB_PROCESSING_FAILED)) {
            RetryPolicy policy(job->count_status(JOB_PROCESSING_FAILED), config_.max_attempts);
            if (policy.next_attempt() == RetryDecision::ALLOWED) {
                if (cansubmit) {
                    submit_job(*job);
                    cansubmit = false;
                }
            } else {
                finished.push_back(job.get());
            }
        } else if (status == to_lower(JOB_PROCESSING_OK)) {
            upload_results(*job);
        } else if (status == to_lower(JOB_NEW)) {
            if (cansubmit) {
                submit_job(*job);
                cansubmit = false;
            }
        } else if (status == to_lower(JOB_UPLOAD_OK)) {
            finished.push_back(job.get());
        } else if (status == to_lower(JOB_DELETED)) {
            dropped.push_back(job.get());
        } else {
            throw std::runtime_error(fmt::format("Unrecognized status: {} (job {})", status, job->name()));
        }
    }

    for (SearchJob* job : finished) {
        if (delete_job(*job)) dropped.push_back(job);
    }
    jobs_.erase(std::remove_if(jobs_.begin(), jobs_.end(), [&](const std::unique_ptr<SearchJob>& j) {
        return std::find(dropped.begin(), dropped.end(), j.get()) != dropped.end();
    }), jobs_.end());
}

bool JobPool::submit_job(SearchJob& job) {
    auto result = queue_.submit(job.datafiles(), results_dir_for(job).string());
    if (result.is_err()) {
        log_error("jobpool", fmt::format("Submitting {} failed: {}", job.name(), result.error));
        return false;
    }
    job.set_queue_id(result.value);
    job.log().add_entry(LogEntry::make(JOB_SUBMITTED, "Job ID: " + result.value));
    log_info("jobpool", fmt::format("Submitted {} ({})", job.name(), result.value));
    return true;
}

void JobPool::upload_results(SearchJob& job) {
    auto dir = results_dir_for(job);
    auto result = uploader_.upload(job, dir);
    if (result.is_err()) {
        log_warning("jobpool", fmt::format("Upload for {} failed, will retry: {}", job.name(), result.error));
        return;
    }
    job.log().add_entry(LogEntry::make(JOB_UPLOAD_OK, "Results: " + dir.string()));
}

bool JobPool::delete_job(SearchJob& job) {
    if (is_in_demand(job)) {
        log_info("jobpool", fmt::format("Datafiles of {} are still in demand, not deleting", job.name()));
        return false;
    }

    job.log().add_entry(LogEntry::make(JOB_DELETED));

    if (job.queue_id()) {
        auto listed = queue_.is_running(*job.queue_id());
        if (listed.is_err()) {
            log_warning("jobpool", "Cannot check queue for " + *job.queue_id() + ": " + listed.error);
        } else if (listed.value) {
            auto removed = queue_.remove(*job.queue_id());
            if (removed.is_err()) {
                log_warning("jobpool", "Queue job " + *job.queue_id() + " not removed: " + removed.error);
            }
        }
    }

    if (config_.delete_rawdata) {
        for (const auto& d : job.datafiles()) {
            std::error_code ec;
            fs::remove(d, ec);
            if (ec) log_warning("jobpool", fmt::format("Cannot remove {}: {}", d, ec.message()));
        }
        archive_log(job);
    }
    log_info("jobpool", "Deleted job " + job.name());
    return true;
}

void JobPool::archive_log(SearchJob& job) {
    fs::path archive(config_.log_archive);
    std::error_code ec;
    fs::create_directories(archive, ec);
    fs::path dest = archive / job.log().path().filename();

    fs::rename(job.log().path(), dest, ec);
    if (ec) {
        // Across filesystems: copy, then remove
        ec.clear();
        fs::copy_file(job.log().path(), dest, fs::copy_options::overwrite_existing, ec);
        if (!ec) fs::remove(job.log().path(), ec);
    }
    if (ec) {
        log_warning("jobpool", fmt::format("Cannot archive {}: {}", job.log().path().string(), ec.message()));
        return;
    }
    job.log().relocate(dest);
}

void JobPool::run(const std::atomic<bool>& stop) {
    discover();
    while (!stop) {
        log_info("jobpool", status_summary());
        rotate();
        auto wake = std::chrono::steady_clock::now() + std::chrono::seconds(config_.sleep_secs);
        while (!stop && std::chrono::steady_clock::now() < wake) {
            platform::sleep_ms(200);
        }
    }
}
