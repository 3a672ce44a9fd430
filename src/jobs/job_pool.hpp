#pragma once

#include <atomic>
#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include <core/types.hpp>
#include <queue/queue_manager.hpp>
#include "result_uploader.hpp"
#include "search_job.hpp"

// Single-threaded rotation over every tracked SearchJob:
//
//   new job               -> submit (if a slot is free)
//   submitted / running   -> wait for the job to report
//   processing failed     -> resubmit while attempts remain, else delete
//   processing successful -> upload results
//   upload successful     -> delete
//
// At most one job is submitted per pass. Deleting a job reclaims its
// datafiles only when no other job still needs them.
class JobPool {
public:
    JobPool(const JobsConfig& config, QueueManager& queue, ResultUploader& uploader);

    // Build one single-datafile job for every raw data file found.
    void discover();

    // Track a job over `datafiles`. Returns nullptr if the job's log says
    // it was already deleted.
    SearchJob* add_job(std::vector<std::string> datafiles);

    // One pass over the pool. LogFormatError and unrecognized statuses
    // propagate.
    void rotate();

    // discover(), then rotate every jobs.sleep_secs until `stop` is set.
    void run(const std::atomic<bool>& stop);

    // Datafile -> number of jobs that still need it.
    std::map<std::string, int> demand() const;
    bool is_in_demand(const SearchJob& job) const;

    std::filesystem::path results_dir_for(const SearchJob& job) const;

    const std::vector<std::unique_ptr<SearchJob>>& jobs() const { return jobs_; }
    std::string status_summary() const;

private:
    const JobsConfig& config_;
    QueueManager& queue_;
    ResultUploader& uploader_;
    std::vector<std::unique_ptr<SearchJob>> jobs_;

    bool submit_job(SearchJob& job);
    void upload_results(SearchJob& job);
    bool delete_job(SearchJob& job);
    void archive_log(SearchJob& job);
};
