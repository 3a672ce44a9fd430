#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "job_store.hpp"

// Typed views over rows of the job-tracking tables. These are caches:
// callers re-read them from the store before every decision.

struct RequestRecord {
    int64_t id = 0;
    std::string guid;
    std::string status;
    std::optional<int64_t> size;    // unknown until the file list is materialized
    std::string details;
    std::string created_at;
    std::string updated_at;

    static RequestRecord from_row(const Row& row);
};

struct DownloadRecord {
    int64_t id = 0;
    int64_t request_id = 0;
    std::string remote_filename;
    std::string local_path;
    std::string status;
    int64_t size = 0;
    std::string details;
    std::string created_at;
    std::string updated_at;

    static DownloadRecord from_row(const Row& row);
};

struct AttemptRecord {
    int64_t id = 0;
    int64_t download_id = 0;
    std::string status;
    std::string details;
    std::string created_at;
    std::string updated_at;

    static AttemptRecord from_row(const Row& row);
};

// ── Queries ─────────────────────────────────────────────────

std::optional<RequestRecord> find_request_by_guid(JobStore& store, const std::string& guid);
std::vector<RequestRecord> unfinished_requests(JobStore& store);
std::vector<DownloadRecord> downloads_for_request(JobStore& store, int64_t request_id);
std::vector<AttemptRecord> attempts_for_download(JobStore& store, int64_t download_id);
int attempt_count(JobStore& store, int64_t download_id);
