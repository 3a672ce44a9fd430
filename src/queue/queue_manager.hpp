#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>

struct QueueJob {
    std::string id;
    std::string name;
    std::string state;                     // single-letter PBS state: Q, R, E, ...
    std::vector<std::string> datafiles;
};

struct QueueStatus {
    int running = 0;
    int queued = 0;
};

// External batch queue, as seen by the job pool. Only jobs whose name
// starts with the configured basename belong to the pipeline.
class QueueManager {
public:
    virtual ~QueueManager() = default;

    // Returns the queue's job id; an empty id is an error.
    virtual Result<std::string> submit(const std::vector<std::string>& datafiles,
                                       const std::string& outdir) = 0;

    virtual Result<std::vector<QueueJob>> jobs() = 0;

    // Running / queued pipeline jobs.
    virtual Result<QueueStatus> status() = 0;

    virtual Result<bool> is_running(const std::string& job_id) = 0;

    // Delete and confirm the job is gone or exiting.
    virtual Result<void> remove(const std::string& job_id) = 0;
};
