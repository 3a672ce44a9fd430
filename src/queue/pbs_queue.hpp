#pragma once

#include <optional>
#include <string>
#include <vector>
#include <core/types.hpp>
#include "command_runner.hpp"
#include "queue_manager.hpp"

// PBS/Torque queue driven through qsub, qstat -f and qdel.
class PbsQueue : public QueueManager {
public:
    PbsQueue(const QueueConfig& config, CommandRunner& runner);

    Result<std::string> submit(const std::vector<std::string>& datafiles,
                               const std::string& outdir) override;
    Result<std::vector<QueueJob>> jobs() override;
    Result<QueueStatus> status() override;
    Result<bool> is_running(const std::string& job_id) override;
    Result<void> remove(const std::string& job_id) override;

    // Id of the pipeline job processing `datafile`, if any.
    Result<std::optional<std::string>> is_processing_file(const std::string& datafile);

    // qsub writes <basename>.e<number> / .o<number> into qsublog_dir.
    std::string stderr_path(const std::string& job_id) const;
    std::string stdout_path(const std::string& job_id) const;

    // True if the job's stderr log is non-empty; an error if it is missing.
    Result<bool> had_errors(const std::string& job_id);
    Result<std::string> read_stderr_log(const std::string& job_id);
    Result<std::string> read_stdout_log(const std::string& job_id);

private:
    const QueueConfig& config_;
    CommandRunner& runner_;

    Result<std::string> read_file(const std::string& path);
};

std::string build_qsub_command(const QueueConfig& config,
                               const std::vector<std::string>& datafiles,
                               const std::string& outdir);

// Parse `qstat -f` output into jobs. Continuation lines (leading tab) are
// joined onto the previous attribute.
std::vector<QueueJob> parse_qstat_full(const std::string& text);
