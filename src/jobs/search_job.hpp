#pragma once

#include <optional>
#include <string>
#include <vector>
#include "job_log.hpp"

// A compute job over an ordered list of datafiles. Its state lives in a
// log file next to the primary datafile: <job_name>.log.
class SearchJob {
public:
    // Opens (or starts) the job's log. Throws std::invalid_argument if the
    // primary datafile is not a FITS file, LogFormatError on a bad log.
    explicit SearchJob(std::vector<std::string> datafiles);

    // Primary datafile path without its ".fits" suffix.
    static std::string job_name_for(const std::vector<std::string>& datafiles);

    const std::vector<std::string>& datafiles() const { return datafiles_; }
    const std::string& name() const { return name_; }

    const std::optional<std::string>& queue_id() const { return queue_id_; }
    void set_queue_id(const std::string& id) { queue_id_ = id; }

    JobLog& log() { return log_; }
    const JobLog& log() const { return log_; }

    // Status of the latest log entry, lower-cased.
    std::string status() const;
    int count_status(const std::string& status) const { return log_.count_status(status); }

    // Re-read the log if it changed and pick up a queue id from it.
    void refresh();

private:
    std::vector<std::string> datafiles_;
    std::string name_;
    std::optional<std::string> queue_id_;
    JobLog log_;

    void recover_queue_id();
};
