#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;

// One line of a job log: "timestamp -- status -- host -- info".
struct LogEntry {
    std::string timestamp;
    std::string status;
    std::string host;
    std::string info;

    std::string to_line() const;

    // Entry stamped with the current time and this machine's hostname.
    static LogEntry make(const std::string& status, const std::string& info = "");
};

class LogFormatError : public std::runtime_error {
public:
    explicit LogFormatError(const std::string& msg) : std::runtime_error(msg) {}
};

// Parse a whole log. '#' starts a comment, blank lines are skipped, and
// any other line that does not match the grammar throws LogFormatError.
std::vector<LogEntry> parse_job_log(const std::string& text);

// Append-only job log on disk. The in-memory entries are a cache of the
// file, refreshed by update() when the file changes underneath us.
class JobLog {
public:
    // Read `path` if it exists, otherwise create it holding `initial`.
    JobLog(fs::path path, const LogEntry& initial);

    const fs::path& path() const { return path_; }
    const std::vector<LogEntry>& entries() const { return entries_; }
    const LogEntry& last() const { return entries_.back(); }

    // Case-insensitive count of entries with `status`.
    int count_status(const std::string& status) const;

    // Re-read the file if it was modified since the last read.
    bool update();

    void add_entry(const LogEntry& entry);

    // Point at the file's new location after it has been moved.
    void relocate(fs::path new_path) { path_ = std::move(new_path); }

private:
    fs::path path_;
    std::vector<LogEntry> entries_;
    fs::file_time_type last_update_;

    void read();
};
