#include "job_log.hpp"
#include <core/utils.hpp>
#include <fmt/format.h>
#include <fstream>
#include <regex>
#include <sstream>

std::string LogEntry::to_line() const {
    return fmt::format("{} -- {} -- {} -- {}", timestamp, status, host, info);
}

LogEntry LogEntry::make(const std::string& status, const std::string& info) {
    return LogEntry{now_log_timestamp(), status, local_hostname(), info};
}

std::vector<LogEntry> parse_job_log(const std::string& text) {
    static const std::regex line_re(R"(^(.*?) -- (.*?) -- (.*?) -- (.*)$)");

    std::vector<LogEntry> entries;
    std::istringstream in(text);
    std::string raw;
    int lineno = 0;
    while (std::getline(in, raw)) {
        lineno++;
        std::string line = raw.substr(0, raw.find('#'));
        while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) line.pop_back();

        std::string probe = line;
        trim(probe);
        if (probe.empty()) continue;

        std::smatch m;
        if (!std::regex_match(line, m, line_re)) {
            throw LogFormatError(fmt::format("Log file line {} doesn't have correct format ({})",
                                             lineno, line));
        }
        entries.push_back(LogEntry{m[1].str(), m[2].str(), m[3].str(), m[4].str()});
    }
    return entries;
}

JobLog::JobLog(fs::path path, const LogEntry& initial) : path_(std::move(path)) {
    if (fs::exists(path_)) {
        read();
    } else {
        add_entry(initial);
    }
}

void JobLog::read() {
    std::ifstream in(path_);
    if (!in) {
        throw LogFormatError("Cannot read job log " + path_.string());
    }
    std::stringstream buf;
    buf << in.rdbuf();

    try {
        auto parsed = parse_job_log(buf.str());
        if (parsed.empty()) {
            throw LogFormatError("no entries");
        }
        entries_ = std::move(parsed);
    } catch (const LogFormatError& e) {
        throw LogFormatError(path_.string() + ": " + e.what());
    }
    last_update_ = fs::last_write_time(path_);
}

bool JobLog::update() {
    auto mtime = fs::last_write_time(path_);
    if (mtime == last_update_) return false;
    read();
    return true;
}

void JobLog::add_entry(const LogEntry& entry) {
    std::ofstream out(path_, std::ios::app);
    if (!out) {
        throw std::runtime_error("Cannot append to job log " + path_.string());
    }
    out << entry.to_line() << "\n";
    out.close();
    if (out.fail()) {
        throw std::runtime_error("Write to job log " + path_.string() + " failed");
    }
    // Re-read so lines appended by others since the last read are picked up
    read();
}

int JobLog::count_status(const std::string& status) const {
    std::string wanted = to_lower(status);
    int count = 0;
    for (const auto& e : entries_) {
        if (to_lower(e.status) == wanted) count++;
    }
    return count;
}
