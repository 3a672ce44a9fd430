#pragma once

#include <string>
#include <cstdint>

// Local time as "YYYY-MM-DD HH:MM:SS" (the store's timestamp format).
std::string now_str();

// Local time as "YYYY-MM-DD HH:MM:SS.ffffff" (job log entry timestamps).
std::string now_log_timestamp();

// Human-readable duration: "2 hours 3 minutes 4 seconds."
std::string format_elapsed(double seconds);

// Lower-case copy of an ASCII string.
std::string to_lower(std::string s);

// Name of this machine, "unknown" if it cannot be determined.
std::string local_hostname();

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}

// Quote a string for safe use as a single POSIX shell word.
std::string shell_quote(const std::string& s);
