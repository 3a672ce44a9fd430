#pragma once

#include <string>
#include <fmt/format.h>

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR
};

// Point the process-wide log at a file. Until this is called, lines go to
// the terminal only. Safe to call again (e.g. after loading the config).
void log_configure(const std::string& path, bool screen_output, LogLevel min_level);

// "debug" / "info" / "warning" / "error" → LogLevel (INFO if unknown).
LogLevel parse_log_level(const std::string& name);

// Append one line: "[YYYY-MM-DD HH:MM:SS] LEVEL module: message".
// Thread-safe; download workers log concurrently.
void log_write(LogLevel level, const std::string& module, const std::string& msg);

inline void log_debug(const std::string& module, const std::string& msg) {
    log_write(LogLevel::DEBUG, module, msg);
}

inline void log_info(const std::string& module, const std::string& msg) {
    log_write(LogLevel::INFO, module, msg);
}

inline void log_warning(const std::string& module, const std::string& msg) {
    log_write(LogLevel::WARNING, module, msg);
}

inline void log_error(const std::string& module, const std::string& msg) {
    log_write(LogLevel::ERROR, module, msg);
}
