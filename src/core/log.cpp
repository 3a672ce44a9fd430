#include "log.hpp"
#include "utils.hpp"
#include <fstream>
#include <iostream>
#include <mutex>
#include <filesystem>

namespace {

std::mutex g_log_mutex;
std::string g_log_path;
bool g_screen_output = true;
LogLevel g_min_level = LogLevel::INFO;

const char* level_name(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG:   return "DEBUG";
        case LogLevel::INFO:    return "INFO";
        case LogLevel::WARNING: return "WARNING";
        case LogLevel::ERROR:   return "ERROR";
    }
    return "UNKNOWN";
}

} // namespace

void log_configure(const std::string& path, bool screen_output, LogLevel min_level) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_log_path = path;
    g_screen_output = screen_output;
    g_min_level = min_level;

    if (!g_log_path.empty()) {
        std::error_code ec;
        auto dir = std::filesystem::path(g_log_path).parent_path();
        if (!dir.empty()) std::filesystem::create_directories(dir, ec);
    }
}

LogLevel parse_log_level(const std::string& name) {
    std::string n = to_lower(name);
    if (n == "debug") return LogLevel::DEBUG;
    if (n == "warning" || n == "warn") return LogLevel::WARNING;
    if (n == "error") return LogLevel::ERROR;
    return LogLevel::INFO;
}

void log_write(LogLevel level, const std::string& module, const std::string& msg) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (level < g_min_level) return;

    std::string line = fmt::format("[{}] {} {}: {}\n", now_str(), level_name(level), module, msg);

    if (g_screen_output) {
        if (level >= LogLevel::ERROR) std::cerr << line << std::flush;
        else std::cout << line << std::flush;
    }

    if (g_log_path.empty()) return;
    std::ofstream out(g_log_path, std::ios::app);
    if (!out) return;
    out << line;
}
