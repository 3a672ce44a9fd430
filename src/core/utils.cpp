#include "utils.hpp"
#include "constants.hpp"
#include <chrono>
#include <ctime>
#include <algorithm>
#include <cctype>
#include <unistd.h>
#include <limits.h>
#include <fmt/format.h>

std::string now_str() {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);
    char buf[32];
    std::strftime(buf, sizeof(buf), STORE_TIME_FORMAT, &tm_buf);
    return std::string(buf);
}

std::string now_log_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto us = std::chrono::duration_cast<std::chrono::microseconds>(
        now.time_since_epoch()) % 1000000;
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);
    char buf[32];
    std::strftime(buf, sizeof(buf), STORE_TIME_FORMAT, &tm_buf);
    return fmt::format("{}.{:06d}", buf, static_cast<int>(us.count()));
}

std::string format_elapsed(double seconds) {
    auto total = static_cast<int64_t>(seconds);
    int64_t d = total / 86400;
    int64_t h = (total % 86400) / 3600;
    int64_t m = (total % 3600) / 60;
    int64_t s = total % 60;

    if (d > 0) return fmt::format("{} days {} hours {} minutes {} seconds.", d, h, m, s);
    if (h > 0) return fmt::format("{} hours {} minutes {} seconds.", h, m, s);
    if (m > 0) return fmt::format("{} minutes {} seconds.", m, s);
    return fmt::format("{} seconds.", s);
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string local_hostname() {
    char buf[HOST_NAME_MAX + 1];
    if (gethostname(buf, sizeof(buf)) != 0) return "unknown";
    buf[HOST_NAME_MAX] = '\0';
    return std::string(buf);
}

std::string shell_quote(const std::string& s) {
    std::string out = "'";
    for (char c : s) {
        if (c == '\'') out += "'\\''";
        else out += c;
    }
    out += "'";
    return out;
}
