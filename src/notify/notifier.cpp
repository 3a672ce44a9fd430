#include "notifier.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/process.hpp>
#include <fmt/format.h>

CommandNotifier::CommandNotifier(const NotifyConfig& config) : config_(config) {
}

void CommandNotifier::notify(const std::string& subject, const std::string& message) {
    log_warning("notify", subject + ": " + message);
    if (config_.command.empty()) return;

    std::string body = fmt::format("Subject: {}\n\nHost: {}\nTime: {}\n\n{}\n",
                                   subject, local_hostname(), now_str(), message);
    auto result = platform::run_shell(config_.command, body);
    if (result.failed()) {
        log_error("notify", fmt::format("Notification command failed (exit {}): {}",
                                        result.exit_code, result.get_output()));
    }
}
