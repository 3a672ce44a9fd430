#include "result_uploader.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/process.hpp>
#include <fmt/format.h>

CommandUploader::CommandUploader(const JobsConfig& config) : config_(config) {
}

Result<void> CommandUploader::upload(const SearchJob& job, const std::filesystem::path& results_dir) {
    if (config_.upload_command.empty()) {
        return Result<void>::Err("No upload command configured");
    }

    std::string cmd = config_.upload_command + " " + shell_quote(results_dir.string());
    log_info("jobpool", fmt::format("Uploading results of {}", job.name()));
    auto result = platform::run_shell(cmd);
    if (result.failed()) {
        return Result<void>::Err(fmt::format("Upload of {} failed (exit {}): {}",
                                             job.name(), result.exit_code, result.get_output()));
    }
    return Result<void>::Ok();
}
