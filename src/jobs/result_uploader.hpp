#pragma once

#include <filesystem>
#include <core/types.hpp>
#include "search_job.hpp"

// Hands a finished job's results to the external uploader.
class ResultUploader {
public:
    virtual ~ResultUploader() = default;
    virtual Result<void> upload(const SearchJob& job, const std::filesystem::path& results_dir) = 0;
};

// Runs `jobs.upload_command <results_dir>` through the shell.
class CommandUploader : public ResultUploader {
public:
    explicit CommandUploader(const JobsConfig& config);

    Result<void> upload(const SearchJob& job, const std::filesystem::path& results_dir) override;

private:
    const JobsConfig& config_;
};
