#pragma once

#include <string>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

// Immutable pipeline configuration, loaded once at startup and handed to
// each component by const reference.
class Config {
public:
    // Load from a YAML file (default ./obspipe.yaml)
    static Result<Config> load(const fs::path& path = default_config_path());

    // Parse YAML text directly (used by load() and by tests)
    static Result<Config> parse(const std::string& yaml_text);

    static fs::path default_config_path();

    // Accessors
    const StoreConfig& store() const { return store_; }
    const LogConfig& log() const { return log_; }
    const RestoreServiceConfig& restore_service() const { return restore_service_; }
    const FtpConfig& ftp() const { return ftp_; }
    const DownloadConfig& download() const { return download_; }
    const QueueConfig& queue() const { return queue_; }
    const JobsConfig& jobs() const { return jobs_; }
    const NotifyConfig& notify() const { return notify_; }

public:
    Config() = default;

private:
    StoreConfig store_;
    LogConfig log_;
    RestoreServiceConfig restore_service_;
    FtpConfig ftp_;
    DownloadConfig download_;
    QueueConfig queue_;
    JobsConfig jobs_;
    NotifyConfig notify_;
};
