#pragma once

#include <string>
#include <optional>
#include <vector>
#include <functional>
#include <cstdint>

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Shell / SSH command execution result
struct CommandResult {
    int exit_code;
    std::string stdout_data;
    std::string stderr_data;

    bool success() const { return exit_code == 0; }
    bool failed() const { return exit_code != 0; }

    std::string get_output() const {
        return stdout_data.empty() ? stderr_data : stdout_data;
    }
};

// Configuration structures
struct StoreConfig {
    std::string path;
    int busy_timeout_secs = 40;
    int retry_delay_ms = 1000;
    int warn_after_failures = 60;
};

struct LogConfig {
    std::string file;
    std::string level = "info";
    bool screen_output = true;
};

struct RestoreServiceConfig {
    std::string url;
    std::string soap_namespace = "http://tempuri.org/";
    std::string username;
    std::string password;
    int beams = 1;
    int bits = 4;
    std::string file_type = "wapp";
    int timeout_secs = 60;
};

struct FtpConfig {
    std::string host;
    int port = 31001;
    std::string username;
    std::string password;
    bool verify_peer = false;
    int timeout_secs = 60;
};

struct DownloadConfig {
    std::string staging_dir;
    int64_t space_to_use = 0;                    // bytes
    int max_restores = 2;
    int max_retries = 3;
    int poll_interval_secs = 37;
    int connect_retry_delay_ms = 1000;
    std::string ignore_pattern = R"(.*7\.w4bit\.fits)";
};

struct QueueConfig {
    std::string host;                            // empty: run qsub/qstat/qdel locally
    std::string user;
    std::string password;
    std::optional<std::string> ssh_key_path;
    int port = 22;
    std::string job_basename = "obspipe";
    std::string resource_list;                   // passed to qsub -l
    std::string qsublog_dir;
    std::string script = "search.py";
    int delete_settle_secs = 3;
};

struct JobsConfig {
    std::string rawdata_dir;
    std::string rawdata_pattern = R"(.*\.fits)";
    std::string results_dir;
    std::string log_archive;
    int max_attempts = 2;
    bool delete_rawdata = true;
    int sleep_secs = 60;
    std::string upload_command;
};

struct NotifyConfig {
    std::string command;                         // receives the message on stdin
};

// Status callback for operations
using StatusCallback = std::function<void(const std::string&)>;
