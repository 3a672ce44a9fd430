#include "config.hpp"
#include <yaml-cpp/yaml.h>
#include <regex>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

fs::path Config::default_config_path() {
    return fs::current_path() / "obspipe.yaml";
}

static StoreConfig parse_store_config(const YAML::Node& node) {
    StoreConfig store;
    store.path = node["path"].as<std::string>("");
    store.busy_timeout_secs = node["busy_timeout_secs"].as<int>(40);
    store.retry_delay_ms = node["retry_delay_ms"].as<int>(1000);
    store.warn_after_failures = node["warn_after_failures"].as<int>(60);
    return store;
}

static LogConfig parse_log_config(const YAML::Node& node) {
    LogConfig log;
    log.file = node["file"].as<std::string>("");
    log.level = node["level"].as<std::string>("info");
    log.screen_output = node["screen_output"].as<bool>(true);
    return log;
}

static RestoreServiceConfig parse_restore_service_config(const YAML::Node& node) {
    RestoreServiceConfig svc;
    svc.url = node["url"].as<std::string>("");
    svc.soap_namespace = node["soap_namespace"].as<std::string>("http://tempuri.org/");
    svc.username = node["username"].as<std::string>("");
    svc.password = node["password"].as<std::string>("");
    svc.beams = node["beams"].as<int>(1);
    svc.bits = node["bits"].as<int>(4);
    svc.file_type = node["file_type"].as<std::string>("wapp");
    svc.timeout_secs = node["timeout_secs"].as<int>(60);
    return svc;
}

static FtpConfig parse_ftp_config(const YAML::Node& node) {
    FtpConfig ftp;
    ftp.host = node["host"].as<std::string>("");
    ftp.port = node["port"].as<int>(31001);
    ftp.username = node["username"].as<std::string>("");
    ftp.password = node["password"].as<std::string>("");
    ftp.verify_peer = node["verify_peer"].as<bool>(false);
    ftp.timeout_secs = node["timeout_secs"].as<int>(60);
    return ftp;
}

static DownloadConfig parse_download_config(const YAML::Node& node) {
    DownloadConfig dl;
    dl.staging_dir = node["staging_dir"].as<std::string>("");
    dl.space_to_use = node["space_to_use"].as<int64_t>(0);
    dl.max_restores = node["max_restores"].as<int>(2);
    dl.max_retries = node["max_retries"].as<int>(3);
    dl.poll_interval_secs = node["poll_interval_secs"].as<int>(37);
    dl.connect_retry_delay_ms = node["connect_retry_delay_ms"].as<int>(1000);
    dl.ignore_pattern = node["ignore_pattern"].as<std::string>(R"(.*7\.w4bit\.fits)");
    return dl;
}

static QueueConfig parse_queue_config(const YAML::Node& node) {
    QueueConfig q;
    q.host = node["host"].as<std::string>("");
    q.user = node["user"].as<std::string>("");
    q.password = node["password"].as<std::string>("");
    q.port = node["port"].as<int>(22);
    q.job_basename = node["job_basename"].as<std::string>("obspipe");
    q.resource_list = node["resource_list"].as<std::string>("");
    q.qsublog_dir = node["qsublog_dir"].as<std::string>("qsublog");
    q.script = node["script"].as<std::string>("search.py");
    q.delete_settle_secs = node["delete_settle_secs"].as<int>(3);

    if (node["ssh_key_path"]) {
        q.ssh_key_path = node["ssh_key_path"].as<std::string>();
    }

    return q;
}

static JobsConfig parse_jobs_config(const YAML::Node& node) {
    JobsConfig jobs;
    jobs.rawdata_dir = node["rawdata_dir"].as<std::string>("");
    jobs.rawdata_pattern = node["rawdata_pattern"].as<std::string>(R"(.*\.fits)");
    jobs.results_dir = node["results_dir"].as<std::string>("results");
    jobs.log_archive = node["log_archive"].as<std::string>("log_archive");
    jobs.max_attempts = node["max_attempts"].as<int>(2);
    jobs.delete_rawdata = node["delete_rawdata"].as<bool>(true);
    jobs.sleep_secs = node["sleep_secs"].as<int>(60);
    jobs.upload_command = node["upload_command"].as<std::string>("");
    return jobs;
}

Result<Config> Config::parse(const std::string& yaml_text) {
    try {
        YAML::Node root = YAML::Load(yaml_text);

        Config config;
        config.store_ = parse_store_config(root["store"] ? root["store"] : YAML::Node());
        config.log_ = parse_log_config(root["log"] ? root["log"] : YAML::Node());
        config.restore_service_ = parse_restore_service_config(
            root["restore_service"] ? root["restore_service"] : YAML::Node());
        config.ftp_ = parse_ftp_config(root["ftp"] ? root["ftp"] : YAML::Node());
        config.download_ = parse_download_config(root["download"] ? root["download"] : YAML::Node());
        config.queue_ = parse_queue_config(root["queue"] ? root["queue"] : YAML::Node());
        config.jobs_ = parse_jobs_config(root["jobs"] ? root["jobs"] : YAML::Node());

        if (root["notify"]) {
            config.notify_.command = root["notify"]["command"].as<std::string>("");
        }

        if (config.store_.path.empty()) {
            return Result<Config>::Err("Missing required key: store.path");
        }
        if (config.download_.staging_dir.empty()) {
            return Result<Config>::Err("Missing required key: download.staging_dir");
        }
        if (config.jobs_.rawdata_dir.empty()) {
            return Result<Config>::Err("Missing required key: jobs.rawdata_dir");
        }
        if (config.download_.max_retries < 1 || config.jobs_.max_attempts < 1) {
            return Result<Config>::Err("download.max_retries and jobs.max_attempts must be >= 1");
        }
        for (const auto* pattern : {&config.download_.ignore_pattern, &config.jobs_.rawdata_pattern}) {
            try {
                std::regex check(*pattern);
            } catch (const std::regex_error& e) {
                return Result<Config>::Err("Invalid pattern '" + *pattern + "': " + e.what());
            }
        }

        return Result<Config>::Ok(config);
    } catch (const std::exception& e) {
        return Result<Config>::Err(std::string("Failed to parse config: ") + e.what());
    }
}

Result<Config> Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        return Result<Config>::Err("Config not found at " + path.string());
    }

    std::ifstream in(path);
    if (!in) {
        return Result<Config>::Err("Cannot read config file " + path.string());
    }
    std::stringstream buf;
    buf << in.rdbuf();
    return parse(buf.str());
}
