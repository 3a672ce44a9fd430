#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <core/config.hpp>
#include <platform/platform.hpp>

namespace fs = std::filesystem;

namespace {

const char* MINIMAL = R"(
store:
  path: /var/lib/obspipe/jobs.db
download:
  staging_dir: /data/staging
jobs:
  rawdata_dir: /data/raw
)";

} // namespace

TEST(ConfigTest, MinimalConfigGetsDefaults) {
    auto r = Config::parse(MINIMAL);
    ASSERT_TRUE(r.is_ok()) << r.error;
    const Config& c = r.value;

    EXPECT_EQ(c.store().path, "/var/lib/obspipe/jobs.db");
    EXPECT_EQ(c.store().busy_timeout_secs, 40);
    EXPECT_EQ(c.store().warn_after_failures, 60);
    EXPECT_EQ(c.download().max_restores, 2);
    EXPECT_EQ(c.download().max_retries, 3);
    EXPECT_EQ(c.download().poll_interval_secs, 37);
    EXPECT_EQ(c.ftp().port, 31001);
    EXPECT_FALSE(c.ftp().verify_peer);
    EXPECT_EQ(c.queue().job_basename, "obspipe");
    EXPECT_EQ(c.queue().port, 22);
    EXPECT_FALSE(c.queue().ssh_key_path.has_value());
    EXPECT_EQ(c.jobs().max_attempts, 2);
    EXPECT_TRUE(c.jobs().delete_rawdata);
    EXPECT_EQ(c.log().level, "info");
    EXPECT_TRUE(c.notify().command.empty());
}

TEST(ConfigTest, FullConfig) {
    auto r = Config::parse(R"(
store:
  path: jobs.db
  retry_delay_ms: 250
log:
  file: /var/log/obspipe.log
  level: debug
  screen_output: false
restore_service:
  url: https://archive.example.org/RestoreService.asmx
  username: survey
  password: secret
  beams: 7
ftp:
  host: ftp.example.org
  port: 21
  verify_peer: true
download:
  staging_dir: /data/staging
  space_to_use: 500000000000
  max_restores: 4
  ignore_pattern: ".*\\.tmp"
queue:
  host: head.cluster.example.org
  user: pipeline
  ssh_key_path: /home/pipeline/.ssh/id_ed25519
  resource_list: nodes=1:ppn=1
  qsublog_dir: /scratch/qsublog
jobs:
  rawdata_dir: /data/raw
  max_attempts: 3
  delete_rawdata: false
  upload_command: /usr/local/bin/upload-results
notify:
  command: /usr/sbin/sendmail ops@example.org
)");
    ASSERT_TRUE(r.is_ok()) << r.error;
    const Config& c = r.value;

    EXPECT_EQ(c.store().retry_delay_ms, 250);
    EXPECT_EQ(c.log().level, "debug");
    EXPECT_FALSE(c.log().screen_output);
    EXPECT_EQ(c.restore_service().beams, 7);
    EXPECT_EQ(c.ftp().host, "ftp.example.org");
    EXPECT_TRUE(c.ftp().verify_peer);
    EXPECT_EQ(c.download().space_to_use, 500000000000LL);
    EXPECT_EQ(c.download().max_restores, 4);
    EXPECT_EQ(c.download().ignore_pattern, ".*\\.tmp");
    ASSERT_TRUE(c.queue().ssh_key_path.has_value());
    EXPECT_EQ(*c.queue().ssh_key_path, "/home/pipeline/.ssh/id_ed25519");
    EXPECT_EQ(c.queue().qsublog_dir, "/scratch/qsublog");
    EXPECT_EQ(c.jobs().max_attempts, 3);
    EXPECT_FALSE(c.jobs().delete_rawdata);
    EXPECT_EQ(c.notify().command, "/usr/sbin/sendmail ops@example.org");
}

TEST(ConfigTest, MissingStorePathIsError) {
    auto r = Config::parse(R"(
download:
  staging_dir: /data/staging
jobs:
  rawdata_dir: /data/raw
)");
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("store.path"), std::string::npos);
}

TEST(ConfigTest, ZeroRetriesRejected) {
    std::string text = std::string(MINIMAL) + "  max_attempts: 0\n";
    auto r = Config::parse(text);
    EXPECT_TRUE(r.is_err());
}

TEST(ConfigTest, InvalidPatternRejected) {
    auto r = Config::parse(R"(
store:
  path: jobs.db
download:
  staging_dir: /data/staging
  ignore_pattern: "([unclosed"
jobs:
  rawdata_dir: /data/raw
)");
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("Invalid pattern"), std::string::npos);
}

TEST(ConfigTest, MalformedYamlIsError) {
    auto r = Config::parse("store: [unterminated");
    EXPECT_TRUE(r.is_err());
}

TEST(ConfigTest, LoadMissingFile) {
    auto r = Config::load(fs::temp_directory_path() / "obspipe_no_such_config.yaml");
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("not found"), std::string::npos);
}

TEST(ConfigTest, LoadFromFile) {
    fs::path dir = platform::make_temp_dir("obspipe_test_config");
    fs::path p = dir / "obspipe.yaml";
    {
        std::ofstream out(p);
        out << MINIMAL;
    }
    auto r = Config::load(p);
    fs::remove_all(dir);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.jobs().rawdata_dir, "/data/raw");
}
