#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <core/utils.hpp>
#include <jobs/result_uploader.hpp>
#include <notify/notifier.hpp>
#include <platform/platform.hpp>
#include <platform/process.hpp>
#include <queue/command_runner.hpp>

namespace fs = std::filesystem;

class ShellCommandTest : public ::testing::Test {
protected:
    fs::path test_dir;

    void SetUp() override {
        test_dir = platform::make_temp_dir("obspipe_test_shell");
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    std::string read_file(const fs::path& p) {
        std::ifstream f(p);
        std::stringstream buf;
        buf << f.rdbuf();
        return buf.str();
    }
};

TEST_F(ShellCommandTest, RunShellFeedsStdinAndCollectsOutput) {
    auto r = platform::run_shell("tr a-z A-Z", "hello");
    EXPECT_TRUE(r.success());
    EXPECT_EQ(r.stdout_data, "HELLO");

    auto fail = platform::run_shell("echo oops >&2; exit 3");
    EXPECT_EQ(fail.exit_code, 3);
    EXPECT_EQ(fail.stderr_data, "oops\n");
}

TEST_F(ShellCommandTest, LocalRunnerUsedWithoutHost) {
    QueueConfig config;
    auto runner = make_command_runner(config);
    ASSERT_NE(dynamic_cast<LocalRunner*>(runner.get()), nullptr);
    auto r = runner->run("echo 42.head");
    EXPECT_EQ(r.stdout_data, "42.head\n");
}

TEST_F(ShellCommandTest, SshRunnerUsedWithHost) {
    QueueConfig config;
    config.host = "head.cluster.example.org";
    auto runner = make_command_runner(config);
    EXPECT_NE(dynamic_cast<SSHRunner*>(runner.get()), nullptr);
}

TEST_F(ShellCommandTest, NotifierPipesMessage) {
    fs::path mail = test_dir / "mail.txt";
    NotifyConfig config;
    config.command = "cat > " + shell_quote(mail.string());
    CommandNotifier notifier(config);
    notifier.notify("Restore directory missing", "Restore GUID: guid-1");

    std::string text = read_file(mail);
    EXPECT_EQ(text.rfind("Subject: Restore directory missing\n\n", 0), 0u);
    EXPECT_NE(text.find("Host: "), std::string::npos);
    EXPECT_NE(text.find("Restore GUID: guid-1"), std::string::npos);
}

TEST_F(ShellCommandTest, NotifierFailureIsNotRaised) {
    NotifyConfig config;
    config.command = "exit 1";
    CommandNotifier notifier(config);
    EXPECT_NO_THROW(notifier.notify("subject", "message"));

    CommandNotifier silent{NotifyConfig{}};
    EXPECT_NO_THROW(silent.notify("subject", "message"));
}

TEST_F(ShellCommandTest, UploaderPassesResultsDir) {
    fs::path data = test_dir / "a.fits";
    std::ofstream(data) << "data";
    SearchJob job({data.string()});

    fs::path record = test_dir / "uploaded.txt";
    JobsConfig config;
    config.upload_command = "echo > " + shell_quote(record.string());
    CommandUploader uploader(config);
    ASSERT_TRUE(uploader.upload(job, test_dir / "results" / "a").is_ok());
    EXPECT_TRUE(fs::exists(record));

    config.upload_command = "false";
    EXPECT_TRUE(uploader.upload(job, test_dir / "results" / "a").is_err());

    config.upload_command.clear();
    auto none = uploader.upload(job, test_dir / "results" / "a");
    ASSERT_TRUE(none.is_err());
    EXPECT_EQ(none.error, "No upload command configured");
}
