#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <platform/platform.hpp>
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <managers/download_manager.hpp>
#include <managers/restore_report.hpp>
#include <store/records.hpp>
#include "fakes.hpp"

namespace fs = std::filesystem;

class DownloadManagerTest : public ::testing::Test {
protected:
    fs::path test_dir;
    fs::path staging;
    StoreConfig store_config;
    DownloadConfig config;
    std::unique_ptr<JobStore> store;
    std::shared_ptr<FakeFtpServer> ftp;
    FakeRestoreService service;
    RecordingNotifier notifier;

    void SetUp() override {
        test_dir = platform::make_temp_dir("obspipe_test_download_manager");
        staging = test_dir / "staging";
        fs::create_directories(staging);

        store_config.path = (test_dir / "jobs.db").string();
        store_config.retry_delay_ms = 10;
        store = std::make_unique<JobStore>(store_config);
        store->initialize_schema();

        config.staging_dir = staging.string();
        config.space_to_use = 1000;
        config.max_restores = 2;
        config.connect_retry_delay_ms = 1;

        ftp = std::make_shared<FakeFtpServer>();
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    DownloadManager make() {
        return DownloadManager(config, *store, service, fake_ftp_factory(ftp), notifier);
    }

    void write_file(const fs::path& p, size_t bytes) {
        fs::create_directories(p.parent_path());
        std::ofstream out(p, std::ios::binary);
        out << std::string(bytes, 'x');
    }

    void insert_request(const std::string& guid, const std::string& status,
                        std::optional<int64_t> size = std::nullopt) {
        auto now = now_str();
        SqlValue size_value = nullptr;
        if (size) size_value = *size;
        store->execute(Statement{
            "INSERT INTO requests (guid, status, size, details, created_at, updated_at) "
            "VALUES (?, ?, ?, ?, ?, ?)",
            {guid, status, size_value, std::string(""), now, now}});
    }
};

TEST_F(DownloadManagerTest, DirectoryUsageIsRecursive) {
    write_file(staging / "a.fits", 100);
    write_file(staging / "sub" / "b.fits", 250);
    EXPECT_EQ(directory_usage(staging), 350);
}

TEST_F(DownloadManagerTest, DirectoryUsageOfMissingDirIsZero) {
    EXPECT_EQ(directory_usage(test_dir / "does_not_exist"), 0);
}

TEST_F(DownloadManagerTest, RecoverTracksUnfinishedRequests) {
    insert_request("guid-a", REQUEST_WAITING);
    insert_request("guid-b", REQUEST_READY, 10);
    insert_request("guid-c", REQUEST_FINISHED, 10);

    auto m = make();
    m.recover();
    ASSERT_EQ(m.active_count(), 2u);
    EXPECT_EQ(*m.restores()[0]->guid(), "guid-a");
    EXPECT_EQ(*m.restores()[1]->guid(), "guid-b");
}

TEST_F(DownloadManagerTest, CountGateBlocksAtMaximum) {
    insert_request("guid-a", REQUEST_WAITING);
    insert_request("guid-b", REQUEST_WAITING);

    auto m = make();
    m.recover();
    EXPECT_FALSE(m.can_request_more());
}

TEST_F(DownloadManagerTest, SpaceGateCountsStagingAndActiveSizes) {
    write_file(staging / "old.fits", 600);
    insert_request("guid-a", REQUEST_READY, 500);

    auto m = make();
    m.recover();
    EXPECT_EQ(m.available_space(), 400);
    EXPECT_FALSE(m.can_request_more());

    store->execute(Statement{"UPDATE requests SET size = ? WHERE guid = ?",
                             {int64_t{300}, std::string("guid-a")}});
    EXPECT_TRUE(m.can_request_more());
}

TEST_F(DownloadManagerTest, UnknownSizesCountAsZero) {
    insert_request("guid-a", REQUEST_WAITING);
    auto m = make();
    m.recover();
    EXPECT_TRUE(m.can_request_more());
}

TEST_F(DownloadManagerTest, AdmissionCheckChangesNothing) {
    write_file(staging / "old.fits", 100);
    auto m = make();
    bool first = m.can_request_more();
    bool second = m.can_request_more();
    EXPECT_EQ(first, second);
    EXPECT_EQ(m.active_count(), 0u);
    EXPECT_TRUE(unfinished_requests(*store).empty());
    EXPECT_EQ(service.restore_calls, 0);
}

TEST_F(DownloadManagerTest, TickRequestsNewRestoreWhenAllowed) {
    service.restore_responses.push_back(Result<std::string>::Ok("guid-new"));
    service.locations["guid-new"] = "pending";

    auto m = make();
    m.tick();
    EXPECT_EQ(service.restore_calls, 1);
    ASSERT_EQ(m.active_count(), 1u);
    auto rec = find_request_by_guid(*store, "guid-new");
    ASSERT_TRUE(rec.has_value());
    EXPECT_EQ(rec->status, REQUEST_WAITING);
}

TEST_F(DownloadManagerTest, RefusedRestoreIsNotTracked) {
    auto m = make();
    m.tick();
    EXPECT_EQ(service.restore_calls, 1);
    EXPECT_EQ(m.active_count(), 0u);
}

TEST_F(DownloadManagerTest, NoRequestWhenFull) {
    config.space_to_use = 50;
    write_file(staging / "old.fits", 100);
    auto m = make();
    m.tick();
    EXPECT_EQ(service.restore_calls, 0);
}

TEST_F(DownloadManagerTest, TickDropsFailedRequests) {
    insert_request("guid-a", REQUEST_FAILED);
    auto m = make();
    m.recover();
    ASSERT_EQ(m.active_count(), 1u);
    m.tick();
    EXPECT_EQ(m.active_count(), 0u);
}

TEST_F(DownloadManagerTest, ReportListsActiveRestores) {
    insert_request("guid-a", REQUEST_READY, 100);
    auto rec = find_request_by_guid(*store, "guid-a");
    auto now = now_str();
    store->execute(Statement{
        "INSERT INTO downloads (request_id, remote_filename, filename, status, size, details, "
        "created_at, updated_at) VALUES (?, ?, ?, ?, ?, ?, ?, ?)",
        {rec->id, std::string("a.fits"), (staging / "a.fits").string(),
         std::string(DOWNLOAD_DOWNLOADING), int64_t{100}, std::string("50 -- 50% -- 10 Kb/s"), now, now}});

    std::ostringstream out;
    print_restore_report(*store, out);
    std::string text = out.str();
    EXPECT_NE(text.find("guid-a"), std::string::npos);
    EXPECT_NE(text.find("a.fits"), std::string::npos);
    EXPECT_NE(text.find("50 -- 50% -- 10 Kb/s"), std::string::npos);
    EXPECT_NE(text.find("attempts: 0"), std::string::npos);
}

TEST_F(DownloadManagerTest, ReportWithNothingActive) {
    insert_request("guid-a", REQUEST_FINISHED, 100);
    std::ostringstream out;
    print_restore_report(*store, out);
    EXPECT_EQ(out.str(), "No active restores.\n");
}
