#include <gtest/gtest.h>
#include <chrono>
#include <filesystem>
#include <thread>
#include <sqlite3.h>
#include <platform/platform.hpp>
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <store/job_store.hpp>
#include <store/records.hpp>

namespace fs = std::filesystem;

class JobStoreTest : public ::testing::Test {
protected:
    fs::path test_dir;
    StoreConfig config;

    void SetUp() override {
        test_dir = platform::make_temp_dir("obspipe_test_job_store");
        config.path = (test_dir / "jobs.db").string();
        config.busy_timeout_secs = 0;
        config.retry_delay_ms = 20;
        config.warn_after_failures = 5;
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    int64_t insert_request(JobStore& store, const std::string& guid, const std::string& status) {
        auto now = now_str();
        return store.execute(Statement{
            "INSERT INTO requests (guid, status, details, created_at, updated_at) VALUES (?, ?, ?, ?, ?)",
            {guid, status, std::string("created"), now, now}}).last_insert_id;
    }
};

TEST_F(JobStoreTest, SchemaIsIdempotent) {
    JobStore store(config);
    store.initialize_schema();
    store.initialize_schema();
    EXPECT_TRUE(fs::exists(config.path));
    EXPECT_TRUE(unfinished_requests(store).empty());
}

TEST_F(JobStoreTest, InsertReturnsRowId) {
    JobStore store(config);
    store.initialize_schema();
    int64_t a = insert_request(store, "guid-a", REQUEST_WAITING);
    int64_t b = insert_request(store, "guid-b", REQUEST_WAITING);
    EXPECT_GT(a, 0);
    EXPECT_EQ(b, a + 1);
}

TEST_F(JobStoreTest, NullIsDistinctFromEmpty) {
    JobStore store(config);
    store.initialize_schema();
    insert_request(store, "guid-a", REQUEST_WAITING);

    auto rec = find_request_by_guid(store, "guid-a");
    ASSERT_TRUE(rec.has_value());
    EXPECT_FALSE(rec->size.has_value());

    store.execute(Statement{"UPDATE requests SET size = ?, details = ? WHERE guid = ?",
                            {int64_t{0}, std::string(""), std::string("guid-a")}});
    auto rows = store.query({"SELECT size, details FROM requests WHERE guid = ?", {std::string("guid-a")}});
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_FALSE(rows[0].is_null("size"));
    EXPECT_EQ(rows[0].integer("size", -1), 0);
    EXPECT_FALSE(rows[0].is_null("details"));
    EXPECT_EQ(rows[0].text("details"), "");

    store.execute(Statement{"UPDATE requests SET details = ? WHERE guid = ?",
                            {nullptr, std::string("guid-a")}});
    rows = store.query({"SELECT details FROM requests WHERE guid = ?", {std::string("guid-a")}});
    EXPECT_TRUE(rows[0].is_null("details"));
}

TEST_F(JobStoreTest, FailedBatchCommitsNothing) {
    JobStore store(config);
    store.initialize_schema();
    insert_request(store, "guid-a", REQUEST_WAITING);

    auto now = now_str();
    std::vector<Statement> batch{
        {"UPDATE requests SET status = ? WHERE guid = ?",
         {std::string(REQUEST_READY), std::string("guid-a")}},
        // Duplicate guid violates UNIQUE
        {"INSERT INTO requests (guid, status, created_at, updated_at) VALUES (?, ?, ?, ?)",
         {std::string("guid-a"), std::string(REQUEST_WAITING), now, now}},
    };
    EXPECT_THROW(store.execute(batch), StoreError);

    auto rec = find_request_by_guid(store, "guid-a");
    ASSERT_TRUE(rec.has_value());
    EXPECT_EQ(rec->status, REQUEST_WAITING);
}

TEST_F(JobStoreTest, BadSqlThrows) {
    JobStore store(config);
    store.initialize_schema();
    EXPECT_THROW(store.execute(Statement("SELECT * FROM no_such_table")), StoreError);
}

TEST_F(JobStoreTest, BatchReturnsRowsOfLastStatement) {
    JobStore store(config);
    store.initialize_schema();
    insert_request(store, "guid-a", REQUEST_WAITING);
    insert_request(store, "guid-b", REQUEST_FINISHED);

    auto result = store.execute(std::vector<Statement>{
        {"UPDATE requests SET status = ? WHERE guid = ?",
         {std::string(REQUEST_READY), std::string("guid-a")}},
        "SELECT guid, status FROM requests ORDER BY id",
    });
    ASSERT_EQ(result.rows.size(), 2u);
    EXPECT_EQ(result.rows[0].text("status"), REQUEST_READY);
    EXPECT_EQ(result.rows[1].text("guid"), "guid-b");
}

TEST_F(JobStoreTest, UnfinishedRequestsExcludesFinished) {
    JobStore store(config);
    store.initialize_schema();
    insert_request(store, "guid-a", REQUEST_WAITING);
    insert_request(store, "guid-b", REQUEST_FINISHED);
    insert_request(store, "guid-c", REQUEST_FAILED);

    auto open = unfinished_requests(store);
    ASSERT_EQ(open.size(), 2u);
    EXPECT_EQ(open[0].guid, "guid-a");
    EXPECT_EQ(open[1].guid, "guid-c");
}

TEST_F(JobStoreTest, DownloadAndAttemptViews) {
    JobStore store(config);
    store.initialize_schema();
    int64_t req = insert_request(store, "guid-a", REQUEST_READY);

    auto now = now_str();
    int64_t dl = store.execute(Statement{
        "INSERT INTO downloads (request_id, remote_filename, filename, status, size, created_at, updated_at) "
        "VALUES (?, ?, ?, ?, ?, ?, ?)",
        {req, std::string("a.fits"), std::string("/staging/a.fits"), std::string(DOWNLOAD_NEW),
         int64_t{100}, now, now}}).last_insert_id;
    for (int i = 0; i < 2; i++) {
        store.execute(Statement{
            "INSERT INTO download_attempts (download_id, status, created_at, updated_at) VALUES (?, ?, ?, ?)",
            {dl, std::string(DOWNLOAD_FAILED), now, now}});
    }

    auto downloads = downloads_for_request(store, req);
    ASSERT_EQ(downloads.size(), 1u);
    EXPECT_EQ(downloads[0].local_path, "/staging/a.fits");
    EXPECT_EQ(downloads[0].size, 100);
    EXPECT_EQ(attempt_count(store, dl), 2);
    EXPECT_EQ(attempts_for_download(store, dl).size(), 2u);
    EXPECT_EQ(attempt_count(store, dl + 1), 0);
}

TEST_F(JobStoreTest, LockContentionIsRetried) {
    JobStore store(config);
    store.initialize_schema();

    sqlite3* other = nullptr;
    ASSERT_EQ(sqlite3_open(config.path.c_str(), &other), SQLITE_OK);
    ASSERT_EQ(sqlite3_exec(other, "BEGIN EXCLUSIVE", nullptr, nullptr, nullptr), SQLITE_OK);

    std::thread releaser([other]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(300));
        sqlite3_exec(other, "COMMIT", nullptr, nullptr, nullptr);
    });

    auto start = std::chrono::steady_clock::now();
    int64_t id = insert_request(store, "guid-a", REQUEST_WAITING);
    auto waited = std::chrono::steady_clock::now() - start;

    releaser.join();
    sqlite3_close(other);

    EXPECT_GT(id, 0);
    EXPECT_GE(waited, std::chrono::milliseconds(200));
    EXPECT_TRUE(find_request_by_guid(store, "guid-a").has_value());
}
