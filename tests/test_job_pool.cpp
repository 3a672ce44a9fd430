#include <gtest/gtest.h>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <platform/platform.hpp>
#include <core/constants.hpp>
#include <jobs/job_pool.hpp>
#include "fakes.hpp"

namespace fs = std::filesystem;

class JobPoolTest : public ::testing::Test {
protected:
    fs::path test_dir;
    fs::path raw;
    JobsConfig config;
    FakeQueue queue;
    FakeUploader uploader;

    void SetUp() override {
        test_dir = platform::make_temp_dir("obspipe_test_job_pool");
        raw = test_dir / "raw";
        fs::create_directories(raw);

        config.rawdata_dir = raw.string();
        config.results_dir = (test_dir / "results").string();
        config.log_archive = (test_dir / "archive").string();
        config.max_attempts = 2;
        config.delete_rawdata = true;
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    std::string datafile(const std::string& name) {
        fs::path p = raw / name;
        fs::create_directories(p.parent_path());
        std::ofstream(p) << "data";
        return p.string();
    }

    void write_log(const std::string& job_name, const std::vector<std::string>& statuses) {
        std::ofstream out(job_name + ".log");
        for (const auto& s : statuses) {
            out << "2026-03-01 10:00:00.000000 -- " << s << " -- head01 -- \n";
        }
    }

    // Append a status as the compute job would, bumping the mtime.
    void report(const SearchJob& job, const std::string& status, const std::string& info = "") {
        fs::path p = job.log().path();
        auto before = fs::last_write_time(p);
        {
            std::ofstream out(p, std::ios::app);
            out << "2026-03-01 11:00:00.000000 -- " << status << " -- node04 -- " << info << "\n";
        }
        fs::last_write_time(p, before + std::chrono::seconds(1));
    }

    static std::string stem(const std::string& path) {
        return path.substr(0, path.size() - 5);
    }
};

TEST_F(JobPoolTest, DiscoverBuildsJobsFromRawData) {
    datafile("a.fits");
    datafile("sub/b.fits");
    datafile("notes.txt");
    auto c = datafile("c.fits");
    write_log(stem(c), {JOB_NEW, JOB_UPLOAD_OK, JOB_DELETED});

    JobPool pool(config, queue, uploader);
    pool.discover();
    ASSERT_EQ(pool.jobs().size(), 2u);
    EXPECT_EQ(pool.jobs()[0]->datafiles()[0], (raw / "a.fits").string());
    EXPECT_EQ(pool.jobs()[1]->datafiles()[0], (raw / "sub" / "b.fits").string());
    EXPECT_EQ(pool.status_summary(), "Jobs in the Pool: 2");
}

TEST_F(JobPoolTest, AtMostOneSubmitPerPass) {
    datafile("a.fits");
    datafile("b.fits");
    datafile("c.fits");
    JobPool pool(config, queue, uploader);
    pool.discover();

    pool.rotate();
    ASSERT_EQ(queue.submitted.size(), 1u);
    EXPECT_EQ(queue.submitted[0][0], (raw / "a.fits").string());
    EXPECT_EQ(pool.jobs()[0]->status(), "submitted to queue");
    ASSERT_TRUE(pool.jobs()[0]->queue_id().has_value());
    EXPECT_EQ(pool.jobs()[0]->log().last().info, "Job ID: " + *pool.jobs()[0]->queue_id());

    queue.current.queued = 1;
    pool.rotate();
    EXPECT_EQ(queue.submitted.size(), 1u);

    queue.current.queued = 0;
    pool.rotate();
    ASSERT_EQ(queue.submitted.size(), 2u);
    EXPECT_EQ(queue.submitted[1][0], (raw / "b.fits").string());
}

TEST_F(JobPoolTest, QueueStatusErrorSkipsPass) {
    datafile("a.fits");
    JobPool pool(config, queue, uploader);
    pool.discover();
    queue.status_fails = true;
    pool.rotate();
    EXPECT_TRUE(queue.submitted.empty());
    EXPECT_EQ(pool.jobs()[0]->status(), "new job");
}

TEST_F(JobPoolTest, FailedJobIsResubmittedThenDeleted) {
    auto a = datafile("a.fits");
    JobPool pool(config, queue, uploader);
    SearchJob* job = pool.add_job({a});
    ASSERT_NE(job, nullptr);

    pool.rotate();
    ASSERT_EQ(queue.submitted.size(), 1u);

    report(*job, JOB_PROCESSING_FAILED, "exit status 1");
    pool.rotate();
    ASSERT_EQ(queue.submitted.size(), 2u);
    EXPECT_EQ(job->status(), "submitted to queue");
    EXPECT_EQ(*job->queue_id(), "101.head");

    report(*job, JOB_PROCESSING_FAILED, "exit status 1");
    pool.rotate();
    EXPECT_EQ(queue.submitted.size(), 2u);
    EXPECT_TRUE(pool.jobs().empty());
    EXPECT_FALSE(fs::exists(a));
    EXPECT_FALSE(fs::exists(raw / "a.log"));

    fs::path archived = fs::path(config.log_archive) / "a.log";
    ASSERT_TRUE(fs::exists(archived));
    JobLog log(archived, LogEntry::make(JOB_NEW));
    EXPECT_EQ(log.last().status, JOB_DELETED);
    EXPECT_EQ(log.count_status(JOB_SUBMITTED), 2);

    ASSERT_EQ(queue.removed.size(), 1u);
    EXPECT_EQ(queue.removed[0], "101.head");
}

TEST_F(JobPoolTest, ExhaustedLogIsDeletedWithoutResubmitting) {
    auto a = datafile("a.fits");
    write_log(stem(a), {JOB_NEW, JOB_SUBMITTED, JOB_PROCESSING_FAILED,
                        JOB_SUBMITTED, JOB_PROCESSING_FAILED});
    JobPool pool(config, queue, uploader);
    pool.discover();
    pool.rotate();
    EXPECT_TRUE(queue.submitted.empty());
    EXPECT_TRUE(pool.jobs().empty());
}

TEST_F(JobPoolTest, SuccessfulJobIsUploadedThenDeleted) {
    auto a = datafile("a.fits");
    write_log(stem(a), {JOB_NEW, JOB_SUBMITTED, JOB_PROCESSING, JOB_PROCESSING_OK});
    JobPool pool(config, queue, uploader);
    pool.discover();

    pool.rotate();
    ASSERT_EQ(uploader.uploaded.size(), 1u);
    ASSERT_EQ(pool.jobs().size(), 1u);
    EXPECT_EQ(pool.jobs()[0]->status(), "upload successful");
    EXPECT_EQ(pool.jobs()[0]->log().last().info,
              "Results: " + (fs::path(config.results_dir) / "a").string());

    pool.rotate();
    EXPECT_TRUE(pool.jobs().empty());
    EXPECT_FALSE(fs::exists(a));
}

TEST_F(JobPoolTest, FailedUploadIsRetriedNextPass) {
    auto a = datafile("a.fits");
    write_log(stem(a), {JOB_NEW, JOB_PROCESSING_OK});
    uploader.succeed = false;
    JobPool pool(config, queue, uploader);
    pool.discover();

    pool.rotate();
    EXPECT_EQ(pool.jobs()[0]->status(), "processing successful");
    uploader.succeed = true;
    pool.rotate();
    EXPECT_EQ(pool.jobs()[0]->status(), "upload successful");
    EXPECT_EQ(uploader.uploaded.size(), 2u);
}

TEST_F(JobPoolTest, SharedDatafileKeptWhileInDemand) {
    auto a = datafile("a.fits");
    auto b = datafile("b.fits");
    auto shared = datafile("shared.fits");
    write_log(stem(a), {JOB_NEW, JOB_PROCESSING_OK, JOB_UPLOAD_OK});
    write_log(stem(b), {JOB_NEW, JOB_SUBMITTED, JOB_PROCESSING});

    JobPool pool(config, queue, uploader);
    ASSERT_NE(pool.add_job({a, shared}), nullptr);
    SearchJob* second = pool.add_job({b, shared});
    ASSERT_NE(second, nullptr);

    pool.rotate();
    EXPECT_TRUE(queue.submitted.empty());
    EXPECT_EQ(pool.jobs().size(), 2u);
    EXPECT_TRUE(fs::exists(a));
    EXPECT_TRUE(fs::exists(shared));
    EXPECT_TRUE(pool.is_in_demand(*pool.jobs()[0]));

    report(*second, JOB_PROCESSING_OK);
    pool.rotate();
    EXPECT_EQ(pool.jobs().size(), 1u);
    EXPECT_FALSE(fs::exists(a));
    EXPECT_FALSE(fs::exists(shared));
    EXPECT_TRUE(fs::exists(b));

    pool.rotate();
    EXPECT_TRUE(pool.jobs().empty());
    EXPECT_FALSE(fs::exists(b));
}

TEST_F(JobPoolTest, DemandCountsOnlyLiveJobs) {
    auto a = datafile("a.fits");
    auto b = datafile("b.fits");
    auto c = datafile("c.fits");
    write_log(stem(b), {JOB_NEW, JOB_UPLOAD_OK});
    write_log(stem(c), {JOB_NEW, JOB_PROCESSING_FAILED});

    JobPool pool(config, queue, uploader);
    pool.discover();
    auto demand = pool.demand();
    EXPECT_EQ(demand[a], 1);
    EXPECT_EQ(demand.count(b), 0u);
    EXPECT_EQ(demand[c], 1);
}

TEST_F(JobPoolTest, KeepRawDataWhenConfigured) {
    config.delete_rawdata = false;
    auto a = datafile("a.fits");
    write_log(stem(a), {JOB_NEW, JOB_UPLOAD_OK});

    JobPool pool(config, queue, uploader);
    pool.discover();
    pool.rotate();
    EXPECT_TRUE(pool.jobs().empty());
    EXPECT_TRUE(fs::exists(a));
    ASSERT_TRUE(fs::exists(raw / "a.log"));

    EXPECT_EQ(pool.add_job({a}), nullptr);
}

TEST_F(JobPoolTest, UnknownStatusThrows) {
    auto a = datafile("a.fits");
    write_log(stem(a), {JOB_NEW, "Waiting for godot"});
    JobPool pool(config, queue, uploader);
    pool.discover();
    EXPECT_THROW(pool.rotate(), std::runtime_error);
}

TEST_F(JobPoolTest, CorruptedLogThrows) {
    auto a = datafile("a.fits");
    JobPool pool(config, queue, uploader);
    SearchJob* job = pool.add_job({a});
    ASSERT_NE(job, nullptr);

    fs::path p = job->log().path();
    auto before = fs::last_write_time(p);
    std::ofstream(p, std::ios::app) << "garbage without separators\n";
    fs::last_write_time(p, before + std::chrono::seconds(1));

    EXPECT_THROW(pool.rotate(), LogFormatError);
}

TEST_F(JobPoolTest, ResultsDirUsesJobBasename) {
    auto a = datafile("sub/a.fits");
    JobPool pool(config, queue, uploader);
    SearchJob* job = pool.add_job({a});
    EXPECT_EQ(pool.results_dir_for(*job).string(), (fs::path(config.results_dir) / "a").string());
}
