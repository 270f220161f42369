#include <gtest/gtest.h>
#include "store/FileJobStore.hpp"
#include "store/StorageFault.hpp"
#include "util/timestamp.hpp"
#include "support/TestEnv.hpp"

#include <fstream>
#include <nlohmann/json.hpp>

using namespace es::store;
using namespace es::sync::model;
using namespace es::test;
using namespace std::chrono;

class FileJobStoreTest : public ::testing::Test {
protected:
    TempDir tmp;
    fs::path dir;

    void SetUp() override { dir = tmp / "jobs"; }

    static SyncJob makeJob(const std::string& id, const int priority, const int64_t createdMs,
                           const Status status = Status::QUEUED) {
        SyncJob j;
        j.job_id = id;
        j.resource_id = "SLIDE_" + id;
        j.source_path = "/data/" + id + ".svs";
        j.file_size = 12;
        j.chunk_size = 5;
        j.chunk_count = 3;
        j.chunks_done = boost::dynamic_bitset<>(3);
        j.status = status;
        j.priority = priority;
        j.created_at = es::util::fromEpochMillis(createdMs);
        j.updated_at = j.created_at;
        return j;
    }
};

TEST_F(FileJobStoreTest, SaveWritesOneRecordPerJob) {
    FileJobStore store(dir);
    store.save(makeJob("JOB_1", 5, 1000));

    EXPECT_TRUE(fs::exists(dir / "JOB_1.json"));
    const auto got = store.get("JOB_1");
    ASSERT_TRUE(got);
    EXPECT_EQ(got->resource_id, "SLIDE_JOB_1");
    EXPECT_FALSE(store.get("JOB_missing"));
}

TEST_F(FileJobStoreTest, NoTemporaryFilesLeftBehind) {
    FileJobStore store(dir);
    for (int i = 0; i < 5; ++i) {
        auto j = makeJob("JOB_1", 5, 1000);
        j.retry_count = i;
        store.save(j);
    }

    unsigned int files = 0;
    for (const auto& e : fs::directory_iterator(dir)) {
        if (e.path().filename() == FileJobStore::LEASE_FILE) continue;
        ++files;
        EXPECT_EQ(e.path().filename(), "JOB_1.json");
    }
    EXPECT_EQ(files, 1u);
}

TEST_F(FileJobStoreTest, NextEligibleOrdersByPriorityThenAge) {
    FileJobStore store(dir);
    store.save(makeJob("JOB_A", 5, 1000));
    store.save(makeJob("JOB_B", 1, 3000));
    store.save(makeJob("JOB_C", 3, 2000));
    store.save(makeJob("JOB_D", 1, 2000));

    const auto next = store.nextEligibleJob(system_clock::now());
    ASSERT_TRUE(next);
    EXPECT_EQ(next->job_id, "JOB_D");
}

TEST_F(FileJobStoreTest, NextEligibleSkipsBackoffCancelledAndTerminal) {
    FileJobStore store(dir);
    const auto now = system_clock::now();

    auto backoff = makeJob("JOB_BACKOFF", 1, 1000, Status::PAUSED);
    backoff.next_attempt_at = now + minutes(5);
    auto cancelled = makeJob("JOB_CANCELLED", 1, 1000, Status::PAUSED);
    cancelled.cancelled = true;

    store.save(backoff);
    store.save(cancelled);
    store.save(makeJob("JOB_DONE", 1, 1000, Status::COMPLETED));
    store.save(makeJob("JOB_FAILED", 1, 1000, Status::FAILED));
    store.save(makeJob("JOB_BUSY", 1, 1000, Status::TRANSFERRING));

    EXPECT_FALSE(store.nextEligibleJob(now));

    store.save(makeJob("JOB_LATE", 9, 9000));
    const auto next = store.nextEligibleJob(now);
    ASSERT_TRUE(next);
    EXPECT_EQ(next->job_id, "JOB_LATE");

    const auto later = store.nextEligibleJob(now + minutes(6));
    ASSERT_TRUE(later);
    EXPECT_EQ(later->job_id, "JOB_BACKOFF");
}

TEST_F(FileJobStoreTest, RecordsSurviveReopen) {
    {
        FileJobStore store(dir);
        auto j = makeJob("JOB_1", 5, 1000, Status::PAUSED);
        j.markChunkDone(0);
        j.markChunkDone(2);
        j.remote_transfer_id = "UPL_1";
        store.save(j);
    }

    FileJobStore reopened(dir);
    const auto got = reopened.get("JOB_1");
    ASSERT_TRUE(got);
    EXPECT_EQ(got->doneChunks(), (std::vector<uint64_t>{0, 2}));
    EXPECT_EQ(got->remote_transfer_id, "UPL_1");
    EXPECT_EQ(got->status, Status::PAUSED);
}

TEST_F(FileJobStoreTest, RecoverInterruptedPausesTransferringJobs) {
    {
        FileJobStore store(dir);
        auto j = makeJob("JOB_1", 5, 1000, Status::TRANSFERRING);
        j.markChunkDone(0);
        store.save(j);
        store.save(makeJob("JOB_2", 5, 1000, Status::QUEUED));
    }

    FileJobStore store(dir);
    EXPECT_EQ(store.recoverInterrupted(), 1u);

    const auto got = store.get("JOB_1");
    ASSERT_TRUE(got);
    EXPECT_EQ(got->status, Status::PAUSED);
    EXPECT_TRUE(got->isEligible(system_clock::now()));
    EXPECT_EQ(got->doneChunks(), std::vector<uint64_t>{0});
    EXPECT_EQ(store.listByStatus(Status::TRANSFERRING).size(), 0u);
    EXPECT_EQ(store.recoverInterrupted(), 0u);
}

TEST_F(FileJobStoreTest, CorruptRecordsAreSkipped) {
    fs::create_directories(dir);
    std::ofstream(dir / "JOB_GARBAGE.json") << "{ not json";

    auto bad = makeJob("JOB_BAD", 5, 1000);
    nlohmann::json j = bad;
    j["chunks_done"] = {7};
    std::ofstream(dir / "JOB_BAD.json") << j.dump();

    FileJobStore store(dir);
    store.save(makeJob("JOB_OK", 5, 1000));

    const auto queued = store.listByStatus(Status::QUEUED);
    ASSERT_EQ(queued.size(), 1u);
    EXPECT_EQ(queued.front().job_id, "JOB_OK");
    EXPECT_FALSE(store.get("JOB_BAD"));
    EXPECT_EQ(store.summary().totalJobs(), 1u);
}

TEST_F(FileJobStoreTest, RepairedRecordIsPickedUpWithoutRestart) {
    fs::create_directories(dir);
    const auto path = dir / "JOB_FIXME.json";
    std::ofstream(path) << "{ truncated";

    FileJobStore store(dir);
    EXPECT_FALSE(store.get("JOB_FIXME"));
    EXPECT_FALSE(store.nextEligibleJob(system_clock::now()));

    const auto rejectedAt = fs::last_write_time(path);
    const nlohmann::json fixed = makeJob("JOB_FIXME", 5, 1000);
    std::ofstream(path, std::ios::trunc) << fixed.dump();
    fs::last_write_time(path, rejectedAt + seconds(1));

    const auto got = store.get("JOB_FIXME");
    ASSERT_TRUE(got);
    EXPECT_EQ(got->status, Status::QUEUED);
    EXPECT_EQ(store.nextEligibleJob(system_clock::now())->job_id, "JOB_FIXME");
}

TEST_F(FileJobStoreTest, PicksUpRecordsInsertedByAnotherProcess) {
    FileJobStore daemon(dir);
    EXPECT_FALSE(daemon.nextEligibleJob(system_clock::now()));

    {
        FileJobStore cli(dir);
        cli.save(makeJob("JOB_EXTERNAL", 5, 1000));
    }

    const auto next = daemon.nextEligibleJob(system_clock::now());
    ASSERT_TRUE(next);
    EXPECT_EQ(next->job_id, "JOB_EXTERNAL");
}

TEST_F(FileJobStoreTest, SummaryCountsJobsAndBytes) {
    FileJobStore store(dir);
    store.save(makeJob("JOB_1", 5, 1000));
    store.save(makeJob("JOB_2", 5, 1000));
    store.save(makeJob("JOB_3", 5, 1000, Status::COMPLETED));

    const auto s = store.summary();
    EXPECT_EQ(s.totals(Status::QUEUED).jobs, 2u);
    EXPECT_EQ(s.totals(Status::QUEUED).bytes, 24u);
    EXPECT_EQ(s.totals(Status::COMPLETED).jobs, 1u);
}

TEST_F(FileJobStoreTest, WorkerLeaseIsExclusive) {
    FileJobStore first(dir);
    FileJobStore second(dir);

    EXPECT_TRUE(first.acquireWorkerLease());
    EXPECT_TRUE(first.acquireWorkerLease());
    EXPECT_FALSE(second.acquireWorkerLease());
}

TEST_F(FileJobStoreTest, WorkerLeaseReleasedWithStore) {
    {
        FileJobStore first(dir);
        ASSERT_TRUE(first.acquireWorkerLease());
    }
    FileJobStore second(dir);
    EXPECT_TRUE(second.acquireWorkerLease());
}

TEST_F(FileJobStoreTest, UnwritableDirectoryRaisesStorageFault) {
    FileJobStore store(dir);
    fs::remove_all(dir);
    // A regular file where the directory was: nothing can be created below it
    std::ofstream(dir) << "x";

    EXPECT_THROW(store.save(makeJob("JOB_1", 5, 1000)), StorageFault);
}
