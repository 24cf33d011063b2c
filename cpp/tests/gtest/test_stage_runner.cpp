// =============================================================================
// Stage Runner Tests
// =============================================================================

#include <gtest/gtest.h>
#include "engram/stage_runner.hpp"
#include "engram/store/memory_store.hpp"
#include "engram/store/schema.hpp"
#include <cstdio>
#include <string>
#include <vector>

using namespace engram;
using store::MemoryStore;
namespace tables = store::tables;

namespace {

// Copies raw rows into the access log; content_ref "bad" is rejected
class CopyStage : public Stage {
public:
    CopyStage(store::DurableStore& db, size_t page) : db_(db), page_(page) {}

    const char* name() const override { return "copy"; }
    size_t page_size() const override { return page_; }

    std::vector<store::Record> next_batch(const store::Watermark& cursor, bool,
                                          size_t limit) override {
        return db_.select_pending(store::PendingQuery{tables::RAW_MEMORIES, tables::ACCESS_LOG, cursor,
                                                      {}, false, limit});
    }

    std::vector<store::Record> fetch(const std::vector<std::string>& ids) override {
        return db_.select(store::Selection{tables::RAW_MEMORIES, {store::where_in("id", ids)},
                                           store::Order::ByTsThenId, 0});
    }

    std::vector<WorkItem> process(const std::vector<store::Record>& batch, Timestamp) override {
        ++process_calls;
        std::vector<WorkItem> out;
        for (const auto& r : batch) {
            WorkItem w;
            w.source_id = r.id;
            w.source_ts = r.ts;
            w.source_hash = r.content_hash;
            if (r.text("content_ref") == "bad") {
                w.rejected_reason = "unreadable content";
            } else {
                store::Record a(r.id, r.ts);
                a.set("node_id", r.id).set("accessed_at", r.ts);
                w.writes.push_back(Write::upsert(tables::ACCESS_LOG, a));
            }
            out.push_back(std::move(w));
        }
        if (cancel_after_first) cancel_after_first->cancel();
        return out;
    }

    int process_calls = 0;
    CancellationToken* cancel_after_first = nullptr;

private:
    store::DurableStore& db_;
    size_t page_;
};

class CountingSink : public ObservabilitySink {
public:
    void on_batch(const BatchReport&) override { ++batches; }
    void on_run(const JobResult& result) override { runs.push_back(result); }

    int batches = 0;
    std::vector<JobResult> runs;
};

Sleeper no_sleep() {
    return [](std::chrono::milliseconds) {};
}

} // namespace

class StageRunnerTest : public ::testing::Test {
protected:
    static constexpr Timestamp BASE = 1700000000000;

    ManualClock clock{BASE};
    MemoryStore db{clock};
    WritebackConfig config;

    static std::string id_for(int i) {
        char buf[16];
        std::snprintf(buf, sizeof(buf), "m%04d", i);
        return buf;
    }

    store::Record raw(int i, const std::string& content = "note") {
        store::Record r(id_for(i), BASE + i);
        r.content_hash = content + std::to_string(i);
        r.set("content_ref", content).set("salience", 0.5).set("importance", 0.5).set("sentiment", 0.0);
        return r;
    }

    void insert(const std::vector<store::Record>& rows) {
        auto tx = db.begin_transaction();
        tx->upsert_batch(tables::RAW_MEMORIES, rows);
        tx->commit();
    }

    void seed(int n, int bad = -1) {
        std::vector<store::Record> rows;
        for (int i = 1; i <= n; ++i) rows.push_back(raw(i, i == bad ? "bad" : "note"));
        insert(rows);
    }

    StageRunner runner(ObservabilitySink* sink = nullptr) {
        StageRunner r(db, config, clock, sink, no_sleep());
        r.set_owner("test-owner");
        return r;
    }
};

TEST_F(StageRunnerTest, ProcessesAllPages) {
    seed(25);
    CopyStage stage(db, 10);
    const auto result = runner().run(stage);

    EXPECT_EQ(result.status, JobStatus::Succeeded);
    EXPECT_EQ(result.stage, "copy");
    EXPECT_EQ(result.records_processed, 25);
    EXPECT_EQ(result.records_succeeded, 25);
    EXPECT_EQ(result.batches, 3);
    EXPECT_EQ(db.row_count(tables::ACCESS_LOG), 25u);
    EXPECT_EQ(db.get_watermark("copy")->last_id, id_for(25));
}

TEST_F(StageRunnerTest, SecondRunIsIncremental) {
    seed(12);
    CopyStage stage(db, 10);
    runner().run(stage);

    insert({raw(13)});
    const auto result = runner().run(stage);
    EXPECT_EQ(result.status, JobStatus::Succeeded);
    EXPECT_EQ(result.records_processed, 1);

    const auto idle = runner().run(stage);
    EXPECT_EQ(idle.records_processed, 0);
    EXPECT_EQ(db.row_count(tables::ACCESS_LOG), 13u);
}

// Another holder of the lock makes the run a no-op, until its ttl expires
TEST_F(StageRunnerTest, HeldLockReportsAlreadyRunning) {
    seed(5);
    ASSERT_TRUE(db.acquire_run_lock("copy", "other-host:1", 60));
    CopyStage stage(db, 10);

    const auto blocked = runner().run(stage);
    EXPECT_EQ(blocked.status, JobStatus::AlreadyRunning);
    EXPECT_EQ(blocked.records_processed, 0);
    EXPECT_EQ(stage.process_calls, 0);

    clock.advance_seconds(61);
    const auto result = runner().run(stage);
    EXPECT_EQ(result.status, JobStatus::Succeeded);
    EXPECT_EQ(result.records_processed, 5);
}

TEST_F(StageRunnerTest, LockReleasedAfterRun) {
    seed(3);
    CopyStage stage(db, 10);
    runner().run(stage);
    EXPECT_TRUE(db.acquire_run_lock("copy", "other-host:1", 60));
}

TEST_F(StageRunnerTest, CancellationStopsAtBatchBoundary) {
    seed(25);
    CancellationToken token;
    CopyStage stage(db, 10);
    stage.cancel_after_first = &token;

    const auto cancelled = runner().run(stage, &token);
    EXPECT_EQ(cancelled.status, JobStatus::Cancelled);
    EXPECT_EQ(cancelled.records_processed, 10);
    EXPECT_EQ(cancelled.batches, 1);
    EXPECT_EQ(db.row_count(tables::ACCESS_LOG), 10u);

    stage.cancel_after_first = nullptr;
    CancellationToken fresh;
    const auto resumed = runner().run(stage, &fresh);
    EXPECT_EQ(resumed.status, JobStatus::Succeeded);
    EXPECT_EQ(resumed.records_processed, 15);
    EXPECT_EQ(db.row_count(tables::ACCESS_LOG), 25u);
}

TEST_F(StageRunnerTest, QuarantinedRecordRetriedNextRun) {
    seed(12, 5);
    CopyStage stage(db, 10);

    const auto first = runner().run(stage);
    EXPECT_EQ(first.status, JobStatus::PartialSuccess);
    EXPECT_EQ(first.records_quarantined, 1);
    EXPECT_EQ(first.records_succeeded, 11);

    // Still broken: quarantined again with a higher run count
    const auto second = runner().run(stage);
    EXPECT_EQ(second.records_processed, 1);
    EXPECT_EQ(db.find(tables::QUARANTINE, quarantine_key("copy", id_for(5)))->integer("consecutive_runs"), 2);

    insert({raw(5)});
    const auto third = runner().run(stage);
    EXPECT_EQ(third.status, JobStatus::Succeeded);
    EXPECT_EQ(third.records_succeeded, 1);
    EXPECT_EQ(db.row_count(tables::QUARANTINE), 0u);
    EXPECT_EQ(db.row_count(tables::ACCESS_LOG), 12u);
}

// A crash mid-run leaves committed batches intact; the rerun converges
TEST_F(StageRunnerTest, RerunAfterCrashMatchesCleanRun) {
    config.batch_size = 10;
    config.min_batch_size = 5;
    seed(25);

    ManualClock clean_clock{BASE};
    MemoryStore clean{clean_clock};
    {
        auto tx = clean.begin_transaction();
        std::vector<store::Record> rows;
        for (int i = 1; i <= 25; ++i) rows.push_back(raw(i));
        tx->upsert_batch(tables::RAW_MEMORIES, rows);
        tx->commit();
        CopyStage clean_stage(clean, 10);
        StageRunner r(clean, config, clean_clock, nullptr, no_sleep());
        ASSERT_EQ(r.run(clean_stage).status, JobStatus::Succeeded);
    }

    db.crash_after_commits(1);
    CopyStage stage(db, 10);
    const auto crashed = runner().run(stage);
    EXPECT_EQ(crashed.status, JobStatus::Failed);
    EXPECT_FALSE(crashed.errors.empty());
    EXPECT_EQ(db.row_count(tables::ACCESS_LOG), 10u);
    EXPECT_EQ(db.get_watermark("copy")->last_id, id_for(10));

    db.clear_faults();
    const auto rerun = runner().run(stage);
    EXPECT_EQ(rerun.status, JobStatus::Succeeded);
    EXPECT_EQ(rerun.records_processed, 15);
    EXPECT_EQ(db.snapshot().at(tables::ACCESS_LOG), clean.snapshot().at(tables::ACCESS_LOG));
}

TEST_F(StageRunnerTest, SinkSeesBatchesAndRun) {
    seed(15);
    CountingSink sink;
    CopyStage stage(db, 10);
    runner(&sink).run(stage);
    EXPECT_EQ(sink.batches, 2);
    ASSERT_EQ(sink.runs.size(), 1u);
    EXPECT_EQ(sink.runs[0].records_succeeded, 15);
}
