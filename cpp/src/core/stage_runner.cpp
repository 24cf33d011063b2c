#include "engram/stage_runner.hpp"

#include <unistd.h>

#include <algorithm>
#include <chrono>

#include "engram/error.hpp"
#include "engram/logging.hpp"
#include "engram/store/schema.hpp"

namespace engram {

namespace {

// Releases the stage lock on every exit path
class RunLockGuard {
public:
    RunLockGuard(store::DurableStore& store, std::string stage, std::string owner)
        : store_(store), stage_(std::move(stage)), owner_(std::move(owner)) {}

    ~RunLockGuard() {
        try {
            store_.release_run_lock(stage_, owner_);
        } catch (const std::exception& e) {
            LOG_WARN("run lock release failed, it expires with its ttl", kv("stage", stage_),
                     kv("error", e.what()));
        }
    }

    RunLockGuard(const RunLockGuard&) = delete;
    RunLockGuard& operator=(const RunLockGuard&) = delete;

private:
    store::DurableStore& store_;
    std::string stage_;
    std::string owner_;
};

} // namespace

StageRunner::StageRunner(store::DurableStore& store, const WritebackConfig& config, const Clock& clock,
                         ObservabilitySink* sink, Sleeper sleeper)
    : store_(store)
    , config_(config)
    , clock_(clock)
    , sink_(sink)
    , sleeper_(std::move(sleeper))
    , owner_(default_owner()) {}

std::string StageRunner::default_owner() {
    char host[256] = {0};
    if (gethostname(host, sizeof(host) - 1) != 0) {
        host[0] = '\0';
    }
    return std::string(host[0] ? host : "localhost") + ":" + std::to_string(getpid());
}

void StageRunner::accumulate(JobResult& result, const WriteReport& report) const {
    result.records_processed += report.processed;
    result.records_succeeded += report.succeeded;
    result.records_quarantined += report.quarantined;
    result.records_dead_lettered += report.dead_lettered;
}

void StageRunner::finish(JobResult& result) const {
    if (!sink_) return;
    try {
        sink_->on_run(result);
    } catch (const std::exception& e) {
        LOG_WARN("observability sink failed", kv("error", e.what()));
    }
}

JobResult StageRunner::run(Stage& stage, const CancellationToken* cancel) {
    const auto started = std::chrono::steady_clock::now();
    auto elapsed = [&]() {
        return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count();
    };

    JobResult result;
    result.stage = stage.name();

    try {
        if (!store_.acquire_run_lock(result.stage, owner_, config_.run_lock_ttl_seconds)) {
            throw ConcurrencyConflict(result.stage);
        }
    } catch (const ConcurrencyConflict&) {
        result.status = JobStatus::AlreadyRunning;
        result.elapsed_ms = elapsed();
        LOG_INFO("stage already running, nothing to do", kv("stage", result.stage));
        finish(result);
        return result;
    } catch (const EngramException& e) {
        result.status = JobStatus::Failed;
        result.errors.push_back(e.what());
        result.elapsed_ms = elapsed();
        LOG_ERROR("cannot acquire run lock", kv("stage", result.stage), kv("error", e.what()));
        finish(result);
        return result;
    }
    RunLockGuard guard(store_, result.stage, owner_);

    IncrementalWriter writer(store_, config_, clock_, sink_, sleeper_);

    try {
        // Quarantined records are retried before new work
        std::vector<std::string> retry_ids;
        for (const auto& q : store_.select(store::Selection{
                 store::tables::QUARANTINE, {store::where("stage", store::Op::Eq, result.stage)},
                 store::Order::ById, 0})) {
            retry_ids.push_back(q.text("record_id"));
        }
        if (!retry_ids.empty()) {
            LOG_INFO("retrying quarantined records", kv("stage", result.stage), kv("count", retry_ids.size()));
            auto items = stage.process(stage.fetch(retry_ids), clock_.now());
            for (auto& item : items) item.from_quarantine = true;
            accumulate(result, writer.apply(result.stage, items));
            result.batches += 1;
        }

        store::Watermark cursor = stage.start_cursor(store_.get_watermark(result.stage));
        const size_t limit = std::max<size_t>(1, stage.page_size());
        bool first_page = true;

        while (true) {
            if (cancel && cancel->cancelled()) {
                result.status = JobStatus::Cancelled;
                LOG_INFO("stage cancelled at batch boundary", kv("stage", result.stage));
                break;
            }

            const auto batch = stage.next_batch(cursor, first_page, limit);
            first_page = false;
            if (batch.empty()) break;

            const auto items = stage.process(batch, clock_.now());
            accumulate(result, stage.single_transaction() ? writer.apply_atomic(result.stage, items)
                                                          : writer.apply(result.stage, items));
            result.batches += 1;

            for (const auto& r : batch) {
                const auto c = stage.cursor_of(r);
                if (cursor.precedes(c)) cursor = c;
            }
            if (batch.size() < limit) break;
        }
    } catch (const EngramException& e) {
        result.status = JobStatus::Failed;
        result.errors.push_back(e.what());
        LOG_ERROR("stage failed", kv("stage", result.stage), kv("error", e.what()));
    }

    if (result.status == JobStatus::Succeeded &&
        (result.records_quarantined > 0 || result.records_dead_lettered > 0)) {
        result.status = JobStatus::PartialSuccess;
    }
    result.elapsed_ms = elapsed();
    finish(result);
    return result;
}

} // namespace engram
