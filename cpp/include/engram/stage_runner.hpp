#pragma once

#include <atomic>
#include <optional>
#include <string>
#include <vector>

#include "engram/clock.hpp"
#include "engram/config.hpp"
#include "engram/job_result.hpp"
#include "engram/observability.hpp"
#include "engram/store/durable_store.hpp"
#include "engram/writeback.hpp"

namespace engram {

// Checked between batches only
class CancellationToken {
public:
    void cancel() { cancelled_.store(true); }
    bool cancelled() const { return cancelled_.load(); }

private:
    std::atomic<bool> cancelled_{false};
};

/**
 * One pipeline stage: reads source rows page by page and turns each into
 * a WorkItem. Items come back in the order of the records they derive
 * from.
 */
class Stage {
public:
    virtual ~Stage() = default;

    virtual const char* name() const = 0;

    virtual size_t page_size() const = 0;

    // Write each page in one transaction instead of batch_size chunks
    virtual bool single_transaction() const { return false; }

    // Where paging starts for this run; incremental stages resume from
    // the persisted watermark.
    virtual store::Watermark start_cursor(const std::optional<store::Watermark>& persisted) const {
        return persisted ? *persisted : store::Watermark{};
    }

    // Paging position of a source row
    virtual store::Watermark cursor_of(const store::Record& r) const {
        return store::Watermark{r.ts, r.id, r.content_hash};
    }

    // Source rows after cursor; corrections only on the first page of a run
    virtual std::vector<store::Record> next_batch(const store::Watermark& cursor, bool first_page,
                                                  size_t limit) = 0;

    // Source rows by id, for retrying quarantined records
    virtual std::vector<store::Record> fetch(const std::vector<std::string>& ids) = 0;

    virtual std::vector<WorkItem> process(const std::vector<store::Record>& batch, Timestamp now) = 0;
};

/**
 * Drives one stage run: run lock, quarantine retry, paged processing with
 * cancellation at batch boundaries, write-back, and the final JobResult.
 */
class StageRunner {
public:
    StageRunner(store::DurableStore& store, const WritebackConfig& config, const Clock& clock,
                ObservabilitySink* sink = nullptr, Sleeper sleeper = thread_sleeper());

    JobResult run(Stage& stage, const CancellationToken* cancel = nullptr);

    // Identity used for the run lock
    static std::string default_owner();

    void set_owner(std::string owner) { owner_ = std::move(owner); }

private:
    void accumulate(JobResult& result, const WriteReport& report) const;
    void finish(JobResult& result) const;

    store::DurableStore& store_;
    WritebackConfig config_;
    const Clock& clock_;
    ObservabilitySink* sink_;
    Sleeper sleeper_;
    std::string owner_;
};

} // namespace engram
