#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "engram/clock.hpp"
#include "engram/config.hpp"
#include "engram/observability.hpp"
#include "engram/retry.hpp"
#include "engram/store/durable_store.hpp"

namespace engram {

struct Write {
    enum class Kind { Upsert, Delete };

    Kind kind = Kind::Upsert;
    std::string table;
    store::Record record;   // only the id is used for deletes

    static Write upsert(std::string table, store::Record record) {
        return Write{Kind::Upsert, std::move(table), std::move(record)};
    }
    static Write remove(std::string table, std::string id) {
        store::Record r;
        r.id = std::move(id);
        return Write{Kind::Delete, std::move(table), std::move(r)};
    }
};

/**
 * Everything one input record produced. Committed all-or-nothing
 * together with the stage watermark. A non-empty rejected_reason marks
 * an input the stage could not process; it is quarantined without
 * touching the store.
 */
struct WorkItem {
    std::string source_id;
    Timestamp source_ts = 0;
    std::string source_hash;
    bool from_quarantine = false;
    std::string rejected_reason;
    std::vector<Write> writes;

    store::Watermark cursor() const { return store::Watermark{source_ts, source_id, source_hash}; }
    bool rejected() const { return !rejected_reason.empty(); }
};

struct WriteReport {
    int64_t processed = 0;
    int64_t succeeded = 0;
    int64_t quarantined = 0;
    int64_t dead_lettered = 0;
    int64_t commits = 0;
};

// Quarantine and dead-letter rows are keyed by "<stage>:<record id>"
std::string quarantine_key(const std::string& stage, const std::string& record_id);

/**
 * Incremental write-back shared by every stage.
 *
 * Items are committed in chunks of batch_size, one transaction per
 * chunk, with the watermark advanced in the same transaction. A failed
 * chunk is rolled back and retried at half the size down to
 * min_batch_size; a failing floor chunk is split into single items.
 * A single item failing a constraint is quarantined; a transient failure
 * of a single item is fatal for the stage (StageFatalError).
 */
class IncrementalWriter {
public:
    IncrementalWriter(store::DurableStore& store, const WritebackConfig& config, const Clock& clock,
                      ObservabilitySink* sink = nullptr, Sleeper sleeper = thread_sleeper());

    WriteReport apply(const std::string& stage, const std::vector<WorkItem>& items);

    // All accepted items in one transaction, never split. Rejected items
    // are quarantined first; a failed commit leaves the store untouched
    // and throws StageFatalError.
    WriteReport apply_atomic(const std::string& stage, const std::vector<WorkItem>& items);

private:
    enum class Outcome { Committed, Integrity, Transient };

    struct Span {
        const WorkItem* begin;
        const WorkItem* end;
        size_t size() const { return static_cast<size_t>(end - begin); }
    };

    void process(const std::string& stage, Span span, size_t chunk_size, WriteReport& report);
    Outcome commit_chunk(const std::string& stage, Span span, std::string& reason);
    void quarantine(const std::string& stage, const WorkItem& item, const std::string& reason,
                    WriteReport& report);
    std::optional<store::Watermark> advance(Span span) const;
    void notify(const BatchReport& report);

    store::DurableStore& store_;
    WritebackConfig config_;
    const Clock& clock_;
    ObservabilitySink* sink_;
    Sleeper sleeper_;
    RetryPolicy retry_;

    // Committed cursor of the stage being applied
    std::optional<store::Watermark> watermark_;
};

} // namespace engram
