#include "engram/writeback.hpp"

#include <algorithm>
#include <chrono>

#include "engram/error.hpp"
#include "engram/logging.hpp"
#include "engram/store/schema.hpp"

namespace engram {

std::string quarantine_key(const std::string& stage, const std::string& record_id) {
    return stage + ":" + record_id;
}

IncrementalWriter::IncrementalWriter(store::DurableStore& store, const WritebackConfig& config,
                                     const Clock& clock, ObservabilitySink* sink, Sleeper sleeper)
    : store_(store)
    , config_(config)
    , clock_(clock)
    , sink_(sink)
    , sleeper_(std::move(sleeper)) {
    retry_.max_retries = config_.max_retries;
    retry_.base_delay = std::chrono::milliseconds(config_.retry_base_delay_ms);
    retry_.max_delay = std::chrono::milliseconds(config_.retry_max_delay_ms);
}

WriteReport IncrementalWriter::apply(const std::string& stage, const std::vector<WorkItem>& items) {
    WriteReport report;
    watermark_ = store_.get_watermark(stage);
    if (items.empty()) return report;

    const size_t batch = static_cast<size_t>(std::max(1, config_.batch_size));
    const WorkItem* const first = items.data();
    const WorkItem* const last = items.data() + items.size();

    for (const WorkItem* chunk = first; chunk < last;) {
        const WorkItem* chunk_end = chunk + std::min(batch, static_cast<size_t>(last - chunk));
        const WriteReport before = report;
        const auto started = std::chrono::steady_clock::now();

        // Rejected inputs split the chunk; everything else goes through the store
        const WorkItem* run = chunk;
        for (const WorkItem* it = chunk; it < chunk_end; ++it) {
            if (!it->rejected()) continue;
            if (run < it) process(stage, Span{run, it}, batch, report);
            report.processed += 1;
            quarantine(stage, *it, it->rejected_reason, report);
            run = it + 1;
        }
        if (run < chunk_end) process(stage, Span{run, chunk_end}, batch, report);

        BatchReport br;
        br.stage = stage;
        br.processed = report.processed - before.processed;
        br.succeeded = report.succeeded - before.succeeded;
        br.quarantined = report.quarantined - before.quarantined;
        br.dead_lettered = report.dead_lettered - before.dead_lettered;
        br.failed = br.quarantined + br.dead_lettered;
        br.chunk_size = static_cast<int64_t>(chunk_end - chunk);
        br.elapsed_ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count();
        notify(br);

        chunk = chunk_end;
    }
    return report;
}

WriteReport IncrementalWriter::apply_atomic(const std::string& stage, const std::vector<WorkItem>& items) {
    WriteReport report;
    watermark_ = store_.get_watermark(stage);
    if (items.empty()) return report;
    const auto started = std::chrono::steady_clock::now();

    std::vector<WorkItem> accepted;
    accepted.reserve(items.size());
    for (const auto& item : items) {
        if (item.rejected()) {
            report.processed += 1;
            quarantine(stage, item, item.rejected_reason, report);
        } else {
            accepted.push_back(item);
        }
    }

    if (!accepted.empty()) {
        std::string reason;
        const Span all{accepted.data(), accepted.data() + accepted.size()};
        if (commit_chunk(stage, all, reason) != Outcome::Committed) {
            LOG_ERROR("single-transaction write rolled back", kv("stage", stage), kv("size", all.size()),
                      kv("reason", reason));
            throw StageFatalError("write of " + std::to_string(all.size()) +
                                  " records rolled back, nothing applied: " + reason, stage);
        }
        report.processed += static_cast<int64_t>(all.size());
        report.succeeded += static_cast<int64_t>(all.size());
        report.commits += 1;
    }

    BatchReport br;
    br.stage = stage;
    br.processed = report.processed;
    br.succeeded = report.succeeded;
    br.quarantined = report.quarantined;
    br.dead_lettered = report.dead_lettered;
    br.failed = br.quarantined + br.dead_lettered;
    br.chunk_size = static_cast<int64_t>(items.size());
    br.elapsed_ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count();
    notify(br);
    return report;
}

void IncrementalWriter::process(const std::string& stage, Span span, size_t chunk_size, WriteReport& report) {
    const size_t floor = static_cast<size_t>(std::max(1, config_.min_batch_size));

    for (const WorkItem* it = span.begin; it < span.end;) {
        Span chunk{it, it + std::min(chunk_size, static_cast<size_t>(span.end - it))};
        it = chunk.end;

        std::string reason;
        const Outcome outcome = commit_chunk(stage, chunk, reason);
        if (outcome == Outcome::Committed) {
            report.processed += static_cast<int64_t>(chunk.size());
            report.succeeded += static_cast<int64_t>(chunk.size());
            report.commits += 1;
            continue;
        }

        LOG_WARN("write-back chunk rolled back", kv("stage", stage), kv("size", chunk.size()),
                 kv("reason", reason));

        if (chunk.size() > floor) {
            process(stage, chunk, std::max(floor, chunk.size() / 2), report);
            continue;
        }

        // Floor reached: isolate item by item
        for (const WorkItem* single = chunk.begin; single < chunk.end; ++single) {
            Span one{single, single + 1};
            std::string item_reason;
            const Outcome o = chunk.size() == 1 ? outcome : commit_chunk(stage, one, item_reason);
            if (chunk.size() == 1) item_reason = reason;

            report.processed += 1;
            if (o == Outcome::Committed) {
                report.succeeded += 1;
                report.commits += 1;
            } else if (o == Outcome::Integrity) {
                quarantine(stage, *single, item_reason, report);
            } else {
                throw StageFatalError("transient failure writing record " + single->source_id + ": " +
                                      item_reason, stage);
            }
        }
    }
}

IncrementalWriter::Outcome IncrementalWriter::commit_chunk(const std::string& stage, Span span,
                                                           std::string& reason) {
    const auto next = advance(span);
    try {
        retry_with_backoff(retry_, sleeper_, "write-back commit", [&]() {
            auto tx = store_.begin_transaction();

            // Consecutive writes to the same table go out as one batch
            std::vector<store::Record> run;
            std::string run_table;
            Write::Kind run_kind = Write::Kind::Upsert;
            auto flush = [&]() {
                if (run.empty()) return;
                if (run_kind == Write::Kind::Upsert) {
                    tx->upsert_batch(run_table, run);
                } else {
                    std::vector<std::string> ids;
                    ids.reserve(run.size());
                    for (const auto& r : run) ids.push_back(r.id);
                    tx->delete_batch(run_table, ids);
                }
                run.clear();
            };

            std::vector<std::string> released;
            for (const WorkItem* it = span.begin; it < span.end; ++it) {
                for (const auto& w : it->writes) {
                    if (!run.empty() && (w.kind != run_kind || w.table != run_table)) flush();
                    run_kind = w.kind;
                    run_table = w.table;
                    run.push_back(w.record);
                }
                if (it->from_quarantine) released.push_back(quarantine_key(stage, it->source_id));
            }
            flush();

            if (!released.empty()) tx->delete_batch(store::tables::QUARANTINE, released);
            if (next) tx->set_watermark(stage, *next);
            tx->commit();
        });
    } catch (const DataIntegrityError& e) {
        reason = e.what();
        return Outcome::Integrity;
    } catch (const TransientIOError& e) {
        reason = e.what();
        return Outcome::Transient;
    }

    if (next) watermark_ = next;
    return Outcome::Committed;
}

void IncrementalWriter::quarantine(const std::string& stage, const WorkItem& item, const std::string& reason,
                                   WriteReport& report) {
    const Timestamp now = clock_.now();
    const std::string key = quarantine_key(stage, item.source_id);
    const auto next = advance(Span{&item, &item + 1});

    bool dead = false;
    retry_with_backoff(retry_, sleeper_, "quarantine write", [&]() {
        const auto existing = store_.find(store::tables::QUARANTINE, key);
        const int64_t runs = existing ? existing->integer_or("consecutive_runs", 0) + 1 : 1;
        const Timestamp first_seen = existing ? existing->integer_or("first_seen", now) : now;

        auto tx = store_.begin_transaction();
        dead = runs >= config_.dead_letter_after_runs;
        if (dead) {
            store::Record r(key, now);
            r.set("stage", stage).set("record_id", item.source_id).set("reason", reason)
             .set("runs", runs).set("dead_lettered_at", now);
            tx->upsert_batch(store::tables::DEAD_LETTERS, {r});
            if (existing) tx->delete_batch(store::tables::QUARANTINE, {key});
        } else {
            store::Record r(key, now);
            r.set("stage", stage).set("record_id", item.source_id).set("reason", reason)
             .set("consecutive_runs", runs).set("first_seen", first_seen).set("last_seen", now);
            tx->upsert_batch(store::tables::QUARANTINE, {r});
        }
        if (next) tx->set_watermark(stage, *next);
        tx->commit();
    });
    if (next) watermark_ = next;

    if (dead) {
        report.dead_lettered += 1;
        LOG_ERROR("record dead-lettered", kv("stage", stage), kv("record", item.source_id), kv("reason", reason));
    } else {
        report.quarantined += 1;
        LOG_WARN("record quarantined", kv("stage", stage), kv("record", item.source_id), kv("reason", reason));
    }
}

std::optional<store::Watermark> IncrementalWriter::advance(Span span) const {
    std::optional<store::Watermark> best;
    for (const WorkItem* it = span.begin; it < span.end; ++it) {
        const auto c = it->cursor();
        if (!best || best->precedes(c)) best = c;
    }
    if (best && watermark_ && !watermark_->precedes(*best)) return std::nullopt;
    return best;
}

void IncrementalWriter::notify(const BatchReport& report) {
    if (!sink_) return;
    try {
        sink_->on_batch(report);
    } catch (const std::exception& e) {
        LOG_WARN("observability sink failed", kv("error", e.what()));
    }
}

} // namespace engram
