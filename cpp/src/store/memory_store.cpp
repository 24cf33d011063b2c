#include "engram/store/memory_store.hpp"

#include <algorithm>
#include <set>

#include "engram/error.hpp"
#include "engram/logging.hpp"

namespace engram::store {

// =============================================================================
// MemoryTransaction
// =============================================================================

class MemoryTransaction : public StoreTransaction {
public:
    explicit MemoryTransaction(MemoryStore& store) : store_(store) {}

    ~MemoryTransaction() override {
        if (!done_) rollback();
    }

    void upsert_batch(const std::string& table, const std::vector<Record>& records) override {
        check_usable();
        store_.note_upsert(table, records.size());
        for (const auto& r : records) {
            try {
                store_.check_upsert(table, r);
            } catch (const EngramException&) {
                aborted_ = true;
                throw;
            }
            ops_.push_back(MemoryStore::Op{false, table, r});
        }
    }

    void delete_batch(const std::string& table, const std::vector<std::string>& ids) override {
        check_usable();
        schema_for(table);
        for (const auto& id : ids) {
            ops_.push_back(MemoryStore::Op{true, table, Record(id, 0)});
        }
    }

    void set_watermark(const std::string& stage, const Watermark& watermark) override {
        check_usable();
        watermarks_[stage] = watermark;
    }

    void commit() override {
        check_usable();
        done_ = true;
        store_.commit_ops(ops_, watermarks_);
    }

    void rollback() override {
        done_ = true;
        ops_.clear();
        watermarks_.clear();
    }

private:
    void check_usable() const {
        ENGRAM_CHECK(!done_, ErrorCode::INVALID_ARGUMENT, "transaction already finished");
        if (aborted_) {
            throw EngramException(ErrorCode::INVALID_ARGUMENT,
                                  "current transaction is aborted, rollback required");
        }
    }

    MemoryStore& store_;
    std::vector<MemoryStore::Op> ops_;
    std::map<std::string, Watermark> watermarks_;
    bool done_ = false;
    bool aborted_ = false;
};

// =============================================================================
// MemoryStore
// =============================================================================

MemoryStore::MemoryStore(const Clock& clock) : clock_(clock) {
    for (const auto& t : all_tables()) {
        tables_[t.name];
    }
}

std::unique_ptr<StoreTransaction> MemoryStore::begin_transaction() {
    return std::make_unique<MemoryTransaction>(*this);
}

void MemoryStore::check_upsert(const std::string& table, const Record& record) const {
    check_constraints(schema_for(table), record);
    std::lock_guard<std::mutex> lock(mutex_);
    if (!transient_id_.empty() && record.id == transient_id_) {
        throw TransientIOError("simulated store timeout", record.id, ErrorCode::STORE_TIMEOUT);
    }
}

void MemoryStore::commit_ops(const std::vector<Op>& ops,
                             const std::map<std::string, Watermark>& watermarks) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (fail_next_ > 0) {
        --fail_next_;
        throw TransientIOError("simulated commit failure", "", ErrorCode::STORE_TIMEOUT);
    }
    if (crash_after_ >= 0 && commits_ >= static_cast<size_t>(crash_after_)) {
        throw TransientIOError("simulated crash before commit", "", ErrorCode::STORE_TIMEOUT);
    }

    for (const auto& op : ops) {
        Table& t = tables_[op.table];
        if (op.is_delete) {
            t.erase(op.record.id);
            continue;
        }
        auto it = t.find(op.record.id);
        if (it == t.end()) {
            t.emplace(op.record.id, op.record);
        } else if (is_final(schema_for(op.table), it->second)) {
            LOG_DEBUG("upsert of final row dropped", kv("table", op.table), kv("id", op.record.id));
        } else {
            it->second = op.record;
        }
    }
    for (const auto& [stage, wm] : watermarks) {
        watermarks_[stage] = wm;
    }
    ++commits_;
}

std::optional<Watermark> MemoryStore::get_watermark(const std::string& stage) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = watermarks_.find(stage);
    if (it == watermarks_.end()) return std::nullopt;
    return it->second;
}

bool MemoryStore::acquire_run_lock(const std::string& stage, const std::string& owner,
                                   int ttl_seconds) {
    std::lock_guard<std::mutex> lock(mutex_);
    Timestamp now = clock_.now();
    auto it = locks_.find(stage);
    if (it != locks_.end() && it->second.owner != owner && it->second.expires_at > now) {
        return false;
    }
    locks_[stage] = LockEntry{owner, now + static_cast<Timestamp>(ttl_seconds) * MS_PER_SECOND};
    return true;
}

void MemoryStore::release_run_lock(const std::string& stage, const std::string& owner) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = locks_.find(stage);
    if (it != locks_.end() && it->second.owner == owner) {
        locks_.erase(it);
    }
}

std::vector<Record> MemoryStore::filter(const Table& rows, const TableSchema& schema,
                                        const std::vector<Predicate>& predicates) const {
    std::vector<Record> out;
    for (const auto& [id, row] : rows) {
        bool match = true;
        for (const auto& p : predicates) {
            ColumnType type = column_type(schema, p.column);
            if (!row.has(p.column)) {
                match = false;
                break;
            }
            const std::string v = row.value(p.column);
            if (p.op == store::Op::In) {
                match = std::any_of(p.values.begin(), p.values.end(), [&](const std::string& x) {
                    return compare_values(type, v, x) == 0;
                });
            } else {
                ENGRAM_CHECK_ARGUMENT(p.values.size() == 1, "predicate needs exactly one value");
                int c = compare_values(type, v, p.values.front());
                switch (p.op) {
                    case store::Op::Eq: match = c == 0; break;
                    case store::Op::Ne: match = c != 0; break;
                    case store::Op::Gt: match = c > 0; break;
                    case store::Op::Ge: match = c >= 0; break;
                    case store::Op::Lt: match = c < 0; break;
                    case store::Op::Le: match = c <= 0; break;
                    case store::Op::In: break;
                }
            }
            if (!match) break;
        }
        if (match) out.push_back(row);
    }
    return out;
}

namespace {

void order_and_limit(std::vector<Record>& rows, Order order, size_t limit) {
    if (order == Order::ByTsThenId) {
        std::sort(rows.begin(), rows.end(), [](const Record& a, const Record& b) {
            return a.ts != b.ts ? a.ts < b.ts : a.id < b.id;
        });
    } else {
        std::sort(rows.begin(), rows.end(),
                  [](const Record& a, const Record& b) { return a.id < b.id; });
    }
    if (limit > 0 && rows.size() > limit) rows.resize(limit);
}

} // namespace

std::vector<Record> MemoryStore::select(const Selection& selection) {
    const TableSchema& schema = schema_for(selection.table);
    std::lock_guard<std::mutex> lock(mutex_);
    auto rows = filter(tables_[selection.table], schema, selection.predicates);
    order_and_limit(rows, selection.order, selection.limit);
    return rows;
}

std::vector<Record> MemoryStore::select_pending(const PendingQuery& query) {
    const TableSchema& schema = schema_for(query.source_table);
    schema_for(query.target_table);
    std::lock_guard<std::mutex> lock(mutex_);

    const Table& target = tables_[query.target_table];
    auto candidates = filter(tables_[query.source_table], schema, query.predicates);

    std::vector<Record> out;
    for (auto& r : candidates) {
        bool after = query.after.ts < r.ts || (query.after.ts == r.ts && query.after.last_id < r.id);
        bool corrected = false;
        if (!after && query.include_corrections) {
            auto it = target.find(r.id);
            corrected = it != target.end() && it->second.value("source_hash") != r.content_hash;
        }
        if (after || corrected) out.push_back(std::move(r));
    }
    order_and_limit(out, Order::ByTsThenId, query.limit);
    return out;
}

void MemoryStore::fail_next_commits(int n) {
    std::lock_guard<std::mutex> lock(mutex_);
    fail_next_ = n;
}

void MemoryStore::crash_after_commits(int n) {
    std::lock_guard<std::mutex> lock(mutex_);
    crash_after_ = static_cast<int>(commits_) + n;
}

void MemoryStore::fail_transiently_on(const std::string& record_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    transient_id_ = record_id;
}

void MemoryStore::clear_faults() {
    std::lock_guard<std::mutex> lock(mutex_);
    fail_next_ = 0;
    crash_after_ = -1;
    transient_id_.clear();
}

void MemoryStore::note_upsert(const std::string& table, size_t size) {
    std::lock_guard<std::mutex> lock(mutex_);
    attempts_[table].push_back(size);
}

std::vector<size_t> MemoryStore::upsert_attempts(const std::string& table) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = attempts_.find(table);
    return it == attempts_.end() ? std::vector<size_t>{} : it->second;
}

size_t MemoryStore::commit_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return commits_;
}

size_t MemoryStore::row_count(const std::string& table) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tables_.find(table);
    return it == tables_.end() ? 0 : it->second.size();
}

MemoryStore::Snapshot MemoryStore::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tables_;
}

} // namespace engram::store
