#pragma once

#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "engram/clock.hpp"
#include "engram/store/durable_store.hpp"
#include "engram/store/schema.hpp"

namespace engram::store {

/**
 * In-process store honouring the same table constraints as PgStore.
 * Used by tests and dry runs. Faults can be injected at commit time to
 * exercise retry, batch halving and crash recovery.
 */
class MemoryStore : public DurableStore {
public:
    using Table = std::map<std::string, Record>;
    using Snapshot = std::map<std::string, Table>;

    explicit MemoryStore(const Clock& clock);

    std::unique_ptr<StoreTransaction> begin_transaction() override;
    std::optional<Watermark> get_watermark(const std::string& stage) override;
    bool acquire_run_lock(const std::string& stage, const std::string& owner,
                          int ttl_seconds) override;
    void release_run_lock(const std::string& stage, const std::string& owner) override;
    std::vector<Record> select(const Selection& selection) override;
    std::vector<Record> select_pending(const PendingQuery& query) override;

    // Next n commits fail with TransientIOError
    void fail_next_commits(int n);
    // Every commit after the first n successful ones fails, until cleared
    void crash_after_commits(int n);
    // Upserts of this record id fail as a transient store error
    void fail_transiently_on(const std::string& record_id);
    void clear_faults();

    size_t commit_count() const;
    // Size of every upsert batch sent for the table, in order, whether or
    // not its transaction committed
    std::vector<size_t> upsert_attempts(const std::string& table) const;
    size_t row_count(const std::string& table) const;
    Snapshot snapshot() const;

private:
    friend class MemoryTransaction;

    struct Op {
        bool is_delete = false;
        std::string table;
        Record record;
    };

    struct LockEntry {
        std::string owner;
        Timestamp expires_at = 0;
    };

    // Validates a pending upsert; throws like the database would.
    void check_upsert(const std::string& table, const Record& record) const;
    void commit_ops(const std::vector<Op>& ops, const std::map<std::string, Watermark>& watermarks);
    void note_upsert(const std::string& table, size_t size);

    std::vector<Record> filter(const Table& rows, const TableSchema& schema,
                               const std::vector<Predicate>& predicates) const;

    const Clock& clock_;
    mutable std::mutex mutex_;
    Snapshot tables_;
    std::map<std::string, Watermark> watermarks_;
    std::map<std::string, LockEntry> locks_;

    std::map<std::string, std::vector<size_t>> attempts_;
    size_t commits_ = 0;
    int fail_next_ = 0;
    int crash_after_ = -1;
    std::string transient_id_;
};

} // namespace engram::store
