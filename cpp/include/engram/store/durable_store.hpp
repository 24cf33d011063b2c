#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "engram/store/record.hpp"

namespace engram::store {

/**
 * All-or-nothing unit of work. Statements run eagerly; constraint
 * failures surface as DataIntegrityError from the failing call and
 * leave the transaction unusable until rollback(). Destroying an
 * uncommitted transaction rolls it back.
 */
class StoreTransaction {
public:
    virtual ~StoreTransaction() = default;

    virtual void upsert_batch(const std::string& table, const std::vector<Record>& records) = 0;
    virtual void delete_batch(const std::string& table, const std::vector<std::string>& ids) = 0;
    virtual void set_watermark(const std::string& stage, const Watermark& watermark) = 0;
    virtual void commit() = 0;
    virtual void rollback() = 0;
};

/**
 * The single shared mutable resource of the pipeline. Reads see
 * committed data only.
 */
class DurableStore {
public:
    virtual ~DurableStore() = default;

    virtual std::unique_ptr<StoreTransaction> begin_transaction() = 0;

    virtual std::optional<Watermark> get_watermark(const std::string& stage) = 0;

    // True when the lock was free, expired, or already held by owner.
    virtual bool acquire_run_lock(const std::string& stage, const std::string& owner,
                                  int ttl_seconds) = 0;
    virtual void release_run_lock(const std::string& stage, const std::string& owner) = 0;

    virtual std::vector<Record> select(const Selection& selection) = 0;
    virtual std::vector<Record> select_pending(const PendingQuery& query) = 0;

    // Convenience: a single row by id.
    std::optional<Record> find(const std::string& table, const std::string& id) {
        auto rows = select(Selection{table, {where("id", Op::Eq, id)}, Order::ById, 1});
        if (rows.empty()) return std::nullopt;
        return rows.front();
    }
};

} // namespace engram::store
