#pragma once

#include <memory>
#include <string>
#include <vector>

#include "engram/config.hpp"
#include "engram/db/connection.hpp"
#include "engram/db/helpers.hpp"
#include "engram/store/durable_store.hpp"
#include "engram/store/schema.hpp"

namespace engram::db {

/**
 * DurableStore on PostgreSQL. Every pipeline table is keyed by a TEXT id
 * with BIGINT ts and TEXT content_hash, the remaining columns and their
 * CHECK constraints come from store::all_tables().
 */
class PgStore : public store::DurableStore {
public:
    explicit PgStore(const DatabaseConfig& config);
    PgStore(std::string conninfo, size_t pool_size, std::chrono::milliseconds pool_timeout);

    // CREATE TABLE IF NOT EXISTS for every table plus watermarks/run_locks.
    void ensure_schema();

    std::unique_ptr<store::StoreTransaction> begin_transaction() override;
    std::optional<store::Watermark> get_watermark(const std::string& stage) override;
    bool acquire_run_lock(const std::string& stage, const std::string& owner,
                          int ttl_seconds) override;
    void release_run_lock(const std::string& stage, const std::string& owner) override;
    std::vector<store::Record> select(const store::Selection& selection) override;
    std::vector<store::Record> select_pending(const store::PendingQuery& query) override;

    ConnectionPool& pool() { return pool_; }

    static std::string create_table_sql(const store::TableSchema& schema);
    // ON CONFLICT update condition that leaves final rows untouched
    static std::string update_guard_sql(const store::TableSchema& schema);

private:
    static std::vector<store::Record> read_records(const Result& res);

    ConnectionPool pool_;
};

} // namespace engram::db
