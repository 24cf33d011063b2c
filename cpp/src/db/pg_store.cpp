#include "engram/db/pg_store.hpp"

#include "engram/db/helpers.hpp"
#include "engram/db/operations.hpp"
#include "engram/error.hpp"
#include "engram/hash.hpp"
#include "engram/logging.hpp"

namespace engram::db {

using store::ColumnType;
using store::Op;
using store::Record;

namespace {

const char* sql_type(ColumnType t) {
    switch (t) {
        case ColumnType::Text: return "TEXT";
        case ColumnType::Integer: return "BIGINT";
        case ColumnType::Real: return "DOUBLE PRECISION";
        case ColumnType::Boolean: return "BOOLEAN";
    }
    return "TEXT";
}

std::string literal(const std::string& s) {
    std::string out = "'";
    for (char c : s) {
        if (c == '\'') out += '\'';
        out += c;
    }
    out += '\'';
    return out;
}

std::string number_literal(double v) {
    return format_double(v);
}

const char* op_sql(Op op) {
    switch (op) {
        case Op::Eq: return " = ";
        case Op::Ne: return " <> ";
        case Op::Gt: return " > ";
        case Op::Ge: return " >= ";
        case Op::Lt: return " < ";
        case Op::Le: return " <= ";
        case Op::In: return " IN ";
    }
    return " = ";
}

std::string cast_for(ColumnType t) {
    return std::string("::") + sql_type(t);
}

// Appends "AND <predicate>" clauses for the given alias, binding params.
void append_predicates(std::string& sql, const std::string& alias,
                       const store::TableSchema& schema,
                       const std::vector<store::Predicate>& predicates,
                       std::vector<std::optional<std::string>>& params) {
    for (const auto& p : predicates) {
        ColumnType type = store::column_type(schema, p.column);
        std::string col = alias + quote_ident(p.column);
        if (p.op == Op::In) {
            if (p.values.empty()) {
                sql += " AND FALSE";
                continue;
            }
            sql += " AND " + col + " IN (";
            for (size_t i = 0; i < p.values.size(); ++i) {
                if (i) sql += ", ";
                params.emplace_back(p.values[i]);
                sql += "$" + std::to_string(params.size()) + cast_for(type);
            }
            sql += ")";
        } else {
            ENGRAM_CHECK_ARGUMENT(p.values.size() == 1, "predicate needs exactly one value");
            params.emplace_back(p.values.front());
            sql += " AND " + col + op_sql(p.op) + "$" + std::to_string(params.size()) + cast_for(type);
        }
    }
}

std::string normalize_bool(const std::string& v) {
    if (v == "t") return "true";
    if (v == "f") return "false";
    return v;
}

} // namespace

// =============================================================================
// PgTransaction
// =============================================================================

class PgTransaction : public store::StoreTransaction {
public:
    explicit PgTransaction(ConnectionPool& pool)
        : conn_(std::make_unique<PooledConnection>(pool))
        , tx_(std::make_unique<Transaction>(conn_->get())) {}

    ~PgTransaction() override {
        // Transaction rolls back before the connection returns to the pool
        tx_.reset();
    }

    void upsert_batch(const std::string& table, const std::vector<Record>& records) override {
        const auto& schema = store::schema_for(table);
        const std::string guard = PgStore::update_guard_sql(schema);
        for (const auto& r : records) {
            store::check_constraints(schema, r);

            std::vector<std::string> columns = {"id", "ts", "content_hash"};
            std::vector<std::optional<std::string>> params = {r.id, std::to_string(r.ts), r.content_hash};
            for (const auto& [name, value] : r.columns) {
                columns.push_back(name);
                params.emplace_back(value);
            }
            exec_checked(conn_->get(), build_upsert(table, columns, guard), params, r.id);
        }
    }

    void delete_batch(const std::string& table, const std::vector<std::string>& ids) override {
        store::schema_for(table);
        const std::string sql = "DELETE FROM " + quote_ident(table) + " WHERE id = $1";
        for (const auto& id : ids) {
            exec_checked(conn_->get(), sql, {id}, id);
        }
    }

    void set_watermark(const std::string& stage, const store::Watermark& wm) override {
        exec_checked(conn_->get(),
                     R"SQL(
            INSERT INTO watermarks (stage, ts, last_id, content_hash)
            VALUES ($1, $2, $3, $4)
            ON CONFLICT (stage) DO UPDATE SET
                ts = EXCLUDED.ts,
                last_id = EXCLUDED.last_id,
                content_hash = EXCLUDED.content_hash
        )SQL",
                     {stage, std::to_string(wm.ts), wm.last_id, wm.content_hash});
    }

    void commit() override { tx_->commit(); }
    void rollback() override { tx_->rollback(); }

private:
    std::unique_ptr<PooledConnection> conn_;
    std::unique_ptr<Transaction> tx_;
};

// =============================================================================
// PgStore
// =============================================================================

PgStore::PgStore(const DatabaseConfig& config) : pool_(config) {}

PgStore::PgStore(std::string conninfo, size_t pool_size, std::chrono::milliseconds pool_timeout)
    : pool_(std::move(conninfo), pool_size, pool_timeout) {}

std::string PgStore::update_guard_sql(const store::TableSchema& schema) {
    if (schema.final_column.empty() || schema.final_values.empty()) return "";
    std::string sql = quote_ident(schema.name) + "." + quote_ident(schema.final_column) + " NOT IN (";
    for (size_t i = 0; i < schema.final_values.size(); ++i) {
        if (i) sql += ", ";
        sql += literal(schema.final_values[i]);
    }
    sql += ")";
    return sql;
}

std::string PgStore::create_table_sql(const store::TableSchema& schema) {
    std::string sql = "CREATE TABLE IF NOT EXISTS " + quote_ident(schema.name) + " (\n"
                      "    id TEXT COLLATE \"C\" PRIMARY KEY,\n"
                      "    ts BIGINT NOT NULL,\n"
                      "    content_hash TEXT NOT NULL DEFAULT ''";
    for (const auto& c : schema.columns) {
        std::string col = quote_ident(c.name);
        sql += ",\n    " + col + " " + sql_type(c.type);
        if (c.required) sql += " NOT NULL";
        if (c.min) sql += " CHECK (" + col + " >= " + number_literal(*c.min) + ")";
        if (c.max) sql += " CHECK (" + col + " <= " + number_literal(*c.max) + ")";
        if (!c.allowed.empty()) {
            sql += " CHECK (" + col + " IN (";
            for (size_t i = 0; i < c.allowed.size(); ++i) {
                if (i) sql += ", ";
                sql += literal(c.allowed[i]);
            }
            sql += "))";
        }
    }
    sql += "\n)";
    return sql;
}

void PgStore::ensure_schema() {
    PooledConnection conn(pool_);
    Transaction tx(conn.get());

    for (const auto& schema : store::all_tables()) {
        exec_checked(conn.get(), create_table_sql(schema));
        exec_checked(conn.get(), "CREATE INDEX IF NOT EXISTS " +
                     quote_ident("idx_" + schema.name + "_ts") + " ON " +
                     quote_ident(schema.name) + " (ts, id)");
    }

    exec_checked(conn.get(), R"SQL(
        CREATE TABLE IF NOT EXISTS watermarks (
            stage TEXT PRIMARY KEY,
            ts BIGINT NOT NULL,
            last_id TEXT NOT NULL DEFAULT '',
            content_hash TEXT NOT NULL DEFAULT ''
        )
    )SQL");

    exec_checked(conn.get(), R"SQL(
        CREATE TABLE IF NOT EXISTS run_locks (
            stage TEXT PRIMARY KEY,
            owner TEXT NOT NULL,
            expires_at BIGINT NOT NULL
        )
    )SQL");

    tx.commit();
    LOG_INFO("Schema ready", kv("tables", store::all_tables().size() + 2));
}

std::unique_ptr<store::StoreTransaction> PgStore::begin_transaction() {
    return std::make_unique<PgTransaction>(pool_);
}

std::optional<store::Watermark> PgStore::get_watermark(const std::string& stage) {
    PooledConnection conn(pool_);
    Result res = exec_checked(conn.get(),
                              "SELECT ts, last_id, content_hash FROM watermarks WHERE stage = $1",
                              {stage});
    if (res.ntuples() == 0) return std::nullopt;
    return store::Watermark{res.int64(0, 0), res.str(0, 1), res.str(0, 2)};
}

bool PgStore::acquire_run_lock(const std::string& stage, const std::string& owner, int ttl_seconds) {
    PooledConnection conn(pool_);
    Result res = exec_checked(conn.get(), R"SQL(
        WITH now_ms AS (
            SELECT (EXTRACT(EPOCH FROM clock_timestamp()) * 1000)::BIGINT AS v
        )
        INSERT INTO run_locks (stage, owner, expires_at)
        SELECT $1, $2, now_ms.v + $3::BIGINT * 1000 FROM now_ms
        ON CONFLICT (stage) DO UPDATE SET
            owner = EXCLUDED.owner,
            expires_at = EXCLUDED.expires_at
        WHERE run_locks.expires_at <= (EXTRACT(EPOCH FROM clock_timestamp()) * 1000)::BIGINT
           OR run_locks.owner = EXCLUDED.owner
        RETURNING stage
    )SQL", {stage, owner, std::to_string(ttl_seconds)});
    return res.ntuples() == 1;
}

void PgStore::release_run_lock(const std::string& stage, const std::string& owner) {
    PooledConnection conn(pool_);
    exec_checked(conn.get(), "DELETE FROM run_locks WHERE stage = $1 AND owner = $2", {stage, owner});
}

std::vector<Record> PgStore::read_records(const Result& res) {
    std::vector<Record> out;
    out.reserve(static_cast<size_t>(res.ntuples()));
    const int nf = res.nfields();
    for (int row = 0; row < res.ntuples(); ++row) {
        Record r;
        for (int col = 0; col < nf; ++col) {
            const std::string name = res.field_name(col);
            if (name == "id") {
                r.id = res.str(row, col);
            } else if (name == "ts") {
                r.ts = res.int64(row, col);
            } else if (name == "content_hash") {
                r.content_hash = res.str(row, col);
            } else if (!res.is_null(row, col)) {
                r.columns[name] = normalize_bool(res.str(row, col));
            }
        }
        out.push_back(std::move(r));
    }
    return out;
}

std::vector<Record> PgStore::select(const store::Selection& selection) {
    const auto& schema = store::schema_for(selection.table);
    std::vector<std::optional<std::string>> params;
    std::string sql = "SELECT * FROM " + quote_ident(selection.table) + " t WHERE TRUE";
    append_predicates(sql, "t.", schema, selection.predicates, params);
    sql += selection.order == store::Order::ById ? " ORDER BY t.id" : " ORDER BY t.ts, t.id";
    if (selection.limit > 0) sql += " LIMIT " + std::to_string(selection.limit);

    PooledConnection conn(pool_);
    return read_records(exec_checked(conn.get(), sql, params));
}

std::vector<Record> PgStore::select_pending(const store::PendingQuery& query) {
    const auto& schema = store::schema_for(query.source_table);
    store::schema_for(query.target_table);

    std::vector<std::optional<std::string>> params = {std::to_string(query.after.ts), query.after.last_id};
    std::string sql = "SELECT s.* FROM " + quote_ident(query.source_table) + " s WHERE TRUE";
    append_predicates(sql, "s.", schema, query.predicates, params);
    sql += " AND ((s.ts, s.id) > ($1::BIGINT, $2::TEXT)";
    if (query.include_corrections) {
        sql += " OR EXISTS (SELECT 1 FROM " + quote_ident(query.target_table) +
               " t WHERE t.id = s.id AND t.source_hash IS DISTINCT FROM s.content_hash)";
    }
    sql += ") ORDER BY s.ts, s.id";
    if (query.limit > 0) sql += " LIMIT " + std::to_string(query.limit);

    PooledConnection conn(pool_);
    return read_records(exec_checked(conn.get(), sql, params));
}

} // namespace engram::db
