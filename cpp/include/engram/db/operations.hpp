/**
 * @file operations.hpp
 * @brief Transaction RAII and upsert statement building
 */

#pragma once

#include <string>
#include <vector>
#include <libpq-fe.h>

#include "engram/db/helpers.hpp"
#include "engram/logging.hpp"

namespace engram::db {

// =============================================================================
// Transaction RAII
// =============================================================================

/**
 * Explicit commit; rolls back on scope exit otherwise.
 *
 *   {
 *       Transaction tx(conn);
 *       exec_checked(conn, "INSERT ...");
 *       tx.commit();
 *   }
 */
class Transaction {
public:
    explicit Transaction(PGconn* conn) : conn_(conn), finished_(false) {
        exec_checked(conn_, "BEGIN ISOLATION LEVEL READ COMMITTED");
    }

    ~Transaction() {
        if (!finished_) {
            Result res = exec(conn_, "ROLLBACK");
            if (!res.ok()) {
                LOG_WARN("rollback failed: ", res.error_message());
            }
        }
    }

    void commit() {
        if (!finished_) {
            finished_ = true;
            exec_checked(conn_, "COMMIT");
        }
    }

    void rollback() {
        if (!finished_) {
            finished_ = true;
            exec_checked(conn_, "ROLLBACK");
        }
    }

    bool finished() const { return finished_; }

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

private:
    PGconn* conn_;
    bool finished_;
};

// Quote an identifier that comes from the table schema.
inline std::string quote_ident(const std::string& name) {
    std::string out = "\"";
    for (char c : name) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

/**
 * INSERT ... ON CONFLICT (id) DO UPDATE for the given column list.
 * Parameters are $1..$n in column order. A non-empty update_when limits
 * the update to existing rows matching it.
 */
inline std::string build_upsert(const std::string& table, const std::vector<std::string>& columns,
                                const std::string& update_when = "") {
    std::string sql = "INSERT INTO " + quote_ident(table) + " (";
    std::string values;
    std::string updates;
    for (size_t i = 0; i < columns.size(); ++i) {
        if (i) {
            sql += ", ";
            values += ", ";
        }
        sql += quote_ident(columns[i]);
        values += "$" + std::to_string(i + 1);
        if (columns[i] != "id") {
            if (!updates.empty()) updates += ", ";
            updates += quote_ident(columns[i]) + " = EXCLUDED." + quote_ident(columns[i]);
        }
    }
    sql += ") VALUES (" + values + ") ON CONFLICT (id) DO ";
    sql += updates.empty() ? "NOTHING" : "UPDATE SET " + updates;
    if (!updates.empty() && !update_when.empty()) sql += " WHERE " + update_when;
    return sql;
}

} // namespace engram::db
