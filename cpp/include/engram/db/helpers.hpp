/**
 * @file helpers.hpp
 * @brief libpq result access and statement execution
 *
 * - RAII Result wrapper
 * - Parameterized execution (PQexecParams, text format)
 * - SQLSTATE classification into the engram exception hierarchy
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <libpq-fe.h>

#include "engram/error.hpp"

namespace engram::db {

// =============================================================================
// Result Value Extraction
// =============================================================================

inline std::string get_string(PGresult* res, int row, int col) {
    if (!res || row >= PQntuples(res) || col >= PQnfields(res)) {
        return {};
    }
    if (PQgetisnull(res, row, col)) {
        return {};
    }
    const char* val = PQgetvalue(res, row, col);
    return val ? val : "";
}

inline int64_t get_int64(PGresult* res, int row, int col, int64_t default_val = 0) {
    std::string val = get_string(res, row, col);
    if (val.empty()) {
        return default_val;
    }
    try {
        return std::stoll(val);
    } catch (const std::logic_error&) {
        return default_val;
    }
}

/**
 * RAII wrapper for PGresult.
 */
class Result {
public:
    Result() : res_(nullptr) {}
    explicit Result(PGresult* res) : res_(res) {}
    ~Result() { if (res_) PQclear(res_); }

    Result(Result&& other) noexcept : res_(other.res_) { other.res_ = nullptr; }
    Result& operator=(Result&& other) noexcept {
        if (this != &other) {
            if (res_) PQclear(res_);
            res_ = other.res_;
            other.res_ = nullptr;
        }
        return *this;
    }
    Result(const Result&) = delete;
    Result& operator=(const Result&) = delete;

    PGresult* get() const { return res_; }
    operator PGresult*() const { return res_; }

    bool ok() const {
        ExecStatusType status = PQresultStatus(res_);
        return status == PGRES_TUPLES_OK || status == PGRES_COMMAND_OK;
    }

    int ntuples() const { return res_ ? PQntuples(res_) : 0; }
    int nfields() const { return res_ ? PQnfields(res_) : 0; }

    bool is_null(int row, int col) const {
        return !res_ || PQgetisnull(res_, row, col);
    }

    std::string field_name(int col) const {
        const char* n = res_ ? PQfname(res_, col) : nullptr;
        return n ? n : "";
    }

    std::string sqlstate() const {
        const char* s = res_ ? PQresultErrorField(res_, PG_DIAG_SQLSTATE) : nullptr;
        return s ? s : "";
    }

    std::string error_message() const {
        return res_ ? PQresultErrorMessage(res_) : "null result";
    }

    std::string str(int row, int col) const { return get_string(res_, row, col); }
    int64_t int64(int row, int col, int64_t def = 0) const { return get_int64(res_, row, col, def); }

private:
    PGresult* res_;
};

// =============================================================================
// Statement Execution
// =============================================================================

/**
 * Map a failed result onto the exception hierarchy:
 * class 23 (integrity) -> DataIntegrityError, connection / serialization /
 * operator-intervention classes -> TransientIOError, anything else ->
 * EngramException.
 */
[[noreturn]] inline void raise_for(const Result& res, PGconn* conn, const std::string& record_id) {
    std::string state = res.sqlstate();
    std::string msg = res.get() ? res.error_message() : std::string(PQerrorMessage(conn));
    std::string cls = state.size() >= 2 ? state.substr(0, 2) : "";

    if (cls == "23" || cls == "22") {
        throw DataIntegrityError(msg, record_id, ErrorCode::CONSTRAINT_VIOLATION);
    }
    if (cls.empty() || cls == "08" || cls == "40" || cls == "53" || cls == "57" ||
        PQstatus(conn) != CONNECTION_OK) {
        throw TransientIOError(msg, state, ErrorCode::STORE_TIMEOUT);
    }
    throw EngramException(ErrorCode::TRANSIENT_IO, msg, state);
}

inline Result exec(PGconn* conn, const std::string& sql) {
    return Result(PQexec(conn, sql.c_str()));
}

// Text-format parameters; std::nullopt binds SQL NULL.
inline Result exec_params(PGconn* conn, const std::string& sql,
                          const std::vector<std::optional<std::string>>& params) {
    std::vector<const char*> values;
    values.reserve(params.size());
    for (const auto& p : params) {
        values.push_back(p ? p->c_str() : nullptr);
    }
    return Result(PQexecParams(conn, sql.c_str(), static_cast<int>(values.size()),
                               nullptr, values.data(), nullptr, nullptr, 0));
}

// Execute and throw on failure.
inline Result exec_checked(PGconn* conn, const std::string& sql,
                           const std::vector<std::optional<std::string>>& params = {},
                           const std::string& record_id = "") {
    Result res = params.empty() ? exec(conn, sql) : exec_params(conn, sql, params);
    if (!res.ok()) {
        raise_for(res, conn, record_id);
    }
    return res;
}

inline int cmd_tuples(PGresult* res) {
    if (!res) return 0;
    const char* val = PQcmdTuples(res);
    if (!val || *val == '\0') return 0;
    try {
        return std::stoi(val);
    } catch (const std::logic_error&) {
        return 0;
    }
}

} // namespace engram::db
