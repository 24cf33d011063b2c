#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "engram/types.hpp"

namespace engram::store {

/**
 * One row of a pipeline table. Every table shares the key columns
 * (id, ts, content_hash); everything else lives in `columns` as text,
 * the same representation libpq hands back.
 *
 * ts is the change timestamp that incremental selection orders by.
 */
struct Record {
    std::string id;
    Timestamp ts = 0;
    std::string content_hash;
    std::map<std::string, std::string> columns;

    Record() = default;
    Record(std::string id_, Timestamp ts_) : id(std::move(id_)), ts(ts_) {}

    Record& set(const std::string& col, std::string value);
    Record& set(const std::string& col, const char* value) { return set(col, std::string(value)); }
    Record& set(const std::string& col, double value);
    Record& set(const std::string& col, int64_t value);
    Record& set(const std::string& col, int value) { return set(col, static_cast<int64_t>(value)); }
    Record& set(const std::string& col, uint64_t value) { return set(col, static_cast<int64_t>(value)); }
    Record& set(const std::string& col, bool value);

    bool has(const std::string& col) const;

    // Raw value of a key or payload column; empty when absent.
    std::string value(const std::string& col) const;

    // Required accessors throw DataIntegrityError naming the record.
    std::string text(const std::string& col) const;
    double real(const std::string& col) const;
    int64_t integer(const std::string& col) const;
    bool flag(const std::string& col) const;

    std::string text_or(const std::string& col, const std::string& def) const;
    double real_or(const std::string& col, double def) const;
    int64_t integer_or(const std::string& col, int64_t def) const;

    bool operator==(const Record& o) const {
        return id == o.id && ts == o.ts && content_hash == o.content_hash && columns == o.columns;
    }
};

// =============================================================================
// Query description
// =============================================================================

enum class Op { Eq, Ne, Gt, Ge, Lt, Le, In };

struct Predicate {
    std::string column;
    Op op = Op::Eq;
    std::vector<std::string> values;
};

inline Predicate where(const std::string& column, Op op, std::string value) {
    return Predicate{column, op, {std::move(value)}};
}

inline Predicate where_in(const std::string& column, std::vector<std::string> values) {
    return Predicate{column, Op::In, std::move(values)};
}

enum class Order { ByTsThenId, ById };

struct Selection {
    std::string table;
    std::vector<Predicate> predicates;
    Order order = Order::ByTsThenId;
    size_t limit = 0;  // 0 = unbounded
};

// Persisted incremental cursor of a stage
struct Watermark {
    Timestamp ts = 0;
    std::string last_id;
    std::string content_hash;

    bool precedes(const Watermark& o) const {
        return ts < o.ts || (ts == o.ts && last_id < o.last_id);
    }
};

/**
 * Records of source_table after the cursor, plus (when include_corrections)
 * records whose content_hash differs from the source_hash stored on the
 * target row with the same id.
 */
struct PendingQuery {
    std::string source_table;
    std::string target_table;
    Watermark after;
    std::vector<Predicate> predicates;
    bool include_corrections = true;
    size_t limit = 0;
};

} // namespace engram::store
