#pragma once

#include <optional>
#include <string>
#include <vector>

#include "engram/store/record.hpp"

namespace engram::store {

namespace tables {
constexpr const char* RAW_MEMORIES = "raw_memories";
constexpr const char* WORKING_MEMORY = "working_memory";
constexpr const char* EPISODE_MEMBERS = "episode_members";
constexpr const char* EPISODES = "episodes";
constexpr const char* ASSOCIATIONS = "associations";
constexpr const char* CONSOLIDATED = "consolidated_memories";
constexpr const char* SEMANTIC_NODES = "semantic_nodes";
constexpr const char* CLUSTERS = "clusters";
constexpr const char* ACCESS_LOG = "access_log";
constexpr const char* QUARANTINE = "quarantine";
constexpr const char* DEAD_LETTERS = "dead_letters";
} // namespace tables

enum class ColumnType { Text, Integer, Real, Boolean };

struct ColumnSpec {
    std::string name;
    ColumnType type = ColumnType::Text;
    bool required = true;
    std::optional<double> min;
    std::optional<double> max;
    std::vector<std::string> allowed;  // enumerated text values
};

/**
 * Table layout shared by both store implementations. PgStore renders it
 * as DDL with CHECK constraints, MemoryStore enforces the same checks
 * in-process.
 */
struct TableSchema {
    std::string name;
    std::vector<ColumnSpec> columns;
    // Rows whose final_column holds one of final_values are never updated
    // again; later upserts of the same id are dropped.
    std::string final_column;
    std::vector<std::string> final_values;

    const ColumnSpec* find(const std::string& column) const;
};

const std::vector<TableSchema>& all_tables();

// Throws EngramException(INVALID_ARGUMENT) for unknown tables.
const TableSchema& schema_for(const std::string& table);

// Type of a key or payload column; throws for unknown columns.
ColumnType column_type(const TableSchema& schema, const std::string& column);

// True if the stored row is in a final state of its table.
bool is_final(const TableSchema& schema, const Record& stored);

// Throws DataIntegrityError(CONSTRAINT_VIOLATION) naming the record.
void check_constraints(const TableSchema& schema, const Record& record);

// Typed three-way comparison of two textual values.
int compare_values(ColumnType type, const std::string& a, const std::string& b);

} // namespace engram::store
