#include "engram/store/schema.hpp"

#include <algorithm>
#include <cmath>

#include "engram/error.hpp"

namespace engram::store {

namespace {

ColumnSpec text(const char* name, bool required = true) {
    return ColumnSpec{name, ColumnType::Text, required, std::nullopt, std::nullopt, {}};
}

ColumnSpec one_of(const char* name, std::vector<std::string> allowed) {
    return ColumnSpec{name, ColumnType::Text, true, std::nullopt, std::nullopt, std::move(allowed)};
}

ColumnSpec integer(const char* name, std::optional<double> min = std::nullopt,
                   std::optional<double> max = std::nullopt) {
    return ColumnSpec{name, ColumnType::Integer, true, min, max, {}};
}

ColumnSpec real(const char* name, std::optional<double> min = std::nullopt,
                std::optional<double> max = std::nullopt) {
    return ColumnSpec{name, ColumnType::Real, true, min, max, {}};
}

ColumnSpec unit(const char* name) { return real(name, 0.0, 1.0); }

ColumnSpec boolean(const char* name) {
    return ColumnSpec{name, ColumnType::Boolean, true, std::nullopt, std::nullopt, {}};
}

std::vector<TableSchema> build_tables() {
    const std::vector<std::string> wm_status = {"active", "pending", "expired"};
    const std::vector<std::string> ep_state = {"pending", "replaying", "strengthened",
                                               "weakened", "consolidated_to_ltm", "discarded"};
    return {
        {tables::RAW_MEMORIES, {
            text("content_ref"), unit("salience"), unit("importance"),
            real("sentiment", -1.0, 1.0), text("topic", false)}},
        {tables::WORKING_MEMORY, {
            text("content_ref"), unit("salience"), unit("importance"),
            real("sentiment", -1.0, 1.0), text("topic", false),
            integer("item_created_at"), one_of("status", wm_status),
            unit("attention_score"), integer("admit_rank", 0.0), integer("cycle", 0.0),
            integer("capacity", 5.0, 9.0), text("source_hash")}},
        {tables::EPISODE_MEMBERS, {
            text("episode_id"), text("category"), integer("item_created_at"),
            unit("importance"), real("sentiment", -1.0, 1.0), text("source_hash")}},
        {tables::EPISODES, {
            text("category"), integer("window_start"), integer("window_end"),
            integer("item_count", 0.0), unit("recency_factor"), unit("emotional_salience"),
            unit("stm_strength"), integer("hebbian_potential", 0.0), boolean("ready"),
            unit("strength"), integer("replay_count", 0.0), one_of("state", ep_state)},
            "state", {"consolidated_to_ltm", "discarded"}},
        {tables::ASSOCIATIONS, {
            text("source_id"), text("target_id"), unit("weight"),
            one_of("kind", {"replay", "creative"})}},
        {tables::CONSOLIDATED, {
            text("semantic_category"), unit("consolidated_strength"), unit("replay_strength"),
            text("associations", false), text("semantic_gist"), text("cortical_region"),
            integer("consolidated_at"), text("source_hash")}},
        {tables::SEMANTIC_NODES, {
            text("semantic_category"), integer("cluster_id", 0.0), integer("competition_rank", 1.0),
            unit("consolidated_strength"), integer("access_frequency", 0.0),
            unit("retrieval_strength"), real("homeostatic_scale", 0.0),
            integer("consolidated_at"), integer("computed_at"),
            one_of("age_category", {"recent", "week_old", "month_old", "remote"}),
            one_of("consolidation_state", {"episodic", "consolidating", "schematized"}),
            one_of("memory_fidelity", {"high", "medium", "low", "fragmented"}),
            text("features", false), text("source_hash")}},
        {tables::CLUSTERS, {
            text("centroid", false), integer("member_count", 0.0)}},
        {tables::ACCESS_LOG, {
            text("node_id"), integer("accessed_at")}},
        {tables::QUARANTINE, {
            text("stage"), text("record_id"), text("reason"), integer("consecutive_runs", 1.0),
            integer("first_seen"), integer("last_seen")}},
        {tables::DEAD_LETTERS, {
            text("stage"), text("record_id"), text("reason"), integer("runs", 1.0),
            integer("dead_lettered_at")}},
    };
}

bool parse_number(ColumnType type, const std::string& raw, double& out) {
    try {
        size_t pos = 0;
        if (type == ColumnType::Integer) {
            out = static_cast<double>(std::stoll(raw, &pos));
        } else {
            out = std::stod(raw, &pos);
        }
        return pos == raw.size() && std::isfinite(out);
    } catch (const std::logic_error&) {
        return false;
    }
}

} // namespace

const ColumnSpec* TableSchema::find(const std::string& column) const {
    for (const auto& c : columns) {
        if (c.name == column) return &c;
    }
    return nullptr;
}

const std::vector<TableSchema>& all_tables() {
    static const std::vector<TableSchema> tables = build_tables();
    return tables;
}

const TableSchema& schema_for(const std::string& table) {
    for (const auto& t : all_tables()) {
        if (t.name == table) return t;
    }
    throw EngramException(ErrorCode::INVALID_ARGUMENT, "unknown table '" + table + "'");
}

bool is_final(const TableSchema& schema, const Record& stored) {
    if (schema.final_column.empty() || !stored.has(schema.final_column)) return false;
    const std::string v = stored.value(schema.final_column);
    return std::find(schema.final_values.begin(), schema.final_values.end(), v) != schema.final_values.end();
}

ColumnType column_type(const TableSchema& schema, const std::string& column) {
    if (column == "id" || column == "content_hash") return ColumnType::Text;
    if (column == "ts") return ColumnType::Integer;
    if (const ColumnSpec* col = schema.find(column)) return col->type;
    throw EngramException(ErrorCode::INVALID_ARGUMENT,
                          "unknown column '" + column + "' in table '" + schema.name + "'");
}

void check_constraints(const TableSchema& schema, const Record& record) {
    auto fail = [&](const std::string& what) {
        throw DataIntegrityError(schema.name + ": " + what, record.id,
                                 ErrorCode::CONSTRAINT_VIOLATION);
    };

    if (record.id.empty()) fail("empty id");

    for (const auto& [name, value] : record.columns) {
        if (!schema.find(name)) fail("unknown column '" + name + "'");
    }

    for (const auto& col : schema.columns) {
        auto it = record.columns.find(col.name);
        if (it == record.columns.end()) {
            if (col.required) fail("missing column '" + col.name + "'");
            continue;
        }
        const std::string& raw = it->second;
        switch (col.type) {
            case ColumnType::Text:
                if (!col.allowed.empty() &&
                    std::find(col.allowed.begin(), col.allowed.end(), raw) == col.allowed.end()) {
                    fail("value '" + raw + "' not allowed in '" + col.name + "'");
                }
                break;
            case ColumnType::Boolean:
                if (raw != "true" && raw != "false" && raw != "t" && raw != "f") {
                    fail("malformed boolean in '" + col.name + "'");
                }
                break;
            case ColumnType::Integer:
            case ColumnType::Real: {
                double v = 0.0;
                if (!parse_number(col.type, raw, v)) fail("malformed number in '" + col.name + "'");
                if (col.min && v < *col.min) fail("'" + col.name + "' below " + std::to_string(*col.min));
                if (col.max && v > *col.max) fail("'" + col.name + "' above " + std::to_string(*col.max));
                break;
            }
        }
    }
}

int compare_values(ColumnType type, const std::string& a, const std::string& b) {
    if (type == ColumnType::Integer || type == ColumnType::Real) {
        double x = 0.0;
        double y = 0.0;
        bool okx = parse_number(type, a, x);
        bool oky = parse_number(type, b, y);
        if (okx && oky) return x < y ? -1 : (x > y ? 1 : 0);
    }
    return a < b ? -1 : (a > b ? 1 : 0);
}

} // namespace engram::store
