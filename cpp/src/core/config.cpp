#include "engram/config.hpp"

#include <cctype>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>

#include "engram/logging.hpp"

namespace engram {

namespace {

// Single table of every configuration key and the field it binds to.
template<typename Visitor>
void bind_fields(PipelineConfig& c, Visitor&& v) {
    v("attention.base_capacity", c.attention.base_capacity);
    v("attention.capacity_variance", c.attention.capacity_variance);
    v("attention.recency_weight", c.attention.recency_weight);
    v("attention.decay_constant_seconds", c.attention.decay_constant_seconds);
    v("attention.window_seconds", c.attention.window_seconds);
    v("attention.seed", c.attention.seed);

    v("stm.coactivation_window_seconds", c.short_term.coactivation_window_seconds);
    v("stm.decay_constant_seconds", c.short_term.decay_constant_seconds);
    v("stm.hebbian_window_seconds", c.short_term.hebbian_window_seconds);
    v("stm.hebbian_cap", c.short_term.hebbian_cap);
    v("stm.ready_potential", c.short_term.ready_potential);
    v("stm.ready_salience", c.short_term.ready_salience);
    v("stm.importance_weight", c.short_term.importance_weight);
    v("stm.sentiment_weight", c.short_term.sentiment_weight);

    v("consolidation.learning_rate", c.consolidation.learning_rate);
    v("consolidation.decay_threshold", c.consolidation.decay_threshold);
    v("consolidation.strengthen_threshold", c.consolidation.strengthen_threshold);
    v("consolidation.threshold", c.consolidation.consolidation_threshold);
    v("consolidation.discard_threshold", c.consolidation.discard_threshold);
    v("consolidation.max_replay_cycles", c.consolidation.max_replay_cycles);
    v("consolidation.batch_size", c.consolidation.batch_size);
    v("consolidation.replay_adjacency_seconds", c.consolidation.replay_adjacency_seconds);
    v("consolidation.creative_pairs", c.consolidation.creative_pairs);
    v("consolidation.creative_max_weight", c.consolidation.creative_max_weight);
    v("consolidation.seed", c.consolidation.seed);

    v("semantic.cluster_count", c.semantic.cluster_count);
    v("semantic.category_buckets", c.semantic.category_buckets);
    v("semantic.cluster_spawn_distance", c.semantic.cluster_spawn_distance);
    v("semantic.recluster_iterations", c.semantic.recluster_iterations);
    v("semantic.seed", c.semantic.seed);
    v("semantic.weight_strength", c.semantic.weight_strength);
    v("semantic.weight_rank", c.semantic.weight_rank);
    v("semantic.weight_frequency", c.semantic.weight_frequency);
    v("semantic.weight_recency", c.semantic.weight_recency);
    v("semantic.age_decay_constant_seconds", c.semantic.age_decay_constant_seconds);
    v("semantic.access_window_days", c.semantic.access_window_days);
    v("semantic.schematized_access_threshold", c.semantic.schematized_access_threshold);
    v("semantic.consolidating_access_threshold", c.semantic.consolidating_access_threshold);
    v("semantic.prune_threshold", c.semantic.prune_threshold);
    v("semantic.high_fidelity_threshold", c.semantic.high_fidelity_threshold);
    v("semantic.low_fidelity_threshold", c.semantic.low_fidelity_threshold);

    v("writeback.batch_size", c.writeback.batch_size);
    v("writeback.min_batch_size", c.writeback.min_batch_size);
    v("writeback.max_retries", c.writeback.max_retries);
    v("writeback.retry_base_delay_ms", c.writeback.retry_base_delay_ms);
    v("writeback.retry_max_delay_ms", c.writeback.retry_max_delay_ms);
    v("writeback.dead_letter_after_runs", c.writeback.dead_letter_after_runs);
    v("writeback.run_lock_ttl_seconds", c.writeback.run_lock_ttl_seconds);

    v("collaborator.timeout_ms", c.collaborator.timeout_ms);
    v("collaborator.max_retries", c.collaborator.max_retries);
    v("collaborator.retry_base_delay_ms", c.collaborator.retry_base_delay_ms);
    v("collaborator.cache_capacity", c.collaborator.cache_capacity);
    v("collaborator.cache_ttl_seconds", c.collaborator.cache_ttl_seconds);
    v("collaborator.breaker_failure_threshold", c.collaborator.breaker_failure_threshold);
    v("collaborator.breaker_cooldown_seconds", c.collaborator.breaker_cooldown_seconds);
    v("collaborator.workers", c.collaborator.workers);
    v("collaborator.max_queued_calls", c.collaborator.max_queued_calls);

    v("db.host", c.database.host);
    v("db.port", c.database.port);
    v("db.name", c.database.name);
    v("db.user", c.database.user);
    v("db.pass", c.database.password);
    v("db.pool_size", c.database.pool_size);
    v("db.pool_timeout_ms", c.database.pool_timeout_ms);
    v("db.connect_timeout_seconds", c.database.connect_timeout_seconds);

    v("log.level", c.log_level);
    v("log.file", c.log_file);
}

std::string trim(const std::string& s) {
    auto b = std::find_if(s.begin(), s.end(), [](int ch) { return !std::isspace(ch); });
    auto e = std::find_if(s.rbegin(), s.rend(), [](int ch) { return !std::isspace(ch); }).base();
    return b < e ? std::string(b, e) : std::string();
}

void check_unit(double v, const char* key) {
    ErrorHandler::check_config(v >= 0.0 && v <= 1.0, key, "value must lie in [0,1]");
}

void check_positive(double v, const char* key) {
    ErrorHandler::check_config(v > 0.0, key, "value must be positive");
}

} // namespace

std::string DatabaseConfig::to_conninfo() const {
    std::string conninfo = "dbname=" + name;
    if (!host.empty()) conninfo += " host=" + host;
    if (!port.empty()) conninfo += " port=" + port;
    if (!user.empty()) conninfo += " user=" + user;
    if (!password.empty()) conninfo += " password=" + password;
    conninfo += " connect_timeout=" + std::to_string(connect_timeout_seconds);
    return conninfo;
}

// =============================================================================
// ConfigValues
// =============================================================================

std::string ConfigValues::env_name(const std::string& key) {
    std::string name = "ENGRAM_";
    for (char ch : key) {
        name += ch == '.' ? '_' : static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
    }
    return name;
}

void ConfigValues::load_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigurationError("cannot open config file", path);
    }

    std::string line;
    int lineno = 0;
    while (std::getline(file, line)) {
        ++lineno;
        std::string t = trim(line);
        if (t.empty() || t[0] == '#' || t[0] == ';') continue;

        size_t eq = t.find('=');
        if (eq == std::string::npos) {
            throw ConfigurationError("expected key = value at line " + std::to_string(lineno), path);
        }
        std::string key = trim(t.substr(0, eq));
        if (!key.empty()) {
            values_[key] = trim(t.substr(eq + 1));
        }
    }

    LOG_INFO("Loaded configuration from file: ", path);
}

void ConfigValues::load_env() {
    PipelineConfig scratch;
    bind_fields(scratch, [this](const char* key, auto&) {
        if (const char* env = std::getenv(env_name(key).c_str()); env && *env) {
            values_[key] = env;
        }
    });
}

// =============================================================================
// PipelineConfig
// =============================================================================

PipelineConfig config_from_values(const ConfigValues& values) {
    PipelineConfig cfg;
    bind_fields(cfg, [&values](const char* key, auto& field) {
        using T = std::decay_t<decltype(field)>;
        field = values.get<T>(key, field);
    });

    for (const auto& [key, value] : values.values()) {
        bool known = false;
        PipelineConfig scratch;
        bind_fields(scratch, [&](const char* k, auto&) { known = known || key == k; });
        if (!known) {
            LOG_WARN("Ignoring unknown configuration key '", key, "'");
        }
    }
    return cfg;
}

void PipelineConfig::validate() const {
    const auto& a = attention;
    ErrorHandler::check_config(a.capacity_variance >= 0, "attention.capacity_variance",
                               "variance must be non-negative");
    ErrorHandler::check_config(a.base_capacity - a.capacity_variance >= 5 &&
                               a.base_capacity + a.capacity_variance <= 9,
                               "attention.base_capacity",
                               "capacity bounds must lie within [5,9]");
    check_unit(a.recency_weight, "attention.recency_weight");
    check_positive(a.decay_constant_seconds, "attention.decay_constant_seconds");
    check_positive(a.window_seconds, "attention.window_seconds");

    const auto& s = short_term;
    check_positive(s.coactivation_window_seconds, "stm.coactivation_window_seconds");
    check_positive(s.decay_constant_seconds, "stm.decay_constant_seconds");
    check_positive(s.hebbian_window_seconds, "stm.hebbian_window_seconds");
    ErrorHandler::check_config(s.hebbian_cap > 0, "stm.hebbian_cap", "cap must be positive");
    ErrorHandler::check_config(s.ready_potential > 0 && s.ready_potential <= s.hebbian_cap,
                               "stm.ready_potential", "threshold must lie in [1, hebbian_cap]");
    check_unit(s.ready_salience, "stm.ready_salience");
    check_unit(s.importance_weight, "stm.importance_weight");
    check_unit(s.sentiment_weight, "stm.sentiment_weight");
    ErrorHandler::check_config(std::fabs(s.importance_weight + s.sentiment_weight - 1.0) < 1e-9,
                               "stm.importance_weight", "salience weights must sum to 1");

    const auto& c = consolidation;
    ErrorHandler::check_config(c.learning_rate >= 0.05 && c.learning_rate <= 0.2,
                               "consolidation.learning_rate", "learning rate must lie in [0.05,0.2]");
    check_unit(c.decay_threshold, "consolidation.decay_threshold");
    check_unit(c.strengthen_threshold, "consolidation.strengthen_threshold");
    check_unit(c.consolidation_threshold, "consolidation.threshold");
    check_unit(c.discard_threshold, "consolidation.discard_threshold");
    check_unit(c.creative_max_weight, "consolidation.creative_max_weight");
    ErrorHandler::check_config(c.decay_threshold <= c.strengthen_threshold,
                               "consolidation.decay_threshold",
                               "decay threshold must not exceed strengthen threshold");
    ErrorHandler::check_config(c.discard_threshold < c.consolidation_threshold,
                               "consolidation.discard_threshold",
                               "discard threshold must be below consolidation threshold");
    ErrorHandler::check_config(c.max_replay_cycles > 0, "consolidation.max_replay_cycles",
                               "must be positive");
    ErrorHandler::check_config(c.batch_size > 0, "consolidation.batch_size", "must be positive");
    ErrorHandler::check_config(c.creative_pairs >= 0, "consolidation.creative_pairs",
                               "must be non-negative");
    check_positive(c.replay_adjacency_seconds, "consolidation.replay_adjacency_seconds");

    const auto& m = semantic;
    ErrorHandler::check_config(m.cluster_count > 0, "semantic.cluster_count", "must be positive");
    ErrorHandler::check_config(m.category_buckets > 0, "semantic.category_buckets", "must be positive");
    check_positive(m.cluster_spawn_distance, "semantic.cluster_spawn_distance");
    ErrorHandler::check_config(m.recluster_iterations > 0, "semantic.recluster_iterations",
                               "must be positive");
    check_unit(m.weight_strength, "semantic.weight_strength");
    check_unit(m.weight_rank, "semantic.weight_rank");
    check_unit(m.weight_frequency, "semantic.weight_frequency");
    check_unit(m.weight_recency, "semantic.weight_recency");
    double wsum = m.weight_strength + m.weight_rank + m.weight_frequency + m.weight_recency;
    ErrorHandler::check_config(std::fabs(wsum - 1.0) < 1e-9, "semantic.weight_strength",
                               "retrieval weights must sum to 1");
    check_positive(m.age_decay_constant_seconds, "semantic.age_decay_constant_seconds");
    ErrorHandler::check_config(m.access_window_days > 0, "semantic.access_window_days",
                               "must be positive");
    ErrorHandler::check_config(m.consolidating_access_threshold >= 0 &&
                               m.consolidating_access_threshold <= m.schematized_access_threshold,
                               "semantic.consolidating_access_threshold",
                               "must not exceed schematized threshold");
    check_unit(m.prune_threshold, "semantic.prune_threshold");
    check_unit(m.high_fidelity_threshold, "semantic.high_fidelity_threshold");
    check_unit(m.low_fidelity_threshold, "semantic.low_fidelity_threshold");
    ErrorHandler::check_config(m.low_fidelity_threshold <= c.consolidation_threshold &&
                               c.consolidation_threshold <= m.high_fidelity_threshold,
                               "semantic.low_fidelity_threshold",
                               "fidelity cutoffs must bracket the consolidation threshold");

    const auto& w = writeback;
    ErrorHandler::check_config(w.min_batch_size > 0, "writeback.min_batch_size", "must be positive");
    ErrorHandler::check_config(w.batch_size >= w.min_batch_size, "writeback.batch_size",
                               "batch size must not be below the minimum batch size");
    ErrorHandler::check_config(w.max_retries >= 0, "writeback.max_retries", "must be non-negative");
    ErrorHandler::check_config(w.retry_base_delay_ms >= 0 && w.retry_max_delay_ms >= w.retry_base_delay_ms,
                               "writeback.retry_max_delay_ms", "delays must be ordered and non-negative");
    ErrorHandler::check_config(w.dead_letter_after_runs > 0, "writeback.dead_letter_after_runs",
                               "must be positive");
    ErrorHandler::check_config(w.run_lock_ttl_seconds > 0, "writeback.run_lock_ttl_seconds",
                               "must be positive");

    const auto& k = collaborator;
    ErrorHandler::check_config(k.timeout_ms > 0, "collaborator.timeout_ms", "must be positive");
    ErrorHandler::check_config(k.max_retries >= 0, "collaborator.max_retries", "must be non-negative");
    ErrorHandler::check_config(k.retry_base_delay_ms >= 0, "collaborator.retry_base_delay_ms",
                               "must be non-negative");
    ErrorHandler::check_config(k.cache_capacity > 0, "collaborator.cache_capacity", "must be positive");
    ErrorHandler::check_config(k.cache_ttl_seconds > 0, "collaborator.cache_ttl_seconds", "must be positive");
    ErrorHandler::check_config(k.breaker_failure_threshold > 0, "collaborator.breaker_failure_threshold",
                               "must be positive");
    ErrorHandler::check_config(k.breaker_cooldown_seconds >= 0, "collaborator.breaker_cooldown_seconds",
                               "must be non-negative");
    ErrorHandler::check_config(k.workers > 0, "collaborator.workers", "must be positive");
    ErrorHandler::check_config(k.max_queued_calls >= 0, "collaborator.max_queued_calls", "must be non-negative");

    const auto& d = database;
    ErrorHandler::check_config(d.pool_size > 0, "db.pool_size", "must be positive");
    ErrorHandler::check_config(d.pool_timeout_ms > 0, "db.pool_timeout_ms", "must be positive");
    ErrorHandler::check_config(!d.name.empty(), "db.name", "database name not configured");

    ErrorHandler::check_config(log_level == "debug" || log_level == "info" || log_level == "warn" ||
                               log_level == "error" || log_level == "off",
                               "log.level", "unknown log level");
}

PipelineConfig load_config(const std::string& path) {
    ConfigValues values;
    if (!path.empty()) {
        if (!std::filesystem::exists(path)) {
            throw ConfigurationError("config file not found", path);
        }
        values.load_file(path);
    }
    values.load_env();

    PipelineConfig cfg = config_from_values(values);
    cfg.validate();
    return cfg;
}

} // namespace engram
