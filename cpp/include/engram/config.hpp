#pragma once

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <map>
#include <string>
#include <type_traits>

#include "engram/error.hpp"

namespace engram {

// =============================================================================
// Configuration sections
// =============================================================================

struct AttentionConfig {
    int base_capacity = 7;
    int capacity_variance = 2;
    double recency_weight = 0.5;
    double decay_constant_seconds = 300.0;
    double window_seconds = 300.0;
    uint64_t seed = 42;
};

struct ShortTermConfig {
    double coactivation_window_seconds = 300.0;
    // Disputed between 30 s and 1800 s; configurable.
    double decay_constant_seconds = 1800.0;
    double hebbian_window_seconds = 3600.0;
    int hebbian_cap = 10;
    int ready_potential = 3;
    double ready_salience = 0.5;
    double importance_weight = 0.6;
    double sentiment_weight = 0.4;
};

struct ConsolidationConfig {
    double learning_rate = 0.1;
    double decay_threshold = 0.3;
    double strengthen_threshold = 0.7;
    // Disputed between 0.5 and 0.6; configurable.
    double consolidation_threshold = 0.5;
    double discard_threshold = 0.1;
    int max_replay_cycles = 5;
    int batch_size = 100;
    double replay_adjacency_seconds = 3600.0;
    int creative_pairs = 2;
    double creative_max_weight = 0.3;
    uint64_t seed = 42;
};

struct SemanticConfig {
    int cluster_count = 1000;
    int category_buckets = 16;
    double cluster_spawn_distance = 0.5;
    int recluster_iterations = 10;
    uint64_t seed = 42;
    double weight_strength = 0.3;
    double weight_rank = 0.2;
    double weight_frequency = 0.2;
    double weight_recency = 0.3;
    double age_decay_constant_seconds = 2592000.0;  // 30 days
    int access_window_days = 7;
    int64_t schematized_access_threshold = 10;
    int64_t consolidating_access_threshold = 3;
    double prune_threshold = 0.01;
    double high_fidelity_threshold = 0.8;
    double low_fidelity_threshold = 0.3;
};

struct WritebackConfig {
    int batch_size = 1000;
    int min_batch_size = 50;
    int max_retries = 3;
    int retry_base_delay_ms = 100;
    int retry_max_delay_ms = 5000;
    int dead_letter_after_runs = 3;
    int run_lock_ttl_seconds = 3600;
};

struct CollaboratorConfig {
    int timeout_ms = 30000;
    int max_retries = 3;
    int retry_base_delay_ms = 200;
    int cache_capacity = 10000;
    int cache_ttl_seconds = 3600;
    int breaker_failure_threshold = 5;
    int breaker_cooldown_seconds = 60;
    // Concurrent calls, and calls allowed to wait behind them
    int workers = 4;
    int max_queued_calls = 64;
};

struct DatabaseConfig {
    std::string host = "localhost";
    std::string port = "5432";
    std::string name = "engram";
    std::string user = "postgres";
    std::string password;
    int pool_size = 4;
    int pool_timeout_ms = 5000;
    int connect_timeout_seconds = 5;

    std::string to_conninfo() const;
};

/**
 * Complete, validated pipeline configuration. Built once per job and
 * passed by const reference; nothing mutates it after validate().
 */
struct PipelineConfig {
    AttentionConfig attention;
    ShortTermConfig short_term;
    ConsolidationConfig consolidation;
    SemanticConfig semantic;
    WritebackConfig writeback;
    CollaboratorConfig collaborator;
    DatabaseConfig database;
    std::string log_level = "info";
    std::string log_file;

    // Throws ConfigurationError naming the first offending key.
    void validate() const;
};

// =============================================================================
// Key/value source: defaults <- file <- ENGRAM_* environment
// =============================================================================

class ConfigValues {
public:
    void set(const std::string& key, const std::string& value) { values_[key] = value; }

    bool has(const std::string& key) const { return values_.count(key) != 0; }

    // Parse "key = value" lines, '#' and ';' start comments.
    void load_file(const std::string& path);

    // Every known key may be overridden by ENGRAM_<SECTION>_<NAME>.
    void load_env();

    template<typename T>
    T get(const std::string& key, T default_value) const {
        auto it = values_.find(key);
        if (it == values_.end()) {
            return default_value;
        }
        const std::string& raw = it->second;
        try {
            if constexpr (std::is_same_v<T, int>) {
                size_t pos = 0;
                int v = std::stoi(raw, &pos);
                if (pos != raw.size()) throw std::invalid_argument(raw);
                return v;
            } else if constexpr (std::is_same_v<T, int64_t>) {
                size_t pos = 0;
                int64_t v = std::stoll(raw, &pos);
                if (pos != raw.size()) throw std::invalid_argument(raw);
                return v;
            } else if constexpr (std::is_same_v<T, uint64_t>) {
                size_t pos = 0;
                uint64_t v = std::stoull(raw, &pos);
                if (pos != raw.size()) throw std::invalid_argument(raw);
                return v;
            } else if constexpr (std::is_same_v<T, double>) {
                size_t pos = 0;
                double v = std::stod(raw, &pos);
                if (pos != raw.size()) throw std::invalid_argument(raw);
                return v;
            } else if constexpr (std::is_same_v<T, bool>) {
                std::string val = raw;
                std::transform(val.begin(), val.end(), val.begin(),
                               [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
                return val == "true" || val == "1" || val == "yes" || val == "on";
            } else {
                return raw;
            }
        } catch (const std::logic_error&) {
            throw ConfigurationError("cannot parse value '" + raw + "'", key);
        }
    }

    const std::map<std::string, std::string>& values() const { return values_; }

    static std::string env_name(const std::string& key);

private:
    std::map<std::string, std::string> values_;
};

PipelineConfig config_from_values(const ConfigValues& values);

// Defaults, then file (if non-empty and present), then environment; validated.
PipelineConfig load_config(const std::string& path = "");

} // namespace engram
