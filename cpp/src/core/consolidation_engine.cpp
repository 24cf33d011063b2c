#include "engram/consolidation_engine.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <map>
#include <random>

#include "engram/error.hpp"
#include "engram/hash.hpp"
#include "engram/logging.hpp"

namespace engram {

// =============================================================================
// Similarity and sampling
// =============================================================================

std::string EnrichmentSimilarityScorer::describe(const Episode& e) {
    std::string text = e.category;
    for (const auto& content : e.member_content) {
        if (content.empty()) continue;
        text += ' ';
        text += content;
    }
    return text;
}

double EnrichmentSimilarityScorer::score(const Episode& a, const Episode& b) {
    return clamp01(provider_.similarity(describe(a), describe(b)));
}

std::vector<Association> RandomPairSampler::sample(const Episode& episode,
                                                   const std::vector<Episode>& candidates) {
    std::vector<const Episode*> others;
    for (const auto& c : candidates) {
        if (c.id != episode.id && c.category != episode.category) others.push_back(&c);
    }
    std::sort(others.begin(), others.end(),
              [](const Episode* a, const Episode* b) { return a->id < b->id; });

    const uint64_t h = stable_hash(episode.id);
    std::seed_seq seq{static_cast<uint32_t>(seed_), static_cast<uint32_t>(seed_ >> 32),
                      static_cast<uint32_t>(h), static_cast<uint32_t>(h >> 32)};
    std::mt19937_64 rng(seq);

    std::vector<Association> out;
    const size_t wanted = std::min(others.size(), static_cast<size_t>(std::max(0, pairs_)));
    for (size_t i = 0; i < wanted; ++i) {
        // Partial Fisher-Yates over the sorted candidates
        const size_t j = i + static_cast<size_t>(rng() % (others.size() - i));
        std::swap(others[i], others[j]);
        Association a;
        a.source_id = episode.id;
        a.target_id = others[i]->id;
        a.weight = max_weight_ * static_cast<double>(rng() % 1001) / 1000.0;
        a.kind = AssociationKind::Creative;
        out.push_back(std::move(a));
    }
    return out;
}

// =============================================================================
// Claims
// =============================================================================

void ClaimRegistry::Claim::release() {
    if (registry_) {
        registry_->release(id_);
        registry_ = nullptr;
    }
}

ClaimRegistry::Claim ClaimRegistry::try_claim(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!claimed_.insert(id).second) {
        return Claim();
    }
    return Claim(this, id);
}

bool ClaimRegistry::is_claimed(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return claimed_.count(id) != 0;
}

void ClaimRegistry::release(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    claimed_.erase(id);
}

// =============================================================================
// Engine
// =============================================================================

ConsolidationEngine::ConsolidationEngine(const ConsolidationConfig& config, const ShortTermConfig& short_term,
                                         SimilarityScorer* scorer, AssociationSampler& sampler)
    : config_(config)
    , hebbian_cap_(std::max(1, short_term.hebbian_cap))
    , scorer_(scorer)
    , sampler_(sampler) {}

double ConsolidationEngine::normalized_potential(int potential) const {
    return std::min(1.0, static_cast<double>(std::max(0, potential)) / hebbian_cap_);
}

std::vector<Association> ConsolidationEngine::replay(const Episode& episode,
                                                     const std::vector<Episode>& candidates) {
    if (!scorer_) {
        return {};
    }
    const auto adjacency = static_cast<Timestamp>(config_.replay_adjacency_seconds * 1000.0);

    std::vector<Association> edges;
    try {
        for (const auto& c : candidates) {
            if (c.id == episode.id) continue;
            const bool related = c.category == episode.category ||
                                 std::llabs(c.window_start - episode.window_start) <= adjacency;
            if (!related) continue;

            const double w = scorer_->score(episode, c);
            if (!std::isfinite(w) || w <= 0.0) continue;
            Association a;
            a.source_id = episode.id;
            a.target_id = c.id;
            a.weight = clamp01(w);
            a.kind = AssociationKind::Replay;
            edges.push_back(std::move(a));
        }
    } catch (const EngramException& e) {
        LOG_WARN("similarity scorer failed, replay without associations",
                 kv("episode", episode.id), kv("error", e.message()));
        return {};
    }
    return edges;
}

double ConsolidationEngine::hebbian_update(double old_strength, double learning_rate, double pre, double post) {
    ENGRAM_CHECK_ARGUMENT(learning_rate >= 0.05 && learning_rate <= 0.2,
                          "learning rate must lie in [0.05, 0.2]");
    const double updated = old_strength * (1.0 + learning_rate * clamp01(pre) * clamp01(post));
    if (!std::isfinite(updated) || updated < 0.0 || updated > 1.0) {
        LOG_WARN("hebbian update out of range, clamped", kv("value", updated));
    }
    return clamp01(updated);
}

double ConsolidationEngine::competitive_forgetting(double strength) const {
    double s = clamp01(strength);
    if (s < config_.decay_threshold) {
        s *= 0.8;
    } else if (s > config_.strengthen_threshold) {
        s = std::min(1.0, s * 1.2);
    }
    return s;
}

double ConsolidationEngine::replay_strength(const Episode& episode) const {
    return clamp01(0.3 * episode.stm_strength + 0.3 * episode.emotional_salience +
                   0.2 * std::min(1.0, episode.hebbian_potential / 10.0) +
                   0.2 * episode.recency_factor);
}

CorticalMapping ConsolidationEngine::cortical_mapping(const std::string& category) {
    static const std::map<std::string, CorticalMapping> table = {
        {"strategy", {"executive_function", "Strategic planning and goal-oriented thinking process",
                      "prefrontal_cortex"}},
        {"communication", {"social_cognition", "Social communication and collaborative interaction pattern",
                           "temporal_superior_cortex"}},
        {"finance", {"quantitative_reasoning", "Resource management and financial decision-making schema",
                     "parietal_cortex"}},
        {"project", {"temporal_sequencing", "Project execution and temporal coordination pattern",
                     "frontal_motor_cortex"}},
        {"client", {"interpersonal_skills", "Customer service and relationship maintenance schema",
                    "orbitofrontal_cortex"}},
        {"operations", {"technical_procedures", "Operational maintenance and system reliability pattern",
                        "motor_cortex"}},
    };
    auto it = table.find(category);
    if (it != table.end()) return it->second;
    return {"general_cognition", "General task processing and workflow management", "association_cortex"};
}

ReplayOutcome ConsolidationEngine::run_cycle(const Episode& episode, const std::vector<Episode>& candidates,
                                             Timestamp now) {
    if (is_terminal(episode.state)) {
        throw InvariantViolation(std::string("episode already ") + to_string(episode.state), episode.id);
    }

    ReplayOutcome out;
    out.episode = episode;
    Episode& e = out.episode;
    e.state = EpisodeState::Replaying;

    AssociationGraph graph;
    for (const auto& a : replay(episode, candidates)) graph.add_or_strengthen(a);

    std::map<std::string, int> potential_by_id;
    for (const auto& c : candidates) potential_by_id[c.id] = c.hebbian_potential;

    const auto replayed = graph.outgoing(e.id);
    double post = 0.0;
    if (!replayed.empty()) {
        for (const auto& a : replayed) {
            post += normalized_potential(potential_by_id[a.target_id]);
        }
        post /= static_cast<double>(replayed.size());
    }
    const double pre = normalized_potential(e.hebbian_potential);

    const double before = clamp01(e.strength);
    double s = hebbian_update(before, config_.learning_rate, pre, post);
    s = competitive_forgetting(s);
    e.strength = s;
    e.replay_count += 1;
    e.state = s >= before ? EpisodeState::Strengthened : EpisodeState::Weakened;

    for (const auto& a : sampler_.sample(e, candidates)) graph.add_or_strengthen(a);
    out.edges = graph.outgoing(e.id);

    if (s > config_.consolidation_threshold) {
        e.state = EpisodeState::ConsolidatedToLTM;
        const auto mapping = cortical_mapping(e.category);
        ConsolidatedMemory m;
        m.id = e.id;
        m.semantic_category = mapping.semantic_category;
        m.consolidated_strength = s;
        m.replay_strength = replay_strength(e);
        m.associations = out.edges;
        m.semantic_gist = mapping.gist;
        m.cortical_region = mapping.region;
        m.consolidated_at = now;
        out.promoted = std::move(m);
    } else if (s < config_.discard_threshold || e.replay_count >= config_.max_replay_cycles) {
        e.state = EpisodeState::Discarded;
    }

    LOG_DEBUG("replay cycle", kv("episode", e.id), kv("strength", s), kv("state", to_string(e.state)),
              kv("edges", out.edges.size()));
    return out;
}

} // namespace engram
