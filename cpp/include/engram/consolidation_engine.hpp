#pragma once

#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "engram/association_graph.hpp"
#include "engram/config.hpp"
#include "engram/enrichment.hpp"
#include "engram/types.hpp"

namespace engram {

// =============================================================================
// Collaborator seams
// =============================================================================

// Pairwise episode similarity in [0,1]. May throw EngramException.
class SimilarityScorer {
public:
    virtual ~SimilarityScorer() = default;
    virtual double score(const Episode& a, const Episode& b) = 0;
};

// Scores episodes through an enrichment provider's text similarity.
class EnrichmentSimilarityScorer : public SimilarityScorer {
public:
    explicit EnrichmentSimilarityScorer(EnrichmentProvider& provider) : provider_(provider) {}

    double score(const Episode& a, const Episode& b) override;

    // Text handed to the provider for an episode
    static std::string describe(const Episode& e);

private:
    EnrichmentProvider& provider_;
};

// Proposes creative (cross-category) associations for an episode.
class AssociationSampler {
public:
    virtual ~AssociationSampler() = default;
    virtual std::vector<Association> sample(const Episode& episode,
                                            const std::vector<Episode>& candidates) = 0;
};

/**
 * Picks up to `pairs` episodes of other categories with low weights.
 * Draws are seeded by (seed, episode id) so reruns reproduce the same edges.
 */
class RandomPairSampler : public AssociationSampler {
public:
    RandomPairSampler(int pairs, double max_weight, uint64_t seed)
        : pairs_(pairs), max_weight_(max_weight), seed_(seed) {}

    std::vector<Association> sample(const Episode& episode,
                                     const std::vector<Episode>& candidates) override;

private:
    int pairs_;
    double max_weight_;
    uint64_t seed_;
};

class NoCreativeSampler : public AssociationSampler {
public:
    std::vector<Association> sample(const Episode&, const std::vector<Episode>&) override { return {}; }
};

// =============================================================================
// Claims: single writer per episode id within a process
// =============================================================================

class ClaimRegistry {
public:
    class Claim {
    public:
        Claim() = default;
        Claim(ClaimRegistry* registry, std::string id) : registry_(registry), id_(std::move(id)) {}
        ~Claim() { release(); }

        Claim(const Claim&) = delete;
        Claim& operator=(const Claim&) = delete;
        Claim(Claim&& other) noexcept : registry_(other.registry_), id_(std::move(other.id_)) {
            other.registry_ = nullptr;
        }
        Claim& operator=(Claim&& other) noexcept {
            if (this != &other) {
                release();
                registry_ = other.registry_;
                id_ = std::move(other.id_);
                other.registry_ = nullptr;
            }
            return *this;
        }

        explicit operator bool() const { return registry_ != nullptr; }
        const std::string& id() const { return id_; }
        void release();

    private:
        ClaimRegistry* registry_ = nullptr;
        std::string id_;
    };

    // Empty claim when another holder owns the id
    Claim try_claim(const std::string& id);

    bool is_claimed(const std::string& id) const;

private:
    friend class Claim;
    void release(const std::string& id);

    mutable std::mutex mutex_;
    std::set<std::string> claimed_;
};

// =============================================================================
// Consolidation engine
// =============================================================================

struct CorticalMapping {
    std::string semantic_category;
    std::string gist;
    std::string region;
};

struct ReplayOutcome {
    Episode episode;                       // updated strength, state, replay_count
    std::vector<Association> edges;        // replay and creative edges
    std::optional<ConsolidatedMemory> promoted;
};

/**
 * Simulated hippocampal replay. One cycle: gather related episodes,
 * Hebbian strengthening, competitive forgetting, then promotion or
 * discard. Terminal episodes are rejected.
 */
class ConsolidationEngine {
public:
    ConsolidationEngine(const ConsolidationConfig& config, const ShortTermConfig& short_term,
                        SimilarityScorer* scorer, AssociationSampler& sampler);

    // Related: same category, or window start within the adjacency range.
    // Scorer missing or failing yields no edges.
    std::vector<Association> replay(const Episode& episode, const std::vector<Episode>& candidates);

    // clamp(old * (1 + lr * pre * post)); lr must lie in [0.05, 0.2]
    static double hebbian_update(double old_strength, double learning_rate, double pre, double post);

    double competitive_forgetting(double strength) const;

    double replay_strength(const Episode& episode) const;

    static CorticalMapping cortical_mapping(const std::string& category);

    /**
     * Run one replay cycle for a non-terminal episode.
     * @throws InvariantViolation if the episode is already terminal
     */
    ReplayOutcome run_cycle(const Episode& episode, const std::vector<Episode>& candidates, Timestamp now);

private:
    double normalized_potential(int potential) const;

    ConsolidationConfig config_;
    int hebbian_cap_;
    SimilarityScorer* scorer_;
    AssociationSampler& sampler_;
};

} // namespace engram
