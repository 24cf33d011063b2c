#pragma once

#include <memory>
#include <string>
#include <vector>

#include "engram/clock.hpp"
#include "engram/config.hpp"
#include "engram/consolidation_engine.hpp"
#include "engram/enrichment.hpp"
#include "engram/job_result.hpp"
#include "engram/observability.hpp"
#include "engram/stage_runner.hpp"
#include "engram/stages.hpp"
#include "engram/store/durable_store.hpp"

namespace engram {

/**
 * External collaborators of a pipeline. Null members are replaced by
 * the built-in defaults: rule-based enrichment, similarity through the
 * enrichment provider, seeded random creative pairs, no embeddings and
 * no observability.
 *
 * Given an enrichment_client and no enrichment provider, enrichment goes
 * through a cached RemoteEnrichmentProvider behind a circuit breaker that
 * falls back to the rule-based provider.
 */
struct Collaborators {
    EnrichmentProvider* enrichment = nullptr;
    std::shared_ptr<EnrichmentClient> enrichment_client;
    EmbeddingProvider* embedding = nullptr;
    SimilarityScorer* similarity = nullptr;
    AssociationSampler* sampler = nullptr;
    ObservabilitySink* sink = nullptr;
};

/**
 * Wires stages to a store and runs them. One Pipeline per process; the
 * claim registry it owns keeps concurrent consolidation runs off the
 * same episode.
 */
class Pipeline {
public:
    Pipeline(store::DurableStore& store, PipelineConfig config, const Clock& clock,
             Collaborators collaborators = {}, Sleeper sleeper = thread_sleeper());

    Pipeline(const Pipeline&) = delete;
    Pipeline& operator=(const Pipeline&) = delete;

    // Every runnable stage, incremental stages first in data-flow order
    static const std::vector<std::string>& stage_names();

    // Throws EngramException(INVALID_ARGUMENT) for unknown names.
    std::unique_ptr<Stage> make_stage(const std::string& name);

    JobResult run_stage(const std::string& name, const CancellationToken* cancel = nullptr);

    // working memory -> short-term -> consolidation -> long-term
    std::vector<JobResult> run_all(const CancellationToken* cancel = nullptr);

    // Retrieval event for a semantic node; feeds access frequency.
    void record_access(const std::string& node_id, Timestamp at);

    const PipelineConfig& config() const { return config_; }
    StageRunner& runner() { return runner_; }

private:
    store::DurableStore& store_;
    PipelineConfig config_;
    const Clock& clock_;
    Collaborators collaborators_;

    // Remote enrichment chain, built only with an enrichment client
    std::unique_ptr<FallbackEnrichmentProvider> fallback_enrichment_;
    std::unique_ptr<FeatureCache> feature_cache_;
    std::unique_ptr<RemoteEnrichmentProvider> remote_enrichment_;

    std::unique_ptr<EnrichmentProvider> default_enrichment_;
    std::unique_ptr<SimilarityScorer> default_similarity_;
    std::unique_ptr<AssociationSampler> default_sampler_;

    ClaimRegistry claims_;
    StageRunner runner_;
};

} // namespace engram
