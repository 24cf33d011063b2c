#include "engram/pipeline.hpp"

#include "engram/error.hpp"
#include "engram/logging.hpp"
#include "engram/store/repository.hpp"

namespace engram {

Pipeline::Pipeline(store::DurableStore& store, PipelineConfig config, const Clock& clock,
                   Collaborators collaborators, Sleeper sleeper)
    : store_(store)
    , config_(std::move(config))
    , clock_(clock)
    , collaborators_(collaborators)
    , runner_(store, config_.writeback, clock, collaborators.sink, sleeper) {
    config_.validate();

    if (!collaborators_.enrichment && collaborators_.enrichment_client) {
        const auto& c = config_.collaborator;
        fallback_enrichment_ = std::make_unique<FallbackEnrichmentProvider>();
        feature_cache_ = std::make_unique<FeatureCache>(static_cast<size_t>(c.cache_capacity),
                                                        static_cast<Timestamp>(c.cache_ttl_seconds) * MS_PER_SECOND,
                                                        clock_);
        remote_enrichment_ = std::make_unique<RemoteEnrichmentProvider>(collaborators_.enrichment_client, c,
                                                                         feature_cache_.get(), sleeper);
        default_enrichment_ = std::make_unique<CircuitBreakerProvider>(
            *remote_enrichment_, *fallback_enrichment_, c.breaker_failure_threshold,
            static_cast<Timestamp>(c.breaker_cooldown_seconds) * MS_PER_SECOND, clock_);
        collaborators_.enrichment = default_enrichment_.get();
    } else if (!collaborators_.enrichment) {
        default_enrichment_ = std::make_unique<FallbackEnrichmentProvider>();
        collaborators_.enrichment = default_enrichment_.get();
    }
    if (!collaborators_.similarity) {
        default_similarity_ = std::make_unique<EnrichmentSimilarityScorer>(*collaborators_.enrichment);
        collaborators_.similarity = default_similarity_.get();
    }
    if (!collaborators_.sampler) {
        default_sampler_ = std::make_unique<RandomPairSampler>(config_.consolidation.creative_pairs,
                                                               config_.consolidation.creative_max_weight,
                                                               config_.consolidation.seed);
        collaborators_.sampler = default_sampler_.get();
    }

    LOG_DEBUG("pipeline ready", kv("enrichment", collaborators_.enrichment->name()),
              kv("embedding", collaborators_.embedding ? "yes" : "no"));
}

const std::vector<std::string>& Pipeline::stage_names() {
    static const std::vector<std::string> names = {
        stage_names::WORKING_MEMORY,
        stage_names::SHORT_TERM_MEMORY,
        stage_names::CONSOLIDATION,
        stage_names::LONG_TERM_MEMORY,
        stage_names::HOMEOSTASIS,
        stage_names::RECLUSTER,
    };
    return names;
}

std::unique_ptr<Stage> Pipeline::make_stage(const std::string& name) {
    if (name == stage_names::WORKING_MEMORY) {
        return std::make_unique<WorkingMemoryStage>(store_, config_);
    }
    if (name == stage_names::SHORT_TERM_MEMORY) {
        return std::make_unique<ShortTermStage>(store_, config_, *collaborators_.enrichment);
    }
    if (name == stage_names::CONSOLIDATION) {
        return std::make_unique<ConsolidationStage>(store_, config_, collaborators_.similarity,
                                                    *collaborators_.sampler, claims_);
    }
    if (name == stage_names::LONG_TERM_MEMORY) {
        return std::make_unique<LongTermStage>(store_, config_, collaborators_.embedding);
    }
    if (name == stage_names::HOMEOSTASIS) {
        return std::make_unique<HomeostasisStage>(store_, config_);
    }
    if (name == stage_names::RECLUSTER) {
        return std::make_unique<ReclusterStage>(store_, config_);
    }
    throw EngramException(ErrorCode::INVALID_ARGUMENT, "unknown stage: " + name);
}

JobResult Pipeline::run_stage(const std::string& name, const CancellationToken* cancel) {
    auto stage = make_stage(name);
    LOG_INFO("stage starting", kv("stage", name));
    return runner_.run(*stage, cancel);
}

std::vector<JobResult> Pipeline::run_all(const CancellationToken* cancel) {
    std::vector<JobResult> results;
    for (const char* name : {stage_names::WORKING_MEMORY, stage_names::SHORT_TERM_MEMORY,
                             stage_names::CONSOLIDATION, stage_names::LONG_TERM_MEMORY}) {
        results.push_back(run_stage(name, cancel));
        const JobStatus status = results.back().status;
        if (status == JobStatus::Failed || status == JobStatus::Cancelled) {
            LOG_WARN("pipeline stopped early", kv("stage", name), kv("status", to_string(status)));
            break;
        }
    }
    return results;
}

void Pipeline::record_access(const std::string& node_id, Timestamp at) {
    ENGRAM_CHECK_ARGUMENT(!node_id.empty(), "node id must not be empty");
    store::MemoryRepository(store_).record_access(node_id, at);
}

} // namespace engram
