#pragma once

#include <string>
#include <vector>

#include "engram/attention_gate.hpp"
#include "engram/config.hpp"
#include "engram/consolidation_engine.hpp"
#include "engram/enrichment.hpp"
#include "engram/episode_builder.hpp"
#include "engram/semantic_network.hpp"
#include "engram/stage_runner.hpp"
#include "engram/store/repository.hpp"

namespace engram {

namespace stage_names {
constexpr const char* WORKING_MEMORY = "working_memory";
constexpr const char* SHORT_TERM_MEMORY = "short_term_memory";
constexpr const char* CONSOLIDATION = "consolidation";
constexpr const char* LONG_TERM_MEMORY = "long_term_memory";
constexpr const char* HOMEOSTASIS = "homeostasis";
constexpr const char* RECLUSTER = "recluster";
}

// raw_memories -> working_memory
class WorkingMemoryStage : public Stage {
public:
    WorkingMemoryStage(store::DurableStore& store, const PipelineConfig& config);

    const char* name() const override { return stage_names::WORKING_MEMORY; }
    size_t page_size() const override { return static_cast<size_t>(config_.writeback.batch_size); }

    std::vector<store::Record> next_batch(const store::Watermark& cursor, bool first_page, size_t limit) override;
    std::vector<store::Record> fetch(const std::vector<std::string>& ids) override;
    std::vector<WorkItem> process(const std::vector<store::Record>& batch, Timestamp now) override;

private:
    store::DurableStore& store_;
    store::MemoryRepository repo_;
    const PipelineConfig& config_;
    AttentionGate gate_;
};

// Active working_memory -> episode_members, episodes
class ShortTermStage : public Stage {
public:
    ShortTermStage(store::DurableStore& store, const PipelineConfig& config, EnrichmentProvider& enrichment);

    const char* name() const override { return stage_names::SHORT_TERM_MEMORY; }
    size_t page_size() const override { return static_cast<size_t>(config_.writeback.batch_size); }

    std::vector<store::Record> next_batch(const store::Watermark& cursor, bool first_page, size_t limit) override;
    std::vector<store::Record> fetch(const std::vector<std::string>& ids) override;
    std::vector<WorkItem> process(const std::vector<store::Record>& batch, Timestamp now) override;

private:
    store::DurableStore& store_;
    store::MemoryRepository repo_;
    const PipelineConfig& config_;
    EnrichmentProvider& enrichment_;
    EpisodeBuilder builder_;
};

/**
 * Ready episodes -> replayed episodes, associations, consolidated_memories.
 * Selection is driven by episode state, so every run starts from the
 * first eligible episode.
 */
class ConsolidationStage : public Stage {
public:
    ConsolidationStage(store::DurableStore& store, const PipelineConfig& config,
                       SimilarityScorer* scorer, AssociationSampler& sampler, ClaimRegistry& claims);

    const char* name() const override { return stage_names::CONSOLIDATION; }
    size_t page_size() const override { return static_cast<size_t>(config_.consolidation.batch_size); }

    store::Watermark start_cursor(const std::optional<store::Watermark>&) const override { return {}; }
    store::Watermark cursor_of(const store::Record& r) const override { return {0, r.id, r.content_hash}; }

    std::vector<store::Record> next_batch(const store::Watermark& cursor, bool first_page, size_t limit) override;
    std::vector<store::Record> fetch(const std::vector<std::string>& ids) override;
    std::vector<WorkItem> process(const std::vector<store::Record>& batch, Timestamp now) override;

private:
    store::DurableStore& store_;
    store::MemoryRepository repo_;
    const PipelineConfig& config_;
    ConsolidationEngine engine_;
    ClaimRegistry& claims_;
    // Claims of the last processed page, held until the next page
    std::vector<ClaimRegistry::Claim> held_;
};

// consolidated_memories -> semantic_nodes, clusters
class LongTermStage : public Stage {
public:
    LongTermStage(store::DurableStore& store, const PipelineConfig& config, EmbeddingProvider* embedding);

    const char* name() const override { return stage_names::LONG_TERM_MEMORY; }
    size_t page_size() const override { return static_cast<size_t>(config_.writeback.batch_size); }

    std::vector<store::Record> next_batch(const store::Watermark& cursor, bool first_page, size_t limit) override;
    std::vector<store::Record> fetch(const std::vector<std::string>& ids) override;
    std::vector<WorkItem> process(const std::vector<store::Record>& batch, Timestamp now) override;

private:
    std::optional<Embedding> embed(const ConsolidatedMemory& memory);

    store::DurableStore& store_;
    store::MemoryRepository repo_;
    const PipelineConfig& config_;
    EmbeddingProvider* embedding_;
    SemanticNetwork network_;
};

// Weekly pass over every cluster: rescale retrieval, prune remote weak nodes
class HomeostasisStage : public Stage {
public:
    HomeostasisStage(store::DurableStore& store, const PipelineConfig& config);

    const char* name() const override { return stage_names::HOMEOSTASIS; }
    size_t page_size() const override { return static_cast<size_t>(config_.writeback.batch_size); }

    store::Watermark start_cursor(const std::optional<store::Watermark>&) const override { return {}; }
    store::Watermark cursor_of(const store::Record& r) const override { return {0, r.id, r.content_hash}; }

    std::vector<store::Record> next_batch(const store::Watermark& cursor, bool first_page, size_t limit) override;
    std::vector<store::Record> fetch(const std::vector<std::string>& ids) override;
    std::vector<WorkItem> process(const std::vector<store::Record>& batch, Timestamp now) override;

private:
    store::DurableStore& store_;
    store::MemoryRepository repo_;
    const PipelineConfig& config_;
    SemanticNetwork network_;
};

// Explicit full k-means over every semantic node
class ReclusterStage : public Stage {
public:
    ReclusterStage(store::DurableStore& store, const PipelineConfig& config);

    const char* name() const override { return stage_names::RECLUSTER; }
    // Single page holding every node, committed as a whole
    size_t page_size() const override { return static_cast<size_t>(-1); }
    bool single_transaction() const override { return true; }

    store::Watermark start_cursor(const std::optional<store::Watermark>&) const override { return {}; }
    store::Watermark cursor_of(const store::Record& r) const override { return {0, r.id, r.content_hash}; }

    std::vector<store::Record> next_batch(const store::Watermark& cursor, bool first_page, size_t limit) override;
    std::vector<store::Record> fetch(const std::vector<std::string>& ids) override;
    std::vector<WorkItem> process(const std::vector<store::Record>& batch, Timestamp now) override;

private:
    store::DurableStore& store_;
    store::MemoryRepository repo_;
    const PipelineConfig& config_;
    SemanticNetwork network_;
};

} // namespace engram
