// =============================================================================
// Pipeline Tests
// =============================================================================

#include <gtest/gtest.h>
#include "engram/error.hpp"
#include "engram/pipeline.hpp"
#include "engram/store/memory_store.hpp"
#include "engram/store/repository.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

using namespace engram;
using store::MemoryStore;
namespace tables = store::tables;

namespace {

class UnavailableEmbedding : public EmbeddingProvider {
public:
    Embedding embed(const ConsolidatedMemory& memory) override {
        ++calls;
        throw TransientIOError("embedding service unavailable", memory.id);
    }
    int calls = 0;
};

// Rule-based enrichment that counts calls per item
class CountingEnrichment : public EnrichmentProvider {
public:
    Features enrich(const MemoryItem& item) override {
        ++calls[item.id];
        return fallback_.enrich(item);
    }
    double similarity(const std::string& a, const std::string& b) override {
        return fallback_.similarity(a, b);
    }
    const char* name() const override { return "counting"; }

    std::map<std::string, int> calls;

private:
    FallbackEnrichmentProvider fallback_;
};

// Remote transport answering from a script; called from worker threads
class ScriptedClient : public EnrichmentClient {
public:
    explicit ScriptedClient(bool healthy) : healthy_(healthy) {}

    Features request_features(const std::string&) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++feature_calls_;
        if (!healthy_) throw TransientIOError("enrichment service unreachable", "client");
        Features f;
        f.category = "strategy";
        f.topics = {"launch"};
        f.importance = 0.9;
        f.sentiment = 0.8;
        return f;
    }

    double request_similarity(const std::string& a, const std::string& b) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!healthy_) throw TransientIOError("enrichment service unreachable", "client");
        texts_.push_back(a);
        texts_.push_back(b);
        return 0.6;
    }

    int feature_calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return feature_calls_;
    }

    std::vector<std::string> similarity_texts() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return texts_;
    }

private:
    bool healthy_;
    mutable std::mutex mutex_;
    int feature_calls_ = 0;
    std::vector<std::string> texts_;
};

Sleeper no_sleep() {
    return [](std::chrono::milliseconds) {};
}

} // namespace

class PipelineTest : public ::testing::Test {
protected:
    // Start of a 300 s co-activation bucket
    static constexpr Timestamp T0 = 1700000100000;
    static constexpr Timestamp BURST_GAP = 360000;

    ManualClock clock{T0};
    MemoryStore db{clock};
    PipelineConfig config;

    static MemoryItem note(const std::string& id, Timestamp created_at, const std::string& content) {
        MemoryItem m;
        m.id = id;
        m.content_ref = content;
        m.created_at = created_at;
        m.salience = 0.7;
        m.importance = 0.9;
        m.sentiment = 0.8;
        m.topic = "strategy";
        return m;
    }

    // Two salient strategy notes, with the clock just after them
    void append(int k) {
        const Timestamp at = T0 + k * BURST_GAP;
        clock.set(at + 10000);
        std::vector<MemoryItem> items;
        for (int j = 0; j < 2; ++j) {
            const std::string id = "b" + std::to_string(k) + "-" + std::to_string(j);
            items.push_back(note(id, at + 1000 * j, "launch planning note " + id));
        }
        store::MemoryRepository(db).append_raw(items);
    }

    // One burst processed by every incremental stage
    std::vector<JobResult> burst(Pipeline& pipeline, int k) {
        append(k);
        return pipeline.run_all();
    }

    void feed(Pipeline& pipeline) {
        for (int k = 0; k < 3; ++k) {
            for (const auto& r : burst(pipeline, k)) {
                EXPECT_EQ(r.status, JobStatus::Succeeded) << r.stage << " in burst " << k;
            }
        }
    }

    std::map<std::string, Episode> episodes() {
        std::map<std::string, Episode> out;
        for (const auto& r : db.select(store::Selection{tables::EPISODES, {}, store::Order::ById, 0})) {
            Episode e = store::episode_from_record(r);
            out.emplace(e.id, std::move(e));
        }
        return out;
    }

    std::vector<SemanticNode> nodes() {
        std::vector<SemanticNode> out;
        for (const auto& r : db.select(store::Selection{tables::SEMANTIC_NODES, {}, store::Order::ById, 0})) {
            out.push_back(store::node_from_record(r));
        }
        return out;
    }
};

TEST_F(PipelineTest, StageNamesInDataFlowOrder) {
    const auto& names = Pipeline::stage_names();
    ASSERT_EQ(names.size(), 6u);
    EXPECT_EQ(names[0], "working_memory");
    EXPECT_EQ(names[3], "long_term_memory");
    EXPECT_EQ(names[5], "recluster");
}

// Three bursts of related notes become three semantic nodes
TEST_F(PipelineTest, RawItemsBecomeSemanticNodes) {
    Pipeline pipeline(db, config, clock, {}, no_sleep());
    feed(pipeline);

    EXPECT_EQ(db.row_count(tables::WORKING_MEMORY), 6u);
    EXPECT_EQ(db.row_count(tables::EPISODE_MEMBERS), 6u);
    ASSERT_EQ(db.row_count(tables::EPISODES), 3u);
    for (const auto& r : db.select(store::Selection{tables::EPISODES, {}, store::Order::ById, 0})) {
        const Episode e = store::episode_from_record(r);
        EXPECT_EQ(e.category, "strategy");
        EXPECT_EQ(e.item_count, 2);
        EXPECT_EQ(e.hebbian_potential, 3);
        EXPECT_EQ(e.replay_count, 1);
        EXPECT_EQ(e.state, EpisodeState::ConsolidatedToLTM) << e.id;
    }

    ASSERT_EQ(db.row_count(tables::CONSOLIDATED), 3u);
    for (const auto& r : db.select(store::Selection{tables::CONSOLIDATED, {}, store::Order::ById, 0})) {
        const ConsolidatedMemory m = store::consolidated_from_record(r);
        EXPECT_EQ(m.semantic_category, "executive_function");
        EXPECT_EQ(m.cortical_region, "prefrontal_cortex");
        EXPECT_GT(m.consolidated_strength, config.consolidation.consolidation_threshold);
    }

    const auto semantic = nodes();
    ASSERT_EQ(semantic.size(), 3u);
    std::set<int64_t> ranks;
    for (const auto& n : semantic) {
        EXPECT_EQ(n.cluster_id, semantic.front().cluster_id);
        EXPECT_EQ(n.age_category, AgeCategory::Recent);
        EXPECT_EQ(n.consolidation_state, ConsolidationState::Episodic);
        EXPECT_GT(n.retrieval_strength, 0.0);
        EXPECT_LE(n.retrieval_strength, 1.0);
        ranks.insert(n.competition_rank);
    }
    EXPECT_EQ(ranks, (std::set<int64_t>{1, 2, 3}));
    EXPECT_EQ(db.row_count(tables::CLUSTERS), 1u);
    EXPECT_EQ(db.row_count(tables::QUARANTINE), 0u);
}

TEST_F(PipelineTest, EpisodesWaitForEnoughCoactivation) {
    Pipeline pipeline(db, config, clock, {}, no_sleep());
    burst(pipeline, 0);
    burst(pipeline, 1);
    EXPECT_EQ(db.row_count(tables::EPISODES), 2u);
    EXPECT_EQ(db.row_count(tables::CONSOLIDATED), 0u);
    EXPECT_EQ(db.row_count(tables::SEMANTIC_NODES), 0u);
}

// Running again with no new input changes nothing
TEST_F(PipelineTest, RerunWithoutInputIsNoop) {
    Pipeline pipeline(db, config, clock, {}, no_sleep());
    feed(pipeline);
    const auto before = db.snapshot();

    clock.advance_seconds(30);
    int64_t processed = 0;
    for (const auto& r : pipeline.run_all()) {
        EXPECT_EQ(r.status, JobStatus::Succeeded);
        processed += r.records_processed;
    }
    EXPECT_EQ(processed, 0);
    EXPECT_EQ(db.snapshot(), before);
}

TEST_F(PipelineTest, HomeostasisAgesAndCountsAccess) {
    Pipeline pipeline(db, config, clock, {}, no_sleep());
    feed(pipeline);
    const std::string hot = nodes().front().id;

    clock.advance_ms(31 * MS_PER_DAY);
    for (int i = 1; i <= 3; ++i) pipeline.record_access(hot, clock.now() - i * 1000);
    EXPECT_EQ(db.row_count(tables::ACCESS_LOG), 3u);

    const auto result = pipeline.run_stage("homeostasis");
    EXPECT_EQ(result.status, JobStatus::Succeeded);
    EXPECT_EQ(result.records_processed, 1);

    const auto after = nodes();
    ASSERT_EQ(after.size(), 3u);
    for (const auto& n : after) {
        EXPECT_EQ(n.age_category, AgeCategory::Remote);
        EXPECT_EQ(n.computed_at, clock.now());
        EXPECT_GT(n.homeostatic_scale, 0.0);
        if (n.id == hot) {
            EXPECT_EQ(n.access_frequency, 3);
            EXPECT_EQ(n.consolidation_state, ConsolidationState::Consolidating);
        } else {
            EXPECT_EQ(n.access_frequency, 0);
        }
    }
}

// Pruning stops at a fixpoint, so a second sweep at the same time is a no-op
TEST_F(PipelineTest, HomeostasisRerunChangesNothing) {
    config.semantic.prune_threshold = 0.99;
    Pipeline pipeline(db, config, clock, {}, no_sleep());
    feed(pipeline);

    clock.advance_ms(31 * MS_PER_DAY);
    pipeline.record_access(nodes().front().id, clock.now() - 1000);
    ASSERT_EQ(pipeline.run_stage("homeostasis").status, JobStatus::Succeeded);
    const auto survivors = nodes();
    EXPECT_LT(survivors.size(), 3u);
    ASSERT_FALSE(survivors.empty());
    const auto once = db.snapshot();

    ASSERT_EQ(pipeline.run_stage("homeostasis").status, JobStatus::Succeeded);
    EXPECT_EQ(db.snapshot(), once);
}

// A short-term write built before consolidation ran lands after it
TEST_F(PipelineTest, LateShortTermWriteKeepsConsolidatedEpisodes) {
    Pipeline pipeline(db, config, clock, {}, no_sleep());
    for (int k = 0; k < 3; ++k) {
        append(k);
        ASSERT_EQ(pipeline.run_stage("working_memory").status, JobStatus::Succeeded);
        ASSERT_EQ(pipeline.run_stage("short_term_memory").status, JobStatus::Succeeded);
    }
    append(3);
    ASSERT_EQ(pipeline.run_stage("working_memory").status, JobStatus::Succeeded);

    auto stm = pipeline.make_stage("short_term_memory");
    const auto pending = stm->next_batch(stm->start_cursor(db.get_watermark("short_term_memory")), true,
                                         stm->page_size());
    ASSERT_FALSE(pending.empty());
    const auto stale = stm->process(pending, clock.now());

    ASSERT_EQ(pipeline.run_stage("consolidation").status, JobStatus::Succeeded);
    std::map<std::string, Episode> consolidated;
    for (const auto& [id, e] : episodes()) {
        if (e.state == EpisodeState::ConsolidatedToLTM) consolidated.emplace(id, e);
    }
    ASSERT_FALSE(consolidated.empty());

    IncrementalWriter(db, config.writeback, clock, nullptr, no_sleep()).apply("short_term_memory", stale);
    ASSERT_EQ(pipeline.run_stage("consolidation").status, JobStatus::Succeeded);

    const auto after = episodes();
    for (const auto& [id, before] : consolidated) {
        auto it = after.find(id);
        ASSERT_NE(it, after.end()) << id;
        EXPECT_EQ(it->second.state, EpisodeState::ConsolidatedToLTM) << id;
        EXPECT_EQ(it->second.replay_count, before.replay_count) << id;
        EXPECT_EQ(it->second.hebbian_potential, before.hebbian_potential) << id;
    }
}

// Working memory rewrites re-ranked rows; short-term enriches each content once
TEST_F(PipelineTest, ReRankedItemsAreEnrichedOnce) {
    CountingEnrichment enrichment;
    Collaborators collaborators;
    collaborators.enrichment = &enrichment;
    Pipeline pipeline(db, config, clock, collaborators, no_sleep());
    store::MemoryRepository repo(db);

    auto step = [&](Timestamp at) {
        clock.set(at + 10000);
        ASSERT_EQ(pipeline.run_stage("working_memory").status, JobStatus::Succeeded);
        ASSERT_EQ(pipeline.run_stage("short_term_memory").status, JobStatus::Succeeded);
    };
    for (int i = 0; i < 3; ++i) {
        const Timestamp at = T0 + i * 60000;
        const std::string id = "n" + std::to_string(i);
        repo.append_raw({note(id, at, "launch planning note " + id)});
        step(at);
    }
    EXPECT_EQ(enrichment.calls, (std::map<std::string, int>{{"n0", 1}, {"n1", 1}, {"n2", 1}}));

    // A corrected note is enriched again and regrouped from its new content
    repo.append_raw({note("n0", T0, "revised launch planning note n0")});
    step(T0 + 180000);
    EXPECT_EQ(enrichment.calls["n0"], 2);
    EXPECT_EQ(enrichment.calls["n1"], 1);

    const auto snap = db.snapshot();
    const auto& wm = snap.at(tables::WORKING_MEMORY).at("n0");
    const auto& member = snap.at(tables::EPISODE_MEMBERS).at("n0");
    EXPECT_EQ(member.text("source_hash"), wm.content_hash);
    EXPECT_EQ(wm.text("content_ref"), "revised launch planning note n0");
}

// A crash mid-recluster leaves nodes and clusters as they were
TEST_F(PipelineTest, ReclusterIsOneTransaction) {
    config.writeback.batch_size = 2;
    config.writeback.min_batch_size = 1;
    Pipeline pipeline(db, config, clock, {}, no_sleep());
    feed(pipeline);
    const auto before = db.snapshot();

    clock.advance_seconds(60);
    db.crash_after_commits(0);
    const auto failed = pipeline.run_stage("recluster");
    EXPECT_EQ(failed.status, JobStatus::Failed);
    EXPECT_EQ(db.snapshot(), before);

    db.clear_faults();
    const auto result = pipeline.run_stage("recluster");
    ASSERT_EQ(result.status, JobStatus::Succeeded);
    std::set<std::string> cluster_ids;
    for (const auto& r : db.select(store::Selection{tables::CLUSTERS, {}, store::Order::ById, 0})) {
        cluster_ids.insert(r.id);
    }
    for (const auto& n : nodes()) {
        EXPECT_EQ(cluster_ids.count(std::to_string(n.cluster_id)), 1u) << n.id;
    }
}

TEST_F(PipelineTest, EnrichmentClientIsUsedWhileHealthy) {
    auto client = std::make_shared<ScriptedClient>(true);
    Collaborators collaborators;
    collaborators.enrichment_client = client;
    Pipeline pipeline(db, config, clock, collaborators, no_sleep());
    feed(pipeline);

    EXPECT_EQ(client->feature_calls(), 6);
    const auto texts = client->similarity_texts();
    ASSERT_FALSE(texts.empty());
    for (const auto& t : texts) {
        EXPECT_NE(t.find("launch planning note"), std::string::npos) << t;
    }
    EXPECT_EQ(db.row_count(tables::SEMANTIC_NODES), 3u);
}

// Two failures open the breaker; each later burst spends one trial call
TEST_F(PipelineTest, FailingEnrichmentClientFallsBack) {
    config.collaborator.max_retries = 0;
    config.collaborator.breaker_failure_threshold = 2;
    auto client = std::make_shared<ScriptedClient>(false);
    Collaborators collaborators;
    collaborators.enrichment_client = client;
    Pipeline pipeline(db, config, clock, collaborators, no_sleep());
    feed(pipeline);

    EXPECT_EQ(client->feature_calls(), 4);
    EXPECT_EQ(db.row_count(tables::EPISODE_MEMBERS), 6u);
    EXPECT_EQ(db.row_count(tables::SEMANTIC_NODES), 3u);
    EXPECT_EQ(db.row_count(tables::QUARANTINE), 0u);
}

TEST_F(PipelineTest, ReclusterReplacesClusterTable) {
    Pipeline pipeline(db, config, clock, {}, no_sleep());
    feed(pipeline);

    const auto result = pipeline.run_stage("recluster");
    EXPECT_EQ(result.status, JobStatus::Succeeded);
    EXPECT_EQ(result.records_succeeded, 3);

    std::set<std::string> cluster_ids;
    for (const auto& r : db.select(store::Selection{tables::CLUSTERS, {}, store::Order::ById, 0})) {
        cluster_ids.insert(r.id);
    }
    const auto after = nodes();
    ASSERT_EQ(after.size(), 3u);
    for (const auto& n : after) {
        EXPECT_EQ(cluster_ids.count(std::to_string(n.cluster_id)), 1u) << n.id;
    }
}

TEST_F(PipelineTest, MissingEmbeddingFallsBackToCategory) {
    UnavailableEmbedding embedding;
    Collaborators collaborators;
    collaborators.embedding = &embedding;
    Pipeline pipeline(db, config, clock, collaborators, no_sleep());
    feed(pipeline);

    EXPECT_EQ(embedding.calls, 3);
    const int expected = ClusterIndex(config.semantic).hashed_cluster("executive_function");
    for (const auto& n : nodes()) EXPECT_EQ(n.cluster_id, expected);
}

TEST_F(PipelineTest, SinkReceivesEveryRun) {
    MetricsRegistry registry;
    MetricsSink sink(registry);
    Collaborators collaborators;
    collaborators.sink = &sink;
    Pipeline pipeline(db, config, clock, collaborators, no_sleep());
    feed(pipeline);

    EXPECT_EQ(registry.counter("engram_runs", {{"stage", "long_term_memory"}, {"status", "succeeded"}}), 3);
    EXPECT_EQ(registry.counter("engram_records_succeeded", {{"stage", "working_memory"}}), 6);
}

TEST_F(PipelineTest, HeldLockSkipsStage) {
    Pipeline pipeline(db, config, clock, {}, no_sleep());
    ASSERT_TRUE(db.acquire_run_lock("working_memory", "other-host:9", 3600));
    const auto result = pipeline.run_stage("working_memory");
    EXPECT_EQ(result.status, JobStatus::AlreadyRunning);
}

TEST_F(PipelineTest, CancelledRunStopsEarly) {
    Pipeline pipeline(db, config, clock, {}, no_sleep());
    CancellationToken token;
    token.cancel();
    const auto results = pipeline.run_all(&token);
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].status, JobStatus::Cancelled);
}

TEST_F(PipelineTest, UnknownStageRejected) {
    Pipeline pipeline(db, config, clock, {}, no_sleep());
    EXPECT_THROW(pipeline.make_stage("dreaming"), EngramException);
    EXPECT_THROW(pipeline.run_stage("dreaming"), EngramException);
}

TEST_F(PipelineTest, InvalidConfigRejected) {
    config.consolidation.learning_rate = 0.9;
    EXPECT_THROW(Pipeline(db, config, clock, {}, no_sleep()), ConfigurationError);
}

TEST_F(PipelineTest, RecordAccessNeedsNodeId) {
    Pipeline pipeline(db, config, clock, {}, no_sleep());
    EXPECT_THROW(pipeline.record_access("", clock.now()), EngramException);
}
