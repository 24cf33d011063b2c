// =============================================================================
// Semantic Network Tests
// =============================================================================

#include <gtest/gtest.h>
#include "engram/error.hpp"
#include "engram/semantic_network.hpp"
#include "engram/store/repository.hpp"
#include <algorithm>
#include <cmath>
#include <set>
#include <string>
#include <vector>

using namespace engram;

class SemanticNetworkTest : public ::testing::Test {
protected:
    static constexpr Timestamp NOW = 1700000000000;

    SemanticConfig config;

    SemanticNode node(const std::string& id, double strength, Timestamp consolidated_at = NOW) {
        SemanticNode n;
        n.id = id;
        n.semantic_category = "executive_function";
        n.cluster_id = 3;
        n.consolidated_strength = strength;
        n.consolidated_at = consolidated_at;
        n.computed_at = NOW;
        return n;
    }
};

TEST_F(SemanticNetworkTest, RanksByStrength) {
    std::vector<SemanticNode> members = {node("b", 0.6), node("c", 0.3), node("a", 0.9)};
    SemanticNetwork::rank_cluster(members);
    EXPECT_EQ(members[0].competition_rank, 2);
    EXPECT_EQ(members[1].competition_rank, 3);
    EXPECT_EQ(members[2].competition_rank, 1);
}

TEST_F(SemanticNetworkTest, RankTiesBrokenById) {
    std::vector<SemanticNode> members = {node("z", 0.5), node("m", 0.5), node("a", 0.5)};
    SemanticNetwork::rank_cluster(members);
    EXPECT_EQ(members[0].competition_rank, 3);
    EXPECT_EQ(members[1].competition_rank, 2);
    EXPECT_EQ(members[2].competition_rank, 1);
}

TEST_F(SemanticNetworkTest, RetrievalFollowsWeightedSum) {
    SemanticNetwork network(config, 0.5);
    SemanticNode n = node("a", 0.9, NOW - 2 * MS_PER_DAY);
    n.competition_rank = 1;
    n.access_frequency = 4;

    const double age = 2.0 * 86400.0;
    const double expected = 0.3 * 0.9 + 0.2 / 2.0 + 0.2 * std::log(5.0) + 0.3 * std::exp(-age / 2592000.0);
    EXPECT_NEAR(network.retrieval_strength(n), std::min(1.0, expected), 1e-12);

    n.access_frequency = 0;
    const double low = 0.3 * 0.9 + 0.2 / 2.0 + 0.3 * std::exp(-age / 2592000.0);
    EXPECT_NEAR(network.retrieval_strength(n), low, 1e-12);
}

// Stored inputs reproduce the stored retrieval strength exactly
TEST_F(SemanticNetworkTest, RetrievalReproducibleFromRecord) {
    SemanticNetwork network(config, 0.5);
    std::vector<SemanticNode> members = {node("a", 0.9, NOW - 3 * MS_PER_DAY),
                                         node("b", 0.6, NOW - 10 * MS_PER_DAY),
                                         node("c", 0.3, NOW - 40 * MS_PER_DAY)};
    SemanticNetwork::rank_cluster(members);
    members[1].access_frequency = 2;
    for (auto& n : members) network.refresh(n, NOW);

    for (const auto& n : members) {
        const auto record = store::node_record(n, "src", NOW);
        const SemanticNode reloaded = store::node_from_record(record);
        EXPECT_EQ(network.retrieval_strength(reloaded), n.retrieval_strength) << n.id;
        EXPECT_EQ(reloaded.retrieval_strength, n.retrieval_strength) << n.id;
    }
}

TEST_F(SemanticNetworkTest, AgeCategoryBoundaries) {
    SemanticNetwork network(config, 0.5);
    EXPECT_EQ(network.age_category(NOW, NOW), AgeCategory::Recent);
    EXPECT_EQ(network.age_category(NOW - MS_PER_DAY + 1, NOW), AgeCategory::Recent);
    EXPECT_EQ(network.age_category(NOW - MS_PER_DAY, NOW), AgeCategory::WeekOld);
    EXPECT_EQ(network.age_category(NOW - 7 * MS_PER_DAY, NOW), AgeCategory::MonthOld);
    EXPECT_EQ(network.age_category(NOW - 30 * MS_PER_DAY, NOW), AgeCategory::Remote);
}

TEST_F(SemanticNetworkTest, ConsolidationStateFromAccess) {
    SemanticNetwork network(config, 0.5);
    EXPECT_EQ(network.consolidation_state(0), ConsolidationState::Episodic);
    EXPECT_EQ(network.consolidation_state(3), ConsolidationState::Consolidating);
    EXPECT_EQ(network.consolidation_state(10), ConsolidationState::Schematized);
}

TEST_F(SemanticNetworkTest, FidelityFromRetrieval) {
    SemanticNetwork network(config, 0.5);
    EXPECT_EQ(network.memory_fidelity(0.85), MemoryFidelity::High);
    EXPECT_EQ(network.memory_fidelity(0.6), MemoryFidelity::Medium);
    EXPECT_EQ(network.memory_fidelity(0.4), MemoryFidelity::Low);
    EXPECT_EQ(network.memory_fidelity(0.1), MemoryFidelity::Fragmented);
}

TEST_F(SemanticNetworkTest, RescaleNormalizesClusterMean) {
    SemanticNetwork network(config, 0.5);
    std::vector<SemanticNode> members = {node("a", 0.1, NOW - 100 * MS_PER_DAY),
                                         node("b", 0.2, NOW - 100 * MS_PER_DAY)};
    SemanticNetwork::rank_cluster(members);
    std::vector<double> base;
    double mean = 0.0;
    for (auto& n : members) {
        network.refresh(n, NOW);
        base.push_back(n.retrieval_strength);
        mean += n.retrieval_strength;
    }
    mean /= 2.0;
    ASSERT_GT(mean, 0.0);

    network.homeostatic_rescale(members);
    for (size_t i = 0; i < members.size(); ++i) {
        EXPECT_NEAR(members[i].homeostatic_scale, 1.0 / mean, 1e-12);
        EXPECT_NEAR(members[i].retrieval_strength, std::min(1.0, base[i] / mean), 1e-9);
        EXPECT_EQ(members[i].memory_fidelity, network.memory_fidelity(members[i].retrieval_strength));
    }
}

TEST_F(SemanticNetworkTest, RescaleDoesNotCompound) {
    SemanticNetwork network(config, 0.5);
    std::vector<SemanticNode> members = {node("a", 0.1, NOW - 100 * MS_PER_DAY),
                                         node("b", 0.9, NOW - 100 * MS_PER_DAY)};
    SemanticNetwork::rank_cluster(members);
    for (auto& n : members) network.refresh(n, NOW);

    network.homeostatic_rescale(members);
    const auto once = members;
    network.homeostatic_rescale(members);
    for (size_t i = 0; i < members.size(); ++i) {
        EXPECT_DOUBLE_EQ(members[i].homeostatic_scale, once[i].homeostatic_scale);
        EXPECT_DOUBLE_EQ(members[i].retrieval_strength, once[i].retrieval_strength);
    }
}

TEST_F(SemanticNetworkTest, RescaleSkipsZeroMean) {
    SemanticConfig c = config;
    c.weight_strength = 0.0;
    c.weight_rank = 0.0;
    c.weight_frequency = 0.0;
    c.weight_recency = 0.0;
    SemanticNetwork network(c, 0.5);
    std::vector<SemanticNode> members = {node("a", 0.5)};
    network.homeostatic_rescale(members);
    EXPECT_DOUBLE_EQ(members[0].homeostatic_scale, 1.0);
}

TEST_F(SemanticNetworkTest, PruneOnlyRemoteWeakNodes) {
    SemanticNetwork network(config, 0.5);
    SemanticNode n = node("a", 0.1, NOW - 60 * MS_PER_DAY);
    n.retrieval_strength = 0.005;
    n.age_category = AgeCategory::Remote;
    EXPECT_TRUE(network.should_prune(n));
    n.age_category = AgeCategory::MonthOld;
    EXPECT_FALSE(network.should_prune(n));
    n.age_category = AgeCategory::Remote;
    n.retrieval_strength = 0.02;
    EXPECT_FALSE(network.should_prune(n));
}

// =============================================================================
// Cluster index
// =============================================================================

TEST_F(SemanticNetworkTest, AssignWithoutEmbeddingUsesCategoryHash) {
    ClusterIndex index(config);
    const int a = index.assign("finance", std::nullopt);
    const int b = index.assign("finance", std::nullopt);
    EXPECT_EQ(a, b);
    EXPECT_EQ(a, index.hashed_cluster("finance"));
    ASSERT_NE(index.find(a), nullptr);
    EXPECT_EQ(index.find(a)->member_count, 2);
    EXPECT_FALSE(index.find(a)->initialized());
    EXPECT_EQ(index.dirty().count(a), 1u);
}

TEST_F(SemanticNetworkTest, NearbyEmbeddingsShareCluster) {
    ClusterIndex index(config);
    const int first = index.assign("finance", Embedding{1.0, 0.0, 0.0});
    const int second = index.assign("finance", Embedding{0.99, 0.05, 0.0});
    EXPECT_EQ(first, second);
    EXPECT_EQ(index.find(first)->member_count, 2);
    EXPECT_TRUE(index.find(first)->initialized());
}

TEST_F(SemanticNetworkTest, DistantEmbeddingSpawnsCluster) {
    ClusterIndex index(config);
    const int first = index.assign("finance", Embedding{1.0, 0.0, 0.0});
    const int second = index.assign("finance", Embedding{0.0, 0.0, 1.0});
    EXPECT_NE(first, second);
}

TEST_F(SemanticNetworkTest, FeatureVectorLayout) {
    ClusterIndex index(config);
    const Embedding e{3.0, 4.0};
    const auto x = index.feature_vector("client", &e);
    ASSERT_EQ(x.size(), config.category_buckets + 2);
    EXPECT_DOUBLE_EQ(x.head(config.category_buckets).sum(), 1.0);
    EXPECT_NEAR(x(config.category_buckets), 0.6, 1e-12);
    EXPECT_NEAR(x(config.category_buckets + 1), 0.8, 1e-12);
}

TEST_F(SemanticNetworkTest, ReclusterSeparatesGroups) {
    SemanticConfig c = config;
    c.cluster_count = 2;
    ClusterIndex index(c);

    std::vector<std::vector<double>> points = {
        {0.0, 0.0}, {0.1, 0.0}, {0.0, 0.1}, {10.0, 10.0}, {10.1, 10.0}, {10.0, 10.1},
    };
    const auto assignment = index.recluster(points);
    ASSERT_EQ(assignment.size(), points.size());
    EXPECT_EQ(assignment[0], assignment[1]);
    EXPECT_EQ(assignment[0], assignment[2]);
    EXPECT_EQ(assignment[3], assignment[4]);
    EXPECT_EQ(assignment[3], assignment[5]);
    EXPECT_NE(assignment[0], assignment[3]);

    ASSERT_EQ(index.clusters().size(), 2u);
    for (const auto& [id, cluster] : index.clusters()) {
        EXPECT_EQ(cluster.member_count, 3);
    }

    ClusterIndex again(c);
    EXPECT_EQ(again.recluster(points), assignment);
}

TEST_F(SemanticNetworkTest, ClusterRecordRoundTrip) {
    Cluster c;
    c.id = 17;
    c.centroid = Eigen::VectorXd::LinSpaced(4, 0.1, 0.4);
    c.member_count = 5;
    const auto record = cluster_record(c, NOW);
    EXPECT_EQ(record.id, "17");
    const Cluster back = cluster_from_record(record);
    EXPECT_EQ(back.id, 17);
    EXPECT_EQ(back.member_count, 5);
    EXPECT_EQ(back.centroid, c.centroid);

    store::Record bad("seventeen", NOW);
    bad.set("member_count", 1);
    EXPECT_THROW(cluster_from_record(bad), DataIntegrityError);
}
