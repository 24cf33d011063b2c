#pragma once

#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include <Eigen/Dense>

#include "engram/config.hpp"
#include "engram/enrichment.hpp"
#include "engram/store/record.hpp"
#include "engram/types.hpp"

namespace engram {

// =============================================================================
// Clusters
// =============================================================================

struct Cluster {
    int id = 0;
    Eigen::VectorXd centroid;     // empty until the first embedded member
    int64_t member_count = 0;

    bool initialized() const { return centroid.size() > 0; }
};

store::Record cluster_record(const Cluster& c, Timestamp now);
Cluster cluster_from_record(const store::Record& r);

/**
 * Fixed-cardinality cluster table. Ids are [0, cluster_count).
 * Assignment of a node happens once; only recluster() moves nodes.
 */
class ClusterIndex {
public:
    explicit ClusterIndex(const SemanticConfig& config);

    int cluster_count() const { return config_.cluster_count; }

    void load(const std::vector<Cluster>& clusters);

    // Hashed category one-hot block followed by the L2-normalized embedding
    Eigen::VectorXd feature_vector(const std::string& category, const Embedding* embedding) const;

    int hashed_cluster(const std::string& category) const;

    /**
     * Assign a new node. With an embedding the nearest initialized centroid
     * wins, unless it is farther than the spawn distance and a free cluster
     * exists; the chosen centroid moves by running mean. Without an
     * embedding the category hash picks the cluster.
     */
    int assign(const std::string& category, const std::optional<Embedding>& embedding);

    /**
     * Full k-means over the given feature vectors (seeded, fixed iteration
     * count). Replaces every cluster; returns the cluster id per input.
     */
    std::vector<int> recluster(const std::vector<std::vector<double>>& features);

    const std::map<int, Cluster>& clusters() const { return clusters_; }
    const Cluster* find(int id) const;

    // Clusters changed since load()
    const std::set<int>& dirty() const { return dirty_; }

private:
    std::optional<int> free_cluster(const std::string& category) const;
    Cluster& at(int id);

    SemanticConfig config_;
    std::map<int, Cluster> clusters_;
    std::set<int> dirty_;
};

// =============================================================================
// Retrieval scoring and homeostasis
// =============================================================================

class SemanticNetwork {
public:
    SemanticNetwork(const SemanticConfig& config, double consolidation_threshold);

    // competition_rank 1..n by consolidated_strength desc, ties by id.
    // Members keep their order.
    static void rank_cluster(std::vector<SemanticNode>& members);

    // Pure function of the node's persisted fields
    double retrieval_strength(const SemanticNode& node) const;
    // Weighted factors before the homeostatic scale and clamp
    double base_strength(const SemanticNode& node) const;

    AgeCategory age_category(Timestamp consolidated_at, Timestamp now) const;
    ConsolidationState consolidation_state(int64_t access_frequency) const;
    MemoryFidelity memory_fidelity(double retrieval_strength) const;

    // Recompute every derived field at time now
    void refresh(SemanticNode& node, Timestamp now) const;

    /**
     * Set every node's homeostatic scale to one over the cluster mean of
     * base strength, then recompute retrieval. The previous scale is not
     * compounded, so rescaling an unchanged cluster is a no-op. A zero
     * mean leaves the cluster untouched.
     */
    void homeostatic_rescale(std::vector<SemanticNode>& cluster) const;

    bool should_prune(const SemanticNode& node) const;

private:
    SemanticConfig config_;
    double consolidation_threshold_;
};

} // namespace engram
