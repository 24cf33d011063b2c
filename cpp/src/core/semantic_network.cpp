#include "engram/semantic_network.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <random>

#include "engram/error.hpp"
#include "engram/hash.hpp"
#include "engram/logging.hpp"
#include "engram/store/repository.hpp"

namespace engram {

// =============================================================================
// Cluster codec
// =============================================================================

store::Record cluster_record(const Cluster& c, Timestamp now) {
    store::Record r(std::to_string(c.id), now);
    if (c.initialized()) {
        std::vector<double> v(c.centroid.data(), c.centroid.data() + c.centroid.size());
        r.set("centroid", store::encode_vector(v));
    }
    r.set("member_count", c.member_count);
    ContentHasher h;
    h.add(r.id).add(r.text_or("centroid", "")).add(c.member_count);
    r.content_hash = h.hex();
    return r;
}

Cluster cluster_from_record(const store::Record& r) {
    Cluster c;
    try {
        size_t pos = 0;
        c.id = std::stoi(r.id, &pos);
        if (pos != r.id.size()) throw std::invalid_argument(r.id);
    } catch (const std::logic_error&) {
        throw DataIntegrityError("cluster id is not an integer", r.id);
    }
    const auto v = store::decode_vector(r.text_or("centroid", ""), r.id);
    if (!v.empty()) {
        c.centroid = Eigen::Map<const Eigen::VectorXd>(v.data(), static_cast<Eigen::Index>(v.size()));
    }
    c.member_count = r.integer("member_count");
    return c;
}

// =============================================================================
// ClusterIndex
// =============================================================================

ClusterIndex::ClusterIndex(const SemanticConfig& config) : config_(config) {
    ENGRAM_CHECK_ARGUMENT(config_.cluster_count > 0, "cluster_count must be positive");
    ENGRAM_CHECK_ARGUMENT(config_.category_buckets > 0, "category_buckets must be positive");
}

void ClusterIndex::load(const std::vector<Cluster>& clusters) {
    clusters_.clear();
    dirty_.clear();
    for (const auto& c : clusters) {
        if (c.id < 0 || c.id >= config_.cluster_count) {
            LOG_WARN("cluster outside the configured range ignored", kv("cluster", c.id));
            continue;
        }
        clusters_[c.id] = c;
    }
}

Eigen::VectorXd ClusterIndex::feature_vector(const std::string& category, const Embedding* embedding) const {
    const Eigen::Index buckets = config_.category_buckets;
    const Eigen::Index dim = buckets + (embedding ? static_cast<Eigen::Index>(embedding->size()) : 0);
    Eigen::VectorXd x = Eigen::VectorXd::Zero(dim);
    x(static_cast<Eigen::Index>(stable_hash(category) % static_cast<uint64_t>(buckets))) = 1.0;
    if (embedding && !embedding->empty()) {
        Eigen::Map<const Eigen::VectorXd> e(embedding->data(), static_cast<Eigen::Index>(embedding->size()));
        const double norm = e.norm();
        if (norm > 0.0 && std::isfinite(norm)) {
            x.tail(e.size()) = e / norm;
        }
    }
    return x;
}

int ClusterIndex::hashed_cluster(const std::string& category) const {
    return static_cast<int>(stable_hash(category) % static_cast<uint64_t>(config_.cluster_count));
}

const Cluster* ClusterIndex::find(int id) const {
    auto it = clusters_.find(id);
    return it == clusters_.end() ? nullptr : &it->second;
}

Cluster& ClusterIndex::at(int id) {
    auto it = clusters_.find(id);
    if (it == clusters_.end()) {
        Cluster c;
        c.id = id;
        it = clusters_.emplace(id, std::move(c)).first;
    }
    return it->second;
}

std::optional<int> ClusterIndex::free_cluster(const std::string& category) const {
    const int k = config_.cluster_count;
    const int start = hashed_cluster(category);
    for (int i = 0; i < k; ++i) {
        const int id = (start + i) % k;
        const Cluster* c = find(id);
        if (!c || (!c->initialized() && c->member_count == 0)) return id;
    }
    return std::nullopt;
}

int ClusterIndex::assign(const std::string& category, const std::optional<Embedding>& embedding) {
    if (!embedding || embedding->empty()) {
        const int id = hashed_cluster(category);
        at(id).member_count += 1;
        dirty_.insert(id);
        return id;
    }

    const Eigen::VectorXd x = feature_vector(category, &*embedding);

    int best = -1;
    double best_dist = std::numeric_limits<double>::infinity();
    for (const auto& [id, c] : clusters_) {
        if (c.centroid.size() != x.size()) continue;
        const double d = (c.centroid - x).norm();
        if (d < best_dist) {
            best_dist = d;
            best = id;
        }
    }

    int chosen = best;
    if (best < 0 || best_dist > config_.cluster_spawn_distance) {
        if (auto free = free_cluster(category)) {
            chosen = *free;
        }
    }
    if (chosen < 0) {
        // Every cluster is taken by vectors of another dimension
        chosen = hashed_cluster(category);
    }

    Cluster& c = at(chosen);
    c.member_count += 1;
    if (c.centroid.size() != x.size()) {
        c.centroid = x;
    } else {
        c.centroid += (x - c.centroid) / static_cast<double>(c.member_count);
    }
    dirty_.insert(chosen);
    return chosen;
}

std::vector<int> ClusterIndex::recluster(const std::vector<std::vector<double>>& features) {
    const auto n = static_cast<int64_t>(features.size());
    std::vector<int> assignment(features.size(), 0);

    for (const auto& [id, c] : clusters_) dirty_.insert(id);
    clusters_.clear();
    if (n == 0) return assignment;

    size_t dim = 0;
    for (const auto& f : features) dim = std::max(dim, f.size());

    // Pad to a common dimension
    Eigen::MatrixXd points = Eigen::MatrixXd::Zero(static_cast<Eigen::Index>(dim), n);
    for (int64_t i = 0; i < n; ++i) {
        const auto& f = features[static_cast<size_t>(i)];
        for (size_t j = 0; j < f.size(); ++j) {
            points(static_cast<Eigen::Index>(j), i) = f[j];
        }
    }

    const int k = static_cast<int>(std::min<int64_t>(config_.cluster_count, n));

    // Seeded choice of k distinct initial points
    std::vector<int64_t> order(static_cast<size_t>(n));
    std::iota(order.begin(), order.end(), 0);
    std::seed_seq seq{static_cast<uint32_t>(config_.seed), static_cast<uint32_t>(config_.seed >> 32),
                      static_cast<uint32_t>(n)};
    std::mt19937_64 rng(seq);
    for (int i = 0; i < k; ++i) {
        const auto j = i + static_cast<int64_t>(rng() % static_cast<uint64_t>(n - i));
        std::swap(order[static_cast<size_t>(i)], order[static_cast<size_t>(j)]);
    }
    Eigen::MatrixXd centroids(static_cast<Eigen::Index>(dim), k);
    for (int c = 0; c < k; ++c) {
        centroids.col(c) = points.col(order[static_cast<size_t>(c)]);
    }

    for (int iter = 0; iter < std::max(1, config_.recluster_iterations); ++iter) {
        // Assignment step, independent per point
        #pragma omp parallel for schedule(static)
        for (int64_t i = 0; i < n; ++i) {
            int best = 0;
            double best_dist = std::numeric_limits<double>::infinity();
            for (int c = 0; c < k; ++c) {
                const double d = (centroids.col(c) - points.col(i)).squaredNorm();
                if (d < best_dist) {
                    best_dist = d;
                    best = c;
                }
            }
            assignment[static_cast<size_t>(i)] = best;
        }

        Eigen::MatrixXd sums = Eigen::MatrixXd::Zero(static_cast<Eigen::Index>(dim), k);
        std::vector<int64_t> counts(static_cast<size_t>(k), 0);
        for (int64_t i = 0; i < n; ++i) {
            const int c = assignment[static_cast<size_t>(i)];
            sums.col(c) += points.col(i);
            counts[static_cast<size_t>(c)] += 1;
        }
        for (int c = 0; c < k; ++c) {
            // Empty clusters keep their previous centroid
            if (counts[static_cast<size_t>(c)] > 0) {
                centroids.col(c) = sums.col(c) / static_cast<double>(counts[static_cast<size_t>(c)]);
            }
        }
    }

    for (int c = 0; c < k; ++c) {
        Cluster cl;
        cl.id = c;
        cl.centroid = centroids.col(c);
        clusters_[c] = std::move(cl);
        dirty_.insert(c);
    }
    for (int c : assignment) clusters_[c].member_count += 1;

    LOG_INFO("recluster complete", kv("points", n), kv("clusters", k),
             kv("iterations", config_.recluster_iterations));
    return assignment;
}

// =============================================================================
// SemanticNetwork
// =============================================================================

SemanticNetwork::SemanticNetwork(const SemanticConfig& config, double consolidation_threshold)
    : config_(config), consolidation_threshold_(consolidation_threshold) {}

void SemanticNetwork::rank_cluster(std::vector<SemanticNode>& members) {
    std::vector<size_t> idx(members.size());
    std::iota(idx.begin(), idx.end(), 0);
    std::sort(idx.begin(), idx.end(), [&](size_t a, size_t b) {
        const auto& na = members[a];
        const auto& nb = members[b];
        if (na.consolidated_strength != nb.consolidated_strength) {
            return na.consolidated_strength > nb.consolidated_strength;
        }
        return na.id < nb.id;
    });
    for (size_t rank = 0; rank < idx.size(); ++rank) {
        members[idx[rank]].competition_rank = static_cast<int>(rank) + 1;
    }
}

double SemanticNetwork::base_strength(const SemanticNode& node) const {
    const double age = age_seconds(node.consolidated_at, node.computed_at);
    return config_.weight_strength * clamp01(node.consolidated_strength) +
           config_.weight_rank / (static_cast<double>(std::max(0, node.competition_rank)) + 1.0) +
           config_.weight_frequency * std::log(static_cast<double>(std::max<int64_t>(0, node.access_frequency)) + 1.0) +
           config_.weight_recency * std::exp(-age / config_.age_decay_constant_seconds);
}

double SemanticNetwork::retrieval_strength(const SemanticNode& node) const {
    return clamp01(node.homeostatic_scale * base_strength(node));
}

AgeCategory SemanticNetwork::age_category(Timestamp consolidated_at, Timestamp now) const {
    const Timestamp age = now > consolidated_at ? now - consolidated_at : 0;
    if (age < MS_PER_DAY) return AgeCategory::Recent;
    if (age < 7 * MS_PER_DAY) return AgeCategory::WeekOld;
    if (age < 30 * MS_PER_DAY) return AgeCategory::MonthOld;
    return AgeCategory::Remote;
}

ConsolidationState SemanticNetwork::consolidation_state(int64_t access_frequency) const {
    if (access_frequency >= config_.schematized_access_threshold) return ConsolidationState::Schematized;
    if (access_frequency >= config_.consolidating_access_threshold) return ConsolidationState::Consolidating;
    return ConsolidationState::Episodic;
}

MemoryFidelity SemanticNetwork::memory_fidelity(double retrieval) const {
    if (retrieval > config_.high_fidelity_threshold) return MemoryFidelity::High;
    if (retrieval > consolidation_threshold_) return MemoryFidelity::Medium;
    if (retrieval > config_.low_fidelity_threshold) return MemoryFidelity::Low;
    return MemoryFidelity::Fragmented;
}

void SemanticNetwork::refresh(SemanticNode& node, Timestamp now) const {
    node.computed_at = now;
    node.age_category = age_category(node.consolidated_at, now);
    node.consolidation_state = consolidation_state(node.access_frequency);
    node.retrieval_strength = retrieval_strength(node);
    node.memory_fidelity = memory_fidelity(node.retrieval_strength);
}

void SemanticNetwork::homeostatic_rescale(std::vector<SemanticNode>& cluster) const {
    if (cluster.empty()) return;
    double sum = 0.0;
    for (const auto& n : cluster) sum += base_strength(n);
    const double mean = sum / static_cast<double>(cluster.size());
    if (!(mean > 0.0)) {
        LOG_DEBUG("cluster mean retrieval is zero, rescale skipped", kv("cluster", cluster.front().cluster_id));
        return;
    }
    for (auto& n : cluster) {
        n.homeostatic_scale = 1.0 / mean;
        n.retrieval_strength = retrieval_strength(n);
        n.memory_fidelity = memory_fidelity(n.retrieval_strength);
    }
}

bool SemanticNetwork::should_prune(const SemanticNode& node) const {
    return node.retrieval_strength < config_.prune_threshold && node.age_category == AgeCategory::Remote;
}

} // namespace engram
