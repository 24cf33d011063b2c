#include "engram/stages.hpp"

#include <algorithm>
#include <limits>
#include <map>
#include <set>

#include "engram/error.hpp"
#include "engram/logging.hpp"

namespace engram {

using store::Op;
using store::Order;
using store::Record;
using store::Selection;
using store::where;
using store::where_in;
namespace tables = store::tables;

namespace {

WorkItem item_for(const Record& r, Timestamp ts) {
    WorkItem w;
    w.source_id = r.id;
    w.source_ts = ts;
    w.source_hash = r.content_hash;
    return w;
}

// Index of the last item that will reach the store, if any
std::optional<size_t> last_accepted(const std::vector<WorkItem>& items) {
    for (size_t i = items.size(); i-- > 0;) {
        if (!items[i].rejected()) return i;
    }
    return std::nullopt;
}

std::vector<Record> select_by_ids(store::DurableStore& store, const char* table,
                                  const std::vector<std::string>& ids) {
    if (ids.empty()) return {};
    return store.select(Selection{table, {where_in("id", ids)}, Order::ById, 0});
}

Selection after_id(const char* table, const store::Watermark& cursor, size_t limit) {
    Selection sel{table, {}, Order::ById, limit};
    if (!cursor.last_id.empty()) sel.predicates.push_back(where("id", Op::Gt, cursor.last_id));
    return sel;
}

// Semantic nodes with the source hash they were derived from
struct StoredNode {
    SemanticNode node;
    std::string source_hash;
};

std::vector<StoredNode> load_nodes(store::DurableStore& store, std::vector<store::Predicate> predicates) {
    std::vector<StoredNode> out;
    for (const auto& r : store.select(Selection{tables::SEMANTIC_NODES, std::move(predicates), Order::ById, 0})) {
        try {
            out.push_back(StoredNode{store::node_from_record(r), r.text("source_hash")});
        } catch (const DataIntegrityError& e) {
            LOG_WARN("skipping malformed semantic node", kv("id", r.id), kv("error", e.message()));
        }
    }
    return out;
}

std::vector<std::string> cluster_keys(const std::set<int>& ids) {
    std::vector<std::string> out;
    out.reserve(ids.size());
    for (int id : ids) out.push_back(std::to_string(id));
    return out;
}

} // namespace

// =============================================================================
// Working memory
// =============================================================================

WorkingMemoryStage::WorkingMemoryStage(store::DurableStore& store, const PipelineConfig& config)
    : store_(store), repo_(store), config_(config), gate_(config.attention) {}

std::vector<Record> WorkingMemoryStage::next_batch(const store::Watermark& cursor, bool first_page, size_t limit) {
    return store_.select_pending(store::PendingQuery{tables::RAW_MEMORIES, tables::WORKING_MEMORY, cursor, {},
                                                     first_page, limit});
}

std::vector<Record> WorkingMemoryStage::fetch(const std::vector<std::string>& ids) {
    return select_by_ids(store_, tables::RAW_MEMORIES, ids);
}

std::vector<WorkItem> WorkingMemoryStage::process(const std::vector<Record>& batch, Timestamp now) {
    std::vector<WorkItem> items;
    std::vector<MemoryItem> incoming;
    std::map<std::string, size_t> owner;

    items.reserve(batch.size());
    for (const auto& r : batch) {
        WorkItem w = item_for(r, r.ts);
        try {
            MemoryItem m = store::item_from_raw(r);
            owner[m.id] = items.size();
            incoming.push_back(std::move(m));
        } catch (const DataIntegrityError& e) {
            w.rejected_reason = e.what();
        }
        items.push_back(std::move(w));
    }

    const uint64_t cycle = gate_.cycle_at(now);
    const AdmissionResult admission = gate_.admit(incoming, repo_.working_pool(), now, cycle);

    // Pool entries re-ranked by this cycle ride with the last item
    const auto tail = last_accepted(items);
    for (const auto& entry : admission.entries) {
        auto it = owner.find(entry.item.id);
        if (it != owner.end()) {
            items[it->second].writes.push_back(Write::upsert(tables::WORKING_MEMORY, store::wm_record(entry, now)));
        } else if (tail) {
            items[*tail].writes.push_back(Write::upsert(tables::WORKING_MEMORY, store::wm_record(entry, now)));
        }
    }

    LOG_INFO("attention cycle", kv("cycle", cycle), kv("capacity", admission.capacity),
             kv("incoming", incoming.size()), kv("active", admission.active_count()));
    return items;
}

// =============================================================================
// Short-term memory
// =============================================================================

ShortTermStage::ShortTermStage(store::DurableStore& store, const PipelineConfig& config,
                               EnrichmentProvider& enrichment)
    : store_(store), repo_(store), config_(config), enrichment_(enrichment), builder_(config.short_term) {}

std::vector<Record> ShortTermStage::next_batch(const store::Watermark& cursor, bool first_page, size_t limit) {
    return store_.select_pending(store::PendingQuery{tables::WORKING_MEMORY, tables::EPISODE_MEMBERS, cursor,
                                                     {where("status", Op::Eq, to_string(WmStatus::Active))},
                                                     first_page, limit});
}

std::vector<Record> ShortTermStage::fetch(const std::vector<std::string>& ids) {
    return select_by_ids(store_, tables::WORKING_MEMORY, ids);
}

std::vector<WorkItem> ShortTermStage::process(const std::vector<Record>& batch, Timestamp now) {
    std::vector<WorkItem> items;
    std::vector<std::pair<size_t, WorkingMemoryEntry>> active;

    items.reserve(batch.size());
    for (const auto& r : batch) {
        WorkItem w = item_for(r, r.ts);
        try {
            WorkingMemoryEntry e = store::wm_from_record(r);
            if (e.status == WmStatus::Active) active.emplace_back(items.size(), std::move(e));
        } catch (const EngramException& e) {
            w.rejected_reason = e.what();
        }
        items.push_back(std::move(w));
    }
    if (active.empty()) return items;

    // Items already grouped from the same content are not enriched again
    std::vector<std::string> active_ids;
    active_ids.reserve(active.size());
    for (const auto& [idx, e] : active) active_ids.push_back(e.item.id);
    std::map<std::string, EpisodeMember> grouped;
    for (auto& m : repo_.members_by_item(active_ids)) grouped.emplace(m.item_id, std::move(m));

    std::vector<EnrichedItem> enriched;
    std::vector<EpisodeMember> known;
    std::map<std::string, size_t> item_owner;
    size_t unchanged = 0;
    for (auto& [idx, e] : active) {
        auto g = grouped.find(e.item.id);
        if (g != grouped.end() && g->second.source_hash == e.item.content_hash) {
            ++unchanged;
            continue;
        }
        try {
            e.item.stage = MemoryStage::ShortTerm;
            Features f = enrichment_.enrich(e.item);
            item_owner[e.item.id] = idx;
            if (g != grouped.end()) known.push_back(g->second);
            enriched.push_back(EnrichedItem{std::move(e.item), std::move(f)});
        } catch (const EngramException& ex) {
            items[idx].rejected_reason = ex.what();
        }
    }
    if (enriched.empty()) {
        LOG_DEBUG("no short-term changes", kv("unchanged", unchanged));
        return items;
    }

    // Everything the new members can touch
    std::set<std::string> episode_ids;
    std::map<std::string, std::pair<Timestamp, Timestamp>> span;
    for (const auto& ei : enriched) {
        const std::string& category = ei.features.category;
        episode_ids.insert(builder_.episode_id(category, ei.item.created_at));
        const Timestamp start = builder_.bucket_start(ei.item.created_at);
        auto it = span.find(category);
        if (it == span.end()) {
            span.emplace(category, std::make_pair(start, start));
        } else {
            it->second.first = std::min(it->second.first, start);
            it->second.second = std::max(it->second.second, start);
        }
    }
    for (const auto& m : known) episode_ids.insert(m.episode_id);

    const std::vector<std::string> ids(episode_ids.begin(), episode_ids.end());
    const auto existing = repo_.episodes_by_id(ids);
    const auto existing_members = repo_.members_of_episodes(ids);

    const auto h = static_cast<Timestamp>(config_.short_term.hebbian_window_seconds * 1000.0);
    std::vector<Episode> nearby;
    for (const auto& [category, range] : span) {
        auto near = repo_.episodes_near(category, range.first - h, range.second + h);
        nearby.insert(nearby.end(), near.begin(), near.end());
    }

    const EpisodeBuild build = builder_.build(enriched, existing, existing_members, known, nearby, now);

    // Episode rows go with the last item that changed them
    std::map<std::string, size_t> episode_owner;
    std::map<std::string, std::string> previous;
    for (const auto& m : known) previous[m.item_id] = m.episode_id;
    for (const auto& m : build.members) {
        const size_t idx = item_owner.at(m.item_id);
        items[idx].writes.push_back(Write::upsert(tables::EPISODE_MEMBERS, store::member_record(m, now)));
        episode_owner[m.episode_id] = idx;
        auto prev = previous.find(m.item_id);
        if (prev != previous.end() && prev->second != m.episode_id) episode_owner[prev->second] = idx;
    }

    const auto tail = last_accepted(items);
    for (const auto& e : build.episodes) {
        auto it = episode_owner.find(e.id);
        const auto idx = it != episode_owner.end() ? std::optional<size_t>(it->second) : tail;
        if (idx) items[*idx].writes.push_back(Write::upsert(tables::EPISODES, store::episode_record(e, now)));
    }
    if (tail) {
        for (const auto& e : build.neighbours) {
            items[*tail].writes.push_back(Write::upsert(tables::EPISODES, store::episode_record(e, now)));
        }
    }

    LOG_INFO("episodes updated", kv("items", enriched.size()), kv("episodes", build.episodes.size()),
             kv("neighbours", build.neighbours.size()), kv("unchanged", unchanged + build.duplicates.size()));
    return items;
}

// =============================================================================
// Consolidation
// =============================================================================

ConsolidationStage::ConsolidationStage(store::DurableStore& store, const PipelineConfig& config,
                                       SimilarityScorer* scorer, AssociationSampler& sampler,
                                       ClaimRegistry& claims)
    : store_(store)
    , repo_(store)
    , config_(config)
    , engine_(config.consolidation, config.short_term, scorer, sampler)
    , claims_(claims) {}

std::vector<Record> ConsolidationStage::next_batch(const store::Watermark& cursor, bool, size_t limit) {
    Selection sel = after_id(tables::EPISODES, cursor, limit);
    sel.predicates.push_back(where("ready", Op::Eq, "true"));
    sel.predicates.push_back(where_in("state", {to_string(EpisodeState::Pending),
                                                to_string(EpisodeState::Strengthened),
                                                to_string(EpisodeState::Weakened)}));
    return store_.select(sel);
}

std::vector<Record> ConsolidationStage::fetch(const std::vector<std::string>& ids) {
    return select_by_ids(store_, tables::EPISODES, ids);
}

std::vector<WorkItem> ConsolidationStage::process(const std::vector<Record>& batch, Timestamp now) {
    held_.clear();

    std::vector<WorkItem> items;
    std::vector<std::pair<size_t, Episode>> episodes;
    items.reserve(batch.size());
    for (const auto& r : batch) {
        WorkItem w = item_for(r, now);
        try {
            episodes.emplace_back(items.size(), store::episode_from_record(r));
        } catch (const DataIntegrityError& e) {
            w.rejected_reason = e.what();
        }
        items.push_back(std::move(w));
    }
    if (episodes.empty()) return items;

    // Replay candidates: same categories, or windows within the adjacency range
    std::set<std::string> categories;
    Timestamp lo = std::numeric_limits<Timestamp>::max();
    Timestamp hi = std::numeric_limits<Timestamp>::min();
    for (const auto& [idx, e] : episodes) {
        categories.insert(e.category);
        lo = std::min(lo, e.window_start);
        hi = std::max(hi, e.window_start);
    }
    const auto adjacency = static_cast<Timestamp>(config_.consolidation.replay_adjacency_seconds * 1000.0);

    std::map<std::string, Episode> by_id;
    for (auto& e : repo_.episodes_in_categories({categories.begin(), categories.end()})) by_id[e.id] = e;
    for (auto& e : repo_.episodes_in_window(lo - adjacency, hi + adjacency)) by_id[e.id] = e;

    std::vector<std::string> candidate_ids;
    candidate_ids.reserve(by_id.size());
    for (const auto& [id, e] : by_id) candidate_ids.push_back(id);
    std::vector<std::string> item_ids;
    for (const auto& m : repo_.members_of_episodes(candidate_ids)) {
        auto it = by_id.find(m.episode_id);
        if (it != by_id.end()) {
            it->second.member_ids.push_back(m.item_id);
            item_ids.push_back(m.item_id);
        }
    }

    // Similarity is scored on what the members say
    std::map<std::string, std::string> content;
    for (const auto& r : select_by_ids(store_, tables::RAW_MEMORIES, item_ids)) {
        content[r.id] = r.text_or("content_ref", "");
    }

    std::vector<Episode> candidates;
    std::map<std::string, size_t> position;
    for (auto& [id, e] : by_id) {
        std::sort(e.member_ids.begin(), e.member_ids.end());
        for (const auto& m : e.member_ids) {
            auto c = content.find(m);
            e.member_content.push_back(c != content.end() ? c->second : std::string());
        }
        position[id] = candidates.size();
        candidates.push_back(e);
    }

    int promoted = 0;
    int discarded = 0;
    for (auto& [idx, stored] : episodes) {
        WorkItem& w = items[idx];

        ClaimRegistry::Claim claim = claims_.try_claim(stored.id);
        if (!claim) {
            LOG_WARN("episode claimed by another worker, skipped", kv("episode", stored.id));
            continue;
        }

        auto pos = position.find(stored.id);
        Episode e = pos != position.end() ? candidates[pos->second] : stored;
        e.state = stored.state;

        try {
            ReplayOutcome out = engine_.run_cycle(e, candidates, now);

            w.writes.push_back(Write::upsert(tables::EPISODES, store::episode_record(out.episode, now)));
            for (const auto& a : out.edges) {
                w.writes.push_back(Write::upsert(tables::ASSOCIATIONS, store::association_record(a, now)));
            }
            if (out.promoted) {
                w.writes.push_back(Write::upsert(tables::CONSOLIDATED,
                                                 store::consolidated_record(*out.promoted, w.source_hash, now)));
                ++promoted;
            } else if (out.episode.state == EpisodeState::Discarded) {
                ++discarded;
            }

            // Later episodes of this page see the updated state
            if (pos != position.end()) candidates[pos->second] = out.episode;
        } catch (const InvariantViolation& ex) {
            LOG_ERROR("invariant violated, episode quarantined", kv("episode", stored.id), kv("error", ex.what()));
            w.rejected_reason = ex.what();
        }
        held_.push_back(std::move(claim));
    }

    LOG_INFO("replay page", kv("episodes", episodes.size()), kv("promoted", promoted),
             kv("discarded", discarded));
    return items;
}

// =============================================================================
// Long-term memory
// =============================================================================

LongTermStage::LongTermStage(store::DurableStore& store, const PipelineConfig& config,
                             EmbeddingProvider* embedding)
    : store_(store)
    , repo_(store)
    , config_(config)
    , embedding_(embedding)
    , network_(config.semantic, config.consolidation.consolidation_threshold) {}

std::vector<Record> LongTermStage::next_batch(const store::Watermark& cursor, bool first_page, size_t limit) {
    return store_.select_pending(store::PendingQuery{tables::CONSOLIDATED, tables::SEMANTIC_NODES, cursor, {},
                                                     first_page, limit});
}

std::vector<Record> LongTermStage::fetch(const std::vector<std::string>& ids) {
    return select_by_ids(store_, tables::CONSOLIDATED, ids);
}

std::optional<Embedding> LongTermStage::embed(const ConsolidatedMemory& memory) {
    if (!embedding_) return std::nullopt;
    try {
        Embedding e = embedding_->embed(memory);
        if (e.empty()) return std::nullopt;
        return e;
    } catch (const EngramException& ex) {
        LOG_WARN("embedding unavailable, clustering by category", kv("memory", memory.id),
                 kv("error", ex.message()));
        return std::nullopt;
    }
}

std::vector<WorkItem> LongTermStage::process(const std::vector<Record>& batch, Timestamp now) {
    std::vector<WorkItem> items;
    std::vector<std::pair<size_t, ConsolidatedMemory>> memories;
    items.reserve(batch.size());
    for (const auto& r : batch) {
        WorkItem w = item_for(r, r.ts);
        try {
            memories.emplace_back(items.size(), store::consolidated_from_record(r));
        } catch (const DataIntegrityError& e) {
            w.rejected_reason = e.what();
        }
        items.push_back(std::move(w));
    }
    if (memories.empty()) return items;

    ClusterIndex index(config_.semantic);
    std::vector<Cluster> loaded;
    for (const auto& r : repo_.clusters()) {
        try {
            loaded.push_back(cluster_from_record(r));
        } catch (const DataIntegrityError& e) {
            LOG_WARN("skipping malformed cluster", kv("id", r.id), kv("error", e.message()));
        }
    }
    index.load(loaded);

    std::vector<std::string> ids;
    for (const auto& [idx, m] : memories) ids.push_back(m.id);
    std::map<std::string, StoredNode> existing;
    for (auto& s : load_nodes(store_, {where_in("id", ids)})) existing.emplace(s.node.id, std::move(s));

    // New or corrected nodes, keyed by id, with the item that carries them
    std::map<std::string, StoredNode> fresh;
    std::map<std::string, size_t> node_owner;
    std::map<int, size_t> cluster_owner;
    for (const auto& [idx, m] : memories) {
        SemanticNode n;
        auto it = existing.find(m.id);
        if (it != existing.end()) {
            // Assignment is sticky
            n = it->second.node;
        } else {
            const auto emb = embed(m);
            n.cluster_id = index.assign(m.semantic_category, emb);
            const Eigen::VectorXd f = index.feature_vector(m.semantic_category, emb ? &*emb : nullptr);
            n.features.assign(f.data(), f.data() + f.size());
        }
        n.id = m.id;
        n.semantic_category = m.semantic_category;
        n.consolidated_strength = clamp01(m.consolidated_strength);
        n.consolidated_at = m.consolidated_at;

        fresh[m.id] = StoredNode{n, items[idx].source_hash};
        node_owner[m.id] = idx;
        cluster_owner[n.cluster_id] = idx;
    }

    std::set<int> affected;
    for (const auto& [id, s] : fresh) affected.insert(s.node.cluster_id);

    std::map<int, std::vector<StoredNode>> clusters;
    for (auto& s : load_nodes(store_, {where_in("cluster_id", cluster_keys(affected))})) {
        if (!fresh.count(s.node.id)) clusters[s.node.cluster_id].push_back(std::move(s));
    }
    for (auto& [id, s] : fresh) clusters[s.node.cluster_id].push_back(s);

    std::vector<std::string> all_ids;
    for (const auto& [cid, members] : clusters) {
        for (const auto& s : members) all_ids.push_back(s.node.id);
    }
    const Timestamp since = now - config_.semantic.access_window_days * MS_PER_DAY;
    const auto counts = repo_.access_counts(all_ids, since);

    for (auto& [cid, members] : clusters) {
        std::vector<SemanticNode> nodes;
        nodes.reserve(members.size());
        for (const auto& s : members) nodes.push_back(s.node);
        for (auto& n : nodes) {
            auto c = counts.find(n.id);
            n.access_frequency = c == counts.end() ? 0 : c->second;
        }
        SemanticNetwork::rank_cluster(nodes);
        for (auto& n : nodes) network_.refresh(n, now);

        const size_t owner = cluster_owner.at(cid);
        for (size_t i = 0; i < nodes.size(); ++i) {
            auto o = node_owner.find(nodes[i].id);
            const size_t idx = o != node_owner.end() ? o->second : owner;
            items[idx].writes.push_back(Write::upsert(tables::SEMANTIC_NODES,
                                                      store::node_record(nodes[i], members[i].source_hash, now)));
        }
    }

    for (int cid : index.dirty()) {
        const Cluster* c = index.find(cid);
        auto o = cluster_owner.find(cid);
        if (c && o != cluster_owner.end()) {
            items[o->second].writes.push_back(Write::upsert(tables::CLUSTERS, cluster_record(*c, now)));
        }
    }

    LOG_INFO("semantic nodes updated", kv("memories", memories.size()), kv("clusters", clusters.size()));
    return items;
}

// =============================================================================
// Homeostasis
// =============================================================================

HomeostasisStage::HomeostasisStage(store::DurableStore& store, const PipelineConfig& config)
    : store_(store)
    , repo_(store)
    , config_(config)
    , network_(config.semantic, config.consolidation.consolidation_threshold) {}

std::vector<Record> HomeostasisStage::next_batch(const store::Watermark& cursor, bool, size_t limit) {
    return store_.select(after_id(tables::CLUSTERS, cursor, limit));
}

std::vector<Record> HomeostasisStage::fetch(const std::vector<std::string>& ids) {
    return select_by_ids(store_, tables::CLUSTERS, ids);
}

std::vector<WorkItem> HomeostasisStage::process(const std::vector<Record>& batch, Timestamp now) {
    std::vector<WorkItem> items;
    items.reserve(batch.size());
    const Timestamp since = now - config_.semantic.access_window_days * MS_PER_DAY;

    int64_t pruned_total = 0;
    for (const auto& r : batch) {
        WorkItem w = item_for(r, now);
        try {
            Cluster cluster = cluster_from_record(r);
            auto stored = load_nodes(store_, {where("cluster_id", Op::Eq, r.id)});

            std::vector<SemanticNode> nodes;
            std::vector<std::string> ids;
            std::map<std::string, std::string> hashes;
            for (const auto& s : stored) {
                nodes.push_back(s.node);
                ids.push_back(s.node.id);
                hashes[s.node.id] = s.source_hash;
            }
            const auto counts = repo_.access_counts(ids, since);
            for (auto& n : nodes) {
                auto c = counts.find(n.id);
                n.access_frequency = c == counts.end() ? 0 : c->second;
            }

            // Rank, refresh, rescale and prune until nothing more is pruned,
            // so the survivors carry the scale and ranks of their final set
            std::vector<SemanticNode> kept = std::move(nodes);
            int64_t pruned = 0;
            while (true) {
                SemanticNetwork::rank_cluster(kept);
                for (auto& n : kept) network_.refresh(n, now);
                network_.homeostatic_rescale(kept);

                std::vector<SemanticNode> next;
                next.reserve(kept.size());
                for (auto& n : kept) {
                    if (network_.should_prune(n)) {
                        w.writes.push_back(Write::remove(tables::SEMANTIC_NODES, n.id));
                    } else {
                        next.push_back(std::move(n));
                    }
                }
                const auto removed = static_cast<int64_t>(kept.size() - next.size());
                kept = std::move(next);
                if (removed == 0) break;
                pruned += removed;
            }

            for (const auto& n : kept) {
                w.writes.push_back(Write::upsert(tables::SEMANTIC_NODES, store::node_record(n, hashes[n.id], now)));
            }

            cluster.member_count = std::max<int64_t>(0, cluster.member_count - pruned);
            w.writes.push_back(Write::upsert(tables::CLUSTERS, cluster_record(cluster, now)));
            pruned_total += pruned;
        } catch (const DataIntegrityError& e) {
            w.rejected_reason = e.what();
        }
        items.push_back(std::move(w));
    }

    LOG_INFO("homeostasis page", kv("clusters", batch.size()), kv("pruned", pruned_total));
    return items;
}

// =============================================================================
// Recluster
// =============================================================================

ReclusterStage::ReclusterStage(store::DurableStore& store, const PipelineConfig& config)
    : store_(store)
    , repo_(store)
    , config_(config)
    , network_(config.semantic, config.consolidation.consolidation_threshold) {}

std::vector<Record> ReclusterStage::next_batch(const store::Watermark&, bool first_page, size_t) {
    if (!first_page) return {};
    return store_.select(Selection{tables::SEMANTIC_NODES, {}, Order::ById, 0});
}

std::vector<Record> ReclusterStage::fetch(const std::vector<std::string>&) {
    // Every run covers all nodes; there is nothing to retry one by one
    return {};
}

std::vector<WorkItem> ReclusterStage::process(const std::vector<Record>& batch, Timestamp now) {
    std::vector<WorkItem> items;
    std::vector<std::pair<size_t, StoredNode>> nodes;
    items.reserve(batch.size());
    for (const auto& r : batch) {
        WorkItem w = item_for(r, now);
        try {
            nodes.emplace_back(items.size(), StoredNode{store::node_from_record(r), r.text("source_hash")});
        } catch (const DataIntegrityError& e) {
            w.rejected_reason = e.what();
        }
        items.push_back(std::move(w));
    }
    if (nodes.empty()) return items;

    ClusterIndex index(config_.semantic);
    std::vector<std::vector<double>> features;
    features.reserve(nodes.size());
    for (const auto& [idx, s] : nodes) {
        if (!s.node.features.empty()) {
            features.push_back(s.node.features);
        } else {
            const Eigen::VectorXd f = index.feature_vector(s.node.semantic_category, nullptr);
            features.emplace_back(f.data(), f.data() + f.size());
        }
    }
    const std::vector<int> assignment = index.recluster(features);

    std::map<int, std::vector<size_t>> members;
    std::vector<std::string> ids;
    for (size_t i = 0; i < nodes.size(); ++i) {
        nodes[i].second.node.cluster_id = assignment[i];
        members[assignment[i]].push_back(i);
        ids.push_back(nodes[i].second.node.id);
    }
    const auto counts = repo_.access_counts(ids, now - config_.semantic.access_window_days * MS_PER_DAY);

    for (const auto& [cid, list] : members) {
        std::vector<SemanticNode> group;
        for (size_t i : list) group.push_back(nodes[i].second.node);
        for (auto& n : group) {
            auto c = counts.find(n.id);
            n.access_frequency = c == counts.end() ? 0 : c->second;
        }
        SemanticNetwork::rank_cluster(group);
        for (size_t k = 0; k < list.size(); ++k) {
            network_.refresh(group[k], now);
            const auto& [idx, s] = nodes[list[k]];
            items[idx].writes.push_back(Write::upsert(tables::SEMANTIC_NODES,
                                                      store::node_record(group[k], s.source_hash, now)));
        }
    }

    // The cluster table is replaced with the new centroids
    const auto tail = last_accepted(items);
    if (tail) {
        for (const auto& r : repo_.clusters()) {
            try {
                if (!index.find(std::stoi(r.id))) {
                    items[*tail].writes.push_back(Write::remove(tables::CLUSTERS, r.id));
                }
            } catch (const std::logic_error&) {
                items[*tail].writes.push_back(Write::remove(tables::CLUSTERS, r.id));
            }
        }
        for (const auto& [cid, c] : index.clusters()) {
            items[*tail].writes.push_back(Write::upsert(tables::CLUSTERS, cluster_record(c, now)));
        }
    }

    LOG_INFO("nodes reclustered", kv("nodes", nodes.size()), kv("clusters", index.clusters().size()));
    return items;
}

} // namespace engram
