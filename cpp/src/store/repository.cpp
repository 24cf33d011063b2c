#include "engram/store/repository.hpp"

#include <set>
#include <sstream>

#include "engram/error.hpp"
#include "engram/hash.hpp"
#include "engram/logging.hpp"

namespace engram::store {

namespace {

std::vector<std::string> to_strings(const std::vector<int>& ids) {
    std::vector<std::string> out;
    out.reserve(ids.size());
    for (int id : ids) out.push_back(std::to_string(id));
    return out;
}

// Payload hash of a derived row, excluding the key columns.
std::string payload_hash(const Record& r) {
    ContentHasher h;
    h.add(r.id);
    for (const auto& [k, v] : r.columns) {
        h.add(k).add(v);
    }
    return h.hex();
}

std::string encode_associations(const std::vector<Association>& edges) {
    std::string out;
    for (const auto& a : edges) {
        out += a.target_id;
        out += '\t';
        out += format_double(a.weight);
        out += '\t';
        out += to_string(a.kind);
        out += '\n';
    }
    return out;
}

std::vector<Association> decode_associations(const std::string& source, const std::string& text) {
    std::vector<Association> out;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        if (line.empty()) continue;
        size_t t1 = line.find('\t');
        size_t t2 = t1 == std::string::npos ? t1 : line.find('\t', t1 + 1);
        if (t2 == std::string::npos) {
            throw DataIntegrityError("malformed association '" + line + "'", source);
        }
        Association a;
        a.source_id = source;
        a.target_id = line.substr(0, t1);
        try {
            a.weight = std::stod(line.substr(t1 + 1, t2 - t1 - 1));
        } catch (const std::logic_error&) {
            throw DataIntegrityError("malformed association weight", source);
        }
        a.kind = parse_association_kind(line.substr(t2 + 1));
        out.push_back(std::move(a));
    }
    return out;
}

} // namespace

// =============================================================================
// Codecs
// =============================================================================

std::string item_content_hash(const MemoryItem& item) {
    return ContentHasher()
        .add(item.id)
        .add(item.content_ref)
        .add(item.created_at)
        .add(item.salience)
        .add(item.importance)
        .add(item.sentiment)
        .add(item.topic)
        .hex();
}

Record raw_record(const MemoryItem& item) {
    Record r(item.id, item.created_at);
    r.content_hash = item.content_hash.empty() ? item_content_hash(item) : item.content_hash;
    r.set("content_ref", item.content_ref)
     .set("salience", item.salience)
     .set("importance", item.importance)
     .set("sentiment", item.sentiment);
    if (!item.topic.empty()) r.set("topic", item.topic);
    return r;
}

MemoryItem item_from_raw(const Record& r) {
    MemoryItem item;
    item.id = r.id;
    item.created_at = r.ts;
    item.content_ref = r.text("content_ref");
    item.salience = r.real("salience");
    item.importance = r.real("importance");
    item.sentiment = r.real("sentiment");
    item.topic = r.text_or("topic", "");
    item.content_hash = r.content_hash.empty() ? item_content_hash(item) : r.content_hash;
    return item;
}

Record wm_record(const WorkingMemoryEntry& e, Timestamp now) {
    Record r(e.item.id, now);
    r.content_hash = e.item.content_hash;
    r.set("content_ref", e.item.content_ref)
     .set("salience", e.item.salience)
     .set("importance", e.item.importance)
     .set("sentiment", e.item.sentiment)
     .set("item_created_at", e.item.created_at)
     .set("status", to_string(e.status))
     .set("attention_score", e.attention_score)
     .set("admit_rank", e.admit_rank)
     .set("cycle", e.cycle)
     .set("capacity", e.capacity)
     .set("source_hash", e.item.content_hash);
    if (!e.item.topic.empty()) r.set("topic", e.item.topic);
    return r;
}

WorkingMemoryEntry wm_from_record(const Record& r) {
    WorkingMemoryEntry e;
    e.item.id = r.id;
    e.item.content_ref = r.text("content_ref");
    e.item.created_at = r.integer("item_created_at");
    e.item.salience = r.real("salience");
    e.item.importance = r.real("importance");
    e.item.sentiment = r.real("sentiment");
    e.item.topic = r.text_or("topic", "");
    e.item.content_hash = r.text("source_hash");
    e.item.stage = MemoryStage::WorkingMemory;
    e.status = parse_wm_status(r.text("status"));
    e.attention_score = r.real("attention_score");
    e.admit_rank = static_cast<int>(r.integer("admit_rank"));
    e.cycle = static_cast<uint64_t>(r.integer("cycle"));
    e.capacity = static_cast<int>(r.integer("capacity"));
    return e;
}

Record member_record(const EpisodeMember& m, Timestamp now) {
    Record r(m.item_id, now);
    r.set("episode_id", m.episode_id)
     .set("category", m.category)
     .set("item_created_at", m.created_at)
     .set("importance", m.importance)
     .set("sentiment", m.sentiment)
     .set("source_hash", m.source_hash);
    r.content_hash = payload_hash(r);
    return r;
}

EpisodeMember member_from_record(const Record& r) {
    EpisodeMember m;
    m.item_id = r.id;
    m.episode_id = r.text("episode_id");
    m.category = r.text("category");
    m.created_at = r.integer("item_created_at");
    m.importance = r.real("importance");
    m.sentiment = r.real("sentiment");
    m.source_hash = r.text("source_hash");
    return m;
}

Record episode_record(const Episode& e, Timestamp now) {
    Record r(e.id, now);
    r.set("category", e.category)
     .set("window_start", e.window_start)
     .set("window_end", e.window_end)
     .set("item_count", e.item_count)
     .set("recency_factor", e.recency_factor)
     .set("emotional_salience", e.emotional_salience)
     .set("stm_strength", e.stm_strength)
     .set("hebbian_potential", e.hebbian_potential)
     .set("ready", e.ready_for_consolidation)
     .set("strength", e.strength)
     .set("replay_count", e.replay_count)
     .set("state", to_string(e.state));
    r.content_hash = payload_hash(r);
    return r;
}

Episode episode_from_record(const Record& r) {
    Episode e;
    e.id = r.id;
    e.category = r.text("category");
    e.window_start = r.integer("window_start");
    e.window_end = r.integer("window_end");
    e.item_count = r.integer("item_count");
    e.recency_factor = r.real("recency_factor");
    e.emotional_salience = r.real("emotional_salience");
    e.stm_strength = r.real("stm_strength");
    e.hebbian_potential = static_cast<int>(r.integer("hebbian_potential"));
    e.ready_for_consolidation = r.flag("ready");
    e.strength = r.real("strength");
    e.replay_count = static_cast<int>(r.integer("replay_count"));
    e.state = parse_episode_state(r.text("state"));
    return e;
}

Record association_record(const Association& a, Timestamp now) {
    Record r(a.key(), now);
    r.set("source_id", a.source_id)
     .set("target_id", a.target_id)
     .set("weight", a.weight)
     .set("kind", to_string(a.kind));
    r.content_hash = payload_hash(r);
    return r;
}

Association association_from_record(const Record& r) {
    Association a;
    a.source_id = r.text("source_id");
    a.target_id = r.text("target_id");
    a.weight = r.real("weight");
    a.kind = parse_association_kind(r.text("kind"));
    return a;
}

Record consolidated_record(const ConsolidatedMemory& m, const std::string& source_hash, Timestamp now) {
    Record r(m.id, now);
    r.set("semantic_category", m.semantic_category)
     .set("consolidated_strength", m.consolidated_strength)
     .set("replay_strength", m.replay_strength)
     .set("semantic_gist", m.semantic_gist)
     .set("cortical_region", m.cortical_region)
     .set("consolidated_at", m.consolidated_at)
     .set("source_hash", source_hash);
    if (!m.associations.empty()) r.set("associations", encode_associations(m.associations));
    r.content_hash = payload_hash(r);
    return r;
}

ConsolidatedMemory consolidated_from_record(const Record& r) {
    ConsolidatedMemory m;
    m.id = r.id;
    m.semantic_category = r.text("semantic_category");
    m.consolidated_strength = r.real("consolidated_strength");
    m.replay_strength = r.real("replay_strength");
    m.semantic_gist = r.text("semantic_gist");
    m.cortical_region = r.text("cortical_region");
    m.consolidated_at = r.integer("consolidated_at");
    m.associations = decode_associations(r.id, r.text_or("associations", ""));
    return m;
}

Record node_record(const SemanticNode& n, const std::string& source_hash, Timestamp now) {
    Record r(n.id, now);
    r.set("semantic_category", n.semantic_category)
     .set("cluster_id", n.cluster_id)
     .set("competition_rank", n.competition_rank)
     .set("consolidated_strength", n.consolidated_strength)
     .set("access_frequency", n.access_frequency)
     .set("retrieval_strength", n.retrieval_strength)
     .set("homeostatic_scale", n.homeostatic_scale)
     .set("consolidated_at", n.consolidated_at)
     .set("computed_at", n.computed_at)
     .set("age_category", to_string(n.age_category))
     .set("consolidation_state", to_string(n.consolidation_state))
     .set("memory_fidelity", to_string(n.memory_fidelity))
     .set("source_hash", source_hash);
    if (!n.features.empty()) r.set("features", encode_vector(n.features));
    r.content_hash = payload_hash(r);
    return r;
}

SemanticNode node_from_record(const Record& r) {
    SemanticNode n;
    n.id = r.id;
    n.semantic_category = r.text("semantic_category");
    n.cluster_id = static_cast<int>(r.integer("cluster_id"));
    n.competition_rank = static_cast<int>(r.integer("competition_rank"));
    n.consolidated_strength = r.real("consolidated_strength");
    n.access_frequency = r.integer("access_frequency");
    n.retrieval_strength = r.real("retrieval_strength");
    n.homeostatic_scale = r.real("homeostatic_scale");
    n.consolidated_at = r.integer("consolidated_at");
    n.computed_at = r.integer("computed_at");
    n.age_category = parse_age_category(r.text("age_category"));
    n.consolidation_state = parse_consolidation_state(r.text("consolidation_state"));
    n.memory_fidelity = parse_memory_fidelity(r.text("memory_fidelity"));
    n.features = decode_vector(r.text_or("features", ""), r.id);
    return n;
}

std::string encode_vector(const std::vector<double>& v) {
    std::string out;
    for (size_t i = 0; i < v.size(); ++i) {
        if (i) out += ',';
        out += format_double(v[i]);
    }
    return out;
}

std::vector<double> decode_vector(const std::string& text, const std::string& record_id) {
    std::vector<double> out;
    if (text.empty()) return out;
    std::istringstream in(text);
    std::string part;
    while (std::getline(in, part, ',')) {
        try {
            out.push_back(std::stod(part));
        } catch (const std::logic_error&) {
            throw DataIntegrityError("malformed vector component '" + part + "'", record_id);
        }
    }
    return out;
}

// =============================================================================
// MemoryRepository
// =============================================================================

void MemoryRepository::append_raw(const std::vector<MemoryItem>& items) {
    std::vector<Record> rows;
    rows.reserve(items.size());
    for (const auto& item : items) rows.push_back(raw_record(item));
    auto tx = store_.begin_transaction();
    tx->upsert_batch(tables::RAW_MEMORIES, rows);
    tx->commit();
}

std::vector<WorkingMemoryEntry> MemoryRepository::working_pool() {
    auto rows = store_.select(Selection{tables::WORKING_MEMORY,
                                        {where_in("status", {"active", "pending"})},
                                        Order::ById, 0});
    std::vector<WorkingMemoryEntry> out;
    out.reserve(rows.size());
    for (const auto& r : rows) {
        try {
            out.push_back(wm_from_record(r));
        } catch (const DataIntegrityError& e) {
            LOG_WARN("skipping malformed working memory row: ", e.message(), kv("id", r.id));
        }
    }
    return out;
}

std::vector<EpisodeMember> MemoryRepository::members_of_episodes(const std::vector<std::string>& episode_ids) {
    std::vector<EpisodeMember> out;
    if (episode_ids.empty()) return out;
    for (const auto& r : store_.select(Selection{tables::EPISODE_MEMBERS,
                                                 {where_in("episode_id", episode_ids)},
                                                 Order::ByTsThenId, 0})) {
        out.push_back(member_from_record(r));
    }
    return out;
}

std::vector<EpisodeMember> MemoryRepository::members_by_item(const std::vector<std::string>& item_ids) {
    std::vector<EpisodeMember> out;
    if (item_ids.empty()) return out;
    for (const auto& r : store_.select(Selection{tables::EPISODE_MEMBERS,
                                                 {where_in("id", item_ids)},
                                                 Order::ById, 0})) {
        out.push_back(member_from_record(r));
    }
    return out;
}

std::vector<Episode> MemoryRepository::episodes_by_id(const std::vector<std::string>& ids) {
    std::vector<Episode> out;
    if (ids.empty()) return out;
    for (const auto& r : store_.select(Selection{tables::EPISODES, {where_in("id", ids)}, Order::ById, 0})) {
        out.push_back(episode_from_record(r));
    }
    return out;
}

std::vector<Episode> MemoryRepository::episodes_near(const std::string& category, Timestamp from, Timestamp to) {
    std::vector<Episode> out;
    for (const auto& r : store_.select(Selection{tables::EPISODES,
                                                 {where("category", Op::Eq, category),
                                                  where("window_start", Op::Ge, std::to_string(from)),
                                                  where("window_start", Op::Le, std::to_string(to))},
                                                 Order::ById, 0})) {
        out.push_back(episode_from_record(r));
    }
    return out;
}

std::vector<Episode> MemoryRepository::episodes_in_window(Timestamp from, Timestamp to) {
    std::vector<Episode> out;
    for (const auto& r : store_.select(Selection{tables::EPISODES,
                                                 {where("window_start", Op::Ge, std::to_string(from)),
                                                  where("window_start", Op::Le, std::to_string(to))},
                                                 Order::ById, 0})) {
        out.push_back(episode_from_record(r));
    }
    return out;
}

std::vector<Episode> MemoryRepository::episodes_in_categories(const std::vector<std::string>& categories) {
    std::vector<Episode> out;
    if (categories.empty()) return out;
    for (const auto& r : store_.select(Selection{tables::EPISODES,
                                                 {where_in("category", categories)},
                                                 Order::ById, 0})) {
        out.push_back(episode_from_record(r));
    }
    return out;
}

std::vector<SemanticNode> MemoryRepository::nodes_by_id(const std::vector<std::string>& ids) {
    std::vector<SemanticNode> out;
    if (ids.empty()) return out;
    for (const auto& r : store_.select(Selection{tables::SEMANTIC_NODES, {where_in("id", ids)}, Order::ById, 0})) {
        out.push_back(node_from_record(r));
    }
    return out;
}

std::vector<SemanticNode> MemoryRepository::nodes_in_clusters(const std::vector<int>& cluster_ids) {
    std::vector<SemanticNode> out;
    if (cluster_ids.empty()) return out;
    for (const auto& r : store_.select(Selection{tables::SEMANTIC_NODES,
                                                 {where_in("cluster_id", to_strings(cluster_ids))},
                                                 Order::ById, 0})) {
        out.push_back(node_from_record(r));
    }
    return out;
}

std::map<std::string, int64_t> MemoryRepository::access_counts(const std::vector<std::string>& node_ids,
                                                                Timestamp since) {
    std::map<std::string, int64_t> counts;
    if (node_ids.empty()) return counts;
    for (const auto& r : store_.select(Selection{tables::ACCESS_LOG,
                                                 {where_in("node_id", node_ids),
                                                  where("accessed_at", Op::Ge, std::to_string(since))},
                                                 Order::ById, 0})) {
        ++counts[r.text("node_id")];
    }
    return counts;
}

void MemoryRepository::record_access(const std::string& node_id, Timestamp at) {
    Record r(node_id + "@" + std::to_string(at), at);
    r.set("node_id", node_id).set("accessed_at", at);
    auto tx = store_.begin_transaction();
    tx->upsert_batch(tables::ACCESS_LOG, {r});
    tx->commit();
}

std::vector<Record> MemoryRepository::clusters(const std::vector<int>& ids) {
    Selection sel{tables::CLUSTERS, {}, Order::ById, 0};
    if (!ids.empty()) sel.predicates.push_back(where_in("id", to_strings(ids)));
    return store_.select(sel);
}

std::vector<Record> MemoryRepository::quarantined(const std::string& stage) {
    return store_.select(Selection{tables::QUARANTINE, {where("stage", Op::Eq, stage)}, Order::ById, 0});
}

} // namespace engram::store
