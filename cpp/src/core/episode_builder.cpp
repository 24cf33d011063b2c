#include "engram/episode_builder.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <set>

#include "engram/logging.hpp"

namespace engram {

EpisodeBuilder::EpisodeBuilder(const ShortTermConfig& config) : config_(config) {}

Timestamp EpisodeBuilder::window_ms() const {
    return std::max<Timestamp>(1, static_cast<Timestamp>(config_.coactivation_window_seconds * 1000.0));
}

Timestamp EpisodeBuilder::bucket_start(Timestamp ts) const {
    const Timestamp w = window_ms();
    // floor division, correct for negative timestamps too
    Timestamp q = ts / w;
    if (ts % w != 0 && ts < 0) --q;
    return q * w;
}

std::string EpisodeBuilder::episode_id(const std::string& category, Timestamp ts) const {
    return "ep:" + category + ":" + std::to_string(bucket_start(ts) / window_ms());
}

double EpisodeBuilder::recency_factor(Timestamp window_end, Timestamp now) const {
    return clamp01(std::exp(-age_seconds(window_end, now) / config_.decay_constant_seconds));
}

double EpisodeBuilder::emotional_salience(const std::vector<EpisodeMember>& members) const {
    if (members.empty()) return 0.0;
    double importance = 0.0;
    double sentiment = 0.0;
    for (const auto& m : members) {
        importance += clamp01(m.importance);
        sentiment += std::fabs(std::clamp(m.sentiment, -1.0, 1.0));
    }
    const double n = static_cast<double>(members.size());
    return clamp01(config_.importance_weight * (importance / n) +
                   config_.sentiment_weight * (sentiment / n));
}

int EpisodeBuilder::hebbian_potential(const Episode& episode, const std::vector<Episode>& same_category) const {
    const auto h = static_cast<Timestamp>(config_.hebbian_window_seconds * 1000.0);
    std::set<std::string> distinct{episode.id};
    for (const auto& other : same_category) {
        if (other.category != episode.category) continue;
        if (std::llabs(other.window_start - episode.window_start) <= h) {
            distinct.insert(other.id);
        }
    }
    return std::min(config_.hebbian_cap, static_cast<int>(distinct.size()));
}

bool EpisodeBuilder::ready_for_consolidation(int potential, double salience) const {
    return potential >= config_.ready_potential && salience > config_.ready_salience;
}

void EpisodeBuilder::recompute(Episode& episode, const std::vector<EpisodeMember>& members,
                               const std::vector<Episode>& same_category, Timestamp now) const {
    episode.item_count = static_cast<int64_t>(members.size());
    episode.member_ids.clear();
    Timestamp latest = episode.window_start;
    for (const auto& m : members) {
        episode.member_ids.push_back(m.item_id);
        latest = std::max(latest, m.created_at);
    }
    std::sort(episode.member_ids.begin(), episode.member_ids.end());
    episode.window_end = latest;

    episode.recency_factor = recency_factor(episode.window_end, now);
    episode.emotional_salience = emotional_salience(members);
    episode.stm_strength = clamp01(episode.recency_factor * episode.emotional_salience);
    episode.hebbian_potential = hebbian_potential(episode, same_category);
    episode.ready_for_consolidation = ready_for_consolidation(episode.hebbian_potential,
                                                              episode.emotional_salience);
    if (episode.state == EpisodeState::Pending) {
        episode.strength = episode.stm_strength;
    }
}

EpisodeBuild EpisodeBuilder::build(const std::vector<EnrichedItem>& items,
                                   const std::vector<Episode>& existing,
                                   const std::vector<EpisodeMember>& existing_members,
                                   const std::vector<EpisodeMember>& known,
                                   const std::vector<Episode>& nearby,
                                   Timestamp now) const {
    EpisodeBuild out;

    std::map<std::string, Episode> episodes;
    for (const auto& e : existing) episodes[e.id] = e;

    std::map<std::string, std::map<std::string, EpisodeMember>> members;
    for (const auto& m : existing_members) members[m.episode_id][m.item_id] = m;

    std::map<std::string, EpisodeMember> known_by_item;
    for (const auto& m : known) known_by_item[m.item_id] = m;

    std::set<std::string> touched;
    for (const auto& ei : items) {
        const std::string& category = ei.features.category;
        const std::string id = episode_id(category, ei.item.created_at);

        auto k = known_by_item.find(ei.item.id);
        if (k != known_by_item.end()) {
            if (k->second.episode_id == id && k->second.source_hash == ei.item.content_hash) {
                out.duplicates.push_back(ei.item.id);
                continue;
            }
            if (k->second.episode_id != id) {
                // Corrected item moved to another episode
                members[k->second.episode_id].erase(ei.item.id);
                touched.insert(k->second.episode_id);
            }
        }

        EpisodeMember m;
        m.item_id = ei.item.id;
        m.episode_id = id;
        m.category = category;
        m.created_at = ei.item.created_at;
        m.importance = clamp01(ei.features.importance);
        m.sentiment = std::clamp(ei.features.sentiment, -1.0, 1.0);
        m.source_hash = ei.item.content_hash;
        members[id][m.item_id] = m;
        out.members.push_back(m);
        touched.insert(id);

        if (!episodes.count(id)) {
            Episode e;
            e.id = id;
            e.category = category;
            e.window_start = bucket_start(ei.item.created_at);
            e.window_end = e.window_start;
            e.state = EpisodeState::Pending;
            episodes[id] = e;
        }
    }

    // Same-category view used for potential: stored neighbours, then
    // the touched episodes overriding by id
    std::map<std::string, Episode> by_id;
    for (const auto& e : nearby) by_id[e.id] = e;
    for (const auto& id : touched) {
        auto it = episodes.find(id);
        if (it != episodes.end()) by_id[id] = it->second;
    }
    std::vector<Episode> pool;
    pool.reserve(by_id.size());
    for (const auto& [id, e] : by_id) pool.push_back(e);

    for (const auto& id : touched) {
        auto it = episodes.find(id);
        if (it == episodes.end()) continue;
        Episode& e = it->second;
        if (is_terminal(e.state)) {
            LOG_DEBUG("membership added to closed episode", kv("episode", e.id),
                      kv("state", to_string(e.state)));
            continue;
        }
        std::vector<EpisodeMember> list;
        for (const auto& [item, m] : members[id]) list.push_back(m);
        recompute(e, list, pool, now);
        out.episodes.push_back(e);
    }

    // Symmetric co-activation: neighbours see the new episodes too
    for (const auto& n : nearby) {
        if (touched.count(n.id) || is_terminal(n.state)) continue;
        Episode e = n;
        e.hebbian_potential = hebbian_potential(e, pool);
        e.ready_for_consolidation = ready_for_consolidation(e.hebbian_potential, e.emotional_salience);
        if (e.hebbian_potential != n.hebbian_potential ||
            e.ready_for_consolidation != n.ready_for_consolidation) {
            out.neighbours.push_back(std::move(e));
        }
    }

    return out;
}

} // namespace engram
