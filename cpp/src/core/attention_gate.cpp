#include "engram/attention_gate.hpp"

#include <algorithm>
#include <cmath>
#include <random>
#include <unordered_map>

#include "engram/hash.hpp"
#include "engram/logging.hpp"

namespace engram {

std::vector<const WorkingMemoryEntry*> AdmissionResult::with_status(WmStatus status) const {
    std::vector<const WorkingMemoryEntry*> out;
    for (const auto& e : entries) {
        if (e.status == status) out.push_back(&e);
    }
    return out;
}

size_t AdmissionResult::active_count() const {
    return static_cast<size_t>(std::count_if(entries.begin(), entries.end(),
        [](const WorkingMemoryEntry& e) { return e.status == WmStatus::Active; }));
}

std::string AdmissionResult::fingerprint() const {
    ContentHasher h;
    h.add(cycle).add(capacity);
    for (const auto& e : entries) {
        h.add(e.item.id).add(static_cast<int>(e.status)).add(e.attention_score).add(e.admit_rank);
    }
    return h.hex();
}

AttentionGate::AttentionGate(const AttentionConfig& config) : config_(config) {}

int AttentionGate::capacity_for_cycle(uint64_t cycle) const {
    std::seed_seq seq{static_cast<uint32_t>(config_.seed), static_cast<uint32_t>(config_.seed >> 32),
                      static_cast<uint32_t>(cycle), static_cast<uint32_t>(cycle >> 32)};
    std::mt19937_64 rng(seq);
    // Draw through raw engine output so the result does not depend on
    // the standard library's distribution implementation.
    const int span = 2 * config_.capacity_variance + 1;
    const int draw = static_cast<int>(rng() % static_cast<uint64_t>(span)) - config_.capacity_variance;
    return std::clamp(config_.base_capacity + draw, MIN_CAPACITY, MAX_CAPACITY);
}

double AttentionGate::score(const MemoryItem& item, Timestamp now) const {
    const double recency = std::exp(-age_seconds(item.created_at, now) / config_.decay_constant_seconds);
    return clamp01(config_.recency_weight * recency + (1.0 - config_.recency_weight) * clamp01(item.salience));
}

uint64_t AttentionGate::cycle_at(Timestamp now) const {
    const auto window_ms = static_cast<Timestamp>(config_.window_seconds * 1000.0);
    return now > 0 ? static_cast<uint64_t>(now / std::max<Timestamp>(window_ms, 1)) : 0;
}

AdmissionResult AttentionGate::admit(const std::vector<MemoryItem>& incoming,
                                     const std::vector<WorkingMemoryEntry>& pool,
                                     Timestamp now, uint64_t cycle) const {
    AdmissionResult result;
    result.cycle = cycle;
    result.capacity = capacity_for_cycle(cycle);

    struct Candidate {
        MemoryItem item;
        size_t order;
    };

    // Pool first, new items override entries with the same id
    std::vector<Candidate> candidates;
    std::unordered_map<std::string, size_t> index;
    auto push = [&](const MemoryItem& item) {
        auto it = index.find(item.id);
        if (it != index.end()) {
            candidates[it->second].item = item;
            return;
        }
        index.emplace(item.id, candidates.size());
        candidates.push_back(Candidate{item, candidates.size()});
    };
    for (const auto& e : pool) push(e.item);
    for (const auto& item : incoming) push(item);

    const auto window_ms = static_cast<Timestamp>(config_.window_seconds * 1000.0);

    std::vector<WorkingMemoryEntry> live;
    std::vector<WorkingMemoryEntry> expired;
    std::vector<size_t> live_order;
    for (const auto& c : candidates) {
        WorkingMemoryEntry e;
        e.item = c.item;
        e.item.stage = MemoryStage::WorkingMemory;
        e.cycle = cycle;
        e.capacity = result.capacity;
        if (now - c.item.created_at > window_ms) {
            e.status = WmStatus::Expired;
            e.attention_score = score(c.item, now);
            expired.push_back(std::move(e));
        } else {
            e.attention_score = score(c.item, now);
            live.push_back(std::move(e));
            live_order.push_back(c.order);
        }
    }

    // Score desc, then arrival: created_at, then input order
    std::vector<size_t> idx(live.size());
    for (size_t i = 0; i < idx.size(); ++i) idx[i] = i;
    std::sort(idx.begin(), idx.end(), [&](size_t a, size_t b) {
        const auto& ea = live[a];
        const auto& eb = live[b];
        if (ea.attention_score != eb.attention_score) return ea.attention_score > eb.attention_score;
        if (ea.item.created_at != eb.item.created_at) return ea.item.created_at < eb.item.created_at;
        return live_order[a] < live_order[b];
    });

    result.entries.reserve(candidates.size());
    for (size_t rank = 0; rank < idx.size(); ++rank) {
        WorkingMemoryEntry e = std::move(live[idx[rank]]);
        e.admit_rank = static_cast<int>(rank) + 1;
        e.status = static_cast<int>(rank) < result.capacity ? WmStatus::Active : WmStatus::Pending;
        result.entries.push_back(std::move(e));
    }

    std::sort(expired.begin(), expired.end(), [](const WorkingMemoryEntry& a, const WorkingMemoryEntry& b) {
        return a.item.id < b.item.id;
    });
    for (auto& e : expired) result.entries.push_back(std::move(e));

    LOG_DEBUG("admission cycle", kv("cycle", cycle), kv("capacity", result.capacity),
              kv("candidates", candidates.size()), kv("active", result.active_count()),
              kv("expired", expired.size()));
    return result;
}

} // namespace engram
