#pragma once

#include <string>
#include <vector>

#include "engram/config.hpp"
#include "engram/types.hpp"

namespace engram {

constexpr int MIN_CAPACITY = 5;
constexpr int MAX_CAPACITY = 9;

struct AdmissionResult {
    uint64_t cycle = 0;
    int capacity = 0;
    // Non-expired entries in rank order, then expired entries by id
    std::vector<WorkingMemoryEntry> entries;

    std::vector<const WorkingMemoryEntry*> with_status(WmStatus status) const;
    size_t active_count() const;

    // Content hash of the ordered result; identical inputs and seed
    // produce identical fingerprints.
    std::string fingerprint() const;
};

/**
 * Working-memory admission. Capacity varies per cycle around the base
 * (Miller's 7 +/- 2); candidates are ranked by a blend of recency decay
 * and supplied salience.
 */
class AttentionGate {
public:
    explicit AttentionGate(const AttentionConfig& config);

    int capacity_for_cycle(uint64_t cycle) const;

    double score(const MemoryItem& item, Timestamp now) const;

    /**
     * Rank new items together with the current pool (Active and Pending
     * entries). Candidates older than the sliding window expire; the top
     * capacity entries become Active, the rest Pending.
     * A new item replaces a pool entry with the same id.
     */
    AdmissionResult admit(const std::vector<MemoryItem>& incoming,
                          const std::vector<WorkingMemoryEntry>& pool,
                          Timestamp now, uint64_t cycle) const;

    // Cycle number for a point in time: one cycle per window length.
    uint64_t cycle_at(Timestamp now) const;

private:
    AttentionConfig config_;
};

} // namespace engram
