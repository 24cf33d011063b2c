#pragma once

#include <string>
#include <vector>

#include "engram/config.hpp"
#include "engram/types.hpp"

namespace engram {

// An admitted item paired with the features enrichment produced for it
struct EnrichedItem {
    MemoryItem item;
    Features features;
};

struct EpisodeBuild {
    // Episodes touched by the new members, in id order
    std::vector<Episode> episodes;
    // Non-terminal same-category neighbours whose potential changed
    std::vector<Episode> neighbours;
    // New or changed memberships
    std::vector<EpisodeMember> members;
    // Items whose membership was already recorded with the same hash
    std::vector<std::string> duplicates;
};

/**
 * Short-term memory: groups admitted items into episodes by category and
 * co-activation window and computes the episode strength terms.
 */
class EpisodeBuilder {
public:
    explicit EpisodeBuilder(const ShortTermConfig& config);

    Timestamp window_ms() const;
    Timestamp bucket_start(Timestamp ts) const;
    std::string episode_id(const std::string& category, Timestamp ts) const;

    double recency_factor(Timestamp window_end, Timestamp now) const;
    double emotional_salience(const std::vector<EpisodeMember>& members) const;

    // Distinct same-category episodes (itself included) with a window
    // start within +/- hebbian window, capped.
    int hebbian_potential(const Episode& episode, const std::vector<Episode>& same_category) const;

    bool ready_for_consolidation(int hebbian_potential, double emotional_salience) const;

    // Recompute every derived field of an episode from its members.
    void recompute(Episode& episode, const std::vector<EpisodeMember>& members,
                   const std::vector<Episode>& same_category, Timestamp now) const;

    /**
     * Fold new items into episodes.
     *
     * existing: stored episodes with the ids the new items map to
     * existing_members: all stored members of those episodes
     * known: stored memberships of the incoming item ids (for dedupe)
     * nearby: stored episodes of the same categories within the hebbian
     *         window (potential and neighbour refresh)
     */
    EpisodeBuild build(const std::vector<EnrichedItem>& items,
                       const std::vector<Episode>& existing,
                       const std::vector<EpisodeMember>& existing_members,
                       const std::vector<EpisodeMember>& known,
                       const std::vector<Episode>& nearby,
                       Timestamp now) const;

private:
    ShortTermConfig config_;
};

} // namespace engram
