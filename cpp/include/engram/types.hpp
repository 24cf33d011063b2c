#pragma once

#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace engram {

// Milliseconds since the Unix epoch
using Timestamp = int64_t;

constexpr Timestamp MS_PER_SECOND = 1000;
constexpr Timestamp MS_PER_DAY = 86400 * MS_PER_SECOND;

inline double age_seconds(Timestamp then, Timestamp now) {
    return now > then ? static_cast<double>(now - then) / 1000.0 : 0.0;
}

inline double clamp01(double v) {
    if (!(v == v)) return 0.0;  // NaN
    return std::clamp(v, 0.0, 1.0);
}

// =============================================================================
// Enumerations (persisted as their lower-case names)
// =============================================================================

enum class MemoryStage : uint8_t {
    Incoming,
    WorkingMemory,
    ShortTerm,
    Consolidated,
    LongTerm,
    Discarded
};

enum class WmStatus : uint8_t {
    Active,
    Pending,
    Expired
};

enum class EpisodeState : uint8_t {
    Pending,
    Replaying,
    Strengthened,
    Weakened,
    ConsolidatedToLTM,
    Discarded
};

enum class AssociationKind : uint8_t {
    Replay,
    Creative
};

enum class AgeCategory : uint8_t {
    Recent,
    WeekOld,
    MonthOld,
    Remote
};

enum class ConsolidationState : uint8_t {
    Episodic,
    Consolidating,
    Schematized
};

enum class MemoryFidelity : uint8_t {
    High,
    Medium,
    Low,
    Fragmented
};

const char* to_string(MemoryStage v);
const char* to_string(WmStatus v);
const char* to_string(EpisodeState v);
const char* to_string(AssociationKind v);
const char* to_string(AgeCategory v);
const char* to_string(ConsolidationState v);
const char* to_string(MemoryFidelity v);

// Parsers throw DataIntegrityError on unknown names.
MemoryStage parse_memory_stage(const std::string& s);
WmStatus parse_wm_status(const std::string& s);
EpisodeState parse_episode_state(const std::string& s);
AssociationKind parse_association_kind(const std::string& s);
AgeCategory parse_age_category(const std::string& s);
ConsolidationState parse_consolidation_state(const std::string& s);
MemoryFidelity parse_memory_fidelity(const std::string& s);

inline bool is_terminal(EpisodeState s) {
    return s == EpisodeState::ConsolidatedToLTM || s == EpisodeState::Discarded;
}

// =============================================================================
// Domain records
// =============================================================================

struct MemoryItem {
    std::string id;
    std::string content_ref;
    Timestamp created_at = 0;
    double salience = 0.0;
    double importance = 0.0;
    double sentiment = 0.0;       // [-1, 1]
    std::string topic;            // optional category hint
    MemoryStage stage = MemoryStage::Incoming;
    double strength = 0.0;
    int64_t co_activation_count = 0;
    std::string content_hash;
};

struct WorkingMemoryEntry {
    MemoryItem item;
    WmStatus status = WmStatus::Pending;
    double attention_score = 0.0;
    int admit_rank = 0;           // 1-based among non-expired, 0 when expired
    uint64_t cycle = 0;
    int capacity = 0;
};

// Member of an episode as persisted in episode_members
struct EpisodeMember {
    std::string item_id;
    std::string episode_id;
    std::string category;
    Timestamp created_at = 0;
    double importance = 0.0;
    double sentiment = 0.0;
    std::string source_hash;
};

struct Episode {
    std::string id;
    std::string category;
    Timestamp window_start = 0;
    Timestamp window_end = 0;
    int64_t item_count = 0;
    std::vector<std::string> member_ids;
    // Content of the members in member_ids order; loaded for replay only
    std::vector<std::string> member_content;
    double recency_factor = 0.0;
    double emotional_salience = 0.0;
    double stm_strength = 0.0;
    int hebbian_potential = 0;
    bool ready_for_consolidation = false;
    double strength = 0.0;
    int replay_count = 0;
    EpisodeState state = EpisodeState::Pending;
};

struct Association {
    std::string source_id;
    std::string target_id;
    double weight = 0.0;
    AssociationKind kind = AssociationKind::Replay;

    std::string key() const { return source_id + "->" + target_id; }
};

struct ConsolidatedMemory {
    std::string id;               // same as the originating episode
    std::string semantic_category;
    double consolidated_strength = 0.0;
    double replay_strength = 0.0;
    std::vector<Association> associations;
    std::string semantic_gist;
    std::string cortical_region;
    Timestamp consolidated_at = 0;
};

struct SemanticNode {
    std::string id;
    std::string semantic_category;
    int cluster_id = -1;
    int competition_rank = 0;
    double consolidated_strength = 0.0;
    int64_t access_frequency = 0;
    double retrieval_strength = 0.0;
    double homeostatic_scale = 1.0;
    Timestamp consolidated_at = 0;
    Timestamp computed_at = 0;
    AgeCategory age_category = AgeCategory::Recent;
    ConsolidationState consolidation_state = ConsolidationState::Episodic;
    MemoryFidelity memory_fidelity = MemoryFidelity::Fragmented;
    std::vector<double> features;
};

// Structured features returned by the enrichment collaborator
struct Features {
    std::string category;
    std::vector<std::string> topics;
    double sentiment = 0.0;
    double importance = 0.0;
    std::string hierarchy_goal;
    std::string spatial_context;
};

using Embedding = std::vector<double>;

} // namespace engram
