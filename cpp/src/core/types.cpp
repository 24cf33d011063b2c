#include "engram/types.hpp"

#include <cstdio>

#include "engram/error.hpp"
#include "engram/hash.hpp"

namespace engram {

namespace {

template<typename E, size_t N>
E parse_enum(const std::string& s, const char* const (&names)[N], const char* what) {
    for (size_t i = 0; i < N; ++i) {
        if (s == names[i]) return static_cast<E>(i);
    }
    throw DataIntegrityError(std::string("unknown ") + what + " '" + s + "'", "",
                             ErrorCode::DATA_INTEGRITY);
}

const char* const kStageNames[] = {"incoming", "working_memory", "short_term",
                                   "consolidated", "long_term", "discarded"};
const char* const kWmNames[] = {"active", "pending", "expired"};
const char* const kEpisodeNames[] = {"pending", "replaying", "strengthened",
                                     "weakened", "consolidated_to_ltm", "discarded"};
const char* const kKindNames[] = {"replay", "creative"};
const char* const kAgeNames[] = {"recent", "week_old", "month_old", "remote"};
const char* const kConsNames[] = {"episodic", "consolidating", "schematized"};
const char* const kFidelityNames[] = {"high", "medium", "low", "fragmented"};

} // namespace

const char* to_string(MemoryStage v) { return kStageNames[static_cast<size_t>(v)]; }
const char* to_string(WmStatus v) { return kWmNames[static_cast<size_t>(v)]; }
const char* to_string(EpisodeState v) { return kEpisodeNames[static_cast<size_t>(v)]; }
const char* to_string(AssociationKind v) { return kKindNames[static_cast<size_t>(v)]; }
const char* to_string(AgeCategory v) { return kAgeNames[static_cast<size_t>(v)]; }
const char* to_string(ConsolidationState v) { return kConsNames[static_cast<size_t>(v)]; }
const char* to_string(MemoryFidelity v) { return kFidelityNames[static_cast<size_t>(v)]; }

MemoryStage parse_memory_stage(const std::string& s) {
    return parse_enum<MemoryStage>(s, kStageNames, "memory stage");
}
WmStatus parse_wm_status(const std::string& s) {
    return parse_enum<WmStatus>(s, kWmNames, "working memory status");
}
EpisodeState parse_episode_state(const std::string& s) {
    return parse_enum<EpisodeState>(s, kEpisodeNames, "episode state");
}
AssociationKind parse_association_kind(const std::string& s) {
    return parse_enum<AssociationKind>(s, kKindNames, "association kind");
}
AgeCategory parse_age_category(const std::string& s) {
    return parse_enum<AgeCategory>(s, kAgeNames, "age category");
}
ConsolidationState parse_consolidation_state(const std::string& s) {
    return parse_enum<ConsolidationState>(s, kConsNames, "consolidation state");
}
MemoryFidelity parse_memory_fidelity(const std::string& s) {
    return parse_enum<MemoryFidelity>(s, kFidelityNames, "memory fidelity");
}

std::string format_double(double v) {
    char buf[32];
    int n = std::snprintf(buf, sizeof(buf), "%.17g", v);
    return std::string(buf, n > 0 ? static_cast<size_t>(n) : 0);
}

} // namespace engram
