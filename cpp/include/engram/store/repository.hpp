#pragma once

#include <map>
#include <string>
#include <vector>

#include "engram/store/durable_store.hpp"
#include "engram/store/schema.hpp"
#include "engram/types.hpp"

namespace engram::store {

// =============================================================================
// Record codecs. Decoders throw DataIntegrityError on malformed rows.
// =============================================================================

std::string item_content_hash(const MemoryItem& item);

Record raw_record(const MemoryItem& item);
MemoryItem item_from_raw(const Record& r);

Record wm_record(const WorkingMemoryEntry& e, Timestamp now);
WorkingMemoryEntry wm_from_record(const Record& r);

Record member_record(const EpisodeMember& m, Timestamp now);
EpisodeMember member_from_record(const Record& r);

Record episode_record(const Episode& e, Timestamp now);
Episode episode_from_record(const Record& r);

Record association_record(const Association& a, Timestamp now);
Association association_from_record(const Record& r);

Record consolidated_record(const ConsolidatedMemory& m, const std::string& source_hash, Timestamp now);
ConsolidatedMemory consolidated_from_record(const Record& r);

Record node_record(const SemanticNode& n, const std::string& source_hash, Timestamp now);
SemanticNode node_from_record(const Record& r);

std::string encode_vector(const std::vector<double>& v);
std::vector<double> decode_vector(const std::string& text, const std::string& record_id);

// =============================================================================
// Typed, parameterized queries
// =============================================================================

class MemoryRepository {
public:
    explicit MemoryRepository(DurableStore& store) : store_(store) {}

    DurableStore& store() { return store_; }

    // Upstream feed helper: append raw items in one transaction.
    void append_raw(const std::vector<MemoryItem>& items);

    // Working memory rows currently Active or Pending
    std::vector<WorkingMemoryEntry> working_pool();

    std::vector<EpisodeMember> members_of_episodes(const std::vector<std::string>& episode_ids);
    std::vector<EpisodeMember> members_by_item(const std::vector<std::string>& item_ids);

    std::vector<Episode> episodes_by_id(const std::vector<std::string>& ids);
    // Same-category episodes whose window_start lies in [from, to]
    std::vector<Episode> episodes_near(const std::string& category, Timestamp from, Timestamp to);
    // Any-category episodes whose window_start lies in [from, to]
    std::vector<Episode> episodes_in_window(Timestamp from, Timestamp to);
    std::vector<Episode> episodes_in_categories(const std::vector<std::string>& categories);

    std::vector<SemanticNode> nodes_by_id(const std::vector<std::string>& ids);
    std::vector<SemanticNode> nodes_in_clusters(const std::vector<int>& cluster_ids);

    // node id -> accesses at or after since
    std::map<std::string, int64_t> access_counts(const std::vector<std::string>& node_ids, Timestamp since);
    void record_access(const std::string& node_id, Timestamp at);

    std::vector<Record> clusters(const std::vector<int>& ids = {});

    std::vector<Record> quarantined(const std::string& stage);

private:
    DurableStore& store_;
};

} // namespace engram::store
