#include "engram/association_graph.hpp"

#include <cmath>

#include "engram/logging.hpp"

namespace engram {

bool AssociationGraph::add_or_strengthen(const Association& edge) {
    if (edge.source_id == edge.target_id || !std::isfinite(edge.weight)) {
        LOG_WARN("association rejected", kv("edge", edge.key()), kv("weight", edge.weight));
        return false;
    }
    Association a = edge;
    a.weight = clamp01(a.weight);

    auto key = std::make_pair(a.source_id, a.target_id);
    auto it = edges_.find(key);
    if (it == edges_.end()) {
        edges_.emplace(std::move(key), std::move(a));
        return true;
    }
    if (a.weight > it->second.weight) {
        it->second.weight = a.weight;
        it->second.kind = a.kind;
    }
    return true;
}

std::vector<Association> AssociationGraph::outgoing(const std::string& source_id) const {
    std::vector<Association> out;
    for (auto it = edges_.lower_bound({source_id, std::string()});
         it != edges_.end() && it->first.first == source_id; ++it) {
        out.push_back(it->second);
    }
    return out;
}

std::vector<Association> AssociationGraph::edges() const {
    std::vector<Association> out;
    out.reserve(edges_.size());
    for (const auto& [key, a] : edges_) out.push_back(a);
    return out;
}

} // namespace engram
