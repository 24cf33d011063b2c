#pragma once

#include <map>
#include <string>
#include <utility>
#include <vector>

#include "engram/types.hpp"

namespace engram {

/**
 * Directed weighted association edges between episodes.
 * Edges are keyed by (source, target); adding an existing edge keeps
 * the larger weight.
 */
class AssociationGraph {
public:
    // Returns false when the weight is not finite or the edge is a self loop
    bool add_or_strengthen(const Association& edge);

    std::vector<Association> outgoing(const std::string& source_id) const;
    std::vector<Association> edges() const;

    size_t size() const { return edges_.size(); }
    bool empty() const { return edges_.empty(); }

private:
    std::map<std::pair<std::string, std::string>, Association> edges_;
};

} // namespace engram
