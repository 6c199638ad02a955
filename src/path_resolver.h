#pragma once

#include "schematic_model.h"
#include <map>
#include <string>
#include <vector>

namespace netoverlay {

enum class ResolveStatus { OK, MISSING_ENDPOINT, NO_PATH };

struct ResolveResult {
    ResolveStatus status = ResolveStatus::NO_PATH;
    std::vector<PathStep> steps;
    std::string missing_node;   // set for MISSING_ENDPOINT

    bool ok() const { return status == ResolveStatus::OK; }
};

// Breadth-first search over the undirected segment graph. Returns a
// minimum-hop path; among equal-length paths the one reached first when
// segments are tried in uuid order wins, so results are reproducible.
class PathResolver {
public:
    // The graph must outlive the resolver
    explicit PathResolver(const NetGraph& graph);

    ResolveResult resolve(const std::string& from_node, const std::string& to_node) const;

private:
    struct Edge {
        std::string segment;
        Direction direction;
        std::string next;
    };

    const NetGraph& graph_;
    std::map<std::string, std::vector<Edge>> adjacency_;
};

// Node a traversal of step starts from / arrives at
const std::string& entry_node(const GraphSegment& seg, Direction dir);
const std::string& exit_node(const GraphSegment& seg, Direction dir);

std::string direction_str(Direction dir);

} // namespace netoverlay
