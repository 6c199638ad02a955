#include "path_resolver.h"

#include <deque>
#include <set>
#include <utility>

namespace netoverlay {

PathResolver::PathResolver(const NetGraph& graph)
    : graph_(graph) {
    // segments is ordered by uuid, so every adjacency list is too
    for (auto& [uuid, seg] : graph_.segments) {
        adjacency_[seg.node_a].push_back({uuid, Direction::A_TO_B, seg.node_b});
        if (seg.node_b != seg.node_a) {
            adjacency_[seg.node_b].push_back({uuid, Direction::B_TO_A, seg.node_a});
        }
    }
}

ResolveResult PathResolver::resolve(const std::string& from_node,
                                    const std::string& to_node) const {
    ResolveResult result;

    if (!graph_.has_node(from_node)) {
        result.status = ResolveStatus::MISSING_ENDPOINT;
        result.missing_node = from_node;
        return result;
    }
    if (!graph_.has_node(to_node)) {
        result.status = ResolveStatus::MISSING_ENDPOINT;
        result.missing_node = to_node;
        return result;
    }

    std::deque<std::pair<std::string, std::vector<PathStep>>> queue;
    std::set<std::string> visited;
    queue.emplace_back(from_node, std::vector<PathStep>{});
    visited.insert(from_node);

    while (!queue.empty()) {
        auto [current, path] = std::move(queue.front());
        queue.pop_front();

        if (current == to_node) {
            result.status = ResolveStatus::OK;
            result.steps = std::move(path);
            return result;
        }

        auto adj = adjacency_.find(current);
        if (adj == adjacency_.end()) continue;

        for (auto& edge : adj->second) {
            if (!visited.insert(edge.next).second) continue;
            std::vector<PathStep> next_path = path;
            next_path.push_back({edge.segment, edge.direction});
            queue.emplace_back(edge.next, std::move(next_path));
        }
    }

    result.status = ResolveStatus::NO_PATH;
    return result;
}

const std::string& entry_node(const GraphSegment& seg, Direction dir) {
    return dir == Direction::A_TO_B ? seg.node_a : seg.node_b;
}

const std::string& exit_node(const GraphSegment& seg, Direction dir) {
    return dir == Direction::A_TO_B ? seg.node_b : seg.node_a;
}

std::string direction_str(Direction dir) {
    return dir == Direction::A_TO_B ? "a_to_b" : "b_to_a";
}

} // namespace netoverlay
