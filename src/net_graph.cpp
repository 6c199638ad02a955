#include "net_graph.h"
#include "coordinate_compiler.h"

#include <cmath>
#include <iostream>
#include <map>

namespace netoverlay {

GraphBuilder::GraphBuilder(const GraphOptions& opts)
    : opts_(opts) {}

GraphBuilder::LocationKey GraphBuilder::location_key(const Point& pt) const {
    return {std::llround(pt.x / opts_.tolerance), std::llround(pt.y / opts_.tolerance)};
}

NetGraph GraphBuilder::build(const PinLocations& pins, const std::vector<RawWire>& wires) {
    warnings_.clear();

    NetGraph graph;
    std::map<LocationKey, std::string> location_to_node;
    int junction_counter = 0;

    // Step 1: every pin is a node
    for (auto& [refdes, by_name] : pins) {
        for (auto& [pin_name, pt] : by_name) {
            GraphNode node;
            node.id = refdes + "." + pin_name;
            node.position = {round_to(pt.x, OUTPUT_PRECISION), round_to(pt.y, OUTPUT_PRECISION)};
            graph.nodes[node.id] = node;

            auto inserted = location_to_node.emplace(location_key(pt), node.id);
            if (!inserted.second) {
                warn("Pin " + node.id + " coincides with " + inserted.first->second +
                     "; wires there attach to " + inserted.first->second);
            }
        }
    }

    auto node_at = [&](const Point& pt) -> std::string {
        auto key = location_key(pt);
        auto it = location_to_node.find(key);
        if (it != location_to_node.end()) return it->second;

        GraphNode node;
        node.id = JUNCTION_PREFIX + std::to_string(junction_counter++);
        node.position = {round_to(pt.x, OUTPUT_PRECISION), round_to(pt.y, OUTPUT_PRECISION)};
        node.junction = true;
        graph.nodes[node.id] = node;
        location_to_node[key] = node.id;
        return node.id;
    };

    // Step 2: wires become segments, creating junctions where no pin exists
    for (auto& wire : wires) {
        if (graph.segments.count(wire.uuid)) {
            warn("Duplicate wire uuid " + wire.uuid + "; keeping the first occurrence");
            continue;
        }

        GraphSegment seg;
        seg.uuid = wire.uuid;
        seg.node_a = node_at(wire.a);
        seg.node_b = node_at(wire.b);
        if (seg.node_a == seg.node_b) {
            warn("Wire " + wire.uuid + " starts and ends at node " + seg.node_a);
        }
        graph.segments[seg.uuid] = seg;
    }

    log("Graph: " + std::to_string(graph.nodes.size()) + " nodes (" +
        std::to_string(junction_counter) + " junctions), " +
        std::to_string(graph.segments.size()) + " segments");
    return graph;
}

void GraphBuilder::log(const std::string& msg) {
    if (opts_.verbose) {
        std::cerr << "[graph] " << msg << std::endl;
    }
}

void GraphBuilder::warn(const std::string& msg) {
    warnings_.push_back(msg);
    std::cerr << "[WARNING] " << msg << std::endl;
}

} // namespace netoverlay
