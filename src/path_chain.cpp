#include "path_chain.h"
#include "path_resolver.h"

#include <iostream>

namespace netoverlay {

double segment_tangent(const GraphSegment& seg, const NetGraph& graph) {
    const GraphNode* a = graph.find_node(seg.node_a);
    const GraphNode* b = graph.find_node(seg.node_b);
    if (!a || !b) return 0.0;
    // Negated once: the sheet is Y-down, draw space is Y-up
    return normalize_degrees(-angle_deg(a->position, b->position));
}

ChainAssembler::ChainAssembler(const ChainOptions& opts)
    : opts_(opts) {}

PointChain ChainAssembler::assemble(const ResolvedPath& path, const BundleLayout& layout,
                                    const NetGraph& graph, std::vector<ConnectionError>& errors) {
    PointChain chain;

    for (auto& step : path.steps) {
        const GraphSegment* seg = graph.find_segment(step.segment);
        if (!seg) {
            errors.push_back({path.connection, ConnectionErrorKind::MISSING_BUNDLE_POINT,
                              "Connection '" + path.connection + "' uses unknown segment '" +
                              step.segment + "'"});
            continue;
        }

        double tangent = segment_tangent(*seg, graph);
        if (step.direction == Direction::B_TO_A) {
            tangent = normalize_degrees(tangent + 180.0);
        }

        for (const std::string* node : {&entry_node(*seg, step.direction),
                                        &exit_node(*seg, step.direction)}) {
            const Point* pt = layout.find(*node, seg->uuid, path.connection);
            if (!pt) {
                errors.push_back({path.connection, ConnectionErrorKind::MISSING_BUNDLE_POINT,
                                  "No bundle point for connection '" + path.connection +
                                  "' at node '" + *node + "' on segment '" + seg->uuid + "'"});
                continue;
            }
            chain.push_back({pt->x, pt->y, tangent});
        }
    }

    log("Connection '" + path.connection + "': " + std::to_string(chain.size()) + " points");
    return chain;
}

void ChainAssembler::log(const std::string& msg) {
    if (opts_.verbose) {
        std::cerr << "[chain] " << msg << std::endl;
    }
}

} // namespace netoverlay
