#include "bundle_geometry.h"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <set>

namespace netoverlay {

double bundle_radius(int components, double spacing_mm) {
    if (components <= 0) return 0.0;
    return std::pow(static_cast<double>(components), BUNDLE_EXPONENT) * spacing_mm;
}

BundleGeometry::BundleGeometry(const BundleOptions& opts)
    : opts_(opts) {}

BundleLayout BundleGeometry::compute(const NetGraph& graph, const std::vector<ResolvedPath>& paths) {
    BundleLayout layout;

    // segment uuid -> connections using it (ordered by name)
    std::map<std::string, std::set<std::string>> users_of_segment;
    for (auto& path : paths) {
        for (auto& step : path.steps) {
            users_of_segment[step.segment].insert(path.connection);
        }
    }

    for (auto& [node_id, node] : graph.nodes) {
        Point center = node.position * MM_PER_INCH;

        struct Spoke {
            const std::string* segment;
            double angle;
            bool flip;   // node is the segment's B end
        };
        std::vector<Spoke> spokes;
        std::set<std::string> touching;

        for (auto& [uuid, seg] : graph.segments) {
            const std::string* far_id = nullptr;
            bool flip = false;
            if (seg.node_a == node_id) {
                far_id = &seg.node_b;
            } else if (seg.node_b == node_id) {
                far_id = &seg.node_a;
                flip = true;
            } else {
                continue;
            }
            const GraphNode* far = graph.find_node(*far_id);
            if (!far) continue;
            spokes.push_back({&uuid, angle_deg(center, far->position * MM_PER_INCH), flip});
            touching.insert(uuid);
        }

        // Distinct components (group keys) passing through this node
        std::set<std::string> components;
        for (auto& path : paths) {
            for (auto& step : path.steps) {
                if (touching.count(step.segment)) {
                    components.insert(path.group.empty() ? path.connection : path.group);
                    break;
                }
            }
        }
        if (components.empty()) {
            layout.skipped_nodes++;
            log("Node " + node_id + " has no passing connections, skipped");
            continue;
        }

        int count = static_cast<int>(components.size());
        double radius = bundle_radius(count, opts_.spacing_mm);
        layout.nodes[node_id] = {center, radius, count};

        for (auto& spoke : spokes) {
            auto users_it = users_of_segment.find(*spoke.segment);
            if (users_it == users_of_segment.end()) continue;

            std::vector<std::string> users(users_it->second.begin(), users_it->second.end());
            // Same relative side seen from either end of the wire
            if (spoke.flip) std::reverse(users.begin(), users.end());

            int n = static_cast<int>(users.size());
            for (int idx = 1; idx <= n; idx++) {
                double offset = (idx - n / 2.0 - 0.5) * opts_.spacing_mm;
                double delta = 0.0;
                if (radius > 1e-9 && std::abs(offset / radius) <= 1.0) {
                    delta = rad_to_deg(std::asin(offset / radius));
                }

                Point on_circle = point_on_circle(center, radius, spoke.angle + delta);
                layout.points[{node_id, *spoke.segment, users[idx - 1]}] = flip_y(on_circle);
                layout.point_count++;
            }
        }
    }

    log("Placed " + std::to_string(layout.point_count) + " bundle points around " +
        std::to_string(layout.nodes.size()) + " nodes (" +
        std::to_string(layout.skipped_nodes) + " without traffic skipped)");
    return layout;
}

void BundleGeometry::log(const std::string& msg) {
    if (opts_.verbose) {
        std::cerr << "[bundle] " << msg << std::endl;
    }
}

} // namespace netoverlay
