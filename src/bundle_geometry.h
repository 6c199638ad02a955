#pragma once

#include "schematic_model.h"
#include "utils.h"
#include <map>
#include <string>
#include <tuple>
#include <vector>

namespace netoverlay {

// Distance between neighbouring lines of a bundle: 0.05 in
constexpr double SEGMENT_SPACING_MM = 0.05 * MM_PER_INCH;

// Bundle radius grows with component count to this power
constexpr double BUNDLE_EXPONENT = 0.7;

struct BundleKey {
    std::string node;
    std::string segment;
    std::string connection;

    bool operator<(const BundleKey& o) const {
        return std::tie(node, segment, connection) < std::tie(o.node, o.segment, o.connection);
    }
};

struct BundleNode {
    Point center;         // sheet orientation (Y-down), mm
    double radius = 0.0;  // mm
    int components = 0;
};

struct BundleLayout {
    std::map<BundleKey, Point> points;         // draw space (Y-up), mm
    std::map<std::string, BundleNode> nodes;   // only nodes with traffic
    int point_count = 0;
    int skipped_nodes = 0;                     // no connection passes through

    const Point* find(const std::string& node, const std::string& segment,
                      const std::string& connection) const {
        auto it = points.find({node, segment, connection});
        return (it != points.end()) ? &it->second : nullptr;
    }
};

struct BundleOptions {
    double spacing_mm = SEGMENT_SPACING_MM;
    bool verbose = false;
};

double bundle_radius(int components, double spacing_mm);

// Places every connection passing through a node on that node's perimeter
// circle, fanned out around each segment's direction so parallel runs do
// not overlap. Output depends only on the graph and the set of paths.
class BundleGeometry {
public:
    explicit BundleGeometry(const BundleOptions& opts = {});

    BundleLayout compute(const NetGraph& graph, const std::vector<ResolvedPath>& paths);

private:
    BundleOptions opts_;

    void log(const std::string& msg);
};

} // namespace netoverlay
