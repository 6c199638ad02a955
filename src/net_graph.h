#pragma once

#include "schematic_model.h"
#include <string>
#include <utility>
#include <vector>

namespace netoverlay {

// Two points are the same node iff they round to the same multiple of this
// (working units). Must stay above the coordinate compiler's rounding noise.
constexpr double NODE_TOLERANCE = 0.01;

constexpr const char* JUNCTION_PREFIX = "wirejunction-";

struct GraphOptions {
    bool verbose = false;
    double tolerance = NODE_TOLERANCE;
};

// Merges coincident pin and wire endpoints into nodes and wires into
// segments. Pins are registered before wires, so a wire end landing on a pin
// attaches to the pin node. Junction ids are numbered per build() call and
// are not stable across runs.
class GraphBuilder {
public:
    explicit GraphBuilder(const GraphOptions& opts = {});

    NetGraph build(const PinLocations& pins, const std::vector<RawWire>& wires);

    const std::vector<std::string>& warnings() const { return warnings_; }

private:
    using LocationKey = std::pair<long long, long long>;

    GraphOptions opts_;
    std::vector<std::string> warnings_;

    LocationKey location_key(const Point& pt) const;

    void log(const std::string& msg);
    void warn(const std::string& msg);
};

} // namespace netoverlay
