#pragma once

#include "bundle_geometry.h"
#include "schematic_model.h"
#include <string>
#include <vector>

namespace netoverlay {

struct ChainOptions {
    bool verbose = false;
};

// Turns a resolved path into the ordered points the renderer draws through.
// Each traversed segment contributes its bundle point at the entry node and
// at the exit node, both carrying the segment's draw-space tangent.
class ChainAssembler {
public:
    explicit ChainAssembler(const ChainOptions& opts = {});

    // Missing bundle points are appended to errors; the chain holds the
    // points that exist.
    PointChain assemble(const ResolvedPath& path, const BundleLayout& layout,
                        const NetGraph& graph, std::vector<ConnectionError>& errors);

private:
    ChainOptions opts_;

    void log(const std::string& msg);
};

// Draw-space tangent of a segment traversed A->B, in [0, 360)
double segment_tangent(const GraphSegment& seg, const NetGraph& graph);

} // namespace netoverlay
