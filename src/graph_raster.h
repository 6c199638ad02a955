#pragma once

#include "schematic_model.h"
#include <string>
#include <vector>

namespace netoverlay {

struct RasterOptions {
    int dpi = 300;
    double sheet_width_in = 11.0;    // letter, landscape
    double sheet_height_in = 8.5;
    double margin_in = 0.5;
    std::string font_file;           // tried before the built-in fallback list
    bool verbose = false;
};

// Debug picture of the raw graph: segments as black lines with a blue
// arrowhead at end B and their uuid at the midpoint, nodes as red dots with
// their id above, and a legend. Node positions are working units (inches)
// mapped 1:1 onto the sheet.
class GraphRaster {
public:
    explicit GraphRaster(const RasterOptions& opts = {});

    // Returns false if the graph is empty or the PNG cannot be written.
    // A missing font is only a warning; the image is drawn without text.
    bool write_png(const std::string& filename, const NetGraph& graph);

    const std::vector<std::string>& warnings() const { return warnings_; }

private:
    RasterOptions opts_;
    std::vector<std::string> warnings_;

    void log(const std::string& msg);
    void warn(const std::string& msg);
};

} // namespace netoverlay
