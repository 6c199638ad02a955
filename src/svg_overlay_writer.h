#pragma once

#include "bundle_geometry.h"
#include "schematic_model.h"
#include "pugixml.hpp"
#include <string>
#include <vector>

namespace netoverlay {

// Page color of KiCad's SVG export; wire masks are filled with it
constexpr const char* PAGE_COLOR = "#F5F4EF";

// Outer size attributes of an SVG document. Overlay and base rendering
// must agree on all three exactly.
struct SvgFrame {
    std::string view_box;
    std::string width;
    std::string height;

    bool operator==(const SvgFrame& o) const {
        return view_box == o.view_box && width == o.width && height == o.height;
    }
    bool operator!=(const SvgFrame& o) const { return !(*this == o); }
};

struct OverlayOptions {
    std::string artifact_id = "kicad_sch_parser";
    bool debug_bundles = false;         // gray bundle circles, red bundle points
    double base_stroke_mm = 0.3;
    double outline_stroke_mm = 0.5;
    double label_font_mm = 0.2;
    double min_center_label_mm = 30.0;  // shorter runs get no center label
    double mask_width_mm = 1.0;
    bool verbose = false;
};

// One connection ready to draw
struct OverlayConnection {
    const RequestedConnection* connection = nullptr;
    PointChain chain;
};

std::string start_group_id(const std::string& artifact_id);
std::string end_group_id(const std::string& artifact_id);

// Path data for a chain: cubic Bezier between consecutive points with
// control points along each point's tangent at a third of the chord.
// Input is draw space (Y-up); output is SVG space (Y-down).
std::string chain_path_data(const PointChain& chain);

// Text rotation that keeps labels upright: (90, 270) turns by 180
double upright_angle(double tangent_deg);

// Label box width/height in mm for the given UTF-8 text and font size
double label_box_width(const std::string& text, double font_mm);
double label_box_height(double font_mm);

class SvgOverlayWriter {
public:
    explicit SvgOverlayWriter(const OverlayOptions& opts = {});

    // Build the overlay document. wires are in working units (inches,
    // sheet orientation) and are masked before any connection is drawn.
    void build(pugi::xml_document& doc, const SvgFrame& frame,
               const std::vector<RawWire>& wires,
               const std::vector<OverlayConnection>& connections,
               const BundleLayout& layout);

    const std::vector<std::string>& warnings() const { return warnings_; }

private:
    OverlayOptions opts_;
    std::vector<std::string> warnings_;

    void add_wire_masks(pugi::xml_node& parent, const std::vector<RawWire>& wires);
    void add_debug_layer(pugi::xml_node& parent, const BundleLayout& layout);
    void add_styled_path(pugi::xml_node& parent, const PointChain& chain,
                         const ConnectionStyle& style);
    void add_label(pugi::xml_node& parent, const ChainPoint& at, const std::string& text,
                   bool inverted);

    void log(const std::string& msg);
    void warn(const std::string& msg);
};

} // namespace netoverlay
