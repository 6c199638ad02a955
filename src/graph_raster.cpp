#include "graph_raster.h"

#include <blend2d.h>
#include <algorithm>
#include <cmath>
#include <iostream>

namespace netoverlay {

namespace {

const BLRgba32 WHITE(0xFFFFFFFFu);
const BLRgba32 BLACK(0xFF000000u);
const BLRgba32 BLUE(0xFF0000FFu);
const BLRgba32 RED(0xFFFF0000u);
const BLRgba32 DARK_RED(0xFF8B0000u);

// Sizes in inches
constexpr double PIN_RADIUS_IN = 0.033;
constexpr double NODE_FONT_IN = 0.05;
constexpr double WIRE_FONT_IN = 0.05 / 3.0;
constexpr double ARROW_LENGTH_IN = 0.067;
constexpr double LINE_WIDTH_IN = 0.02;
constexpr double LABEL_OFFSET_IN = 0.075;
constexpr double ARROW_HALF_ANGLE_DEG = 25.0;

bool load_face(const std::string& preferred, BLFontFace& face, std::string& loaded) {
    std::vector<std::string> candidates;
    if (!preferred.empty()) candidates.push_back(preferred);
    for (const char* f : {"/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf",
                          "/usr/share/fonts/TTF/DejaVuSans.ttf",
                          "/usr/share/fonts/dejavu/DejaVuSans.ttf",
                          "/usr/share/fonts/truetype/liberation/LiberationSans-Regular.ttf",
                          "/System/Library/Fonts/Supplemental/Arial.ttf",
                          "C:/Windows/Fonts/arial.ttf"}) {
        candidates.push_back(f);
    }

    for (auto& path : candidates) {
        if (face.createFromFile(path.c_str()) == BL_SUCCESS && face.isValid()) {
            loaded = path;
            return true;
        }
    }
    return false;
}

double text_width(const BLFont& font, const std::string& text) {
    BLGlyphBuffer gb;
    gb.setUtf8Text(text.c_str(), text.size());
    BLTextMetrics tm;
    if (font.shape(gb) != BL_SUCCESS || font.getTextMetrics(gb, tm) != BL_SUCCESS) {
        return 0.0;
    }
    return tm.boundingBox.x1 - tm.boundingBox.x0;
}

// Text centred horizontally on x, vertically on y
void draw_centered(BLContext& ctx, const BLFont& font, double x, double y,
                   const std::string& text, const BLRgba32& color) {
    double w = text_width(font, text);
    ctx.setFillStyle(color);
    ctx.fillUtf8Text(BLPoint(x - w / 2.0, y + font.size() / 3.0), font, text.c_str());
}

// Text starting at x, vertically centred on y
void draw_left(BLContext& ctx, const BLFont& font, double x, double y,
               const std::string& text, const BLRgba32& color) {
    ctx.setFillStyle(color);
    ctx.fillUtf8Text(BLPoint(x, y + font.size() / 3.0), font, text.c_str());
}

void draw_arrowhead(BLContext& ctx, const BLPoint& from, const BLPoint& tip, double length) {
    double angle = std::atan2(tip.y - from.y, tip.x - from.x);
    double spread = deg_to_rad(ARROW_HALF_ANGLE_DEG);

    BLPath path;
    path.moveTo(tip.x, tip.y);
    path.lineTo(tip.x - length * std::cos(angle - spread), tip.y - length * std::sin(angle - spread));
    path.lineTo(tip.x - length * std::cos(angle + spread), tip.y - length * std::sin(angle + spread));
    path.close();

    ctx.setFillStyle(BLUE);
    ctx.fillPath(path);
}

void draw_node(BLContext& ctx, double x, double y, double radius, double line_width) {
    ctx.setFillStyle(RED);
    ctx.fillCircle(x, y, radius);
    ctx.setStrokeStyle(DARK_RED);
    ctx.setStrokeWidth(line_width);
    ctx.strokeCircle(x, y, radius);
}

} // namespace

GraphRaster::GraphRaster(const RasterOptions& opts)
    : opts_(opts) {}

bool GraphRaster::write_png(const std::string& filename, const NetGraph& graph) {
    if (graph.nodes.empty()) {
        warn("No nodes to draw, graph image not written");
        return false;
    }

    const double dpi = opts_.dpi;
    int width = static_cast<int>(opts_.sheet_width_in * dpi);
    int height = static_cast<int>(opts_.sheet_height_in * dpi);
    double margin = opts_.margin_in * dpi;
    double pin_radius = PIN_RADIUS_IN * dpi;
    double arrow_length = ARROW_LENGTH_IN * dpi;
    double line_width = std::max(1.0, LINE_WIDTH_IN * dpi);
    double label_offset = LABEL_OFFSET_IN * dpi;

    auto map_xy = [&](const Point& p) {
        return BLPoint(p.x * dpi + margin, p.y * dpi + margin);
    };

    BLImage img(width, height, BL_FORMAT_PRGB32);
    BLContext ctx(img);
    ctx.setCompOp(BL_COMP_OP_SRC_COPY);
    ctx.setFillStyle(WHITE);
    ctx.fillAll();
    ctx.setCompOp(BL_COMP_OP_SRC_OVER);

    BLFontFace face;
    std::string face_path;
    bool have_text = load_face(opts_.font_file, face, face_path);
    BLFont node_font, wire_font;
    if (have_text) {
        node_font.createFromFace(face, static_cast<float>(NODE_FONT_IN * dpi));
        wire_font.createFromFace(face, static_cast<float>(WIRE_FONT_IN * dpi));
        log("Using font " + face_path);
    } else {
        warn("No usable font found, graph image labels omitted");
    }

    for (auto& [uuid, seg] : graph.segments) {
        const GraphNode* a = graph.find_node(seg.node_a);
        const GraphNode* b = graph.find_node(seg.node_b);
        if (!a || !b) continue;

        BLPoint p1 = map_xy(a->position);
        BLPoint p2 = map_xy(b->position);
        ctx.setStrokeStyle(BLACK);
        ctx.setStrokeWidth(line_width);
        ctx.strokeLine(p1.x, p1.y, p2.x, p2.y);
        if (p1.x != p2.x || p1.y != p2.y) {
            draw_arrowhead(ctx, p1, p2, arrow_length);
        }

        if (have_text) {
            draw_centered(ctx, wire_font, (p1.x + p2.x) / 2.0, (p1.y + p2.y) / 2.0 - label_offset,
                          uuid, BLUE);
        }
    }

    for (auto& [id, node] : graph.nodes) {
        BLPoint c = map_xy(node.position);
        draw_node(ctx, c.x, c.y, pin_radius, line_width);
        if (have_text) {
            draw_centered(ctx, node_font, c.x, c.y - label_offset, id, BLACK);
        }
    }

    // Legend along the bottom edge
    double legend_y = height - 0.4 * dpi;
    double node_x = margin + 0.15 * dpi;
    draw_node(ctx, node_x, legend_y, pin_radius, line_width);

    double wire_start = margin + 3.5 * dpi;
    double wire_end = wire_start + 0.5 * dpi;
    ctx.setStrokeStyle(BLACK);
    ctx.setStrokeWidth(line_width);
    ctx.strokeLine(wire_start, legend_y, wire_end, legend_y);
    draw_arrowhead(ctx, BLPoint(wire_start, legend_y), BLPoint(wire_end, legend_y), arrow_length);

    if (have_text) {
        draw_left(ctx, node_font, node_x + 0.2 * dpi, legend_y,
                  "= Node (identified by label)", BLACK);
        draw_left(ctx, node_font, wire_end + 0.2 * dpi, legend_y,
                  "= Wire (arrow points from End A to End B)", BLACK);
    }

    ctx.end();

    BLResult err = img.writeToFile(filename.c_str());
    if (err != BL_SUCCESS) {
        warn("Cannot write graph image '" + filename + "' (Blend2D error " +
             std::to_string(err) + ")");
        return false;
    }

    log("Wrote " + filename + " (" + std::to_string(width) + "x" + std::to_string(height) +
        " px, " + std::to_string(graph.nodes.size()) + " nodes, " +
        std::to_string(graph.segments.size()) + " segments)");
    return true;
}

void GraphRaster::log(const std::string& msg) {
    if (opts_.verbose) {
        std::cerr << "[raster] " << msg << std::endl;
    }
}

void GraphRaster::warn(const std::string& msg) {
    warnings_.push_back(msg);
    std::cerr << "[WARNING] " << msg << std::endl;
}

} // namespace netoverlay
