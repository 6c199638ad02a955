#include "svg_overlay_writer.h"
#include "utils.h"

#include <cmath>
#include <iostream>
#include <sstream>

namespace netoverlay {

std::string start_group_id(const std::string& artifact_id) {
    return artifact_id + "-net-overlay-contents-start";
}

std::string end_group_id(const std::string& artifact_id) {
    return artifact_id + "-net-overlay-contents-end";
}

static std::string svg_xy(const Point& draw_pt) {
    return fmt_fixed(draw_pt.x) + "," + fmt_fixed(-draw_pt.y);
}

std::string chain_path_data(const PointChain& chain) {
    if (chain.empty()) return "";

    std::ostringstream d;
    d << "M" << svg_xy({chain[0].x, chain[0].y});
    for (size_t i = 1; i < chain.size(); i++) {
        auto& p0 = chain[i - 1];
        auto& p1 = chain[i];
        double reach = distance({p0.x, p0.y}, {p1.x, p1.y}) / 3.0;

        Point c1 = Point(p0.x, p0.y) + point_on_circle({}, reach, p0.tangent);
        Point c2 = Point(p1.x, p1.y) - point_on_circle({}, reach, p1.tangent);
        d << " C" << svg_xy(c1) << " " << svg_xy(c2) << " " << svg_xy({p1.x, p1.y});
    }
    return d.str();
}

double upright_angle(double tangent_deg) {
    double angle = normalize_degrees(tangent_deg);
    if (angle > 90.0 && angle < 270.0) {
        angle = normalize_degrees(angle + 180.0);
    }
    return angle;
}

// Characters, not bytes: UTF-8 continuation bytes are not counted
static size_t char_count(const std::string& text) {
    size_t n = 0;
    for (unsigned char c : text) {
        if ((c & 0xC0) != 0x80) n++;
    }
    return n;
}

double label_box_width(const std::string& text, double font_mm) {
    return (char_count(text) * 1.2 * font_mm + 0.6) * 1.75;
}

double label_box_height(double font_mm) {
    return 4.0 * font_mm;
}

SvgOverlayWriter::SvgOverlayWriter(const OverlayOptions& opts)
    : opts_(opts) {}

void SvgOverlayWriter::build(pugi::xml_document& doc, const SvgFrame& frame,
                             const std::vector<RawWire>& wires,
                             const std::vector<OverlayConnection>& connections,
                             const BundleLayout& layout) {
    doc.reset();
    auto decl = doc.append_child(pugi::node_declaration);
    decl.append_attribute("version") = "1.0";
    decl.append_attribute("encoding") = "UTF-8";

    auto svg = doc.append_child("svg");
    svg.append_attribute("xmlns") = "http://www.w3.org/2000/svg";
    svg.append_attribute("stroke-linecap") = "round";
    svg.append_attribute("stroke-linejoin") = "round";
    if (!frame.view_box.empty()) svg.append_attribute("viewBox") = frame.view_box.c_str();
    if (!frame.width.empty())    svg.append_attribute("width") = frame.width.c_str();
    if (!frame.height.empty())   svg.append_attribute("height") = frame.height.c_str();

    auto contents = svg.append_child("g");
    contents.append_attribute("id") = start_group_id(opts_.artifact_id).c_str();

    add_wire_masks(contents, wires);
    if (opts_.debug_bundles) {
        add_debug_layer(contents, layout);
    }

    int drawn = 0;
    for (auto& oc : connections) {
        if (!oc.connection) continue;
        auto& conn = *oc.connection;
        if (oc.chain.empty()) {
            warn("Empty chain for connection '" + conn.name + "', nothing drawn");
            continue;
        }

        add_styled_path(contents, oc.chain, conn.style);

        add_label(contents, oc.chain.front(), conn.label_a, true);
        add_label(contents, oc.chain.back(), conn.label_b, true);

        for (size_t i = 0; i + 1 < oc.chain.size(); i++) {
            auto& a = oc.chain[i];
            auto& b = oc.chain[i + 1];
            if (distance({a.x, a.y}, {b.x, b.y}) < opts_.min_center_label_mm) continue;
            ChainPoint mid{(a.x + b.x) / 2.0, (a.y + b.y) / 2.0, a.tangent};
            add_label(contents, mid, conn.label, false);
        }
        drawn++;
    }

    auto end = svg.append_child("g");
    end.append_attribute("id") = end_group_id(opts_.artifact_id).c_str();

    log("Drew " + std::to_string(drawn) + " connections over " +
        std::to_string(wires.size()) + " masked wires");
}

void SvgOverlayWriter::add_wire_masks(pugi::xml_node& parent, const std::vector<RawWire>& wires) {
    for (auto& wire : wires) {
        auto corners = oriented_rect(wire.a * MM_PER_INCH, wire.b * MM_PER_INCH,
                                     opts_.mask_width_mm, opts_.mask_width_mm);
        std::string points;
        for (auto& c : corners) {
            if (!points.empty()) points += " ";
            points += fmt_fixed(c.x) + "," + fmt_fixed(c.y);
        }

        auto poly = parent.append_child("polygon");
        poly.append_attribute("points") = points.c_str();
        poly.append_attribute("fill") = PAGE_COLOR;
        poly.append_attribute("stroke") = "none";
    }
}

void SvgOverlayWriter::add_debug_layer(pugi::xml_node& parent, const BundleLayout& layout) {
    for (auto& [id, node] : layout.nodes) {
        auto circle = parent.append_child("circle");
        circle.append_attribute("cx") = fmt_fixed(node.center.x).c_str();
        circle.append_attribute("cy") = fmt_fixed(node.center.y).c_str();
        circle.append_attribute("r") = fmt_fixed(node.radius).c_str();
        circle.append_attribute("fill") = "gray";
        circle.append_attribute("opacity") = "0.5";
    }
    for (auto& [key, pt] : layout.points) {
        auto dot = parent.append_child("circle");
        dot.append_attribute("cx") = fmt_fixed(pt.x).c_str();
        dot.append_attribute("cy") = fmt_fixed(-pt.y).c_str();
        dot.append_attribute("r") = "0.8";
        dot.append_attribute("fill") = "red";
    }
}

void SvgOverlayWriter::add_styled_path(pugi::xml_node& parent, const PointChain& chain,
                                       const ConnectionStyle& style) {
    std::string d = chain_path_data(chain);

    // Outline first so the base stroke sits on top of it
    struct Layer { const std::string* color; double width; };
    for (auto layer : {Layer{&style.outline_color, opts_.outline_stroke_mm},
                       Layer{&style.base_color, opts_.base_stroke_mm}}) {
        auto path = parent.append_child("path");
        path.append_attribute("d") = d.c_str();
        path.append_attribute("fill") = "none";
        path.append_attribute("stroke") = layer.color->c_str();
        path.append_attribute("stroke-width") = fmt_fixed(layer.width).c_str();
    }
}

void SvgOverlayWriter::add_label(pugi::xml_node& parent, const ChainPoint& at,
                                 const std::string& text, bool inverted) {
    std::string shown = trim(text).empty() ? "?" : text;
    double font = opts_.label_font_mm;
    double width = label_box_width(shown, font);
    double height = label_box_height(font);
    double angle = upright_angle(at.tangent);

    // End labels: white on black. Center labels: black on white, thin border.
    const char* fill = inverted ? "black" : "white";
    const char* text_color = inverted ? "white" : "black";
    const char* border_width = inverted ? "0.2" : "0.05";

    auto group = parent.append_child("g");
    std::string transform = "translate(" + svg_xy({at.x, at.y}) + ") rotate(" +
                            fmt_fixed(-angle) + ")";
    group.append_attribute("transform") = transform.c_str();

    auto rect = group.append_child("rect");
    rect.append_attribute("x") = fmt_fixed(-width / 2.0).c_str();
    rect.append_attribute("y") = fmt_fixed(-height / 2.0).c_str();
    rect.append_attribute("width") = fmt_fixed(width).c_str();
    rect.append_attribute("height") = fmt_fixed(height).c_str();
    rect.append_attribute("fill") = fill;
    rect.append_attribute("stroke") = "black";
    rect.append_attribute("stroke-width") = border_width;

    auto label = group.append_child("text");
    label.append_attribute("x") = "0";
    label.append_attribute("y") = "0";
    label.append_attribute("text-anchor") = "middle";
    std::string style = std::string("fill:") + text_color +
                        ";dominant-baseline:middle;font-family:Arial, Helvetica, sans-serif;"
                        "font-size:" + fmt(font) + "mm";
    label.append_attribute("style") = style.c_str();
    label.text().set(shown.c_str());
}

void SvgOverlayWriter::log(const std::string& msg) {
    if (opts_.verbose) {
        std::cerr << "[overlay] " << msg << std::endl;
    }
}

void SvgOverlayWriter::warn(const std::string& msg) {
    warnings_.push_back(msg);
    std::cerr << "[WARNING] " << msg << std::endl;
}

} // namespace netoverlay
