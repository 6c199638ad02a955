#include "svg_composer.h"

#include <cstring>
#include <iostream>

namespace netoverlay {

static SvgFrame frame_of(const pugi::xml_node& svg) {
    SvgFrame frame;
    frame.view_box = svg.attribute("viewBox").as_string();
    frame.width = svg.attribute("width").as_string();
    frame.height = svg.attribute("height").as_string();
    return frame;
}

static std::string describe(const SvgFrame& f) {
    return "viewBox=\"" + f.view_box + "\" width=\"" + f.width + "\" height=\"" + f.height + "\"";
}

static pugi::xml_node find_by_id(const pugi::xml_node& root, const std::string& id) {
    return root.find_node([&id](const pugi::xml_node& n) {
        return std::strcmp(n.attribute("id").value(), id.c_str()) == 0;
    });
}

bool read_svg_frame(const std::string& filename, SvgFrame& frame, std::string& error) {
    pugi::xml_document doc;
    pugi::xml_parse_result result = doc.load_file(filename.c_str());
    if (!result) {
        error = "Failed to read SVG '" + filename + "': " + result.description();
        return false;
    }
    auto svg = doc.child("svg");
    if (!svg) {
        error = "Not an SVG document (no <svg> root): " + filename;
        return false;
    }
    frame = frame_of(svg);
    return true;
}

SvgComposer::SvgComposer(const ComposerOptions& opts)
    : opts_(opts) {}

bool SvgComposer::compose(pugi::xml_document& base, const pugi::xml_document& overlay) {
    auto base_svg = base.child("svg");
    if (!base_svg) {
        warn("Base rendering has no <svg> root element");
        return false;
    }
    auto overlay_svg = overlay.child("svg");
    if (!overlay_svg) {
        warn("Overlay has no <svg> root element");
        return false;
    }

    SvgFrame base_frame = frame_of(base_svg);
    SvgFrame overlay_frame = frame_of(overlay_svg);
    if (base_frame != overlay_frame) {
        warn("SVG frame mismatch: base has " + describe(base_frame) +
             ", overlay has " + describe(overlay_frame));
        return false;
    }

    std::string start_id = start_group_id(opts_.artifact_id);
    std::string end_id = end_group_id(opts_.artifact_id);

    auto source = find_by_id(overlay_svg, start_id);
    if (!source) {
        warn("Overlay has no group '" + start_id + "'");
        return false;
    }

    auto target = find_by_id(base_svg, start_id);
    if (target) {
        while (target.first_child()) {
            target.remove_child(target.first_child());
        }
        log("Replacing existing overlay group '" + start_id + "'");
    } else {
        target = base_svg.append_child("g");
        target.append_attribute("id") = start_id.c_str();
        auto end = base_svg.append_child("g");
        end.append_attribute("id") = end_id.c_str();
        log("Appending overlay groups to base rendering");
    }

    for (auto child : source.children()) {
        target.append_copy(child);
    }
    return true;
}

bool SvgComposer::compose_files(const std::string& base_file, const pugi::xml_document& overlay,
                                const std::string& output_file) {
    pugi::xml_document base;
    pugi::xml_parse_result result = base.load_file(base_file.c_str());
    if (!result) {
        warn("Failed to read base SVG '" + base_file + "': " + result.description());
        return false;
    }

    if (!compose(base, overlay)) return false;

    if (!base.save_file(output_file.c_str(), "  ")) {
        warn("Cannot write composited SVG: " + output_file);
        return false;
    }
    log("Wrote " + output_file);
    return true;
}

void SvgComposer::log(const std::string& msg) {
    if (opts_.verbose) {
        std::cerr << "[compose] " << msg << std::endl;
    }
}

void SvgComposer::warn(const std::string& msg) {
    warnings_.push_back(msg);
    std::cerr << "[WARNING] " << msg << std::endl;
}

} // namespace netoverlay
