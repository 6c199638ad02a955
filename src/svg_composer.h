#pragma once

#include "svg_overlay_writer.h"
#include "pugixml.hpp"
#include <string>
#include <vector>

namespace netoverlay {

struct ComposerOptions {
    std::string artifact_id = "kicad_sch_parser";
    bool verbose = false;
};

// Frame attributes of an SVG file's root element. Returns false if the file
// is missing, is not XML, or has no <svg> root.
bool read_svg_frame(const std::string& filename, SvgFrame& frame, std::string& error);

// Places overlay contents into the base rendering. The overlay's start group
// children replace the base's existing start group, so compositing twice
// yields one overlay; a base without the group gets the start and end groups
// appended as the last children of its root.
class SvgComposer {
public:
    explicit SvgComposer(const ComposerOptions& opts = {});

    // In-memory form. Fails on a frame mismatch or a missing root/group.
    bool compose(pugi::xml_document& base, const pugi::xml_document& overlay);

    // Load base_file, compose, save to output_file (may equal base_file).
    bool compose_files(const std::string& base_file, const pugi::xml_document& overlay,
                       const std::string& output_file);

    const std::vector<std::string>& warnings() const { return warnings_; }

private:
    ComposerOptions opts_;
    std::vector<std::string> warnings_;

    void log(const std::string& msg);
    void warn(const std::string& msg);
};

} // namespace netoverlay
