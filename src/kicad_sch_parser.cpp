#include "kicad_sch_parser.h"
#include "sexpr_scan.h"
#include "utils.h"

#include <iostream>
#include <regex>

namespace netoverlay {

// Signed decimal as KiCad writes it
static const std::string NUM_RE = "([-+]?[0-9]*\\.?[0-9]+(?:[eE][-+]?[0-9]+)?)";
// Quoted string with backslash escapes
static const std::string STR_RE = "\"((?:[^\"\\\\]|\\\\.)*)\"";

static bool regex_match_block(std::string_view block, const std::regex& re, std::cmatch& m) {
    return std::regex_search(block.data(), block.data() + block.size(), m, re);
}

static std::string unescape(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); i++) {
        if (s[i] == '\\' && i + 1 < s.size()) {
            char n = s[++i];
            if (n == 'n') out += '\n';
            else out += n;
        } else {
            out += s[i];
        }
    }
    return out;
}

// "(at X Y [ANGLE])"
static bool parse_at(std::string_view block, Point& pos, double& angle) {
    static const std::regex re("^\\(at\\s+" + NUM_RE + "\\s+" + NUM_RE + "(?:\\s+" + NUM_RE + ")?");
    std::cmatch m;
    if (block.empty() || !regex_match_block(block, re, m)) return false;
    pos.x = parse_double(m[1].str());
    pos.y = parse_double(m[2].str());
    angle = m[3].matched ? parse_double(m[3].str()) : 0.0;
    return true;
}

// First quoted argument: (name "X" ...), (lib_id "X"), (symbol "X" ...)
static bool quoted_arg(std::string_view block, std::string& value) {
    static const std::regex re("^\\(\\s*[^\\s()]+\\s+" + STR_RE);
    std::cmatch m;
    if (block.empty() || !regex_match_block(block, re, m)) return false;
    value = unescape(m[1].str());
    return true;
}

KicadSchParser::KicadSchParser(const ParserOptions& opts)
    : opts_(opts) {}

bool KicadSchParser::parse(const std::string& filename, ParsedSchematic& out) {
    std::string text;
    if (!read_file(filename, text)) {
        warn("Schematic not found or unreadable: " + filename);
        return false;
    }
    log("Read " + std::to_string(text.size()) + " bytes from " + filename);
    return parse_text(text, out);
}

bool KicadSchParser::parse_text(const std::string& text, ParsedSchematic& out) {
    std::string_view doc(text);

    size_t open = doc.find('(');
    if (open == std::string_view::npos || block_head(doc.substr(open)) != "kicad_sch") {
        warn("Not a KiCad schematic: missing (kicad_sch ...) root");
        return false;
    }

    size_t close = find_block_end(doc, open);
    std::string_view root;
    if (close == std::string_view::npos) {
        // Tolerate truncated files: scan whatever complete blocks exist
        warn("Unbalanced parentheses in schematic; reading complete blocks only");
        root = doc.substr(open);
    } else {
        root = doc.substr(open, close - open + 1);
    }

    parse_lib_symbols(root, out);
    parse_instances(root, out);
    parse_wires(root, out);
    scan_boundaries(root, out);

    log("Parse complete: " + std::to_string(out.symbol_defs.size()) + " library symbols, " +
        std::to_string(out.instances.size()) + " instances, " +
        std::to_string(out.wires.size()) + " wires");
    return true;
}

// --- Library symbols ---

void KicadSchParser::parse_lib_symbols(std::string_view root, ParsedSchematic& out) {
    std::string_view lib = first_child(root, "lib_symbols");
    if (lib.empty()) {
        log("No lib_symbols section found");
        return;
    }

    for (auto block : child_blocks(lib, "symbol")) {
        SymbolDef def;
        if (!quoted_arg(block, def.lib_id)) {
            warn("Skipping library symbol without a name");
            continue;
        }
        parse_symbol_def(block, def);
        log("Symbol " + def.lib_id + ": " + std::to_string(def.pins.size()) + " pins");
        out.symbol_defs[def.lib_id] = std::move(def);
    }
}

void KicadSchParser::parse_symbol_def(std::string_view block, SymbolDef& def) {
    // Pins live in the unit sub-symbols ("NAME_0_1", "NAME_1_1", ...)
    for (auto pin : descendant_blocks(block, "pin")) {
        PinTemplate tpl;
        double angle = 0.0;
        if (!parse_at(first_child(pin, "at"), tpl.position, angle)) {
            warn("Pin without location in symbol " + def.lib_id);
            continue;
        }

        quoted_arg(first_child(pin, "name"), tpl.name);
        if (tpl.name.empty() || tpl.name == "~") {
            // Unnamed pin: fall back to its number
            quoted_arg(first_child(pin, "number"), tpl.name);
        }
        if (tpl.name.empty()) {
            warn("Pin without name or number in symbol " + def.lib_id);
            continue;
        }

        def.pins[tpl.name] = tpl;
    }
}

// --- Placed instances ---

void KicadSchParser::parse_instances(std::string_view root, ParsedSchematic& out) {
    static const std::regex ref_re("^\\(property\\s+\"Reference\"\\s+" + STR_RE);

    for (auto block : child_blocks(root, "symbol")) {
        PlacedInstance inst;
        if (!quoted_arg(first_child(block, "lib_id"), inst.lib_id)) continue;

        if (!parse_at(first_child(block, "at"), inst.position, inst.rotation)) {
            warn("Symbol instance of " + inst.lib_id + " has no placement; skipped");
            continue;
        }

        for (auto prop : child_blocks(block, "property")) {
            std::cmatch m;
            if (regex_match_block(prop, ref_re, m)) {
                inst.refdes = unescape(m[1].str());
                break;
            }
        }
        if (inst.refdes.empty()) {
            log("Symbol instance of " + inst.lib_id + " has no Reference; skipped");
            continue;
        }

        if (!first_child(block, "mirror").empty()) {
            warn("Symbol " + inst.refdes + " is mirrored; mirroring is not applied to pin locations");
        }

        if (out.instances.count(inst.refdes)) {
            warn("Duplicate reference designator " + inst.refdes + "; later placement replaces earlier one");
        }
        out.instances[inst.refdes] = inst;
    }
}

// --- Wires ---

void KicadSchParser::parse_wires(std::string_view root, ParsedSchematic& out) {
    static const std::regex xy_re("^\\(xy\\s+" + NUM_RE + "\\s+" + NUM_RE);
    static const std::regex uuid_re("^\\(uuid\\s+\"?([^\"\\s()]+)\"?");

    int index = 0;
    for (auto block : child_blocks(root, "wire")) {
        int this_index = index++;
        auto pts = child_blocks(first_child(block, "pts"), "xy");
        if (pts.size() != 2) {
            warn("Wire #" + std::to_string(this_index) + " has " + std::to_string(pts.size()) +
                 " points; only two-point wires are supported, skipped");
            continue;
        }

        RawWire wire;
        std::cmatch ma, mb;
        if (!regex_match_block(pts[0], xy_re, ma) || !regex_match_block(pts[1], xy_re, mb)) {
            warn("Wire #" + std::to_string(this_index) + " has malformed coordinates, skipped");
            continue;
        }
        wire.a = {parse_double(ma[1].str()), parse_double(ma[2].str())};
        wire.b = {parse_double(mb[1].str()), parse_double(mb[2].str())};

        std::cmatch m;

        std::string_view uuid_block = first_child(block, "uuid");
        if (!uuid_block.empty() && regex_match_block(uuid_block, uuid_re, m)) {
            wire.uuid = m[1].str();
        } else {
            wire.uuid = "wire-" + std::to_string(this_index);
            warn("Wire #" + std::to_string(this_index) + " has no uuid; using " + wire.uuid);
        }

        out.wires.push_back(wire);
    }
}

// --- Unsupported constructs ---

void KicadSchParser::scan_boundaries(std::string_view root, ParsedSchematic& out) {
    out.boundaries.buses = static_cast<int>(child_blocks(root, "bus").size());
    out.boundaries.bus_entries = static_cast<int>(child_blocks(root, "bus_entry").size());
    out.boundaries.sheets = static_cast<int>(child_blocks(root, "sheet").size());

    if (out.boundaries.buses > 0) {
        warn("Schematic contains " + std::to_string(out.boundaries.buses) +
             " bus segment(s); buses are not supported and were ignored");
    }
    if (out.boundaries.bus_entries > 0) {
        warn("Schematic contains " + std::to_string(out.boundaries.bus_entries) +
             " bus entry(ies); buses are not supported and were ignored");
    }
    if (out.boundaries.sheets > 0) {
        warn("Schematic contains " + std::to_string(out.boundaries.sheets) +
             " hierarchical sheet(s); only the top sheet is read");
    }
}

void KicadSchParser::log(const std::string& msg) {
    if (opts_.verbose) {
        std::cerr << "[kicad_sch] " << msg << std::endl;
    }
}

void KicadSchParser::warn(const std::string& msg) {
    warnings_.push_back(msg);
    std::cerr << "[WARNING] " << msg << std::endl;
}

} // namespace netoverlay
