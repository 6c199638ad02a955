#pragma once

#include "schematic_model.h"
#include <string>
#include <string_view>
#include <vector>

namespace netoverlay {

struct ParserOptions {
    bool verbose = false;
};

// Pattern-based reader for .kicad_sch documents. Recovers library pin
// templates, placed symbol instances and two-point wires; everything else
// in the document is ignored. Single sheet only: buses, bus entries and
// hierarchical sheets are counted and reported, never followed.
class KicadSchParser {
public:
    explicit KicadSchParser(const ParserOptions& opts = {});

    // Parse a .kicad_sch file. Returns false if the file is missing,
    // unreadable or not a schematic.
    bool parse(const std::string& filename, ParsedSchematic& out);

    // Parse schematic text already in memory.
    bool parse_text(const std::string& text, ParsedSchematic& out);

    // Get any parse errors/warnings
    const std::vector<std::string>& warnings() const { return warnings_; }

private:
    ParserOptions opts_;
    std::vector<std::string> warnings_;

    // Independent scanners over the root block
    void parse_lib_symbols(std::string_view root, ParsedSchematic& out);
    void parse_instances(std::string_view root, ParsedSchematic& out);
    void parse_wires(std::string_view root, ParsedSchematic& out);
    void scan_boundaries(std::string_view root, ParsedSchematic& out);

    void parse_symbol_def(std::string_view block, SymbolDef& def);

    void log(const std::string& msg);
    void warn(const std::string& msg);
};

} // namespace netoverlay
