#include "coordinate_compiler.h"

#include <cmath>
#include <iostream>

namespace netoverlay {

CoordinateCompiler::CoordinateCompiler(const CompilerOptions& opts)
    : opts_(opts) {}

Point place_pin(const Point& pin_offset, const PlacedInstance& inst) {
    Point rotated = rotate_point(pin_offset, inst.rotation);
    // Flip only here; flipping before the rotation mirrors rotated symbols
    return {inst.position.x + rotated.x, inst.position.y - rotated.y};
}

PinLocations CoordinateCompiler::compile(const std::map<std::string, SymbolDef>& symbol_defs,
                                         const std::map<std::string, PlacedInstance>& instances) {
    PinLocations out;
    for (auto& [refdes, inst] : instances) {
        auto def_it = symbol_defs.find(inst.lib_id);
        if (def_it == symbol_defs.end()) {
            warn("No pin data found for lib_id '" + inst.lib_id + "' (used by " + refdes + ")");
            continue;
        }

        auto& pins = out[refdes];
        for (auto& [name, tpl] : def_it->second.pins) {
            pins[name] = place_pin(tpl.position, inst);
        }
    }

    log("Compiled pin locations for " + std::to_string(out.size()) + " instances");
    return out;
}

double normalize_value(double value, double scale) {
    double snapped = std::round(value * 10.0) / 10.0;
    return round_to(snapped * scale, OUTPUT_PRECISION);
}

Point normalize_point(const Point& pt, double scale) {
    return {normalize_value(pt.x, scale), normalize_value(pt.y, scale)};
}

void CoordinateCompiler::log(const std::string& msg) {
    if (opts_.verbose) {
        std::cerr << "[compile] " << msg << std::endl;
    }
}

void CoordinateCompiler::warn(const std::string& msg) {
    warnings_.push_back(msg);
    std::cerr << "[WARNING] " << msg << std::endl;
}

} // namespace netoverlay
