#pragma once

#include "schematic_model.h"
#include "utils.h"
#include <string>
#include <vector>

namespace netoverlay {

// Document millimetres -> working inches
constexpr double KICAD_UNIT_SCALE = 1.0 / MM_PER_INCH;

// Decimal digits kept after unit conversion
constexpr int OUTPUT_PRECISION = 5;

struct CompilerOptions {
    bool verbose = false;
};

class CoordinateCompiler {
public:
    explicit CoordinateCompiler(const CompilerOptions& opts = {});

    // Absolute location of every pin of every placed instance, in document
    // units. Instances whose symbol has no pin data are skipped with a warning.
    PinLocations compile(const std::map<std::string, SymbolDef>& symbol_defs,
                         const std::map<std::string, PlacedInstance>& instances);

    PinLocations compile(const ParsedSchematic& sch) {
        return compile(sch.symbol_defs, sch.instances);
    }

    const std::vector<std::string>& warnings() const { return warnings_; }

private:
    CompilerOptions opts_;
    std::vector<std::string> warnings_;

    void log(const std::string& msg);
    void warn(const std::string& msg);
};

// Pin offset -> sheet location. Rotation first, then translation with the
// vertical flip: symbol definitions are Y-up, the sheet is Y-down.
Point place_pin(const Point& pin_offset, const PlacedInstance& inst);

// Snap to 0.1 document unit, scale, round to OUTPUT_PRECISION
double normalize_value(double value, double scale);
Point normalize_point(const Point& pt, double scale);

// ── Coordinate-bearing members of every record type ──────────────────
// Each overload lists the Point members of one type; transforms go through
// these so no coordinate field is missed. Angles are not coordinates.

template <typename Fn>
void visit_coordinates(PinTemplate& pin, Fn& fn) { fn(pin.position); }

template <typename Fn>
void visit_coordinates(SymbolDef& def, Fn& fn) {
    for (auto& [name, pin] : def.pins) visit_coordinates(pin, fn);
}

template <typename Fn>
void visit_coordinates(PlacedInstance& inst, Fn& fn) { fn(inst.position); }

template <typename Fn>
void visit_coordinates(RawWire& wire, Fn& fn) {
    fn(wire.a);
    fn(wire.b);
}

template <typename Fn>
void visit_coordinates(std::vector<RawWire>& wires, Fn& fn) {
    for (auto& w : wires) visit_coordinates(w, fn);
}

template <typename Fn>
void visit_coordinates(PinLocations& pins, Fn& fn) {
    for (auto& [refdes, by_name] : pins) {
        for (auto& [name, pt] : by_name) fn(pt);
    }
}

template <typename Fn>
void visit_coordinates(ParsedSchematic& sch, Fn& fn) {
    for (auto& [id, def] : sch.symbol_defs) visit_coordinates(def, fn);
    for (auto& [refdes, inst] : sch.instances) visit_coordinates(inst, fn);
    visit_coordinates(sch.wires, fn);
}

// Returns a normalized copy of any coordinate-bearing value
template <typename T>
T normalize(T value, double scale) {
    auto fn = [scale](Point& pt) { pt = normalize_point(pt, scale); };
    visit_coordinates(value, fn);
    return value;
}

} // namespace netoverlay
