#pragma once

#include "geometry.h"
#include <string>
#include <vector>
#include <map>

namespace netoverlay {

// ── Parsed schematic (document units: mm, KiCad orientation) ─────────

struct PinTemplate {
    std::string name;
    Point position;          // relative to symbol origin, pre-rotation, Y-up
};

struct SymbolDef {
    std::string lib_id;
    std::map<std::string, PinTemplate> pins; // keyed by pin name
};

struct PlacedInstance {
    std::string refdes;
    std::string lib_id;
    Point position;          // symbol origin on the sheet, Y-down
    double rotation = 0.0;   // degrees
};

struct RawWire {
    std::string uuid;
    Point a, b;
};

// Constructs the overlay does not support, counted so they can be reported
struct BoundaryCounts {
    int buses = 0;
    int bus_entries = 0;
    int sheets = 0;
};

struct ParsedSchematic {
    std::map<std::string, SymbolDef> symbol_defs;       // keyed by lib_id
    std::map<std::string, PlacedInstance> instances;    // keyed by refdes
    std::vector<RawWire> wires;                         // document order
    BoundaryCounts boundaries;
};

// refdes -> pin name -> absolute location
using PinLocations = std::map<std::string, std::map<std::string, Point>>;

// ── Connectivity graph (working units: inches, Y-down) ───────────────

struct GraphNode {
    std::string id;
    Point position;
    bool junction = false;
};

struct GraphSegment {
    std::string uuid;
    std::string node_a;
    std::string node_b;
};

struct NetGraph {
    std::map<std::string, GraphNode> nodes;
    std::map<std::string, GraphSegment> segments;

    bool has_node(const std::string& id) const {
        return nodes.find(id) != nodes.end();
    }

    const GraphNode* find_node(const std::string& id) const {
        auto it = nodes.find(id);
        return (it != nodes.end()) ? &it->second : nullptr;
    }

    const GraphSegment* find_segment(const std::string& uuid) const {
        auto it = segments.find(uuid);
        return (it != segments.end()) ? &it->second : nullptr;
    }
};

// ── Requested connections and their resolution ──────────────────────

struct ConnectionStyle {
    std::string base_color = "blue";
    std::string outline_color = "black";
};

struct RequestedConnection {
    std::string name;
    std::string group;           // upstream grouping key (e.g. parent cable), may be empty
    std::string from_refdes;
    std::string from_connector;
    std::string to_refdes;
    std::string to_connector;
    std::string label_a;         // text at the start of the drawn path
    std::string label_b;         // text at the end of the drawn path
    std::string label;           // text along long runs
    ConnectionStyle style;

    std::string from_node_id() const { return from_refdes + "." + from_connector; }
    std::string to_node_id() const { return to_refdes + "." + to_connector; }
    const std::string& group_key() const { return group.empty() ? name : group; }
};

enum class Direction { A_TO_B, B_TO_A };

struct PathStep {
    std::string segment;
    Direction direction = Direction::A_TO_B;
};

struct ResolvedPath {
    std::string connection;
    std::string group;           // RequestedConnection::group_key()
    std::vector<PathStep> steps;
};

// Draw space: millimetres, Y-up
struct ChainPoint {
    double x = 0.0;
    double y = 0.0;
    double tangent = 0.0;    // degrees in [0, 360)
};

using PointChain = std::vector<ChainPoint>;

// ── Per-connection failures ─────────────────────────────────────────

enum class ConnectionErrorKind { MISSING_ENDPOINT, NO_PATH, MISSING_BUNDLE_POINT };

struct ConnectionError {
    std::string connection;
    ConnectionErrorKind kind = ConnectionErrorKind::NO_PATH;
    std::string message;
};

} // namespace netoverlay
