#include "graph_export.h"
#include "utils.h"

#include <fstream>
#include <iostream>

namespace netoverlay {

static void write_nodes(std::ostream& out, const NetGraph& graph) {
    out << "  \"nodes\": {";
    bool first = true;
    for (auto& [id, node] : graph.nodes) {
        out << (first ? "\n" : ",\n");
        first = false;
        out << "    " << json_quote(id) << ": {\"x\": " << fmt(node.position.x)
            << ", \"y\": " << fmt(node.position.y) << "}";
    }
    out << (first ? "}" : "\n  }");
}

static void write_segments(std::ostream& out, const NetGraph& graph) {
    out << "  \"segments\": {";
    bool first = true;
    for (auto& [uuid, seg] : graph.segments) {
        out << (first ? "\n" : ",\n");
        first = false;
        out << "    " << json_quote(uuid)
            << ": {\"node_at_end_a\": " << json_quote(seg.node_a)
            << ", \"node_at_end_b\": " << json_quote(seg.node_b) << "}";
    }
    out << (first ? "}" : "\n  }");
}

void write_graph_json(std::ostream& out, const NetGraph& graph) {
    out << "{\n";
    write_nodes(out, graph);
    out << ",\n";
    write_segments(out, graph);
    out << "\n}\n";
}

bool write_graph_json_file(const std::string& filename, const NetGraph& graph) {
    if (filename == "-") {
        write_graph_json(std::cout, graph);
        return true;
    }

    std::ofstream out(filename);
    if (!out.is_open()) return false;
    write_graph_json(out, graph);
    return out.good();
}

} // namespace netoverlay
