#pragma once

#include "schematic_model.h"
#include <ostream>
#include <string>

namespace netoverlay {

// Serialize the connectivity graph: node positions and segment end nodes,
// both keyed and ordered by id, 2-space indented.
void write_graph_json(std::ostream& out, const NetGraph& graph);

// Write to a file, or to stdout when filename is "-". Returns false if the
// file cannot be opened.
bool write_graph_json_file(const std::string& filename, const NetGraph& graph);

} // namespace netoverlay
