#pragma once

#include "schematic_model.h"
#include <istream>
#include <string>
#include <vector>

namespace netoverlay {

// Read requested connections: either a top-level array or an object with a
// "connections" array. Returns false on a JSON syntax error or a record
// missing name/from/to; the reason is appended to errors.
bool read_connections(std::istream& in, std::vector<RequestedConnection>& out,
                      std::vector<std::string>& errors);

// Convenience: read from a JSON string.
bool read_connections(const std::string& json_text, std::vector<RequestedConnection>& out,
                      std::vector<std::string>& errors);

// Read from a file. A missing file is reported like a parse error.
bool read_connections_file(const std::string& filename, std::vector<RequestedConnection>& out,
                           std::vector<std::string>& errors);

} // namespace netoverlay
