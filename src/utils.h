#pragma once

#include <string>
#include <sstream>
#include <iomanip>
#include <algorithm>

namespace netoverlay {

// Millimetres per inch; KiCad schematics store coordinates in mm
constexpr double MM_PER_INCH = 25.4;

// Parse a numeric field, returning default if missing/invalid
double parse_double(const std::string& str, double default_val = 0.0);
int parse_int(const std::string& str, int default_val = 0);

// Format a double for output (6 decimal places, trailing zeros trimmed)
std::string fmt(double val);

// Format with a fixed number of decimals (SVG attribute values)
std::string fmt_fixed(double val, int decimals = 3);

// Round to a number of decimal digits
double round_to(double val, int decimals);

// Read a whole file into a string. Returns false if it cannot be opened.
bool read_file(const std::string& filename, std::string& content);

// Trim whitespace
std::string trim(const std::string& s);

// Escape a string for JSON output (with surrounding quotes)
std::string json_quote(const std::string& s);

} // namespace netoverlay
