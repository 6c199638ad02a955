#include "utils.h"
#include <cmath>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <iomanip>

namespace netoverlay {

double parse_double(const std::string& str, double default_val) {
    if (str.empty()) return default_val;
    try {
        size_t used = 0;
        double v = std::stod(str, &used);
        if (used != str.size()) return default_val;
        return v;
    } catch (const std::exception&) {
        return default_val;
    }
}

int parse_int(const std::string& str, int default_val) {
    if (str.empty()) return default_val;
    try {
        size_t used = 0;
        int v = std::stoi(str, &used);
        if (used != str.size()) return default_val;
        return v;
    } catch (const std::exception&) {
        return default_val;
    }
}

std::string fmt(double val) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(6) << val;
    std::string s = oss.str();
    // Trim trailing zeros after decimal point
    if (s.find('.') != std::string::npos) {
        size_t last_nonzero = s.find_last_not_of('0');
        if (last_nonzero != std::string::npos && s[last_nonzero] == '.') {
            s.erase(last_nonzero); // remove the dot too
        } else {
            s.erase(last_nonzero + 1);
        }
    }
    // Avoid "-0"
    if (s == "-0") s = "0";
    return s;
}

std::string fmt_fixed(double val, int decimals) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(decimals) << val;
    std::string s = oss.str();
    // "-0.000" -> "0.000"
    if (s[0] == '-' && s.find_first_not_of("-0.") == std::string::npos) {
        s.erase(0, 1);
    }
    return s;
}

double round_to(double val, int decimals) {
    double factor = std::pow(10.0, decimals);
    double r = std::round(val * factor) / factor;
    return r == 0.0 ? 0.0 : r; // drop negative zero
}

bool read_file(const std::string& filename, std::string& content) {
    std::ifstream in(filename, std::ios::binary);
    if (!in.is_open()) return false;
    std::ostringstream ss;
    ss << in.rdbuf();
    content = ss.str();
    return true;
}

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::string json_quote(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 2);
    out += '"';
    for (char c : s) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            case '\t': out += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", (unsigned char)c);
                    out += buf;
                } else {
                    out += c;
                }
        }
    }
    out += '"';
    return out;
}

} // namespace netoverlay
