#include "connection_import.h"

#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace netoverlay {

// ── helpers ─────────────────────────────────────────────────────────

static std::string string_field(const json& j, const char* key) {
    if (!j.contains(key) || !j[key].is_string()) return "";
    return j[key].get<std::string>();
}

// {"refdes": ..., "connector": ...}; both members required
static bool read_endpoint(const json& j, std::string& refdes, std::string& connector) {
    if (!j.is_object()) return false;
    refdes = string_field(j, "refdes");
    connector = string_field(j, "connector");
    return !refdes.empty() && !connector.empty();
}

static ConnectionStyle read_style(const json& j) {
    ConnectionStyle style;
    if (!j.contains("style") || !j["style"].is_object()) return style;
    auto& sj = j["style"];
    style.base_color    = sj.value("base_color", style.base_color);
    style.outline_color = sj.value("outline_color", style.outline_color);
    return style;
}

static bool read_record(const json& cj, size_t index, RequestedConnection& conn,
                        std::vector<std::string>& errors) {
    std::string where = "Connection record #" + std::to_string(index);
    if (!cj.is_object()) {
        errors.push_back(where + " is not an object");
        return false;
    }

    conn.name = string_field(cj, "name");
    if (conn.name.empty()) {
        errors.push_back(where + " has no name");
        return false;
    }
    where += " ('" + conn.name + "')";

    if (!cj.contains("from") || !read_endpoint(cj["from"], conn.from_refdes, conn.from_connector)) {
        errors.push_back(where + " has no valid 'from' endpoint");
        return false;
    }
    if (!cj.contains("to") || !read_endpoint(cj["to"], conn.to_refdes, conn.to_connector)) {
        errors.push_back(where + " has no valid 'to' endpoint");
        return false;
    }

    conn.group   = string_field(cj, "group");
    conn.label_a = string_field(cj, "label_a");
    conn.label_b = string_field(cj, "label_b");
    conn.label   = string_field(cj, "label");
    conn.style   = read_style(cj);
    return true;
}

// ── public API ──────────────────────────────────────────────────────

bool read_connections(std::istream& in, std::vector<RequestedConnection>& out,
                      std::vector<std::string>& errors) {
    try {
        json j = json::parse(in);

        const json* records = &j;
        if (j.is_object()) {
            if (!j.contains("connections") || !j["connections"].is_array()) {
                errors.push_back("Connections JSON object has no 'connections' array");
                return false;
            }
            records = &j["connections"];
        } else if (!j.is_array()) {
            errors.push_back("Connections JSON must be an array or an object");
            return false;
        }

        std::vector<RequestedConnection> parsed;
        for (size_t i = 0; i < records->size(); i++) {
            RequestedConnection conn;
            if (!read_record((*records)[i], i, conn, errors)) return false;
            parsed.push_back(std::move(conn));
        }

        out.insert(out.end(), parsed.begin(), parsed.end());
        return true;
    } catch (const json::exception& e) {
        errors.push_back(std::string("JSON parse error: ") + e.what());
        return false;
    }
}

bool read_connections(const std::string& json_text, std::vector<RequestedConnection>& out,
                      std::vector<std::string>& errors) {
    std::istringstream iss(json_text);
    return read_connections(iss, out, errors);
}

bool read_connections_file(const std::string& filename, std::vector<RequestedConnection>& out,
                           std::vector<std::string>& errors) {
    std::ifstream in(filename);
    if (!in.is_open()) {
        errors.push_back("Cannot open connections file: " + filename);
        return false;
    }
    return read_connections(in, out, errors);
}

} // namespace netoverlay
