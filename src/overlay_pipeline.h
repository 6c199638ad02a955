#pragma once

#include "bundle_geometry.h"
#include "schematic_model.h"
#include "svg_overlay_writer.h"
#include <string>
#include <vector>

namespace netoverlay {

struct PipelineOptions {
    std::string schematic_file;
    std::string connections_file;    // empty: graph artifacts only
    std::string base_svg;            // required with connections_file
    std::string output_svg;          // empty: overwrite base_svg
    std::string overlay_svg;         // optional standalone overlay
    std::string graph_json;          // optional, "-" for stdout
    std::string graph_png;           // optional
    int dpi = 300;
    std::string font_file;           // raster label font, tried before the system fallbacks
    std::string artifact_id = "kicad_sch_parser";
    bool debug_bundles = false;
    bool verbose = false;
};

enum class RunStatus { OK, FATAL, CONNECTION_ERRORS };

struct RunReport {
    RunStatus status = RunStatus::OK;
    std::string fatal_error;
    std::vector<ConnectionError> errors;     // per connection, run continues
    std::vector<std::string> diagnostics;    // degenerate but valid input

    size_t node_count = 0;
    size_t segment_count = 0;
    size_t connection_count = 0;
    size_t drawn_count = 0;

    void fail(const std::string& msg) {
        status = RunStatus::FATAL;
        fatal_error = msg;
    }

    // 0 success, 1 fatal, 2 per-connection errors
    int exit_code() const {
        switch (status) {
            case RunStatus::OK:                return 0;
            case RunStatus::FATAL:             return 1;
            case RunStatus::CONNECTION_ERRORS: return 2;
        }
        return 1;
    }
};

// parse -> compile -> build graph -> resolve -> bundle -> chain -> render.
// All inputs are read before any output is written.
// The stage methods are public so a caller holding in-memory inputs can
// drive them without files.
class OverlayPipeline {
public:
    explicit OverlayPipeline(const PipelineOptions& opts);

    // drawable() points into the pipeline's own connection list
    OverlayPipeline(const OverlayPipeline&) = delete;
    OverlayPipeline& operator=(const OverlayPipeline&) = delete;

    // Full run from the files named in the options
    RunReport run();

    // Compile pins, normalize coordinates to working units, build the graph
    void extract_graph(const ParsedSchematic& sch, RunReport& report);

    // Resolve every connection, lay out bundles, assemble chains. Failures
    // are recorded per connection in the report.
    void route_connections(const std::vector<RequestedConnection>& connections,
                           RunReport& report);

    const NetGraph& graph() const { return graph_; }
    const std::vector<RawWire>& wires() const { return wires_; }
    const std::vector<ResolvedPath>& paths() const { return paths_; }
    const BundleLayout& layout() const { return layout_; }
    const std::vector<OverlayConnection>& drawable() const { return drawable_; }

private:
    PipelineOptions opts_;

    NetGraph graph_;
    std::vector<RawWire> wires_;                   // working units
    std::vector<RequestedConnection> connections_;
    std::vector<ResolvedPath> paths_;
    BundleLayout layout_;
    std::vector<OverlayConnection> drawable_;

    void write_graph_artifacts(RunReport& report);
    void write_overlay(const SvgFrame& frame, RunReport& report);

    void log(const std::string& msg);
};

} // namespace netoverlay
