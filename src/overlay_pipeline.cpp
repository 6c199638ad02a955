#include "overlay_pipeline.h"
#include "connection_import.h"
#include "coordinate_compiler.h"
#include "graph_export.h"
#include "graph_raster.h"
#include "kicad_sch_parser.h"
#include "net_graph.h"
#include "path_chain.h"
#include "path_resolver.h"
#include "svg_composer.h"

#include <iostream>
#include <set>

namespace netoverlay {

template <typename Stage>
static void collect(const Stage& stage, RunReport& report) {
    for (auto& w : stage.warnings()) report.diagnostics.push_back(w);
}

OverlayPipeline::OverlayPipeline(const PipelineOptions& opts)
    : opts_(opts) {}

void OverlayPipeline::extract_graph(const ParsedSchematic& sch, RunReport& report) {
    CompilerOptions copts;
    copts.verbose = opts_.verbose;
    CoordinateCompiler compiler(copts);
    PinLocations pins = normalize(compiler.compile(sch), KICAD_UNIT_SCALE);
    collect(compiler, report);

    wires_ = normalize(sch.wires, KICAD_UNIT_SCALE);

    GraphOptions gopts;
    gopts.verbose = opts_.verbose;
    GraphBuilder builder(gopts);
    graph_ = builder.build(pins, wires_);
    collect(builder, report);

    report.node_count = graph_.nodes.size();
    report.segment_count = graph_.segments.size();
}

void OverlayPipeline::route_connections(const std::vector<RequestedConnection>& connections,
                                        RunReport& report) {
    connections_ = connections;
    paths_.clear();
    drawable_.clear();
    report.connection_count = connections_.size();

    std::set<std::string> seen;
    for (auto& conn : connections_) {
        if (!seen.insert(conn.name).second) {
            report.diagnostics.push_back("Duplicate connection name '" + conn.name +
                                         "'; bundle points are shared between them");
        }
    }

    // Requests that resolved, in request order; index into connections_
    std::vector<size_t> resolved;
    PathResolver resolver(graph_);
    for (size_t i = 0; i < connections_.size(); i++) {
        auto& conn = connections_[i];
        std::string from = conn.from_node_id();
        std::string to = conn.to_node_id();

        ResolveResult r = resolver.resolve(from, to);
        if (r.status == ResolveStatus::MISSING_ENDPOINT) {
            report.errors.push_back({conn.name, ConnectionErrorKind::MISSING_ENDPOINT,
                                     "Connection '" + conn.name + "': node '" + r.missing_node +
                                     "' is not in the schematic graph"});
            continue;
        }
        if (r.status == ResolveStatus::NO_PATH) {
            report.errors.push_back({conn.name, ConnectionErrorKind::NO_PATH,
                                     "Connection '" + conn.name + "': no wire path from '" +
                                     from + "' to '" + to + "'"});
            continue;
        }

        log("Connection '" + conn.name + "': " + std::to_string(r.steps.size()) + " segments");
        paths_.push_back({conn.name, conn.group_key(), std::move(r.steps)});
        resolved.push_back(i);
    }

    BundleOptions bopts;
    bopts.verbose = opts_.verbose;
    layout_ = BundleGeometry(bopts).compute(graph_, paths_);

    ChainOptions chopts;
    chopts.verbose = opts_.verbose;
    ChainAssembler assembler(chopts);
    for (size_t k = 0; k < paths_.size(); k++) {
        auto& conn = connections_[resolved[k]];
        drawable_.push_back({&conn, assembler.assemble(paths_[k], layout_, graph_, report.errors)});
    }

    if (!report.errors.empty() && report.status == RunStatus::OK) {
        report.status = RunStatus::CONNECTION_ERRORS;
    }
}

void OverlayPipeline::write_graph_artifacts(RunReport& report) {
    if (!opts_.graph_json.empty()) {
        if (!write_graph_json_file(opts_.graph_json, graph_)) {
            report.fail("Cannot write graph JSON: " + opts_.graph_json);
            return;
        }
        log("Wrote graph JSON to " + opts_.graph_json);
    }

    if (!opts_.graph_png.empty()) {
        RasterOptions ropts;
        ropts.dpi = opts_.dpi;
        ropts.font_file = opts_.font_file;
        ropts.verbose = opts_.verbose;
        GraphRaster raster(ropts);
        bool ok = raster.write_png(opts_.graph_png, graph_);
        collect(raster, report);
        // An empty graph is only a diagnostic
        if (!ok && !graph_.nodes.empty()) {
            report.fail("Cannot write graph image: " + opts_.graph_png);
        }
    }
}

void OverlayPipeline::write_overlay(const SvgFrame& frame, RunReport& report) {
    OverlayOptions oopts;
    oopts.artifact_id = opts_.artifact_id;
    oopts.debug_bundles = opts_.debug_bundles;
    oopts.verbose = opts_.verbose;
    SvgOverlayWriter writer(oopts);

    pugi::xml_document overlay;
    writer.build(overlay, frame, wires_, drawable_, layout_);
    collect(writer, report);
    for (auto& d : drawable_) {
        if (!d.chain.empty()) report.drawn_count++;
    }

    ComposerOptions copts;
    copts.artifact_id = opts_.artifact_id;
    copts.verbose = opts_.verbose;
    SvgComposer composer(copts);
    std::string output = opts_.output_svg.empty() ? opts_.base_svg : opts_.output_svg;
    if (!composer.compose_files(opts_.base_svg, overlay, output)) {
        report.fail(composer.warnings().empty() ? "Compositing failed"
                                                : composer.warnings().back());
        return;
    }

    // Standalone copy only once the composite is on disk
    if (!opts_.overlay_svg.empty()) {
        if (!overlay.save_file(opts_.overlay_svg.c_str(), "  ")) {
            report.fail("Cannot write overlay SVG: " + opts_.overlay_svg);
            return;
        }
        log("Wrote overlay SVG to " + opts_.overlay_svg);
    }
}

RunReport OverlayPipeline::run() {
    RunReport report;

    ParserOptions popts;
    popts.verbose = opts_.verbose;
    KicadSchParser parser(popts);
    ParsedSchematic sch;
    if (!parser.parse(opts_.schematic_file, sch)) {
        report.fail(parser.warnings().empty() ? "Cannot parse " + opts_.schematic_file
                                              : parser.warnings().back());
        return report;
    }
    collect(parser, report);

    extract_graph(sch, report);

    // Every input is read before the first output is written, so a fatal
    // setup error leaves nothing behind
    bool draw = !opts_.connections_file.empty();
    std::vector<RequestedConnection> connections;
    SvgFrame frame;
    if (draw) {
        if (opts_.base_svg.empty()) {
            report.fail("A base SVG is required to draw the overlay");
            return report;
        }

        std::vector<std::string> import_errors;
        if (!read_connections_file(opts_.connections_file, connections, import_errors)) {
            report.fail(import_errors.empty() ? "Cannot read " + opts_.connections_file
                                              : import_errors.back());
            return report;
        }
        log("Read " + std::to_string(connections.size()) + " connections");

        std::string frame_error;
        if (!read_svg_frame(opts_.base_svg, frame, frame_error)) {
            report.fail(frame_error);
            return report;
        }
    } else {
        log("No connections file, overlay skipped");
    }

    if (draw) {
        route_connections(connections, report);
        write_overlay(frame, report);
        if (report.status == RunStatus::FATAL) return report;
    }

    write_graph_artifacts(report);
    return report;
}

void OverlayPipeline::log(const std::string& msg) {
    if (opts_.verbose) {
        std::cerr << "[pipeline] " << msg << std::endl;
    }
}

} // namespace netoverlay
