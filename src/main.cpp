#include "overlay_pipeline.h"
#include "utils.h"

#include <iostream>
#include <string>

static void print_help() {
    std::cout << "Usage: kicad-net-overlay [options] <schematic.kicad_sch>\n"
              << "\n"
              << "Extract the wire graph of a KiCad schematic and draw requested\n"
              << "connections over the schematic's SVG export.\n"
              << "\n"
              << "Options:\n"
              << "  -c, --connections <file>  Requested connections JSON (required for overlay)\n"
              << "  -b, --base-svg <file>     KiCad SVG export to composite onto\n"
              << "  -o, --output <file>       Composited SVG (default: overwrite --base-svg)\n"
              << "  --overlay-svg <file>      Also write the standalone overlay SVG\n"
              << "  --graph-json <file>       Write graph JSON (\"-\" for stdout)\n"
              << "  --graph-png <file>        Write raster debug image of the graph\n"
              << "  --dpi <n>                 Raster DPI (default: 300)\n"
              << "  --font <file>             TrueType font for raster labels\n"
              << "  --artifact-id <id>        Overlay group id prefix (default: kicad_sch_parser)\n"
              << "  --debug-bundles           Draw bundle circles and points in the overlay\n"
              << "  --verbose                 Verbose output during processing\n"
              << "  -h, --help                Show help\n";
}

static const char* error_kind_str(netoverlay::ConnectionErrorKind kind) {
    switch (kind) {
        case netoverlay::ConnectionErrorKind::MISSING_ENDPOINT:     return "missing endpoint";
        case netoverlay::ConnectionErrorKind::NO_PATH:              return "no path";
        case netoverlay::ConnectionErrorKind::MISSING_BUNDLE_POINT: return "missing bundle point";
    }
    return "error";
}

int main(int argc, char* argv[]) {
    netoverlay::PipelineOptions opts;

    // Options taking a value
    auto take_value = [&](int& i, const std::string& arg, std::string& dest) {
        if (i + 1 >= argc) {
            std::cerr << "Error: " << arg << " requires an argument\n";
            return false;
        }
        dest = argv[++i];
        return true;
    };

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            print_help();
            return 0;
        } else if (arg == "-c" || arg == "--connections") {
            if (!take_value(i, arg, opts.connections_file)) return 1;
        } else if (arg == "-b" || arg == "--base-svg") {
            if (!take_value(i, arg, opts.base_svg)) return 1;
        } else if (arg == "-o" || arg == "--output") {
            if (!take_value(i, arg, opts.output_svg)) return 1;
        } else if (arg == "--overlay-svg") {
            if (!take_value(i, arg, opts.overlay_svg)) return 1;
        } else if (arg == "--graph-json") {
            if (!take_value(i, arg, opts.graph_json)) return 1;
        } else if (arg == "--graph-png") {
            if (!take_value(i, arg, opts.graph_png)) return 1;
        } else if (arg == "--dpi") {
            std::string value;
            if (!take_value(i, arg, value)) return 1;
            opts.dpi = netoverlay::parse_int(value, 0);
            if (opts.dpi <= 0) {
                std::cerr << "Error: --dpi must be a positive integer\n";
                return 1;
            }
        } else if (arg == "--font") {
            if (!take_value(i, arg, opts.font_file)) return 1;
        } else if (arg == "--artifact-id") {
            if (!take_value(i, arg, opts.artifact_id)) return 1;
        } else if (arg == "--debug-bundles") {
            opts.debug_bundles = true;
        } else if (arg == "--verbose") {
            opts.verbose = true;
        } else if (arg[0] == '-' && arg != "-") {
            std::cerr << "Error: unknown option '" << arg << "'\n";
            print_help();
            return 1;
        } else {
            opts.schematic_file = arg;
        }
    }

    if (opts.schematic_file.empty()) {
        std::cerr << "Error: no schematic file specified\n";
        print_help();
        return 1;
    }

    if (!opts.connections_file.empty() && opts.base_svg.empty()) {
        std::cerr << "Error: --connections requires --base-svg\n";
        return 1;
    }

    netoverlay::OverlayPipeline pipeline(opts);
    netoverlay::RunReport report = pipeline.run();

    if (report.status == netoverlay::RunStatus::FATAL) {
        std::cerr << "Error: " << report.fatal_error << "\n";
        return report.exit_code();
    }

    for (auto& e : report.errors) {
        std::cerr << "Error (" << error_kind_str(e.kind) << "): " << e.message << "\n";
    }

    // Graph JSON may own stdout
    std::ostream& summary = (opts.graph_json == "-") ? std::cerr : std::cout;
    summary << "Processed " << opts.schematic_file << "\n";
    summary << "  Nodes: " << report.node_count << "\n";
    summary << "  Segments: " << report.segment_count << "\n";
    if (!opts.connections_file.empty()) {
        std::string output = opts.output_svg.empty() ? opts.base_svg : opts.output_svg;
        summary << "  Connections: " << report.connection_count
                << " (" << report.drawn_count << " drawn)\n";
        summary << "  Errors: " << report.errors.size() << "\n";
        summary << "  Overlay: " << output << "\n";
    }
    if (!report.diagnostics.empty()) {
        summary << "  Warnings: " << report.diagnostics.size() << "\n";
    }

    return report.exit_code();
}
