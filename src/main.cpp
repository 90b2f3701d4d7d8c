#include "errors.h"
#include "json_io.h"
#include "netlist_xml.h"
#include "project_sync.h"
#include "reconciler.h"
#include "sync_report.h"

#include <iostream>
#include <fstream>
#include <string>
#include <algorithm>

static void print_help() {
    std::cout << "Usage: schsync [options] <target>\n"
              << "\n"
              << "Re-synchronize an existing schematic with a regenerated circuit while\n"
              << "keeping placement, wiring, labels and annotations made in the editor.\n"
              << "\n"
              << "Supported target formats:\n"
              << "  .json               Circuit compiler output (components + sheets)\n"
              << "  .xml, .net          KiCad XML netlist\n"
              << "\n"
              << "Options:\n"
              << "  -d, --destination <file>  Destination snapshots (.json) of the existing schematic\n"
              << "  -o, --output <file>       Write the merge plan as JSON ('-' for stdout)\n"
              << "  --apply <file>            Write the merged destination snapshots as JSON\n"
              << "  --remove-unmatched        Remove destination components the target no longer has\n"
              << "  --mode <m>                Matching mode: auto, identity, topology (default: auto)\n"
              << "  --max-iterations <n>      Canonical refinement bound (default: 4)\n"
              << "  --local-power-nets        Scope power nets like any other net\n"
              << "  --details                 List every change in the summary\n"
              << "  --verbose                 Verbose output during reconciliation\n"
              << "  -h, --help                Show help\n";
}

enum class InputFormat { JSON, NETLIST, UNKNOWN };

static bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

static InputFormat detect_format(const std::string& path) {
    std::string lower_path = path;
    std::transform(lower_path.begin(), lower_path.end(), lower_path.begin(), ::tolower);

    if (ends_with(lower_path, ".json")) return InputFormat::JSON;
    if (ends_with(lower_path, ".xml") || ends_with(lower_path, ".net")) return InputFormat::NETLIST;
    return InputFormat::UNKNOWN;
}

static bool read_target(const std::string& path, InputFormat format, bool verbose,
                        schsync::TargetCircuit& target) {
    if (format == InputFormat::NETLIST) {
        schsync::NetlistReaderOptions opts;
        opts.verbose = verbose;
        schsync::NetlistXmlReader reader(opts);
        if (!reader.read(path, target)) {
            std::cerr << "Error: failed to read netlist " << path << "\n";
            for (auto& w : reader.warnings()) {
                std::cerr << "  " << w << "\n";
            }
            return false;
        }
        return true;
    }

    std::ifstream in(path);
    if (!in.is_open()) {
        std::cerr << "Error: cannot open " << path << "\n";
        return false;
    }
    if (!schsync::read_target_json(in, target)) {
        std::cerr << "Error: failed to parse JSON from " << path << "\n";
        return false;
    }
    return true;
}

int main(int argc, char* argv[]) {
    std::string input_file;
    std::string destination_file;
    std::string output_file;
    std::string apply_file;
    bool details = false;
    schsync::SyncOptions opts;

    // Parse arguments
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            print_help();
            return 0;
        } else if (arg == "-d" || arg == "--destination") {
            if (i + 1 >= argc) {
                std::cerr << "Error: -d requires an argument\n";
                return 1;
            }
            destination_file = argv[++i];
        } else if (arg == "-o" || arg == "--output") {
            if (i + 1 >= argc) {
                std::cerr << "Error: -o requires an argument\n";
                return 1;
            }
            output_file = argv[++i];
        } else if (arg == "--apply") {
            if (i + 1 >= argc) {
                std::cerr << "Error: --apply requires an argument\n";
                return 1;
            }
            apply_file = argv[++i];
        } else if (arg == "--remove-unmatched") {
            opts.preserve_unmatched_destination = false;
        } else if (arg == "--mode") {
            if (i + 1 >= argc || !schsync::parse_match_mode(argv[i + 1], opts.mode)) {
                std::cerr << "Error: --mode requires auto, identity or topology\n";
                return 1;
            }
            ++i;
        } else if (arg == "--max-iterations") {
            if (i + 1 >= argc) {
                std::cerr << "Error: --max-iterations requires an argument\n";
                return 1;
            }
            try {
                opts.max_refinement_iterations = std::stoi(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "Error: --max-iterations must be a number\n";
                return 1;
            }
            if (opts.max_refinement_iterations < 1) {
                std::cerr << "Error: --max-iterations must be at least 1\n";
                return 1;
            }
        } else if (arg == "--local-power-nets") {
            opts.power_nets_global = false;
        } else if (arg == "--details") {
            details = true;
        } else if (arg == "--verbose") {
            opts.verbose = true;
        } else if (arg[0] == '-' && arg != "-") {
            std::cerr << "Error: unknown option '" << arg << "'\n";
            print_help();
            return 1;
        } else {
            input_file = arg;
        }
    }

    if (input_file.empty()) {
        std::cerr << "Error: no target file specified\n";
        print_help();
        return 1;
    }

    InputFormat format = detect_format(input_file);
    if (format == InputFormat::UNKNOWN) {
        std::cerr << "Error: cannot determine input format for '" << input_file << "'\n";
        std::cerr << "  Supported: .json (circuit compiler), .xml, .net (KiCad netlist)\n";
        return 1;
    }

    schsync::ProjectInput input;
    if (!read_target(input_file, format, opts.verbose, input.target)) {
        return 1;
    }

    if (!destination_file.empty()) {
        std::ifstream in(destination_file);
        if (!in.is_open()) {
            std::cerr << "Error: cannot open " << destination_file << "\n";
            return 1;
        }
        if (!schsync::read_snapshots_json(in, input.destinations)) {
            std::cerr << "Error: failed to parse JSON from " << destination_file << "\n";
            return 1;
        }
    } else if (opts.verbose) {
        std::cerr << "No destination given, generating every sheet from scratch\n";
    }

    schsync::ProjectSynchronizer synchronizer(opts);
    schsync::ProjectReport report;
    bool structural = false;
    try {
        synchronizer.sync(input, report);
    } catch (const schsync::StructuralError& e) {
        structural = true;
        std::cerr << "Error: malformed sheet hierarchy: " << e.what() << "\n";
    }

    schsync::print_report(std::cout, report, details);

    if (!output_file.empty()) {
        if (output_file == "-") {
            schsync::write_plan_json(std::cout, report);
        } else {
            std::ofstream out(output_file);
            if (!out.is_open()) {
                std::cerr << "Error: cannot write " << output_file << "\n";
                return 1;
            }
            schsync::write_plan_json(out, report);
        }
    }

    if (!apply_file.empty()) {
        schsync::SnapshotMap merged;
        for (auto& s : report.sheets) {
            if (!s.ok()) {
                // Leave failed sheets exactly as they were
                auto it = input.destinations.find(s.sheet);
                if (it != input.destinations.end()) merged.emplace(s.sheet, it->second);
                continue;
            }
            schsync::SchematicSnapshot base;
            base.sheet_name = s.sheet;
            auto it = input.destinations.find(s.sheet);
            if (it != input.destinations.end()) base = it->second;
            merged.emplace(s.sheet, schsync::apply_merge_plan(base, s.plan));
        }

        std::ofstream out(apply_file);
        if (!out.is_open()) {
            std::cerr << "Error: cannot write " << apply_file << "\n";
            return 1;
        }
        schsync::write_snapshots_json(out, merged);
    }

    if (structural) return 2;
    return report.has_errors() ? 1 : 0;
}
