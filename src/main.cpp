//
//  main.cpp
//  AtomCarve
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include "atomcarve.hpp"
#include "atomcarve_version.hpp"
#include "batch_runner.hpp"
#include "config.hpp"
#include "logging.hpp"
#include "report_json.hpp"
#include <nlohmann/json.hpp>

namespace {

void print_usage() {
    std::cerr << "AtomCarve " << ATOMCARVE_VERSION_DISPLAY << "\n"
              << "Copyright (c) 2026 Till Toenshoff\n\n"
              << "Fixes Canon CR3 files in batch mode by calculating their true size via atom\n"
              << "parsing and carving the correct data.\n\n"
              << "usage:\n"
              << "  atomcarve --input-dir DIR --output-dir DIR [--lastchunk NAME]\n"
              << "            [--endianness big|little] [--start-offset N] [--config FILE]\n"
              << "            [--json] [--log-level LEVEL] [-v|--verbose]\n"
              << "Options:\n"
              << "  --input-dir DIR     Directory containing the files to be fixed.\n"
              << "  --output-dir DIR    Directory where fixed files are saved (created if missing).\n"
              << "  --lastchunk NAME    Last atom to include (default 'mdat').\n"
              << "  --endianness E      Byte order of atom size fields (default big).\n"
              << "  --start-offset N    Byte offset of the container within each input (default 0).\n"
              << "  --config FILE       JSON config; command-line flags take precedence.\n"
              << "  --json              Write a JSON report of the batch to stdout.\n"
              << "  --log-level LEVEL   error|warn|info|debug (default: info).\n"
              << "  -v, --verbose       Same as --log-level debug.\n"
              << "  --version           Print version and exit.\n";
}

int usage_error(const std::string &msg) {
    std::cerr << "Error: " << msg << "\n\n";
    print_usage();
    return 2;
}

}  // namespace

int main(int argc, char **argv) {
    if (argc == 2 && std::string(argv[1]) == "--version") {
        std::cout << "AtomCarve " << ATOMCARVE_VERSION_DISPLAY << "\n";
        return 0;
    }
    if (argc < 2) {
        print_usage();
        return 2;
    }

    std::vector<std::string> args(argv + 1, argv + argc);
    atomcarve::BatchConfig config;

    // Config file first so that any flag can override it.
    for (size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "--config") {
            if (i + 1 >= args.size()) {
                return usage_error("--config needs a value");
            }
            auto st = atomcarve::load_config_json(args[i + 1], config);
            if (!st.ok) {
                return usage_error(st.message);
            }
        }
    }

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string &arg = args[i];
        const bool has_value = i + 1 < args.size();
        if (arg == "--config") {
            ++i;
        } else if (arg == "--input-dir" && has_value) {
            config.input_dir = args[++i];
        } else if (arg == "--output-dir" && has_value) {
            config.output_dir = args[++i];
        } else if (arg == "--lastchunk" && has_value) {
            auto st = atomcarve::set_termination_tag(config, args[++i]);
            if (!st.ok) {
                return usage_error(st.message);
            }
        } else if (arg == "--endianness" && has_value) {
            if (!atomcarve::parse_endianness(args[++i], config.carve.endianness)) {
                return usage_error("--endianness must be 'big' or 'little'");
            }
        } else if (arg == "--start-offset" && has_value) {
            auto st = atomcarve::set_start_offset(config, args[++i]);
            if (!st.ok) {
                return usage_error(st.message);
            }
        } else if (arg == "--log-level" && has_value) {
            if (!atomcarve::parse_log_verbosity(args[++i], config.log_level)) {
                return usage_error("unknown log level: " + args[i]);
            }
        } else if (arg == "-v" || arg == "--verbose") {
            config.log_level = atomcarve::LogVerbosity::Debug;
        } else if (arg == "--json") {
            config.json_report = true;
        } else if (arg == "-h" || arg == "--help") {
            print_usage();
            return 0;
        } else {
            return usage_error("unknown or incomplete option: " + arg);
        }
    }

    auto st = atomcarve::validate_config(config);
    if (!st.ok) {
        return usage_error(st.message);
    }

    atomcarve::Logger logger(config.log_level);
    AC_LOG(logger, "info", "--- AtomCarve " << ATOMCARVE_VERSION_DISPLAY << " (batch mode) ---");
    AC_LOG(logger, "debug", "lastchunk='" << atomcarve::fourcc_display(config.carve.termination_tag)
                                          << "' endianness="
                                          << atomcarve::endianness_name(config.carve.endianness)
                                          << " start_offset=" << config.carve.start_offset);

    const auto report = atomcarve::run_batch(config, logger);
    if (config.json_report) {
        std::cout << atomcarve::to_json(report).dump(2) << "\n";
    }
    if (!report.ok) {
        return 1;
    }
    AC_LOG(logger, "info", "--- AtomCarve complete ---");
    return 0;
}
