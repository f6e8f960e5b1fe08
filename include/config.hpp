//
//  config.hpp
//  AtomCarve
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <filesystem>
#include <string>

#include "atomcarve.hpp"
#include "logging.hpp"

namespace atomcarve {

/**
 * @brief Everything a batch run needs.
 *
 * Populated from defaults, then an optional JSON config file, then command-line flags.
 * JSON keys: `input_dir`, `output_dir`, `last_chunk`, `endianness` ("big"|"little"),
 * `start_offset`, `log_level`.
 */
struct BatchConfig {
    std::filesystem::path input_dir;
    std::filesystem::path output_dir;
    CarveOptions carve;
    LogVerbosity log_level = LogVerbosity::Info;
    bool json_report = false;
};

struct ConfigStatus {
    bool ok{false};
    std::string message;
};

bool parse_endianness(const std::string &name, Endianness &out);
const char *endianness_name(Endianness endianness);

// Set the termination tag from a user string; it must be exactly four bytes.
ConfigStatus set_termination_tag(BatchConfig &config, const std::string &name);

// Set the start offset from a user string: plain decimal digits only, no larger than the
// largest stream offset.
ConfigStatus set_start_offset(BatchConfig &config, const std::string &value);

// Overlay keys present in the JSON file at `path` onto `config`.
ConfigStatus load_config_json(const std::filesystem::path &path, BatchConfig &config);

// Same as load_config_json, for an in-memory document.
ConfigStatus apply_config_json(const std::string &text, BatchConfig &config);

// Required fields present and consistent.
ConfigStatus validate_config(const BatchConfig &config);

}  // namespace atomcarve
