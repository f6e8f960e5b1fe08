//
//  atomcarve.hpp
//  AtomCarve
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

#include "atom_walker.hpp"
#include "carver.hpp"
#include "fourcc_utils.hpp"
#include "size_resolver.hpp"

namespace atomcarve {

class Logger;

/// @defgroup api AtomCarve Public API
/// Recover the valid prefix of a CR3 (ISO-BMFF) file into a new file.
/// @{

/**
 * @brief Return the AtomCarve version string (e.g. `v0.3` or `v0.3+abcd123`).
 */
std::string version_string();  ///< @ingroup api

/// Knobs for one carve: which atom ends the file, header byte order, where the file starts.
struct CarveOptions {
    uint32_t termination_tag = kMdat;
    Endianness endianness = Endianness::Big;
    uint64_t start_offset = 0;
    size_t buffer_size = kCopyBufferSize;
};

enum class FileOutcome {
    Saved,
    SkippedNotFile,
    SkippedExists,
    InvalidStructure,
    IncompleteCopy,
    IoError,
    FilesystemError,
};

const char *file_outcome_name(FileOutcome outcome);

/**
 * @brief Per-file result, suitable for batch reporting.
 *
 * `size` is the resolved logical length (0 when the structure was rejected);
 * `bytes_written` is what the carver copied.
 */
struct FileReport {
    std::filesystem::path input;
    std::filesystem::path output;
    FileOutcome outcome{FileOutcome::IoError};
    uint64_t size{0};
    uint64_t bytes_written{0};
    std::string message;

    bool ok() const { return outcome == FileOutcome::Saved; }
};

/**
 * @brief Resolve and carve a single file.
 *
 * Opens `input_path`, resolves its logical size from `options.start_offset` and, when valid,
 * carves that many bytes to `output_path`. Refuses to run when `output_path` exists.
 * Never throws for per-file failures; they are reported in the returned FileReport.
 */
FileReport carve_file(const std::filesystem::path &input_path,
                      const std::filesystem::path &output_path, const CarveOptions &options,
                      Logger &logger);  ///< @ingroup api

/// @}

}  // namespace atomcarve
