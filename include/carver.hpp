//
//  carver.hpp
//  AtomCarve
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <istream>
#include <string>

namespace atomcarve {

class Logger;

inline constexpr size_t kMiB = 1024 * 1024;
inline constexpr size_t kCopyBufferSize = 8 * kMiB;
inline constexpr const char *kTempSuffix = ".tmp";

enum class CarveError {
    None,
    IncompleteCopy,   // source ran dry before `size` bytes were copied.
    FilesystemError,  // destination exists, or temp create/rename failed.
    IoError,          // seek/read/write failure on either side.
};

const char *carve_error_name(CarveError error);

/**
 * @brief Outcome of a carve.
 *
 * When `ok == true`, `bytes_written` equals the requested size and `message` is empty.
 * On failure, `bytes_written` is what reached the (now deleted) temp file.
 */
struct CarveStatus {
    bool ok{false};
    CarveError error{CarveError::None};
    uint64_t bytes_written{0};
    std::string message;
};

// Temp path used while copying: destination with kTempSuffix appended.
std::filesystem::path temp_path_for(const std::filesystem::path &destination);

/**
 * @brief Copy `size` bytes from `source` at `source_offset` into a new file at `destination`.
 *
 * Data goes to `destination` + ".tmp" first and is renamed into place only once every byte
 * has been written and the file closed cleanly. On any failure the temp file is removed and
 * `destination` is left absent.
 *
 * @param buffer_size Upper bound on bytes held in memory per copy step.
 */
CarveStatus carve(std::istream &source, const std::filesystem::path &destination,
                  uint64_t source_offset, uint64_t size, Logger &logger,
                  size_t buffer_size = kCopyBufferSize);

}  // namespace atomcarve
