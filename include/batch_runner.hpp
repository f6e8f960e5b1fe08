//
//  batch_runner.hpp
//  AtomCarve
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

#include "atomcarve.hpp"
#include "config.hpp"

namespace atomcarve {

class Logger;

struct BatchReport {
    bool ok{false};       // false only for run-level failures (nothing was processed).
    std::string message;  // run-level failure description.
    std::filesystem::path input_dir;
    std::filesystem::path output_dir;
    std::vector<FileReport> files;

    size_t saved_count() const;
};

/**
 * @brief Carve every regular file in `config.input_dir` into `config.output_dir`.
 *
 * The output directory is created when missing. Files are visited in name order; outputs that
 * already exist are skipped, never overwritten. A failure on one file does not stop the batch.
 * Returns `ok == false` only when the directories themselves are unusable.
 */
BatchReport run_batch(const BatchConfig &config, Logger &logger);

}  // namespace atomcarve
