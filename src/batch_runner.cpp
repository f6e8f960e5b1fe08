//
//  batch_runner.cpp
//  AtomCarve
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "batch_runner.hpp"

#include <algorithm>
#include <exception>
#include <system_error>
#include <utility>

#include "logging.hpp"

namespace atomcarve {

size_t BatchReport::saved_count() const {
    return static_cast<size_t>(std::count_if(files.begin(), files.end(),
                                             [](const FileReport &f) { return f.ok(); }));
}

namespace {

BatchReport fail_run(BatchReport report, std::string msg, Logger &logger) {
    AC_LOG(logger, "critical", msg);
    report.ok = false;
    report.message = std::move(msg);
    return report;
}

}  // namespace

BatchReport run_batch(const BatchConfig &config, Logger &logger) {
    BatchReport report;
    report.input_dir = config.input_dir;
    report.output_dir = config.output_dir;

    AC_LOG(logger, "info", "Analyzing files in input directory: " << config.input_dir.string());

    std::error_code ec;
    if (!std::filesystem::is_directory(config.input_dir, ec) || ec) {
        return fail_run(std::move(report),
                        "Input path must be an existing directory: " + config.input_dir.string(),
                        logger);
    }
    std::filesystem::create_directories(config.output_dir, ec);
    if (ec || !std::filesystem::is_directory(config.output_dir, ec)) {
        return fail_run(std::move(report),
                        "Could not create output directory " + config.output_dir.string() +
                            (ec ? ": " + ec.message() : std::string()),
                        logger);
    }

    // Snapshot and sort so runs are reproducible regardless of directory order.
    std::vector<std::filesystem::directory_entry> entries;
    std::filesystem::directory_iterator it(config.input_dir, ec);
    if (ec) {
        return fail_run(std::move(report),
                        "Cannot list " + config.input_dir.string() + ": " + ec.message(), logger);
    }
    for (; it != std::filesystem::directory_iterator(); it.increment(ec)) {
        if (ec) {
            break;
        }
        entries.push_back(*it);
    }
    if (ec) {
        return fail_run(std::move(report),
                        "Error while listing " + config.input_dir.string() + ": " + ec.message(),
                        logger);
    }
    std::sort(entries.begin(), entries.end(),
              [](const std::filesystem::directory_entry &a,
                 const std::filesystem::directory_entry &b) { return a.path() < b.path(); });

    report.ok = true;
    for (const auto &entry : entries) {
        const auto &input_path = entry.path();
        const auto name = input_path.filename();

        std::error_code type_ec;
        if (!entry.is_regular_file(type_ec) || type_ec) {
            AC_LOG(logger, "debug", "Skipping non-file object: " << name.string());
            FileReport skipped;
            skipped.input = input_path;
            skipped.outcome = FileOutcome::SkippedNotFile;
            skipped.message = "not a regular file";
            report.files.push_back(std::move(skipped));
            continue;
        }

        AC_LOG(logger, "info", "--- Processing " << name.string() << " ---");
        try {
            report.files.push_back(
                carve_file(input_path, config.output_dir / name, config.carve, logger));
        } catch (const std::exception &e) {
            AC_LOG(logger, "critical", "An unexpected error occurred during processing "
                                           << name.string() << ": " << e.what());
            FileReport failed;
            failed.input = input_path;
            failed.output = config.output_dir / name;
            failed.outcome = FileOutcome::IoError;
            failed.message = e.what();
            report.files.push_back(std::move(failed));
        }
    }

    AC_LOG(logger, "info", "--- Batch Processing Complete. " << report.saved_count()
                                                             << " files successfully saved. ---");
    return report;
}

}  // namespace atomcarve
