//
//  atomcarve.cpp
//  AtomCarve
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//
#include "atomcarve.hpp"
#include "atomcarve_version.hpp"

#include <cerrno>
#include <chrono>
#include <fstream>
#include <system_error>

#include "logging.hpp"

namespace atomcarve {

std::string version_string() { return ATOMCARVE_VERSION_DISPLAY; }

const char *file_outcome_name(FileOutcome outcome) {
    switch (outcome) {
        case FileOutcome::Saved:
            return "saved";
        case FileOutcome::SkippedNotFile:
            return "skipped_not_file";
        case FileOutcome::SkippedExists:
            return "skipped_exists";
        case FileOutcome::InvalidStructure:
            return "invalid_structure";
        case FileOutcome::IncompleteCopy:
            return "incomplete_copy";
        case FileOutcome::IoError:
            return "io_error";
        case FileOutcome::FilesystemError:
            return "filesystem_error";
    }
    return "unknown";
}

namespace {

FileOutcome outcome_for(CarveError error) {
    switch (error) {
        case CarveError::None:
            return FileOutcome::Saved;
        case CarveError::IncompleteCopy:
            return FileOutcome::IncompleteCopy;
        case CarveError::FilesystemError:
            return FileOutcome::FilesystemError;
        case CarveError::IoError:
            return FileOutcome::IoError;
    }
    return FileOutcome::IoError;
}

}  // namespace

FileReport carve_file(const std::filesystem::path &input_path,
                      const std::filesystem::path &output_path, const CarveOptions &options,
                      Logger &logger) {
    const auto t0 = std::chrono::steady_clock::now();
    FileReport report;
    report.input = input_path;
    report.output = output_path;

    std::error_code ec;
    if (std::filesystem::exists(output_path, ec) || ec) {
        report.outcome = FileOutcome::SkippedExists;
        report.message = ec ? "cannot stat output: " + ec.message()
                            : "output file already exists";
        AC_LOG(logger, "warn", "Output file already exists: " << output_path.filename().string()
                                                              << ". Skipping.");
        return report;
    }

    std::ifstream in(input_path, std::ios::binary);
    if (!in.is_open()) {
        report.outcome = FileOutcome::IoError;
        report.message = "open failed errno=" + std::to_string(errno) + " (" +
                         std::generic_category().message(errno) + ")";
        AC_LOG(logger, "error", "open failed for " << input_path.string() << ": "
                                                   << report.message);
        return report;
    }
    in.seekg(static_cast<std::streamoff>(options.start_offset), std::ios::beg);
    if (!in) {
        report.outcome = FileOutcome::IoError;
        report.message = "seek to start offset " + std::to_string(options.start_offset) +
                         " failed";
        AC_LOG(logger, "error", input_path.filename().string() << ": " << report.message);
        return report;
    }

    const ResolveResult resolved =
        resolve_logical_size(in, logger, options.termination_tag, options.endianness);
    report.size = resolved.size;
    if (!resolved.valid) {
        report.outcome = FileOutcome::InvalidStructure;
        report.message = std::string("no valid CR3 structure (") +
                         resolve_failure_name(resolved.failure) + ")";
        AC_LOG(logger, "error", "Failed to determine a valid CR3 structure and size for "
                                    << input_path.filename().string() << ". File not saved.");
        return report;
    }

    const CarveStatus status =
        carve(in, output_path, options.start_offset, resolved.size, logger, options.buffer_size);
    report.bytes_written = status.bytes_written;
    report.outcome = outcome_for(status.error);
    report.message = status.message;

    const auto elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                                std::chrono::steady_clock::now() - t0)
                                .count();
    AC_LOG(logger, "debug", "carve_file " << input_path.filename().string()
                                          << " outcome=" << file_outcome_name(report.outcome)
                                          << " took " << elapsed_ms << " ms");
    return report;
}

}  // namespace atomcarve
