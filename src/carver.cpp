//
//  carver.cpp
//  AtomCarve
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "carver.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <limits>
#include <memory>
#include <system_error>
#include <utility>
#include <vector>

#include "logging.hpp"

namespace atomcarve {

namespace {

using FileHandle = std::unique_ptr<std::FILE, int (*)(std::FILE *)>;

CarveStatus make_status(CarveError error, uint64_t written, std::string msg = {}) {
    return CarveStatus{error == CarveError::None, error, written, std::move(msg)};
}

std::string errno_text(int err) {
    return "errno=" + std::to_string(err) + " (" + std::generic_category().message(err) + ")";
}

// Best-effort cleanup; a failure here is logged and never replaces the caller's error.
void discard_temp(const std::filesystem::path &tmp, Logger &logger) {
    std::error_code ec;
    if (!std::filesystem::exists(tmp, ec)) {
        return;
    }
    if (!std::filesystem::remove(tmp, ec) || ec) {
        AC_LOG(logger, "error", "failed to remove temp file " << tmp.string() << ": "
                                                              << ec.message());
    }
}

}  // namespace

const char *carve_error_name(CarveError error) {
    switch (error) {
        case CarveError::None:
            return "none";
        case CarveError::IncompleteCopy:
            return "incomplete_copy";
        case CarveError::FilesystemError:
            return "filesystem_error";
        case CarveError::IoError:
            return "io_error";
    }
    return "unknown";
}

std::filesystem::path temp_path_for(const std::filesystem::path &destination) {
    std::filesystem::path tmp = destination;
    tmp += kTempSuffix;
    return tmp;
}

CarveStatus carve(std::istream &source, const std::filesystem::path &destination,
                  uint64_t source_offset, uint64_t size, Logger &logger, size_t buffer_size) {
    const std::string name = destination.filename().string();

    std::error_code ec;
    if (std::filesystem::exists(destination, ec) || ec) {
        std::string msg = name + " already exists: skipping save attempt";
        if (ec) {
            msg = "cannot stat " + destination.string() + ": " + ec.message();
        }
        AC_LOG(logger, "warn", msg);
        return make_status(CarveError::FilesystemError, 0, msg);
    }

    if (source_offset > static_cast<uint64_t>(std::numeric_limits<std::streamoff>::max())) {
        std::string msg = "source offset " + std::to_string(source_offset) + " out of range";
        AC_LOG(logger, "error", msg);
        return make_status(CarveError::IoError, 0, msg);
    }
    source.clear();
    source.seekg(static_cast<std::streamoff>(source_offset), std::ios::beg);
    if (!source) {
        std::string msg = "seek to offset " + std::to_string(source_offset) + " failed";
        AC_LOG(logger, "error", msg);
        return make_status(CarveError::IoError, 0, msg);
    }

    // Exclusive create: an existing temp path (file, directory or dangling link) is never
    // opened, truncated or removed.
    const std::filesystem::path tmp = temp_path_for(destination);
    FileHandle out(std::fopen(tmp.string().c_str(), "wbx"), &std::fclose);
    if (!out) {
        const int err = errno;
        std::string msg = err == EEXIST
                              ? "temp file " + tmp.string() + " already exists; not touching it"
                              : "open failed for " + tmp.string() + " " + errno_text(err);
        AC_LOG(logger, "error", msg);
        return make_status(CarveError::FilesystemError, 0, msg);
    }

    AC_LOG(logger, "info", "Saving " << name << ", calculated size " << size << " B");

    if (buffer_size == 0) {
        buffer_size = kCopyBufferSize;
    }
    uint64_t remaining = size;
    std::vector<char> buffer(
        static_cast<size_t>(std::min<uint64_t>(buffer_size, std::max<uint64_t>(size, 1))));
    while (remaining > 0) {
        const auto want =
            static_cast<std::streamsize>(std::min<uint64_t>(buffer.size(), remaining));
        source.read(buffer.data(), want);
        const std::streamsize got = source.gcount();
        if (got <= 0) {
            if (source.bad()) {
                std::string msg = "read error on source after " +
                                  std::to_string(size - remaining) + " bytes";
                AC_LOG(logger, "error", msg);
                out.reset();
                discard_temp(tmp, logger);
                return make_status(CarveError::IoError, size - remaining, msg);
            }
            AC_LOG(logger, "error", "Premature EOF encountered while reading "
                                        << size << " B for " << name);
            break;
        }
        const size_t put = std::fwrite(buffer.data(), 1, static_cast<size_t>(got), out.get());
        if (put != static_cast<size_t>(got)) {
            std::string msg = "write error on " + tmp.string() + " after " +
                              std::to_string(size - remaining + put) + " bytes " +
                              errno_text(errno);
            AC_LOG(logger, "error", msg);
            out.reset();
            discard_temp(tmp, logger);
            return make_status(CarveError::IoError, size - remaining + put, msg);
        }
        remaining -= static_cast<uint64_t>(got);
    }

    if (std::fclose(out.release()) != 0) {
        std::string msg = "flush/close failed for " + tmp.string() + " " + errno_text(errno);
        AC_LOG(logger, "error", msg);
        discard_temp(tmp, logger);
        return make_status(CarveError::IoError, size - remaining, msg);
    }

    const uint64_t written = size - remaining;
    if (remaining != 0) {
        std::string msg = "Incomplete save for " + name + ". Saved only " +
                          std::to_string(written) + " of " + std::to_string(size) + " bytes";
        AC_LOG(logger, "error", msg);
        discard_temp(tmp, logger);
        return make_status(CarveError::IncompleteCopy, written, msg);
    }

    // Commit point.
    std::filesystem::rename(tmp, destination, ec);
    if (ec) {
        std::string msg = "rename " + tmp.string() + " -> " + destination.string() +
                          " failed: " + ec.message();
        AC_LOG(logger, "error", msg);
        discard_temp(tmp, logger);
        return make_status(CarveError::FilesystemError, written, msg);
    }

    AC_LOG(logger, "info", "[SUCCESS] File successfully fixed and saved to " << name);
    return make_status(CarveError::None, written);
}

}  // namespace atomcarve
