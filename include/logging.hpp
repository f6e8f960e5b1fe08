//
//  logging.hpp
//  AtomCarve
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <algorithm>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace atomcarve {

enum class LogVerbosity { Critical = 0, Error = 1, Warn = 2, Info = 3, Debug = 4 };

inline constexpr LogVerbosity severity_for_tag(std::string_view tag) {
    if (tag == "critical") {
        return LogVerbosity::Critical;
    }
    if (tag == "error") {
        return LogVerbosity::Error;
    }
    if (tag == "warn" || tag == "warning") {
        return LogVerbosity::Warn;
    }
    if (tag == "info") {
        return LogVerbosity::Info;
    }
    // Everything else (walker/carver/etc.) treated as debug-level.
    return LogVerbosity::Debug;
}

// Parse a --log-level style name. Returns false (and leaves `out` alone) for unknown names.
bool parse_log_verbosity(const std::string &name, LogVerbosity &out);

/**
 * @brief Leveled message sink handed to every component that logs.
 *
 * There is no process-wide logger; callers own a Logger and pass it down by reference.
 * The sink defaults to std::cerr and must outlive the Logger.
 */
class Logger {
   public:
    explicit Logger(LogVerbosity level = LogVerbosity::Info, std::ostream &sink = std::cerr)
        : level_(level), sink_(&sink) {}

    void set_verbosity(LogVerbosity level) { level_ = level; }

    bool should_log(const char *level) const {
        const auto sev = severity_for_tag(level ? level : "");
        return static_cast<int>(sev) <= static_cast<int>(level_);
    }

    void write(const char *level, const std::string &msg, const char *file, int line,
               const char *func);

   private:
    LogVerbosity level_;
    std::ostream *sink_;
};

// Hex-preview helper used in debug logs to dump a short prefix of binary blobs (e.g. tags).
inline constexpr size_t kHexPreviewBytes = 8;
inline std::string hex_prefix(const std::vector<uint8_t> &data,
                              size_t max_len = kHexPreviewBytes) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    const size_t limit = std::min(max_len, data.size());
    for (size_t i = 0; i < limit; ++i) {
        oss << std::setw(2) << static_cast<unsigned int>(data[i]);
        if (i + 1 != limit) {
            oss << ' ';
        }
    }
    return oss.str();
}

}  // namespace atomcarve

#define AC_LOG(logger, level, message)                                      \
    do {                                                                    \
        if ((logger).should_log(level)) {                                   \
            std::ostringstream _ac_log_ss;                                  \
            _ac_log_ss << message;                                          \
            (logger).write(level, _ac_log_ss.str(), __FILE__, __LINE__,     \
                           __func__);                                       \
        }                                                                   \
    } while (0)
