//
//  logging.cpp
//  AtomCarve
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "logging.hpp"

namespace atomcarve {

bool parse_log_verbosity(const std::string &name, LogVerbosity &out) {
    if (name == "debug") {
        out = LogVerbosity::Debug;
    } else if (name == "info") {
        out = LogVerbosity::Info;
    } else if (name == "warn" || name == "warning") {
        out = LogVerbosity::Warn;
    } else if (name == "error") {
        out = LogVerbosity::Error;
    } else if (name == "critical") {
        out = LogVerbosity::Critical;
    } else {
        return false;
    }
    return true;
}

void Logger::write(const char *level, const std::string &msg, const char *file, int line,
                   const char *func) {
    const std::string lvl(level ? level : "");
    if (lvl == "error" || lvl == "critical") {
        *sink_ << "[AtomCarve][" << lvl << "][" << file << ":" << line << " " << func << "] "
               << msg << std::endl;
    } else {
        *sink_ << "[AtomCarve][" << lvl << "] " << msg << std::endl;
    }
}

}  // namespace atomcarve
