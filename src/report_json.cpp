//
//  report_json.cpp
//  AtomCarve
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "report_json.hpp"

namespace atomcarve {

nlohmann::json to_json(const FileReport &file) {
    nlohmann::json j;
    j["input"] = file.input.string();
    j["output"] = file.output.string();
    j["outcome"] = file_outcome_name(file.outcome);
    j["size"] = file.size;
    j["bytes_written"] = file.bytes_written;
    // Only carry a message when there is something to say.
    if (!file.message.empty()) {
        j["message"] = file.message;
    }
    return j;
}

nlohmann::json to_json(const BatchReport &report) {
    nlohmann::json j;
    j["ok"] = report.ok;
    j["input_dir"] = report.input_dir.string();
    j["output_dir"] = report.output_dir.string();
    j["saved"] = report.saved_count();
    if (!report.ok) {
        j["message"] = report.message;
    }
    nlohmann::json files = nlohmann::json::array();
    for (const auto &f : report.files) {
        files.push_back(to_json(f));
    }
    j["files"] = files;
    return j;
}

}  // namespace atomcarve
