//
//  report_json.hpp
//  AtomCarve
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <nlohmann/json.hpp>

#include "atomcarve.hpp"
#include "batch_runner.hpp"

namespace atomcarve {

nlohmann::json to_json(const FileReport &file);

// {"ok", "input_dir", "output_dir", "saved", "files": [...]}; "message" only on failure.
nlohmann::json to_json(const BatchReport &report);

}  // namespace atomcarve
