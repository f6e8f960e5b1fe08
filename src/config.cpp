//
//  config.cpp
//  AtomCarve
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "config.hpp"

#include <cerrno>
#include <fstream>
#include <ios>
#include <limits>
#include <nlohmann/json.hpp>
#include <sstream>
#include <system_error>
#include <utility>

using json = nlohmann::json;

namespace atomcarve {

namespace {

ConfigStatus make_status(bool ok, std::string msg = {}) { return ConfigStatus{ok, std::move(msg)}; }

ConfigStatus read_string(const json &j, const char *key, std::string &out, bool &present) {
    present = false;
    if (!j.contains(key)) {
        return make_status(true);
    }
    if (!j[key].is_string()) {
        return make_status(false, std::string("config key '") + key + "' must be a string");
    }
    out = j[key].get<std::string>();
    present = true;
    return make_status(true);
}

constexpr uint64_t kMaxStartOffset =
    static_cast<uint64_t>(std::numeric_limits<std::streamoff>::max());

}  // namespace

bool parse_endianness(const std::string &name, Endianness &out) {
    if (name == "big") {
        out = Endianness::Big;
        return true;
    }
    if (name == "little") {
        out = Endianness::Little;
        return true;
    }
    return false;
}

const char *endianness_name(Endianness endianness) {
    return endianness == Endianness::Little ? "little" : "big";
}

ConfigStatus set_termination_tag(BatchConfig &config, const std::string &name) {
    if (name.empty()) {
        return make_status(false, "--lastchunk must not be empty");
    }
    if (name.size() != 4) {
        return make_status(false, "--lastchunk must be exactly 4 bytes, got '" + name + "'");
    }
    config.carve.termination_tag = fourcc(name);
    return make_status(true);
}

ConfigStatus set_start_offset(BatchConfig &config, const std::string &value) {
    if (value.empty()) {
        return make_status(false, "--start-offset must not be empty");
    }
    uint64_t parsed = 0;
    for (char c : value) {
        if (c < '0' || c > '9') {
            return make_status(false, "--start-offset is not a decimal offset: '" + value + "'");
        }
        const uint64_t digit = static_cast<uint64_t>(c - '0');
        if (parsed > (kMaxStartOffset - digit) / 10) {
            return make_status(false, "--start-offset is out of range: " + value);
        }
        parsed = parsed * 10 + digit;
    }
    config.carve.start_offset = parsed;
    return make_status(true);
}

ConfigStatus apply_config_json(const std::string &text, BatchConfig &config) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error &e) {
        return make_status(false, std::string("config is not valid JSON: ") + e.what());
    }
    if (!j.is_object()) {
        return make_status(false, "config root must be a JSON object");
    }

    std::string value;
    bool present = false;

    auto st = read_string(j, "input_dir", value, present);
    if (!st.ok) return st;
    if (present) config.input_dir = value;

    st = read_string(j, "output_dir", value, present);
    if (!st.ok) return st;
    if (present) config.output_dir = value;

    st = read_string(j, "last_chunk", value, present);
    if (!st.ok) return st;
    if (present) {
        st = set_termination_tag(config, value);
        if (!st.ok) return st;
    }

    st = read_string(j, "endianness", value, present);
    if (!st.ok) return st;
    if (present && !parse_endianness(value, config.carve.endianness)) {
        return make_status(false, "config 'endianness' must be \"big\" or \"little\"");
    }

    st = read_string(j, "log_level", value, present);
    if (!st.ok) return st;
    if (present && !parse_log_verbosity(value, config.log_level)) {
        return make_status(false, "config 'log_level' is not a known level: " + value);
    }

    if (j.contains("start_offset")) {
        if (!j["start_offset"].is_number_unsigned()) {
            return make_status(false, "config 'start_offset' must be a non-negative integer");
        }
        const uint64_t offset = j["start_offset"].get<uint64_t>();
        if (offset > kMaxStartOffset) {
            return make_status(false, "config 'start_offset' is out of range: " +
                                          std::to_string(offset));
        }
        config.carve.start_offset = offset;
    }
    return make_status(true);
}

ConfigStatus load_config_json(const std::filesystem::path &path, BatchConfig &config) {
    std::ifstream f(path);
    if (!f.is_open()) {
        return make_status(false, "open failed for " + path.string() + " errno=" +
                                      std::to_string(errno) + " (" +
                                      std::generic_category().message(errno) + ")");
    }
    std::ostringstream ss;
    ss << f.rdbuf();
    auto st = apply_config_json(ss.str(), config);
    if (!st.ok) {
        st.message = path.string() + ": " + st.message;
    }
    return st;
}

ConfigStatus validate_config(const BatchConfig &config) {
    if (config.input_dir.empty()) {
        return make_status(false, "input directory is required (--input-dir)");
    }
    if (config.output_dir.empty()) {
        return make_status(false, "output directory is required (--output-dir)");
    }
    std::error_code ec;
    if (std::filesystem::equivalent(config.input_dir, config.output_dir, ec) && !ec) {
        return make_status(false, "input and output directories must differ");
    }
    return make_status(true);
}

}  // namespace atomcarve
