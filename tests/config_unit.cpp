// Unit coverage for JSON config overlay, option validation and the JSON batch report.
#include <cstdint>
#include <filesystem>
#include <ios>
#include <limits>
#include <string>

#include <nlohmann/json.hpp>

#include "atom_test_utils.hpp"
#include "config.hpp"
#include "report_json.hpp"

using namespace atomcarve;

namespace {

bool check(bool cond, const std::string &msg) {
    return atom_test_utils::check("config_unit", cond, msg);
}

bool test_full_overlay() {
    BatchConfig cfg;
    auto st = apply_config_json(R"({
        "input_dir": "/data/in",
        "output_dir": "/data/out",
        "last_chunk": "moov",
        "endianness": "little",
        "start_offset": 512,
        "log_level": "debug"
    })",
                                cfg);
    bool ok = check(st.ok, "valid config accepted: " + st.message);
    ok &= check(cfg.input_dir == "/data/in" && cfg.output_dir == "/data/out", "dirs applied");
    ok &= check(cfg.carve.termination_tag == fourcc("moov"), "last_chunk applied");
    ok &= check(cfg.carve.endianness == Endianness::Little, "endianness applied");
    ok &= check(cfg.carve.start_offset == 512, "start_offset applied");
    ok &= check(cfg.log_level == LogVerbosity::Debug, "log_level applied");
    return ok;
}

bool test_partial_overlay_keeps_defaults() {
    BatchConfig cfg;
    cfg.input_dir = "/from/cli";
    auto st = apply_config_json(R"({"output_dir": "/out"})", cfg);
    bool ok = check(st.ok, "partial config accepted");
    ok &= check(cfg.input_dir == "/from/cli", "absent keys leave values alone");
    ok &= check(cfg.carve.termination_tag == kMdat, "default terminator is mdat");
    ok &= check(cfg.carve.endianness == Endianness::Big, "default endianness is big");
    return ok;
}

bool test_rejections() {
    bool ok = true;
    BatchConfig cfg;
    ok &= check(!apply_config_json("{not json", cfg).ok, "malformed JSON rejected");
    ok &= check(!apply_config_json("[1, 2]", cfg).ok, "non-object root rejected");
    ok &= check(!apply_config_json(R"({"input_dir": 5})", cfg).ok, "non-string dir rejected");
    ok &= check(!apply_config_json(R"({"last_chunk": "md"})", cfg).ok,
                "short last_chunk rejected");
    ok &= check(!apply_config_json(R"({"endianness": "middle"})", cfg).ok,
                "unknown endianness rejected");
    ok &= check(!apply_config_json(R"({"start_offset": -4})", cfg).ok,
                "negative start_offset rejected");
    ok &= check(!apply_config_json(R"({"log_level": "chatty"})", cfg).ok,
                "unknown log level rejected");

    ok &= check(!set_termination_tag(cfg, "").ok, "empty termination tag rejected");
    ok &= check(!set_termination_tag(cfg, "mdatx").ok, "long termination tag rejected");
    ok &= check(set_termination_tag(cfg, "uuid").ok &&
                    cfg.carve.termination_tag == fourcc("uuid"),
                "4-byte termination tag accepted");
    return ok;
}

bool test_start_offset_parsing() {
    BatchConfig cfg;
    bool ok = check(set_start_offset(cfg, "010").ok && cfg.carve.start_offset == 10,
                    "leading zeros parse as decimal");
    ok &= check(set_start_offset(cfg, "0").ok && cfg.carve.start_offset == 0, "zero accepted");

    cfg.carve.start_offset = 7;
    ok &= check(!set_start_offset(cfg, "0x20").ok, "hex prefix rejected");
    ok &= check(!set_start_offset(cfg, "-5").ok, "negative offset rejected");
    ok &= check(!set_start_offset(cfg, " -5").ok, "leading whitespace rejected");
    ok &= check(!set_start_offset(cfg, "+5").ok, "explicit sign rejected");
    ok &= check(!set_start_offset(cfg, "").ok, "empty offset rejected");
    ok &= check(!set_start_offset(cfg, "12a").ok, "trailing garbage rejected");
    ok &= check(!set_start_offset(cfg, "99999999999999999999").ok, "overflowing offset rejected");
    ok &= check(cfg.carve.start_offset == 7, "rejected values leave the offset alone");

    const uint64_t max_off = static_cast<uint64_t>(std::numeric_limits<std::streamoff>::max());
    ok &= check(set_start_offset(cfg, std::to_string(max_off)).ok &&
                    cfg.carve.start_offset == max_off,
                "largest stream offset accepted");
    ok &= check(!set_start_offset(cfg, std::to_string(max_off + 1)).ok,
                "offset past the largest stream offset rejected");

    ok &= check(!apply_config_json(R"({"start_offset": 18446744073709551615})", cfg).ok,
                "config start_offset past the largest stream offset rejected");
    ok &= check(apply_config_json("{\"start_offset\": " + std::to_string(max_off) + "}", cfg).ok &&
                    cfg.carve.start_offset == max_off,
                "config start_offset at the largest stream offset accepted");
    return ok;
}

bool test_validate() {
    BatchConfig cfg;
    bool ok = check(!validate_config(cfg).ok, "missing input dir rejected");
    cfg.input_dir = "/in";
    ok &= check(!validate_config(cfg).ok, "missing output dir rejected");
    cfg.output_dir = "/out";
    ok &= check(validate_config(cfg).ok, "both dirs accepted");

    const auto dir = atom_test_utils::make_temp_dir("config_unit_same");
    cfg.input_dir = dir;
    cfg.output_dir = dir / ".";
    ok &= check(!validate_config(cfg).ok, "same input and output dir rejected");
    std::filesystem::remove_all(dir);
    return ok;
}

bool test_load_from_file() {
    const auto dir = atom_test_utils::make_temp_dir("config_unit_file");
    const auto path = dir / "atomcarve.json";
    const std::string text = R"({"last_chunk": "moov", "start_offset": 16})";
    atom_test_utils::write_file(path, std::vector<uint8_t>(text.begin(), text.end()));

    BatchConfig cfg;
    auto st = load_config_json(path, cfg);
    bool ok = check(st.ok, "config file loaded");
    ok &= check(cfg.carve.termination_tag == fourcc("moov") && cfg.carve.start_offset == 16,
                "config file values applied");

    st = load_config_json(dir / "missing.json", cfg);
    ok &= check(!st.ok && st.message.find("open failed") != std::string::npos,
                "missing config file reported");
    std::filesystem::remove_all(dir);
    return ok;
}

bool test_report_json() {
    BatchReport report;
    report.ok = true;
    report.input_dir = "/in";
    report.output_dir = "/out";
    FileReport saved;
    saved.input = "/in/a.CR3";
    saved.output = "/out/a.CR3";
    saved.outcome = FileOutcome::Saved;
    saved.size = 5124;
    saved.bytes_written = 5124;
    report.files.push_back(saved);
    FileReport bad;
    bad.input = "/in/b.CR3";
    bad.output = "/out/b.CR3";
    bad.outcome = FileOutcome::InvalidStructure;
    bad.message = "no valid CR3 structure (bad_first_atom)";
    report.files.push_back(bad);

    const nlohmann::json j = to_json(report);
    bool ok = check(j["ok"] == true && j["saved"] == 1, "summary fields");
    ok &= check(!j.contains("message"), "no run-level message on success");
    ok &= check(j["files"].is_array() && j["files"].size() == 2, "one entry per file");
    ok &= check(j["files"][0]["outcome"] == "saved" && j["files"][0]["size"] == 5124,
                "saved entry");
    ok &= check(!j["files"][0].contains("message"), "empty message omitted");
    ok &= check(j["files"][1]["outcome"] == "invalid_structure" &&
                    j["files"][1]["message"] == "no valid CR3 structure (bad_first_atom)",
                "failed entry carries its message");
    return ok;
}

}  // namespace

int main() {
    bool ok = true;
    ok &= test_full_overlay();
    ok &= test_partial_overlay_keeps_defaults();
    ok &= test_rejections();
    ok &= test_start_offset_parsing();
    ok &= test_validate();
    ok &= test_load_from_file();
    ok &= test_report_json();
    return ok ? 0 : 1;
}
