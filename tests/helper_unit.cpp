// Unit coverage for small helpers: endian readers, FourCC formatting, hex preview and Logger.
#include <cstdint>
#include <sstream>
#include <string>
#include <vector>

#include "atom_test_utils.hpp"
#include "atom_walker.hpp"
#include "fourcc_utils.hpp"
#include "logging.hpp"

using namespace atomcarve;

namespace {

bool check(bool cond, const std::string &msg) {
    return atom_test_utils::check("helper_unit", cond, msg);
}

bool test_endian_readers() {
    uint32_t v32 = 0;
    std::istringstream s32(std::string("\x01\x02\x03\x04", 4));
    bool ok = check(read_u32(s32, Endianness::Big, v32) && v32 == 0x01020304u,
                    "read_u32 big-endian decode");

    std::istringstream s32le(std::string("\x01\x02\x03\x04", 4));
    ok &= check(read_u32(s32le, Endianness::Little, v32) && v32 == 0x04030201u,
                "read_u32 little-endian decode");

    uint64_t v64 = 0;
    std::istringstream s64(std::string("\x01\x02\x03\x04\x05\x06\x07\x08", 8));
    ok &= check(read_u64(s64, Endianness::Big, v64) && v64 == 0x0102030405060708ULL,
                "read_u64 big-endian decode");

    std::istringstream s64le(std::string("\x01\x02\x03\x04\x05\x06\x07\x08", 8));
    ok &= check(read_u64(s64le, Endianness::Little, v64) && v64 == 0x0807060504030201ULL,
                "read_u64 little-endian decode");
    return ok;
}

bool test_endian_readers_short_input() {
    uint32_t v32 = 0xDEADBEEFu;
    std::istringstream s32(std::string("\x01\x02\x03", 3));
    bool ok = check(!read_u32(s32, Endianness::Big, v32), "read_u32 fails on 3 bytes");
    ok &= check(v32 == 0xDEADBEEFu, "read_u32 leaves the output alone on a short read");

    std::istringstream empty;
    ok &= check(!read_u32(empty, Endianness::Little, v32), "read_u32 fails on empty input");

    uint64_t v64 = 42;
    std::istringstream s64(std::string("\x01\x02\x03\x04\x05\x06\x07", 7));
    ok &= check(!read_u64(s64, Endianness::Big, v64), "read_u64 fails on 7 bytes");
    ok &= check(v64 == 42, "read_u64 leaves the output alone on a short read");
    return ok;
}

bool test_fourcc() {
    bool ok = check(fourcc("ftyp") == kFtyp, "fourcc(const char*) matches kFtyp");
    ok &= check(fourcc(std::string("mdat")) == kMdat, "fourcc(std::string) matches kMdat");
    ok &= check(fourcc_to_string(kMdat) == "mdat", "fourcc_to_string round trip");
    ok &= check(fourcc_display(fourcc("moov")) == "moov", "printable tags display as text");
    ok &= check(fourcc_display(0x00A1FF20u) == "0x[00 a1 ff 20]",
                "unprintable tags display as hex");
    ok &= check(!is_printable_fourcc(0x7F414141u), "DEL is not printable");

    bool threw = false;
    try {
        (void)fourcc(std::string("mda"));
    } catch (const std::invalid_argument &) {
        threw = true;
    }
    ok &= check(threw, "fourcc rejects strings that are not 4 bytes");
    return ok;
}

bool test_hex_prefix() {
    bool ok = check(hex_prefix({}) == "", "hex_prefix empty");
    std::vector<uint8_t> data = {0x00, 0x11, 0xAB, 0xCD, 0xFF};
    ok &= check(hex_prefix(data, 4) == "00 11 ab cd", "hex_prefix truncates to max_len");
    ok &= check(hex_prefix(data) == "00 11 ab cd ff", "hex_prefix default prints all up to limit");
    return ok;
}

bool test_logger_levels() {
    std::ostringstream sink;
    Logger logger(LogVerbosity::Warn, sink);
    AC_LOG(logger, "debug", "hidden debug");
    AC_LOG(logger, "info", "hidden info");
    AC_LOG(logger, "warn", "shown warn " << 42);
    AC_LOG(logger, "error", "shown error");
    const std::string text = sink.str();

    bool ok = check(text.find("hidden") == std::string::npos, "levels below Warn suppressed");
    ok &= check(text.find("[AtomCarve][warn] shown warn 42") != std::string::npos,
                "warn line formatted with prefix");
    ok &= check(text.find("[AtomCarve][error][") != std::string::npos,
                "error line carries source location");

    logger.set_verbosity(LogVerbosity::Debug);
    AC_LOG(logger, "walker", "untagged goes to debug");
    ok &= check(sink.str().find("untagged goes to debug") != std::string::npos,
                "unknown tags are debug-level");

    logger.set_verbosity(LogVerbosity::Critical);
    ok &= check(!logger.should_log("error"), "Critical verbosity hides errors");
    ok &= check(logger.should_log("critical"), "Critical verbosity keeps critical");
    return ok;
}

bool test_parse_log_verbosity() {
    LogVerbosity v = LogVerbosity::Info;
    bool ok = check(parse_log_verbosity("debug", v) && v == LogVerbosity::Debug, "parse debug");
    ok &= check(parse_log_verbosity("warning", v) && v == LogVerbosity::Warn, "parse warning");
    ok &= check(!parse_log_verbosity("loud", v) && v == LogVerbosity::Warn,
                "unknown level rejected and value untouched");
    return ok;
}

}  // namespace

int main() {
    bool ok = true;
    ok &= test_endian_readers();
    ok &= test_endian_readers_short_input();
    ok &= test_fourcc();
    ok &= test_hex_prefix();
    ok &= test_logger_levels();
    ok &= test_parse_log_verbosity();
    return ok ? 0 : 1;
}
