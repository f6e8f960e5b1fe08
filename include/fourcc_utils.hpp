//
//  fourcc_utils.hpp
//  AtomCarve
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include "logging.hpp"

namespace atomcarve {

// FourCC helpers. Tags are packed big-endian so that comparing two packed values is the same
// as comparing the four raw bytes.
inline constexpr uint32_t fourcc(const char a, const char b, const char c, const char d) {
    return (uint32_t(uint8_t(a)) << 24) | (uint32_t(uint8_t(b)) << 16) |
           (uint32_t(uint8_t(c)) << 8) | (uint32_t(uint8_t(d)));
}

inline constexpr uint32_t fourcc(const char t[4]) { return fourcc(t[0], t[1], t[2], t[3]); }

inline uint32_t fourcc(const std::string &s) {
    if (s.size() != 4) {
        throw std::invalid_argument("fourcc string must be exactly 4 bytes: '" + s + "'");
    }
    return fourcc(s[0], s[1], s[2], s[3]);
}

inline constexpr uint32_t kFtyp = fourcc('f', 't', 'y', 'p');
inline constexpr uint32_t kMdat = fourcc('m', 'd', 'a', 't');

inline bool is_printable_fourcc(uint32_t type) {
    for (int i = 0; i < 4; ++i) {
        const uint8_t c = static_cast<uint8_t>(type >> (24 - 8 * i));
        if (c < 0x20 || c > 0x7E) {
            return false;
        }
    }
    return true;
}

inline std::string fourcc_to_string(uint32_t type) {
    std::string s(4, ' ');
    s[0] = static_cast<char>((type >> 24) & 0xFF);
    s[1] = static_cast<char>((type >> 16) & 0xFF);
    s[2] = static_cast<char>((type >> 8) & 0xFF);
    s[3] = static_cast<char>(type & 0xFF);
    return s;
}

// Display form for logs: the tag itself when printable, otherwise a hex dump of its bytes.
inline std::string fourcc_display(uint32_t type) {
    if (is_printable_fourcc(type)) {
        return fourcc_to_string(type);
    }
    const std::vector<uint8_t> bytes = {
        static_cast<uint8_t>(type >> 24), static_cast<uint8_t>(type >> 16),
        static_cast<uint8_t>(type >> 8), static_cast<uint8_t>(type)};
    return "0x[" + hex_prefix(bytes) + "]";
}

}  // namespace atomcarve
