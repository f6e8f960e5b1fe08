//
//  atom_walker.cpp
//  AtomCarve
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "atom_walker.hpp"

#include <limits>

#include "fourcc_utils.hpp"
#include "logging.hpp"

namespace atomcarve {

namespace {

constexpr uint32_t kAtomHeaderSize = 8;
constexpr uint32_t kLargeAtomHeaderSize = 16;
constexpr uint32_t kLargeSizeSentinel = 1;

uint32_t decode_u32(const uint8_t b[4], Endianness endianness) {
    if (endianness == Endianness::Little) {
        return (uint32_t(b[3]) << 24) | (uint32_t(b[2]) << 16) | (uint32_t(b[1]) << 8) |
               (uint32_t(b[0]));
    }
    return (uint32_t(b[0]) << 24) | (uint32_t(b[1]) << 16) | (uint32_t(b[2]) << 8) |
           (uint32_t(b[3]));
}

uint64_t decode_u64(const uint8_t b[8], Endianness endianness) {
    const uint64_t lo = decode_u32(endianness == Endianness::Little ? b : b + 4, endianness);
    const uint64_t hi = decode_u32(endianness == Endianness::Little ? b + 4 : b, endianness);
    return (hi << 32) | lo;
}

}  // namespace

bool read_u32(std::istream &in, Endianness endianness, uint32_t &out) {
    uint8_t b[4];
    in.read(reinterpret_cast<char *>(b), 4);
    if (in.gcount() != 4) {
        return false;
    }
    out = decode_u32(b, endianness);
    return true;
}

bool read_u64(std::istream &in, Endianness endianness, uint64_t &out) {
    uint8_t b[8];
    in.read(reinterpret_cast<char *>(b), 8);
    if (in.gcount() != 8) {
        return false;
    }
    out = decode_u64(b, endianness);
    return true;
}

std::optional<AtomInfo> AtomWalker::finish() {
    done_ = true;
    return std::nullopt;
}

std::optional<AtomInfo> AtomWalker::next() {
    if (done_) {
        return std::nullopt;
    }
    // Unconditional absolute jump past the previous atom.
    if (next_offset_) {
        in_.clear();
        in_.seekg(static_cast<std::streamoff>(*next_offset_), std::ios::beg);
        if (!in_) {
            if (logger_) {
                AC_LOG(*logger_, "debug", "walker: seek to " << *next_offset_ << " failed");
            }
            return finish();
        }
    }

    const std::streamoff pos = in_.tellg();
    if (pos < 0) {
        return finish();
    }

    AtomInfo info;
    info.offset = static_cast<uint64_t>(pos);

    uint32_t size32 = 0;
    if (!read_u32(in_, endianness_, size32)) {
        return finish();
    }
    // Tags keep their byte order whatever the size fields use.
    if (!read_u32(in_, Endianness::Big, info.type)) {
        if (logger_) {
            AC_LOG(*logger_, "debug", "walker: truncated tag at offset " << info.offset);
        }
        return finish();
    }
    info.size = size32;
    info.header_size = kAtomHeaderSize;

    if (size32 == kLargeSizeSentinel) {
        // 64-bit extended size.
        if (!read_u64(in_, endianness_, info.size)) {
            if (logger_) {
                AC_LOG(*logger_, "debug", "walker: truncated 64-bit size for "
                                              << fourcc_display(info.type) << " at offset "
                                              << info.offset);
            }
            return finish();
        }
        info.header_size = kLargeAtomHeaderSize;
    }

    if (info.size == 0) {
        if (logger_) {
            AC_LOG(*logger_, "debug", "walker: zero size for " << fourcc_display(info.type)
                                                              << " at offset " << info.offset
                                                              << ", stopping");
        }
        return finish();
    }

    const uint64_t max_offset =
        static_cast<uint64_t>(std::numeric_limits<std::streamoff>::max());
    if (info.offset > max_offset || info.size > max_offset - info.offset) {
        if (logger_) {
            AC_LOG(*logger_, "warn", "walker: atom " << fourcc_display(info.type) << " at offset "
                                                     << info.offset << " claims " << info.size
                                                     << " bytes; end is not addressable");
        }
        return finish();
    }
    next_offset_ = info.offset + info.size;
    return info;
}

}  // namespace atomcarve
