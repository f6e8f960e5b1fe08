//
//  atom_walker.hpp
//  AtomCarve
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <istream>
#include <optional>

namespace atomcarve {

class Logger;

enum class Endianness { Big, Little };

struct AtomInfo {
    uint64_t offset = 0;       // absolute offset of the header in the stream.
    uint32_t type = 0;         // packed FourCC.
    uint64_t size = 0;         // total atom size, header included.
    uint32_t header_size = 8;  // 8, or 16 for the 64-bit size form.
};

// Utility: read a 32-bit value in the given byte order. False (and `out` untouched) on a
// short read.
bool read_u32(std::istream &in, Endianness endianness, uint32_t &out);

// Utility: read a 64-bit value in the given byte order. False (and `out` untouched) on a
// short read.
bool read_u64(std::istream &in, Endianness endianness, uint64_t &out);

/**
 * @brief Step-wise walker over the top-level atoms of a box-structured stream.
 *
 * Starts at the stream's current position. Each call to next() reads one header and yields it;
 * the following call first seeks to `offset + size` of the previously yielded atom. Payloads are
 * never read. The sequence ends (next() returns std::nullopt, and keeps doing so) on a short
 * header read, a zero size, or a jump that cannot be expressed as a stream offset.
 *
 * The walker moves the stream position as it goes and does not restore it.
 */
class AtomWalker {
   public:
    explicit AtomWalker(std::istream &in, Endianness endianness = Endianness::Big,
                        Logger *logger = nullptr)
        : in_(in), endianness_(endianness), logger_(logger) {}

    std::optional<AtomInfo> next();

    bool done() const { return done_; }

   private:
    std::optional<AtomInfo> finish();

    std::istream &in_;
    Endianness endianness_;
    Logger *logger_;
    std::optional<uint64_t> next_offset_;
    bool done_ = false;
};

}  // namespace atomcarve
