//
//  size_resolver.hpp
//  AtomCarve
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <istream>

#include "atom_walker.hpp"
#include "fourcc_utils.hpp"

namespace atomcarve {

class Logger;

// Diagnostic only; callers gate on `valid` (equivalently `size != 0`).
enum class ResolveFailure {
    None,
    BadFirstAtom,        // first atom is not 'ftyp'.
    TerminatorNotFound,  // headers ran out before the termination atom.
    StreamError,         // entry position unavailable.
};

struct ResolveResult {
    uint64_t size = 0;
    bool valid = false;
    ResolveFailure failure = ResolveFailure::None;
};

const char *resolve_failure_name(ResolveFailure failure);

/**
 * @brief Compute the logical length of a box-structured file starting at the current position.
 *
 * Sums atom sizes from the first atom up to and including the first atom tagged
 * `termination_tag`. The first atom must be 'ftyp'. On any failure the result is
 * `{0, false}`. The stream position is restored to its entry value on every path.
 */
ResolveResult resolve_logical_size(std::istream &in, Logger &logger,
                                   uint32_t termination_tag = kMdat,
                                   Endianness endianness = Endianness::Big);

}  // namespace atomcarve
