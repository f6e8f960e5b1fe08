//
//  size_resolver.cpp
//  AtomCarve
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "size_resolver.hpp"

#include "logging.hpp"

namespace atomcarve {

namespace {

// Seeks the stream back to where it was on construction, whatever path leaves the scope.
class StreamPositionGuard {
   public:
    StreamPositionGuard(std::istream &in, std::streampos pos) : in_(in), pos_(pos) {}
    ~StreamPositionGuard() {
        in_.clear();
        in_.seekg(pos_);
    }

    StreamPositionGuard(const StreamPositionGuard &) = delete;
    StreamPositionGuard &operator=(const StreamPositionGuard &) = delete;

   private:
    std::istream &in_;
    std::streampos pos_;
};

ResolveResult fail(ResolveFailure failure) { return ResolveResult{0, false, failure}; }

}  // namespace

const char *resolve_failure_name(ResolveFailure failure) {
    switch (failure) {
        case ResolveFailure::None:
            return "none";
        case ResolveFailure::BadFirstAtom:
            return "bad_first_atom";
        case ResolveFailure::TerminatorNotFound:
            return "terminator_not_found";
        case ResolveFailure::StreamError:
            return "stream_error";
    }
    return "unknown";
}

ResolveResult resolve_logical_size(std::istream &in, Logger &logger, uint32_t termination_tag,
                                   Endianness endianness) {
    const std::streampos entry = in.tellg();
    if (entry == std::streampos(-1)) {
        AC_LOG(logger, "error", "input stream has no readable position");
        return fail(ResolveFailure::StreamError);
    }
    StreamPositionGuard guard(in, entry);

    AtomWalker walker(in, endianness, &logger);
    uint64_t total = 0;
    uint64_t index = 0;
    while (auto atom = walker.next()) {
        if (index == 0 && atom->type != kFtyp) {
            AC_LOG(logger, "error", "Invalid start atom: " << fourcc_display(atom->type)
                                                           << ". Expected 'ftyp'");
            return fail(ResolveFailure::BadFirstAtom);
        }
        // The walker only yields atoms whose end is a valid stream offset, so this cannot wrap.
        total += atom->size;

        AC_LOG(logger, "debug", "Atom index=" << index << ", name=" << fourcc_display(atom->type)
                                              << ", offset=" << atom->offset
                                              << ", size=" << atom->size);

        if (atom->type == termination_tag) {
            AC_LOG(logger, "info", "Termination atom '" << fourcc_display(termination_tag)
                                                        << "' reached. Logical size found: "
                                                        << total << " B");
            return ResolveResult{total, true, ResolveFailure::None};
        }
        ++index;
    }

    AC_LOG(logger, "warn", "File ended before reaching termination atom '"
                               << fourcc_display(termination_tag) << "'. Returning 0.");
    return fail(ResolveFailure::TerminatorNotFound);
}

}  // namespace atomcarve
