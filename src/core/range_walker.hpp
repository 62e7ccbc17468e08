#pragma once

#include <stddef.h>
#include <stdint.h>
#include <cz/vector.hpp>
#include "core/match_index.hpp"
#include "core/nearest.hpp"

namespace lens {

struct Lens_Entry {
    size_t match_index;
    uint64_t line;

    /// Signed distance in `n` presses from the cursor.  Negative is before the cursor.
    int64_t relative_index;

    bool nearest;
};

/// Collect one entry for every visible line with a match, excluding the line of
/// the nearest match.  Matches inside the fold the cursor is in get no entry and
/// don't count towards the relative indices.
///
/// Backward, the entry of a line is the first match met walking backward, numbered
/// `i - t - 1` from the backward reference `t`.  Forward, the entry of a line is the
/// last match on the line, numbered `i - b` from the forward reference `b` where `i`
/// is the first match on the next line.
///
/// `entries` is cleared and then filled sorted by line.
void walk_lens_range(const Match_Index& index,
                     const Nearest_Info& nearest,
                     cz::Vector<Lens_Entry>* entries);

}
