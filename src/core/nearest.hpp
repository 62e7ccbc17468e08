#pragma once

#include <stddef.h>
#include <stdint.h>
#include "core/match_index.hpp"
#include "core/position.hpp"
#include "core/viewport.hpp"

namespace lens {

struct Cursor_State {
    Position point;

    /// The direction of the last search.  Flips the meaning of `n` and `N` in lens labels.
    bool search_forward;
};

struct Nearest_Info {
    /// The index of the nearest match in navigation order.
    size_t index;

    /// The offset of the nearest match from the cursor: `0` if the cursor is inside
    /// the match, `-1` if the match is before the cursor, and `1` if it is after.
    int64_t relative_index;

    uint64_t top_line;
    uint64_t bottom_line;

    /// The start line of the fold the cursor is in or `-1`.
    int64_t folded_line;
    int64_t fold_end;
};

/// Find the match nearest to the cursor in navigation order.  Searching forward picks the
/// first match ending at or after the cursor and wraps around to the first match.  Searching
/// backward picks the last match starting at or before the cursor and wraps around to the
/// last match.
///
/// Returns `false` if there are no matches.
bool resolve_nearest(const Match_Index& index,
                     Cursor_State cursor,
                     Visible_Range viewport,
                     Fold_Range cursor_fold,
                     Nearest_Info* info);

/// Test if `point` is inside any of the matches.
bool cursor_in_match(const Match_Index& index, Position point);

}
