#pragma once

#include <stdint.h>

namespace lens {

/// The lines visible in a window, inclusive on both ends.
struct Visible_Range {
    uint64_t top_line;
    uint64_t bottom_line;

    bool contains(uint64_t line) const { return line >= top_line && line <= bottom_line; }
};

/// A closed fold.  A fold is drawn as a single line so only one lens is shown for it.
struct Fold_Range {
    /// `-1` if there is no fold.
    int64_t start;
    int64_t end;

    bool is_folded() const { return start != -1; }
};

constexpr Fold_Range no_fold = {-1, -1};

}
