#pragma once

#include <stddef.h>
#include <stdint.h>
#include "core/position.hpp"

namespace lens {

namespace Float_When_ {
/// When the lens of the nearest match is drawn in a floating overlay.
enum Float_When {
    /// Only if it doesn't fit at the end of its line.
    AUTO,
    ALWAYS,
    NEVER,
};
}
using Float_When_::Float_When;

namespace Placement_Mode_ {
enum Placement_Mode {
    INLINE,
    FLOATING,
};
}
using Placement_Mode_::Placement_Mode;

struct Window_Geometry {
    /// Total width of the window including the gutter.
    uint64_t columns;
    /// Width of the line numbers, signs, and fold columns.
    uint64_t gutter_columns;
    bool wrap_long_lines;
    /// Command line windows are too small for overlays.
    bool command_line;

    int64_t text_columns() const { return (int64_t)columns - (int64_t)gutter_columns; }
};

struct Placement_Decision {
    Placement_Mode mode;
    /// `INLINE`: the start of the match; the text goes at the end of its line.
    /// `FLOATING`: the cell after the end of the match.
    Position anchor;
};

/// The number of columns left after the end of a line that is `line_columns` wide.
/// If long lines wrap then this is the space left on the line's last visual row.
int64_t remaining_columns(uint64_t line_columns, int64_t text_columns, bool wrap_long_lines);

/// Test if a label `label_columns` wide fits after a line that is `line_columns` wide.
bool fits_inline(uint64_t line_columns, const Window_Geometry& geometry, size_t label_columns);

/// Decide where to put the lens of the nearest match.  Other lenses are always inline.
Placement_Decision decide_placement(Float_When when,
                                    const Match_Span& span,
                                    uint64_t line_columns,
                                    const Window_Geometry& geometry,
                                    size_t label_columns);

}
