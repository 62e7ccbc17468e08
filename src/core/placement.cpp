#include "placement.hpp"

#include <cz/util.hpp>

namespace lens {

int64_t remaining_columns(uint64_t line_columns, int64_t text_columns, bool wrap_long_lines) {
    if (text_columns <= 0) {
        return 0;
    }

    int64_t end = (int64_t)line_columns;
    if (wrap_long_lines) {
        // Floored modulo: an empty line counts as filling its row.
        int64_t used = (end - 1) % text_columns;
        if (used < 0) {
            used += text_columns;
        }
        return text_columns - used - 1;
    } else {
        return cz::max(text_columns - end, (int64_t)0);
    }
}

bool fits_inline(uint64_t line_columns, const Window_Geometry& geometry, size_t label_columns) {
    int64_t remaining =
        remaining_columns(line_columns, geometry.text_columns(), geometry.wrap_long_lines);
    return remaining > (int64_t)label_columns;
}

Placement_Decision decide_placement(Float_When when,
                                    const Match_Span& span,
                                    uint64_t line_columns,
                                    const Window_Geometry& geometry,
                                    size_t label_columns) {
    Placement_Decision decision;
    decision.mode = Placement_Mode::INLINE;
    decision.anchor = span.start;

    if (geometry.command_line) {
        return decision;
    }

    switch (when) {
    case Float_When::NEVER:
        return decision;
    case Float_When::AUTO:
        if (fits_inline(line_columns, geometry, label_columns)) {
            return decision;
        }
        break;
    case Float_When::ALWAYS:
        break;
    }

    decision.mode = Placement_Mode::FLOATING;
    decision.anchor = {span.end.line, span.end.column + 1};
    return decision;
}

}
