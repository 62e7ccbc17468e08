#include "nearest.hpp"

#include <tracy/Tracy.hpp>

namespace lens {

/// Find the number of spans starting at or before `point`.
static size_t count_starting_at_or_before(const Match_Index& index, Position point) {
    size_t start = 0;
    size_t end = index.len();
    while (start < end) {
        size_t mid = (start + end) / 2;
        if (compare_positions(index[mid].start, point) <= 0) {
            start = mid + 1;
        } else {
            end = mid;
        }
    }
    return start;
}

/// Find the first of the first `count` spans that contains `point`.  Returns `count` if none.
/// Spans can overlap and can cover several lines so their ends aren't sorted.
static size_t first_covering(const Match_Index& index, Position point, size_t count) {
    for (size_t i = 0; i < count; ++i) {
        if (index[i].contains(point)) {
            return i;
        }
    }
    return count;
}

bool resolve_nearest(const Match_Index& index,
                     Cursor_State cursor,
                     Visible_Range viewport,
                     Fold_Range cursor_fold,
                     Nearest_Info* info) {
    ZoneScoped;

    if (index.len() == 0) {
        return false;
    }

    if (cursor.search_forward) {
        // Every span starting after the cursor ends after it too.  Before
        // that only the spans covering the cursor end at or after it.
        size_t count = count_starting_at_or_before(index, cursor.point);
        size_t covering = first_covering(index, cursor.point, count);
        if (covering < count) {
            info->index = covering;
            info->relative_index = 0;
        } else if (count == index.len()) {
            info->index = 0;
            info->relative_index = 1;
        } else {
            info->index = count;
            info->relative_index = 1;
        }
    } else {
        size_t count = count_starting_at_or_before(index, cursor.point);
        if (count == 0) {
            info->index = index.len() - 1;
            info->relative_index = -1;
        } else {
            info->index = count - 1;
            info->relative_index = index[count - 1].contains(cursor.point) ? 0 : -1;
        }
    }

    info->top_line = viewport.top_line;
    info->bottom_line = viewport.bottom_line;
    info->folded_line = cursor_fold.start;
    info->fold_end = cursor_fold.is_folded() ? cursor_fold.end : -1;
    return true;
}

bool cursor_in_match(const Match_Index& index, Position point) {
    size_t count = count_starting_at_or_before(index, point);
    return first_covering(index, point, count) < count;
}

}
