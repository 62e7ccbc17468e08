#include "range_walker.hpp"

#include <cz/heap.hpp>
#include <cz/sort.hpp>
#include <cz/util.hpp>
#include <tracy/Tracy.hpp>

namespace lens {

static void set_line_entry(cz::Vector<Lens_Entry>* entries,
                           uint64_t line,
                           int64_t match_index,
                           int64_t relative_index) {
    CZ_DEBUG_ASSERT(match_index >= 0);

    Lens_Entry entry;
    entry.match_index = (size_t)match_index;
    entry.line = line;
    entry.relative_index = relative_index;
    entry.nearest = false;

    for (size_t i = 0; i < entries->len; ++i) {
        if ((*entries)[i].line == line) {
            (*entries)[i] = entry;
            return;
        }
    }

    entries->reserve(cz::heap_allocator(), 1);
    entries->push(entry);
}

static void walk_backward(const Match_Index& index,
                          const Nearest_Info& nearest,
                          cz::Vector<Lens_Entry>* entries) {
    int64_t reference = (int64_t)nearest.index - 1 - cz::min(nearest.relative_index, (int64_t)0);

    // Step over the matches hidden in the fold.
    while (nearest.folded_line > -1 && reference >= 0) {
        if (nearest.folded_line > (int64_t)index.line_of((size_t)reference)) {
            break;
        }
        --reference;
    }

    uint64_t last_line = 0;
    for (int64_t i = reference; i >= 0; --i) {
        uint64_t line = index.line_of((size_t)i);
        if (line < nearest.top_line) {
            break;
        }
        if (line != last_line) {
            last_line = line;
            set_line_entry(entries, line, i, i - reference - 1);
        }
    }
}

static void walk_forward(const Match_Index& index,
                         const Nearest_Info& nearest,
                         cz::Vector<Lens_Entry>* entries) {
    int64_t len = (int64_t)index.len();
    int64_t reference = (int64_t)nearest.index + 1 - cz::max(nearest.relative_index, (int64_t)0);

    // Step over the matches hidden in the fold.
    while (nearest.fold_end > -1 && reference < len - 1) {
        if (nearest.fold_end < (int64_t)index.line_of((size_t)reference)) {
            break;
        }
        ++reference;
    }

    uint64_t last_line = index.line_of(nearest.index);
    uint64_t line = 0;
    int64_t last_index = -1;
    for (int64_t i = reference; i < len; ++i) {
        last_index = i;
        line = index.line_of((size_t)i);
        if (line != last_line) {
            last_line = line;
            set_line_entry(entries, index.line_of((size_t)(i - 1)), i - 1, i - reference);
        }
        if (line > nearest.bottom_line) {
            break;
        }
    }

    if (last_index >= 0 && line <= nearest.bottom_line) {
        set_line_entry(entries, line, last_index, last_index - reference + 1);
    }
}

void walk_lens_range(const Match_Index& index,
                     const Nearest_Info& nearest,
                     cz::Vector<Lens_Entry>* entries) {
    ZoneScoped;

    entries->len = 0;

    walk_backward(index, nearest, entries);
    walk_forward(index, nearest, entries);

    // The nearest match gets its own lens.  Also drop lines the walk recorded
    // while crossing into or out of the visible region or out of the fold.
    uint64_t nearest_line = index.line_of(nearest.index);
    Visible_Range visible = {nearest.top_line, nearest.bottom_line};
    for (size_t i = 0; i < entries->len;) {
        const Lens_Entry& entry = (*entries)[i];
        bool in_fold = nearest.folded_line > -1 && (int64_t)entry.line >= nearest.folded_line &&
                       (int64_t)entry.line <= nearest.fold_end;
        if (entry.line == nearest_line || in_fold || !visible.contains(entry.line)) {
            entries->remove(i);
            continue;
        }
        ++i;
    }

    cz::sort(*entries,
             [](Lens_Entry* left, Lens_Entry* right) { return left->line < right->line; });
}

}
