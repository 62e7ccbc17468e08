#pragma once

#include <stdint.h>
#include <cz/vector.hpp>
#include "core/placement.hpp"
#include "core/position.hpp"
#include "core/viewport.hpp"

namespace lens {

struct Search_State {
    /// The matches of the last search are highlighted.  When this is
    /// turned off (ie by `:nohlsearch`) the lenses should disappear.
    bool highlighting;
    bool forward;
    /// The pattern has an offset (ie `/foo/e`) so the cursor doesn't land
    /// on the match.  Only the nearest lens is shown in this case.
    bool has_offset;
};

/// The editor state the engine reads.  Implemented by the host editor.
struct Lens_Source {
    struct VTable {
        Search_State (*search_state)(void* data);

        /// Fill `matches` with the matches of the active pattern in document order.
        /// Returns `false` if there is no pattern to match against.
        bool (*find_matches)(uint64_t buffer, cz::Vector<Match_Span>* matches, void* data);

        uint64_t (*current_buffer)(void* data);
        Position (*cursor)(void* data);
        Visible_Range (*viewport)(void* data);

        /// Get the closed fold containing `line` or `no_fold`.
        Fold_Range (*fold_at)(uint64_t line, void* data);

        /// Get the window displaying `buffer`.  Returns `false` if it isn't displayed.
        bool (*window_for_buffer)(uint64_t buffer, uint64_t* window, void* data);
        Window_Geometry (*window_geometry)(uint64_t window, void* data);

        /// The number of columns `line` takes up when drawn in `window`.
        uint64_t (*line_columns)(uint64_t window, uint64_t line, void* data);

        /// Turn off the highlighting of the last search.
        void (*clear_search_highlighting)(void* data);
    };

    const VTable* vtable;
    void* data;

    Search_State search_state() const { return vtable->search_state(data); }
    bool find_matches(uint64_t buffer, cz::Vector<Match_Span>* matches) const {
        return vtable->find_matches(buffer, matches, data);
    }
    uint64_t current_buffer() const { return vtable->current_buffer(data); }
    Position cursor() const { return vtable->cursor(data); }
    Visible_Range viewport() const { return vtable->viewport(data); }
    Fold_Range fold_at(uint64_t line) const { return vtable->fold_at(line, data); }
    bool window_for_buffer(uint64_t buffer, uint64_t* window) const {
        return vtable->window_for_buffer(buffer, window, data);
    }
    Window_Geometry window_geometry(uint64_t window) const {
        return vtable->window_geometry(window, data);
    }
    uint64_t line_columns(uint64_t window, uint64_t line) const {
        return vtable->line_columns(window, line, data);
    }
    void clear_search_highlighting() const { vtable->clear_search_highlighting(data); }
};

}
