#pragma once

#include <stddef.h>
#include <stdint.h>
#include <cz/string.hpp>
#include <cz/vector.hpp>
#include <czt/test_base.hpp>
#include "core/engine.hpp"

namespace lens {

struct Recorded_Annotation {
    uint64_t buffer;
    uint64_t line;
    uint64_t column;
    cz::String text;
    Face_Type face_type;
};

struct Recorded_Overlay {
    uint64_t handle;
    uint64_t window;
    Position anchor;
    uint64_t width;
    cz::String text;
};

/// A fake editor for the engine to read from and draw into.
struct Test_Runner {
    // What the engine sees.
    Search_State search;
    bool has_pattern;
    cz::Vector<Match_Span> matches;
    uint64_t buffer;
    Position cursor;
    Visible_Range viewport;
    Fold_Range fold;
    bool has_window;
    uint64_t window;
    Window_Geometry geometry;
    uint64_t line_width;
    Time_Point now;

    // What the engine drew.
    cz::Vector<Recorded_Annotation> annotations;
    size_t annotations_set;
    cz::Vector<Recorded_Overlay> overlays;
    uint64_t next_overlay_handle;
    size_t overlays_opened;
    size_t overlays_closed;
    bool has_highlight;
    Position highlight_start;
    Position highlight_end;
    Face highlight_face;
    size_t find_matches_calls;
    size_t clear_search_highlighting_calls;

    Config config;
    Theme theme;
    Event_Bus events;
    Engine engine;
    bool engine_initialized;

    Test_Runner();
    ~Test_Runner();
    Test_Runner(const Test_Runner&) = delete;
    Test_Runner& operator=(const Test_Runner&) = delete;

    /// Add a match on one line.  Columns are inclusive.
    void add_match(uint64_t line, uint64_t start_column, uint64_t end_column);

    /// Create the engine from `config` and `theme`.  Called by
    /// `start` if it hasn't been called yet.
    void init_engine();
    void start(bool force = false);

    /// Move the fake clock forward and tick the engine.
    void advance(int64_t milliseconds);

    /// Move the cursor and emit `CURSOR_MOVED`.
    void move_cursor(uint64_t line, uint64_t column);

    /// Find the annotation drawn on `line` or `nullptr`.
    const Recorded_Annotation* annotation_at(uint64_t line) const;

    Lens_Source source();
    Lens_Sink sink();
    Clock clock();
};

}
