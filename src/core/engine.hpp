#pragma once

#include <stddef.h>
#include <stdint.h>
#include <cz/vector.hpp>
#include "core/config.hpp"
#include "core/disposable.hpp"
#include "core/event.hpp"
#include "core/float_overlay.hpp"
#include "core/job.hpp"
#include "core/lens_format.hpp"
#include "core/range_walker.hpp"
#include "core/refresh_scheduler.hpp"
#include "core/sink.hpp"
#include "core/source.hpp"
#include "core/theme.hpp"

namespace lens {

/// The inputs of the last drawn cycle.  An unforced refresh
/// with the same inputs has nothing new to draw.
struct Refresh_Cache {
    bool valid;
    uint64_t buffer;
    Position cursor;
    Visible_Range viewport;
    size_t match_count;
    size_t nearest_index;
    int64_t nearest_relative_index;
};

/// Draws search lenses for one editing session.
///
/// The scheduler and the pending jobs point back into the engine so
/// it must not be moved or copied between `init` and `drop`.
struct Engine {
    enum Status {
        STOPPED,
        STARTED,
    };

    Config config;
    Theme theme;
    Lens_Source source;
    Lens_Sink sink;
    Clock clock;
    Event_Bus* events;

    Status status;

    Job_Queue jobs;
    Refresh_Scheduler scheduler;

    /// Undone by `stop`: event subscriptions and the clearing of all lenses.
    cz::Vector<Disposable> stop_disposables;

    Float_Overlay float_overlay;
    /// Buffers we have put annotations in since the last `clear_all`.
    cz::Vector<uint64_t> annotated_buffers;

    Refresh_Cache cache;

    cz::Vector<Match_Span> matches;
    cz::Vector<Lens_Entry> entries;
    cz::Vector<Lens_Chunk> chunks;

    void init(const Config& config,
              const Theme& theme,
              Lens_Source source,
              Lens_Sink sink,
              Clock clock,
              Event_Bus* events);
    void drop();

    /// Start listening to events and draw the lenses.  If already
    /// started then this only requests a refresh.
    void start(bool force = false);

    /// Stop listening to events and clear everything that was drawn.
    /// Calling it when already stopped does nothing.
    void stop();

    bool is_started() const { return status == STARTED; }

    /// Redraw the lenses of the current buffer.  Unless `force`, the redraw
    /// waits until refresh requests stop arriving for `config.refresh_delay`.
    void refresh(bool force = false);

    /// Run deferred work that is due.  Call this once per frame.
    bool tick();

    /// Clear the highlight of the nearest match, the annotations of `buffer`, and
    /// the floating overlay.  `buffer` is only cleared if `clear_buffer` is set.
    void clear(bool highlight, bool clear_buffer, uint64_t buffer, bool floated);

    /// Clear everything the engine has drawn.
    void clear_all();
};

}
