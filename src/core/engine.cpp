#include "engine.hpp"

#include <cz/assert.hpp>
#include <cz/heap.hpp>
#include <tracy/Tracy.hpp>
#include "core/nearest.hpp"
#include "core/placement.hpp"
#include "core/tracy_format.hpp"

namespace lens {

static void remember_annotated_buffer(Engine* engine, uint64_t buffer) {
    for (size_t i = 0; i < engine->annotated_buffers.len; ++i) {
        if (engine->annotated_buffers[i] == buffer) {
            return;
        }
    }
    engine->annotated_buffers.reserve(cz::heap_allocator(), 1);
    engine->annotated_buffers.push(buffer);
}

////////////////////////////////////////////////////////////////////////////////
// Stopping
////////////////////////////////////////////////////////////////////////////////

static void no_highlight_and_stop(Engine* engine) {
    engine->source.clear_search_highlighting();
    engine->stop();
}

static void deferred_no_highlight_and_stop(void* _engine) {
    Engine* engine = (Engine*)_engine;
    if (!engine->is_started()) {
        return;
    }
    no_highlight_and_stop(engine);
}

static void deferred_stop_if_not_highlighting(void* _engine) {
    Engine* engine = (Engine*)_engine;
    if (!engine->is_started()) {
        return;
    }
    if (!engine->source.search_state().highlighting) {
        engine->stop();
    }
}

////////////////////////////////////////////////////////////////////////////////
// Drawing
////////////////////////////////////////////////////////////////////////////////

static void set_lens(Engine* engine, uint64_t buffer, const Match_Span& span, bool nearest) {
    if (!nearest) {
        engine->sink.set_inline_annotation(buffer, span.start.line, span.start.column,
                                           engine->chunks);
        return;
    }

    uint64_t window;
    if (!engine->source.window_for_buffer(buffer, &window)) {
        return;
    }

    Window_Geometry geometry = engine->source.window_geometry(window);
    uint64_t line_columns = engine->source.line_columns(window, span.start.line);
    Placement_Decision decision =
        decide_placement(engine->config.nearest_float_when, span, line_columns, geometry,
                         chunks_width(engine->chunks));

    if (decision.mode == Placement_Mode::INLINE) {
        engine->sink.set_inline_annotation(buffer, decision.anchor.line, decision.anchor.column,
                                           engine->chunks);
        engine->float_overlay.close(engine->sink);
    } else {
        engine->float_overlay.update(engine->sink, window, decision.anchor, engine->chunks);
    }
}

static void add_lens(Engine* engine,
                     uint64_t buffer,
                     const Match_Index& index,
                     bool nearest,
                     size_t match_index,
                     int64_t relative_index,
                     bool search_forward) {
    Lens_Format_Request request;
    request.index = &index;
    request.match_index = match_index;
    request.relative_index = relative_index;
    request.nearest = nearest;
    request.search_forward = search_forward;

    clear_chunks(&engine->chunks);
    if (engine->config.override_lens.vtable) {
        engine->config.override_lens.format(request, engine->theme, &engine->chunks);
    } else {
        default_lens_formatter().format(request, engine->theme, &engine->chunks);
    }

    set_lens(engine, buffer, index[match_index], nearest);
}

static void do_lens(Engine* engine,
                    uint64_t buffer,
                    const Match_Index& index,
                    const Nearest_Info& nearest,
                    Search_State search) {
    ZoneScoped;

    engine->entries.len = 0;
    if (!engine->config.nearest_only && !search.has_offset) {
        walk_lens_range(index, nearest, &engine->entries);
    }

    engine->sink.clear_buffer_annotations(buffer);
    remember_annotated_buffer(engine, buffer);

    add_lens(engine, buffer, index, true, nearest.index, nearest.relative_index, search.forward);
    for (size_t i = 0; i < engine->entries.len; ++i) {
        const Lens_Entry& entry = engine->entries[i];
        add_lens(engine, buffer, index, false, entry.match_index, entry.relative_index,
                 search.forward);
    }

    TracyFormat(message, message_len, 64, "lens: drew %zu lenses", engine->entries.len + 1);
    TracyMessage(message, message_len);
}

static bool update_cache(Refresh_Cache* cache,
                         uint64_t buffer,
                         Position cursor,
                         Visible_Range viewport,
                         size_t match_count,
                         const Nearest_Info& nearest) {
    bool hit = cache->valid && cache->buffer == buffer && cache->cursor == cursor &&
               cache->viewport.top_line == viewport.top_line &&
               cache->viewport.bottom_line == viewport.bottom_line &&
               cache->match_count == match_count && cache->nearest_index == nearest.index &&
               cache->nearest_relative_index == nearest.relative_index;

    cache->valid = true;
    cache->buffer = buffer;
    cache->cursor = cursor;
    cache->viewport = viewport;
    cache->match_count = match_count;
    cache->nearest_index = nearest.index;
    cache->nearest_relative_index = nearest.relative_index;
    return hit;
}

static void refresh_current_buffer(Engine* engine, bool force) {
    ZoneScoped;

    // The refresh was queued before the engine stopped.
    if (!engine->is_started()) {
        return;
    }

    Search_State search = engine->source.search_state();
    if (!search.highlighting) {
        defer_to_next_tick(&engine->jobs, deferred_stop_if_not_highlighting, engine);
        return;
    }

    uint64_t buffer = engine->source.current_buffer();
    engine->matches.len = 0;
    if (!engine->source.find_matches(buffer, &engine->matches)) {
        engine->stop();
        return;
    }

    if (engine->matches.len == 0) {
        engine->clear(true, true, buffer, true);
        return;
    }

    Match_Index index = {engine->matches};
    index.check_ordering();

    Cursor_State cursor;
    cursor.point = engine->source.cursor();
    cursor.search_forward = search.forward;
    Visible_Range viewport = engine->source.viewport();
    Fold_Range fold = engine->source.fold_at(cursor.point.line);

    Nearest_Info nearest;
    if (!resolve_nearest(index, cursor, viewport, fold, &nearest)) {
        return;
    }

    bool hit = update_cache(&engine->cache, buffer, cursor.point, viewport, index.len(), nearest);
    if (engine->config.calm_down) {
        if (!cursor_in_match(index, cursor.point)) {
            no_highlight_and_stop(engine);
            return;
        }
    } else if (!force && hit) {
        return;
    }

    uint64_t window;
    if (engine->source.window_for_buffer(buffer, &window)) {
        const Match_Span& span = index[nearest.index];
        engine->sink.set_nearest_highlight(window, span.start, span.end,
                                           engine->theme.face(Face_Type::NEAR_MATCH));
    }

    do_lens(engine, buffer, index, nearest, search);
}

static void scheduler_callback(bool force, void* engine) {
    refresh_current_buffer((Engine*)engine, force);
}

////////////////////////////////////////////////////////////////////////////////
// Events
////////////////////////////////////////////////////////////////////////////////

static void on_cursor_moved(void* _engine) {
    Engine* engine = (Engine*)_engine;
    engine->refresh(false);
}

static void on_term_enter(void* _engine) {
    Engine* engine = (Engine*)_engine;
    engine->clear(true, true, engine->source.current_buffer(), true);
}

static void on_text_changed(void* _engine) {
    Engine* engine = (Engine*)_engine;
    // Don't stop in the middle of the edit.
    defer_to_next_tick(&engine->jobs, deferred_no_highlight_and_stop, engine);
}

static void on_region_changed(void* _engine) {
    Engine* engine = (Engine*)_engine;
    engine->refresh(true);
}

static void teardown(void* _engine) {
    Engine* engine = (Engine*)_engine;
    engine->status = Engine::STOPPED;
    engine->cache.valid = false;
    engine->clear_all();
    engine->scheduler.cancel();
}

////////////////////////////////////////////////////////////////////////////////
// Engine
////////////////////////////////////////////////////////////////////////////////

void Engine::init(const Config& config,
                  const Theme& theme,
                  Lens_Source source,
                  Lens_Sink sink,
                  Clock clock,
                  Event_Bus* events) {
    CZ_ASSERT(source.vtable);
    CZ_ASSERT(sink.vtable);
    CZ_ASSERT(events);

    this->config = config;
    this->theme = theme;
    this->source = source;
    this->sink = sink;
    this->clock = clock;
    this->events = events;

    status = STOPPED;
    jobs = {};
    scheduler.init(&jobs, config.refresh_delay, scheduler_callback, this);
    stop_disposables = {};
    float_overlay = {};
    annotated_buffers = {};
    cache = {};
    matches = {};
    entries = {};
    chunks = {};
}

void Engine::drop() {
    stop();

    jobs.drop();
    stop_disposables.drop(cz::heap_allocator());
    float_overlay.drop();
    annotated_buffers.drop(cz::heap_allocator());
    matches.drop(cz::heap_allocator());
    entries.drop(cz::heap_allocator());
    drop_chunks(&chunks);

    if (config.override_lens.vtable) {
        config.override_lens.cleanup();
    }
}

void Engine::start(bool force) {
    ZoneScoped;

    if (status != STARTED) {
        TracyMessageL("lens: start");

        status = STARTED;
        subscribe(events, Event_Type::CURSOR_MOVED, on_cursor_moved, this, &stop_disposables);
        subscribe(events, Event_Type::TERM_ENTER, on_term_enter, this, &stop_disposables);
        if (config.calm_down) {
            subscribe(events, Event_Type::TEXT_CHANGED, on_text_changed, this, &stop_disposables);
            subscribe(events, Event_Type::TEXT_CHANGED_INSERT, on_text_changed, this,
                      &stop_disposables);
        }
        subscribe(events, Event_Type::REGION_CHANGED, on_region_changed, this,
                  &stop_disposables);

        scheduler.arm();

        Disposable disposable;
        disposable.dispose = teardown;
        disposable.data = this;
        stop_disposables.reserve(cz::heap_allocator(), 1);
        stop_disposables.push(disposable);
    }

    refresh(force);
}

void Engine::stop() {
    if (stop_disposables.len == 0) {
        return;
    }

    TracyMessageL("lens: stop");
    dispose_all(&stop_disposables);
}

void Engine::refresh(bool force) {
    scheduler.request(force, clock.get());
}

bool Engine::tick() {
    return jobs.run(clock.get());
}

void Engine::clear(bool highlight, bool clear_buffer, uint64_t buffer, bool floated) {
    // Whatever was cleared has to be drawn again by the next refresh.
    cache.valid = false;

    if (highlight) {
        sink.clear_all_highlights();
    }
    if (clear_buffer) {
        sink.clear_buffer_annotations(buffer);
    }
    if (floated) {
        float_overlay.close(sink);
    }
}

void Engine::clear_all() {
    ZoneScoped;

    float_overlay.close(sink);
    for (size_t i = 0; i < annotated_buffers.len; ++i) {
        sink.clear_buffer_annotations(annotated_buffers[i]);
    }
    annotated_buffers.len = 0;
    sink.clear_all_highlights();
}

}
