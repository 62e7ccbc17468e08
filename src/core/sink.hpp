#pragma once

#include <stdint.h>
#include <cz/slice.hpp>
#include "core/face.hpp"
#include "core/lens_format.hpp"
#include "core/position.hpp"

namespace lens {

/// Where lenses are drawn.  Implemented by the host editor.
struct Lens_Sink {
    struct VTable {
        /// Put `chunks` as virtual text at the end of `line`.
        void (*set_inline_annotation)(uint64_t buffer,
                                      uint64_t line,
                                      uint64_t column,
                                      cz::Slice<Lens_Chunk> chunks,
                                      void* data);
        /// Open a floating overlay and return its handle.
        uint64_t (*open_floating_overlay)(uint64_t window,
                                          Position anchor,
                                          cz::Slice<Lens_Chunk> chunks,
                                          uint64_t width,
                                          void* data);
        void (*close_floating_overlay)(uint64_t handle, void* data);
        /// Highlight the nearest match from `start` to `end` inclusive.
        void (*set_nearest_highlight)(uint64_t window,
                                      Position start,
                                      Position end,
                                      Face face,
                                      void* data);
        void (*clear_all_highlights)(void* data);
        void (*clear_buffer_annotations)(uint64_t buffer, void* data);
    };

    const VTable* vtable;
    void* data;

    void set_inline_annotation(uint64_t buffer,
                               uint64_t line,
                               uint64_t column,
                               cz::Slice<Lens_Chunk> chunks) const {
        vtable->set_inline_annotation(buffer, line, column, chunks, data);
    }

    uint64_t open_floating_overlay(uint64_t window,
                                   Position anchor,
                                   cz::Slice<Lens_Chunk> chunks,
                                   uint64_t width) const {
        return vtable->open_floating_overlay(window, anchor, chunks, width, data);
    }

    void close_floating_overlay(uint64_t handle) const {
        vtable->close_floating_overlay(handle, data);
    }

    void set_nearest_highlight(uint64_t window, Position start, Position end, Face face) const {
        vtable->set_nearest_highlight(window, start, end, face, data);
    }

    void clear_all_highlights() const { vtable->clear_all_highlights(data); }

    void clear_buffer_annotations(uint64_t buffer) const {
        vtable->clear_buffer_annotations(buffer, data);
    }
};

}
