#pragma once

#include <stdint.h>
#include <cz/string.hpp>
#include "core/lens_format.hpp"
#include "core/position.hpp"
#include "core/sink.hpp"

namespace lens {

/// The floating overlay showing the nearest lens.  There is at most one at a time.
struct Float_Overlay {
    bool open;
    uint64_t handle;
    uint64_t window;
    Position anchor;
    cz::String text;

    /// Show `chunks` at `anchor`.  The open overlay is kept if it already
    /// shows the same text at the same place; otherwise it is replaced.
    void update(const Lens_Sink& sink,
                uint64_t window,
                Position anchor,
                cz::Slice<Lens_Chunk> chunks);

    void close(const Lens_Sink& sink);

    void drop();
};

}
