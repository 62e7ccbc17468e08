#include "float_overlay.hpp"

#include <cz/defer.hpp>
#include <cz/heap.hpp>
#include <cz/util.hpp>
#include <tracy/Tracy.hpp>

namespace lens {

static void concat_chunks(cz::Slice<Lens_Chunk> chunks, cz::String* text) {
    text->reserve(cz::heap_allocator(), chunks_width(chunks));
    for (size_t i = 0; i < chunks.len; ++i) {
        text->append(chunks[i].text.as_str());
    }
}

void Float_Overlay::update(const Lens_Sink& sink,
                           uint64_t window,
                           Position anchor,
                           cz::Slice<Lens_Chunk> chunks) {
    ZoneScoped;

    cz::String new_text = {};
    CZ_DEFER(new_text.drop(cz::heap_allocator()));
    concat_chunks(chunks, &new_text);

    if (open && this->window == window && this->anchor == anchor &&
        text.as_str() == new_text.as_str()) {
        return;
    }

    close(sink);

    handle = sink.open_floating_overlay(window, anchor, chunks, new_text.len);
    open = true;
    this->window = window;
    this->anchor = anchor;
    cz::swap(text, new_text);
}

void Float_Overlay::close(const Lens_Sink& sink) {
    if (!open) {
        return;
    }

    sink.close_floating_overlay(handle);
    open = false;
    text.len = 0;
}

void Float_Overlay::drop() {
    text.drop(cz::heap_allocator());
}

}
