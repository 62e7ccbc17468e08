#include "lens_format.hpp"

#include <cz/defer.hpp>
#include <cz/format.hpp>
#include <cz/heap.hpp>
#include <tracy/Tracy.hpp>

namespace lens {

void clear_chunks(cz::Vector<Lens_Chunk>* chunks) {
    for (size_t i = 0; i < chunks->len; ++i) {
        (*chunks)[i].text.drop(cz::heap_allocator());
    }
    chunks->len = 0;
}

void drop_chunks(cz::Vector<Lens_Chunk>* chunks) {
    clear_chunks(chunks);
    chunks->drop(cz::heap_allocator());
}

void push_chunk(cz::Vector<Lens_Chunk>* chunks, const Theme& theme, Face_Type type, cz::Str text) {
    Lens_Chunk chunk;
    chunk.text = text.clone(cz::heap_allocator());
    chunk.face_type = type;
    chunk.face = theme.face(type);
    chunks->reserve(cz::heap_allocator(), 1);
    chunks->push(chunk);
}

size_t chunks_width(cz::Slice<Lens_Chunk> chunks) {
    size_t width = 0;
    for (size_t i = 0; i < chunks.len; ++i) {
        width += chunks[i].text.len;
    }
    return width;
}

void append_indicator(cz::Allocator allocator,
                      cz::String* string,
                      int64_t relative_index,
                      bool search_forward) {
    if (relative_index == 0) {
        return;
    }

    uint64_t distance = (uint64_t)(relative_index < 0 ? -relative_index : relative_index);
    bool against = search_forward != (relative_index > 0);
    char letter = against ? 'N' : 'n';
    if (distance > 1) {
        cz::append(allocator, string, distance, letter);
    } else {
        cz::append(allocator, string, letter);
    }
}

static void default_lens_formatter_format(const Lens_Format_Request& request,
                                          const Theme& theme,
                                          cz::Vector<Lens_Chunk>* chunks,
                                          void*) {
    ZoneScoped;

    cz::String text = {};
    CZ_DEFER(text.drop(cz::heap_allocator()));

    cz::String indicator = {};
    CZ_DEFER(indicator.drop(cz::heap_allocator()));
    append_indicator(cz::heap_allocator(), &indicator, request.relative_index,
                     request.search_forward);

    uint64_t number = request.match_index + 1;
    if (request.nearest) {
        uint64_t total = request.index->len();
        if (indicator.len > 0) {
            cz::append(cz::heap_allocator(), &text, '[', indicator.as_str(), ' ', number, '/',
                       total, ']');
        } else {
            cz::append(cz::heap_allocator(), &text, '[', number, '/', total, ']');
        }
    } else {
        cz::append(cz::heap_allocator(), &text, '[', indicator.as_str(), ' ', number, ']');
    }

    push_chunk(chunks, theme, Face_Type::LENS_PADDING, " ");
    push_chunk(chunks, theme, request.nearest ? Face_Type::LENS_NEAR : Face_Type::LENS,
               text.as_str());
}

static void default_lens_formatter_cleanup(void*) {}

Lens_Formatter default_lens_formatter() {
    static const Lens_Formatter::VTable vtable = {
        default_lens_formatter_format,
        default_lens_formatter_cleanup,
    };
    return {&vtable, nullptr};
}

}
