#pragma once

#include <stddef.h>
#include <stdint.h>
#include <cz/string.hpp>
#include <cz/vector.hpp>
#include "core/face.hpp"
#include "core/match_index.hpp"
#include "core/theme.hpp"

namespace lens {

/// A styled piece of a lens label.
struct Lens_Chunk {
    cz::String text;
    Face_Type face_type;
    Face face;
};

/// Drop the text of each chunk and empty the vector.
void clear_chunks(cz::Vector<Lens_Chunk>* chunks);
void drop_chunks(cz::Vector<Lens_Chunk>* chunks);

/// Append a chunk.  The text is copied.
void push_chunk(cz::Vector<Lens_Chunk>* chunks, const Theme& theme, Face_Type type, cz::Str text);

/// The total width of the chunks.  Lens text is ASCII so this is also the number of columns.
size_t chunks_width(cz::Slice<Lens_Chunk> chunks);

/// Append the `n`/`N` indicator for a relative index to `string`:
/// nothing for `0`, `n` or `N` for a distance of one, and the distance
/// followed by the letter otherwise.  The letter is `N` when moving
/// there goes against the direction of the last search.
void append_indicator(cz::Allocator allocator,
                      cz::String* string,
                      int64_t relative_index,
                      bool search_forward);

struct Lens_Format_Request {
    const Match_Index* index;
    size_t match_index;
    int64_t relative_index;
    bool nearest;
    bool search_forward;
};

/// Turns a match into the chunks of its lens label.
struct Lens_Formatter {
    struct VTable {
        void (*format)(const Lens_Format_Request& request,
                       const Theme& theme,
                       cz::Vector<Lens_Chunk>* chunks,
                       void* data);
        void (*cleanup)(void* data);
    };

    const VTable* vtable;
    void* data;

    void format(const Lens_Format_Request& request,
                const Theme& theme,
                cz::Vector<Lens_Chunk>* chunks) const {
        vtable->format(request, theme, chunks, data);
    }

    void cleanup() { vtable->cleanup(data); }
};

/// Formats `[N 3/7]` for the nearest match and `[2n 5]` for the others.
Lens_Formatter default_lens_formatter();

}
