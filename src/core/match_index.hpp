#pragma once

#include <stddef.h>
#include <stdint.h>
#include <cz/assert.hpp>
#include <cz/slice.hpp>
#include "core/position.hpp"

namespace lens {

/// A read only view of the matches of the active search in one buffer.
///
/// The spans are in document order and no two spans start at the same position.
/// The view doesn't own the spans; they must outlive it for the whole refresh cycle.
struct Match_Index {
    cz::Slice<Match_Span> spans;

    size_t len() const { return spans.len; }

    const Match_Span& operator[](size_t index) const {
        CZ_ASSERT(index < spans.len);
        return spans[index];
    }

    uint64_t line_of(size_t index) const {
        CZ_ASSERT(index < spans.len);
        return spans[index].start.line;
    }

    /// Assert that the spans are sorted by their start and that no two spans share a start.
    void check_ordering() const;
};

}
