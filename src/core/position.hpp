#pragma once

#include <stdint.h>

namespace lens {

/// A position in a buffer.  Both the line and the column start at 1.
struct Position {
    uint64_t line;
    uint64_t column;

    bool operator==(const Position& other) const {
        return line == other.line && column == other.column;
    }
    bool operator!=(const Position& other) const { return !(*this == other); }
};

/// Returns a negative number if `left` comes before `right`,
/// `0` if they are the same, and a positive number otherwise.
inline int compare_positions(Position left, Position right) {
    if (left.line != right.line) {
        return left.line < right.line ? -1 : 1;
    }
    if (left.column != right.column) {
        return left.column < right.column ? -1 : 1;
    }
    return 0;
}

/// The span of one search match.  `end` is inclusive.
struct Match_Span {
    Position start;
    Position end;

    bool contains(Position position) const {
        return compare_positions(start, position) <= 0 && compare_positions(position, end) <= 0;
    }
};

}
