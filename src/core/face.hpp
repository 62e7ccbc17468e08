#pragma once

#include <stdint.h>

namespace lens {

/// How a piece of lens text is drawn.  Colors are indices into the host's palette
/// and `-1` means the host's default color.
struct Face {
    int16_t foreground = -1;
    int16_t background = -1;

    enum Flags {
        BOLD = 1,
        UNDERSCORE = 2,
        REVERSE = 4,
        ITALICS = 8,
        INVISIBLE = 16,
    };
    uint32_t flags = 0;

    Face() = default;
    Face(int16_t foreground, int16_t background, uint32_t flags)
        : foreground(foreground), background(background), flags(flags) {}

    bool operator==(const Face& other) const {
        return foreground == other.foreground && background == other.background &&
               flags == other.flags;
    }
    bool operator!=(const Face& other) const { return !(*this == other); }
};

}
