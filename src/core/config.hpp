#pragma once

#include <chrono>
#include "core/lens_format.hpp"
#include "core/placement.hpp"

namespace lens {

struct Config {
    /// Only draw the lens of the nearest match.
    bool nearest_only = false;

    /// When to draw the nearest lens in a floating overlay instead of at the end of its line.
    Float_When nearest_float_when = Float_When::AUTO;

    /// Clear the search highlighting and stop when the text changes or
    /// the cursor leaves the matches.
    bool calm_down = false;

    /// Replaces the default `[2n 5]` labels.  Ignored if `vtable` is null.
    Lens_Formatter override_lens = {};

    /// How long the cursor has to rest before the lenses are recomputed.
    std::chrono::milliseconds refresh_delay = std::chrono::milliseconds(150);
};

}
