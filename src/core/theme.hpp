#pragma once

#include "core/face.hpp"

namespace lens {

namespace Face_Types_ {
enum Face_Type {
    /// The space separating a lens from the text before it.
    LENS_PADDING,
    /// Lenses of matches other than the nearest one.
    LENS,
    /// The lens of the nearest match.
    LENS_NEAR,
    /// The highlight over the nearest match.
    NEAR_MATCH,

    // Special value representing the number of values in the enum.
    length,
};
}
using Face_Types_::Face_Type;

struct Theme {
    Face faces[Face_Type::length];

    const Face& face(Face_Type type) const { return faces[type]; }
};

}
