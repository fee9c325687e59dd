#pragma once

#include <utility>

#include "sdf/sdf.h"

namespace marcher {

// Sphere of radius 3 smoothly fused with a radius 2 sphere above it, with a
// radius 2.5 sphere carved out of the front right.
[[nodiscard]] inline SdfPtr makeDefaultScene() {
    SdfPtr body = sdf::smoothUnite(
        sdf::sphere(3.0),
        sdf::translate(sdf::sphere(2.0), Vec3(0.0, 3.5, 0.0)),
        1.0);

    return sdf::subtract(
        std::move(body),
        sdf::translate(sdf::sphere(2.5), Vec3(1.5, 1.5, -1.75)));
}

}  // namespace marcher
