#pragma once

#include <cmath>
#include <stdexcept>
#include <string>

#include "core/ray.h"

namespace marcher {

struct CameraSettings {
    Point3 origin{0.0, 0.0, -10.0};
    double fovDeg = 64.0;
};

// Pinhole camera looking down +z. Rays leave from a single point through pixel centers.
class Camera {
public:
    Camera(int width, int height, const CameraSettings& settings = {})
        : width_(width), height_(height), origin_(settings.origin) {
        if (width <= 0 || height <= 0) {
            throw std::invalid_argument(
                "Camera frame size must be positive, got " + std::to_string(width) + "x" + std::to_string(height));
        }

        constexpr double pi = 3.14159265358979323846;

        aspect_ = static_cast<double>(width) / static_cast<double>(height);
        halfAngle_ = std::tan(settings.fovDeg / 2.0 * pi / 180.0);
    }

    [[nodiscard]] Ray primaryRay(int x, int y) const {
        const double px = (2.0 * ((static_cast<double>(x) + 0.5) / width_) - 1.0) * halfAngle_ * aspect_;
        const double py = (1.0 - 2.0 * ((static_cast<double>(y) + 0.5) / height_)) * halfAngle_;
        return Ray(origin_, normalize(Vec3(px, py, 1.0)));
    }

    [[nodiscard]] int width() const { return width_; }
    [[nodiscard]] int height() const { return height_; }

private:
    int width_;
    int height_;
    Point3 origin_;
    double aspect_ = 1.0;
    double halfAngle_ = 0.0;
};

}  // namespace marcher
