#pragma once

#include <algorithm>
#include <cmath>
#include <cstdint>

#include "math/vec3.h"

namespace marcher {

struct PointLight {
    Point3 position{4.0, 3.0, -6.0};
    double intensity = 10.0;
    Color albedo{1.0, 0.0, 0.0};
    Color ambient{0.04, 0.04, 0.04};
};

inline constexpr std::uint32_t kMissColor = 0x00000000u;

// Lambert term with inverse-square falloff plus a flat ambient. The result is linear and unclamped.
[[nodiscard]] inline Color shadeLambert(const Point3& position, const Vec3& normal, const PointLight& light) {
    const Vec3 toLight = light.position - position;
    const Vec3 lightDir = normalize(toLight);
    const double distance = toLight.length();
    const double attenuation = light.intensity / (distance * distance);
    const double cosTheta = std::max(0.0, dot(lightDir, normal));

    return light.albedo * (cosTheta * attenuation) + light.ambient;
}

// component * 255 truncated toward zero. Input is clamped to [0, 1] first and NaN maps to 0.
[[nodiscard]] inline std::uint8_t channelToByte(double component) {
    if (std::isnan(component)) {
        return 0;
    }
    return static_cast<std::uint8_t>(std::clamp(component, 0.0, 1.0) * 255.0);
}

// Bytes from most to least significant: alpha, red, green, blue.
[[nodiscard]] inline std::uint32_t packColor(const Color& color, std::uint8_t alpha) {
    const std::uint32_t r = channelToByte(color.x());
    const std::uint32_t g = channelToByte(color.y());
    const std::uint32_t b = channelToByte(color.z());
    return b | (g << 8) | (r << 16) | (static_cast<std::uint32_t>(alpha) << 24);
}

[[nodiscard]] constexpr std::uint8_t alphaOf(std::uint32_t packed) { return static_cast<std::uint8_t>(packed >> 24); }
[[nodiscard]] constexpr std::uint8_t redOf(std::uint32_t packed) { return static_cast<std::uint8_t>(packed >> 16); }
[[nodiscard]] constexpr std::uint8_t greenOf(std::uint32_t packed) { return static_cast<std::uint8_t>(packed >> 8); }
[[nodiscard]] constexpr std::uint8_t blueOf(std::uint32_t packed) { return static_cast<std::uint8_t>(packed); }

}  // namespace marcher
