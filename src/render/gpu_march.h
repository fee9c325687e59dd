#pragma once

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <type_traits>
#include <vector>

#include "math/vec3.h"
#include "render/camera.h"
#include "render/framebuffer.h"
#include "render/shading.h"

#if defined(__CUDACC__)
#define MARCHER_HOST_DEVICE __host__ __device__
#else
#define MARCHER_HOST_DEVICE
#endif

namespace marcher {

inline constexpr int kGpuWorkgroupSize = 64;
inline constexpr int kGpuMaxSteps = 50;
inline constexpr float kGpuEpsilon = 0.001f;
// Iterations whose depth falls outside this window are skipped, not terminated.
inline constexpr float kGpuMinDepth = 0.001f;
inline constexpr float kGpuMaxDepth = 10000.0f;
inline constexpr float kGpuMissDistance = -1.0f;

struct GpuVec3 {
    float x = 0.0f;
    float y = 0.0f;
    float z = 0.0f;
};

// Both records are copied to and from the device as raw memory; field order is the kernel contract.
struct MarchInstruction {
    GpuVec3 origin;
    GpuVec3 direction;
};

struct MarchResult {
    float distance = kGpuMissDistance;
    GpuVec3 normal;
};

// Per-dispatch march budget, passed to the kernel by value.
struct MarchParams {
    int maxSteps = kGpuMaxSteps;
    float epsilon = kGpuEpsilon;
};

static_assert(std::is_standard_layout<MarchInstruction>::value, "MarchInstruction must be standard layout");
static_assert(std::is_standard_layout<MarchResult>::value, "MarchResult must be standard layout");
static_assert(sizeof(MarchInstruction) == 6 * sizeof(float), "MarchInstruction must be six packed floats");
static_assert(sizeof(MarchResult) == 4 * sizeof(float), "MarchResult must be four packed floats");

[[nodiscard]] inline GpuVec3 toGpuVec3(const Vec3& v) {
    return GpuVec3{
        static_cast<float>(v.x()),
        static_cast<float>(v.y()),
        static_cast<float>(v.z())};
}

[[nodiscard]] inline Vec3 fromGpuVec3(const GpuVec3& v) {
    return Vec3(v.x, v.y, v.z);
}

MARCHER_HOST_DEVICE inline GpuVec3 operator+(const GpuVec3& a, const GpuVec3& b) {
    return GpuVec3{a.x + b.x, a.y + b.y, a.z + b.z};
}

MARCHER_HOST_DEVICE inline GpuVec3 operator-(const GpuVec3& a, const GpuVec3& b) {
    return GpuVec3{a.x - b.x, a.y - b.y, a.z - b.z};
}

MARCHER_HOST_DEVICE inline GpuVec3 operator*(const GpuVec3& v, float t) {
    return GpuVec3{v.x * t, v.y * t, v.z * t};
}

MARCHER_HOST_DEVICE inline float gpuLength(const GpuVec3& v) {
    return sqrtf(v.x * v.x + v.y * v.y + v.z * v.z);
}

MARCHER_HOST_DEVICE inline float gpuSphere(const GpuVec3& p, float radius) {
    return gpuLength(p) - radius;
}

MARCHER_HOST_DEVICE inline float gpuSmoothMin(float a, float b, float k) {
    const float h = fminf(fmaxf(0.5f + 0.5f * (b - a) / k, 0.0f), 1.0f);
    return b + (a - b) * h - k * h * (1.0f - h);
}

// Single precision copy of makeDefaultScene(); the kernel cannot walk the virtual Sdf tree.
MARCHER_HOST_DEVICE inline float gpuSceneDistance(const GpuVec3& p) {
    const float body = gpuSmoothMin(
        gpuSphere(p, 3.0f),
        gpuSphere(p - GpuVec3{0.0f, 3.5f, 0.0f}, 2.0f),
        1.0f);
    const float cut = gpuSphere(p - GpuVec3{1.5f, 1.5f, -1.75f}, 2.5f);
    return fmaxf(body, -cut);
}

MARCHER_HOST_DEVICE inline GpuVec3 gpuGradient(const GpuVec3& p, float epsilon) {
    const GpuVec3 dx{epsilon, 0.0f, 0.0f};
    const GpuVec3 dy{0.0f, epsilon, 0.0f};
    const GpuVec3 dz{0.0f, 0.0f, epsilon};

    const GpuVec3 g{
        gpuSceneDistance(p + dx) - gpuSceneDistance(p - dx),
        gpuSceneDistance(p + dy) - gpuSceneDistance(p - dy),
        gpuSceneDistance(p + dz) - gpuSceneDistance(p - dz)};

    const float len = gpuLength(g);
    return len > 0.0f ? g * (1.0f / len) : g;
}

/**
 * Per-element body of the march kernel.
 *
 * Unlike sphereTrace(), a step whose depth lies outside
 * [kGpuMinDepth, kGpuMaxDepth] is skipped while the loop keeps counting, so a
 * ray that overshoots simply burns the rest of its budget. On a hit the
 * result carries the depth along the ray and the unit gradient there; a miss
 * carries kGpuMissDistance and a zero normal. The march starts at the hit
 * epsilon, raised to kGpuMinDepth so the first step is never skipped.
 */
MARCHER_HOST_DEVICE inline MarchResult marchElement(const MarchInstruction& instruction, const MarchParams& params) {
    float depth = fmaxf(params.epsilon, kGpuMinDepth);
    bool hit = false;

    for (int step = 0; step < params.maxSteps; ++step) {
        if (depth < kGpuMinDepth || depth > kGpuMaxDepth) {
            continue;
        }

        const float dist = gpuSceneDistance(instruction.origin + instruction.direction * depth);
        if (dist < params.epsilon) {
            hit = true;
            break;
        }

        depth += dist;
    }

    MarchResult result;
    if (hit) {
        result.distance = depth;
        result.normal = gpuGradient(instruction.origin + instruction.direction * depth, params.epsilon);
    }
    return result;
}

// Rounds up to whole workgroups.
[[nodiscard]] inline std::size_t paddedDispatchSize(std::size_t elementCount) {
    const std::size_t group = static_cast<std::size_t>(kGpuWorkgroupSize);
    return ((elementCount + group - 1) / group) * group;
}

// One instruction per pixel in framebuffer order, zero-padded to whole workgroups.
[[nodiscard]] inline std::vector<MarchInstruction> buildMarchInstructions(const Camera& camera) {
    const std::size_t pixelCount = static_cast<std::size_t>(camera.width()) * static_cast<std::size_t>(camera.height());

    std::vector<MarchInstruction> instructions(paddedDispatchSize(pixelCount));
    for (int y = 0; y < camera.height(); ++y) {
        for (int x = 0; x < camera.width(); ++x) {
            const Ray ray = camera.primaryRay(x, y);
            MarchInstruction& instruction =
                instructions[static_cast<std::size_t>(y) * static_cast<std::size_t>(camera.width()) + static_cast<std::size_t>(x)];
            instruction.origin = toGpuVec3(ray.origin);
            instruction.direction = toGpuVec3(ray.direction);
        }
    }
    return instructions;
}

[[nodiscard]] inline bool isHit(const MarchResult& result) {
    return result.distance >= 0.0f;
}

// Host side lighting of the device results, with the same shader the CPU path uses.
inline void shadeMarchResults(
    const std::vector<MarchInstruction>& instructions,
    const std::vector<MarchResult>& results,
    const PointLight& light,
    Framebuffer& output) {
    const std::size_t pixelCount = output.pixels().size();
    if (instructions.size() < pixelCount || results.size() < pixelCount) {
        throw std::invalid_argument("March buffers are smaller than the framebuffer");
    }

    std::vector<std::uint32_t>& pixels = output.pixels();
    for (std::size_t i = 0; i < pixelCount; ++i) {
        const MarchResult& result = results[i];
        if (!isHit(result)) {
            pixels[i] = kMissColor;
            continue;
        }

        const Point3 origin = fromGpuVec3(instructions[i].origin);
        const Vec3 direction = fromGpuVec3(instructions[i].direction);
        const Point3 position = origin + direction * static_cast<double>(result.distance);
        pixels[i] = packColor(shadeLambert(position, fromGpuVec3(result.normal), light), 255);
    }
}

}  // namespace marcher
