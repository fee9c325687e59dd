#pragma once

#include "core/ray.h"
#include "sdf/sdf.h"

namespace marcher {

struct TraceSettings {
    int maxSteps = 50;
    // Hit threshold, starting depth and finite-difference step for normals.
    double epsilon = 0.001;
};

struct TraceResult {
    bool hit = false;
    Point3 position;
    double depth = 0.0;
    int steps = 0;
};

// March along the ray by the field value until it drops below epsilon or the step budget runs out.
[[nodiscard]] inline TraceResult sphereTrace(const Sdf& scene, const Ray& ray, const TraceSettings& settings) {
    TraceResult result;
    // Starting slightly off the origin keeps a ray that leaves a surface from re-hitting it.
    double depth = settings.epsilon;

    for (int step = 0; step < settings.maxSteps; ++step) {
        const Point3 position = ray.at(depth);
        const double dist = scene.distance(position);
        result.steps = step + 1;

        if (dist < settings.epsilon) {
            result.hit = true;
            result.position = position;
            result.depth = depth;
            return result;
        }

        depth += dist;
    }

    result.position = ray.at(depth);
    result.depth = depth;
    return result;
}

// Central-difference gradient of the field, six evaluations. Only meaningful near the surface.
[[nodiscard]] inline Vec3 estimateNormal(const Sdf& scene, const Point3& p, double epsilon) {
    const Vec3 dx(epsilon, 0.0, 0.0);
    const Vec3 dy(0.0, epsilon, 0.0);
    const Vec3 dz(0.0, 0.0, epsilon);

    return normalize(Vec3(
        scene.distance(p + dx) - scene.distance(p - dx),
        scene.distance(p + dy) - scene.distance(p - dy),
        scene.distance(p + dz) - scene.distance(p - dz)));
}

}  // namespace marcher
