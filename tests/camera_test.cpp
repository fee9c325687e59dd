#include <cmath>
#include <stdexcept>

#include <gtest/gtest.h>

#include "render/camera.h"

namespace marcher {
namespace {

TEST(CameraTest, RaysStartAtFixedOrigin) {
    const Camera camera(8, 6);
    const Ray ray = camera.primaryRay(3, 5);
    EXPECT_DOUBLE_EQ(ray.origin.x(), 0.0);
    EXPECT_DOUBLE_EQ(ray.origin.y(), 0.0);
    EXPECT_DOUBLE_EQ(ray.origin.z(), -10.0);
}

TEST(CameraTest, DirectionsAreUnitLength) {
    const Camera camera(17, 9, CameraSettings{Point3(0.0, 0.0, -10.0), 90.0});
    for (int y = 0; y < camera.height(); ++y) {
        for (int x = 0; x < camera.width(); ++x) {
            EXPECT_NEAR(camera.primaryRay(x, y).direction.length(), 1.0, 1e-12);
        }
    }
}

TEST(CameraTest, CenterPixelOfOddFrameLooksDownPositiveZ) {
    const Camera camera(5, 5);
    const Vec3 dir = camera.primaryRay(2, 2).direction;
    EXPECT_NEAR(dir.x(), 0.0, 1e-15);
    EXPECT_NEAR(dir.y(), 0.0, 1e-15);
    EXPECT_NEAR(dir.z(), 1.0, 1e-15);
}

TEST(CameraTest, MatchesPinholeMapping) {
    constexpr double pi = 3.14159265358979323846;
    const int width = 4;
    const int height = 2;
    const double fov = 64.0;
    const Camera camera(width, height, CameraSettings{Point3(0.0, 0.0, -10.0), fov});

    const double half = std::tan(fov / 2.0 * pi / 180.0);
    const double aspect = 2.0;
    const double px = (2.0 * (0.5 / width) - 1.0) * half * aspect;
    const double py = (1.0 - 2.0 * (1.5 / height)) * half;
    const Vec3 expected = normalize(Vec3(px, py, 1.0));

    const Vec3 dir = camera.primaryRay(0, 1).direction;
    EXPECT_NEAR(dir.x(), expected.x(), 1e-15);
    EXPECT_NEAR(dir.y(), expected.y(), 1e-15);
    EXPECT_NEAR(dir.z(), expected.z(), 1e-15);
}

TEST(CameraTest, TopLeftPixelPointsUpAndLeft) {
    const Camera camera(10, 10);
    const Vec3 dir = camera.primaryRay(0, 0).direction;
    EXPECT_LT(dir.x(), 0.0);
    EXPECT_GT(dir.y(), 0.0);
    EXPECT_GT(dir.z(), 0.0);
}

TEST(CameraTest, RejectsEmptyFrame) {
    EXPECT_THROW(Camera(10, 0), std::invalid_argument);
    EXPECT_THROW(Camera(0, 10), std::invalid_argument);
    EXPECT_THROW(Camera(-1, 4), std::invalid_argument);
}

}  // namespace
}  // namespace marcher
