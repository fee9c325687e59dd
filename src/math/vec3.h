#pragma once

#include <cmath>
#include <ostream>

namespace marcher {

class Vec3 {
public:
    double e[3];

    constexpr Vec3() : e{0.0, 0.0, 0.0} {}
    constexpr Vec3(double x, double y, double z) : e{x, y, z} {}

    [[nodiscard]] constexpr double x() const { return e[0]; }
    [[nodiscard]] constexpr double y() const { return e[1]; }
    [[nodiscard]] constexpr double z() const { return e[2]; }

    [[nodiscard]] constexpr Vec3 operator-() const { return Vec3(-e[0], -e[1], -e[2]); }
    [[nodiscard]] constexpr double operator[](int i) const { return e[i]; }
    [[nodiscard]] constexpr double& operator[](int i) { return e[i]; }

    constexpr Vec3& operator+=(const Vec3& v) {
        e[0] += v.e[0];
        e[1] += v.e[1];
        e[2] += v.e[2];
        return *this;
    }

    constexpr Vec3& operator-=(const Vec3& v) {
        e[0] -= v.e[0];
        e[1] -= v.e[1];
        e[2] -= v.e[2];
        return *this;
    }

    constexpr Vec3& operator*=(double t) {
        e[0] *= t;
        e[1] *= t;
        e[2] *= t;
        return *this;
    }

    constexpr Vec3& operator/=(double t) {
        e[0] /= t;
        e[1] /= t;
        e[2] /= t;
        return *this;
    }

    // Euclidean norm.
    [[nodiscard]] double length() const {
        return std::sqrt(lengthSquared());
    }

    [[nodiscard]] constexpr double lengthSquared() const {
        return e[0] * e[0] + e[1] * e[1] + e[2] * e[2];
    }

    // Applies fn to every component and returns the result as a new vector.
    template <typename Fn>
    [[nodiscard]] Vec3 map(Fn&& fn) const {
        return Vec3(fn(e[0]), fn(e[1]), fn(e[2]));
    }
};

using Point3 = Vec3;
using Color = Vec3;

inline std::ostream& operator<<(std::ostream& os, const Vec3& v) {
    os << v.x() << ' ' << v.y() << ' ' << v.z();
    return os;
}

[[nodiscard]] constexpr Vec3 operator+(const Vec3& u, const Vec3& v) {
    return Vec3(u.x() + v.x(), u.y() + v.y(), u.z() + v.z());
}

[[nodiscard]] constexpr Vec3 operator-(const Vec3& u, const Vec3& v) {
    return Vec3(u.x() - v.x(), u.y() - v.y(), u.z() - v.z());
}

[[nodiscard]] constexpr Vec3 operator*(double t, const Vec3& v) {
    return Vec3(t * v.x(), t * v.y(), t * v.z());
}

[[nodiscard]] constexpr Vec3 operator*(const Vec3& v, double t) {
    return t * v;
}

[[nodiscard]] constexpr Vec3 operator/(const Vec3& v, double t) {
    return Vec3(v.x() / t, v.y() / t, v.z() / t);
}

[[nodiscard]] constexpr double dot(const Vec3& u, const Vec3& v) {
    return u.x() * v.x() + u.y() * v.y() + u.z() * v.z();
}

// Precondition: v has nonzero length. A zero vector yields non-finite components.
[[nodiscard]] inline Vec3 normalize(const Vec3& v) {
    return v / v.length();
}

}  // namespace marcher
