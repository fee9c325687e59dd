#pragma once

#include <algorithm>
#include <memory>
#include <utility>

#include "math/vec3.h"

namespace marcher {

// Signed distance field: negative inside the surface, zero on it, positive outside.
class Sdf {
public:
    virtual ~Sdf() = default;

    [[nodiscard]] virtual double distance(const Point3& p) const = 0;
};

using SdfPtr = std::unique_ptr<Sdf>;

class SphereSdf final : public Sdf {
public:
    double radius;

    explicit SphereSdf(double radiusIn) : radius(radiusIn) {}

    [[nodiscard]] double distance(const Point3& p) const override {
        return p.length() - radius;
    }
};

// Moves the sampling point rather than the field, so the shape itself is unchanged.
class TranslateSdf final : public Sdf {
public:
    TranslateSdf(SdfPtr inner, const Vec3& offset)
        : inner_(std::move(inner)), offset_(offset) {}

    [[nodiscard]] double distance(const Point3& p) const override {
        return inner_->distance(p - offset_);
    }

private:
    SdfPtr inner_;
    Vec3 offset_;
};

// Union of two solids: pointwise minimum of the distances.
class UnionSdf final : public Sdf {
public:
    UnionSdf(SdfPtr a, SdfPtr b) : a_(std::move(a)), b_(std::move(b)) {}

    [[nodiscard]] double distance(const Point3& p) const override {
        return std::min(a_->distance(p), b_->distance(p));
    }

private:
    SdfPtr a_;
    SdfPtr b_;
};

// Intersection of two solids: pointwise maximum of the distances.
class IntersectionSdf final : public Sdf {
public:
    IntersectionSdf(SdfPtr a, SdfPtr b) : a_(std::move(a)), b_(std::move(b)) {}

    [[nodiscard]] double distance(const Point3& p) const override {
        return std::max(a_->distance(p), b_->distance(p));
    }

private:
    SdfPtr a_;
    SdfPtr b_;
};

// Removes solid b from solid a.
class DifferenceSdf final : public Sdf {
public:
    DifferenceSdf(SdfPtr a, SdfPtr b) : a_(std::move(a)), b_(std::move(b)) {}

    [[nodiscard]] double distance(const Point3& p) const override {
        return std::max(a_->distance(p), -b_->distance(p));
    }

private:
    SdfPtr a_;
    SdfPtr b_;
};

/**
 * Polynomial smooth minimum of two fields.
 *
 * Within roughly k of the seam the two surfaces are blended into a rounded
 * fillet; further away the result equals the hard union. The value is never
 * above min(a, b) and never below min(a, b) - k / 4.
 */
class SmoothUnionSdf final : public Sdf {
public:
    SmoothUnionSdf(SdfPtr a, SdfPtr b, double k)
        : a_(std::move(a)), b_(std::move(b)), k_(k) {}

    [[nodiscard]] double distance(const Point3& p) const override {
        const double da = a_->distance(p);
        const double db = b_->distance(p);
        const double h = std::clamp(0.5 + 0.5 * (db - da) / k_, 0.0, 1.0);
        return lerp(db, da, h) - k_ * h * (1.0 - h);
    }

private:
    SdfPtr a_;
    SdfPtr b_;
    double k_;

    [[nodiscard]] static double lerp(double from, double to, double t) {
        return from + (to - from) * t;
    }
};

namespace sdf {

[[nodiscard]] inline SdfPtr sphere(double radius) {
    return std::make_unique<SphereSdf>(radius);
}

[[nodiscard]] inline SdfPtr translate(SdfPtr inner, const Vec3& offset) {
    return std::make_unique<TranslateSdf>(std::move(inner), offset);
}

[[nodiscard]] inline SdfPtr unite(SdfPtr a, SdfPtr b) {
    return std::make_unique<UnionSdf>(std::move(a), std::move(b));
}

[[nodiscard]] inline SdfPtr intersect(SdfPtr a, SdfPtr b) {
    return std::make_unique<IntersectionSdf>(std::move(a), std::move(b));
}

[[nodiscard]] inline SdfPtr subtract(SdfPtr a, SdfPtr b) {
    return std::make_unique<DifferenceSdf>(std::move(a), std::move(b));
}

[[nodiscard]] inline SdfPtr smoothUnite(SdfPtr a, SdfPtr b, double k) {
    return std::make_unique<SmoothUnionSdf>(std::move(a), std::move(b), k);
}

}  // namespace sdf

}  // namespace marcher
