#pragma once

#include <vector>

#include "geometry.hpp"

namespace geoedit {

/**
 * @brief 2D affine transform.
 *
 * x' = a*x + b*y + c
 * y' = d*x + e*y + f
 */
struct AffineMatrix {
    double a = 1.0;
    double b = 0.0;
    double c = 0.0;
    double d = 0.0;
    double e = 1.0;
    double f = 0.0;

    static AffineMatrix translation(double dx, double dy) noexcept;

    /**
     * @brief Rotation about an origin, positive angles counter-clockwise.
     */
    static AffineMatrix rotation(const Point &origin, double degrees) noexcept;

    static AffineMatrix scaling(const Point &origin, double sx,
                                double sy) noexcept;

    Point apply(const Point &p) const noexcept {
        return {a * p.x + b * p.y + c, d * p.x + e * p.y + f};
    }

    double determinant() const noexcept { return a * e - b * d; }
};

/**
 * @brief A displacement link: `from` in the source space maps to `to`.
 */
struct ControlLink {
    Point from;
    Point to;
};

enum class TransformMethod { Affine, Similarity };

const char *to_string(TransformMethod method) noexcept;

/**
 * @brief Least-squares fit of a transform to a set of control links.
 *
 * Similarity (rotation, uniform scale, translation) needs at least two
 * distinct links, affine at least three non-collinear ones.
 * @throws GeometryError if the links cannot determine the transform
 */
AffineMatrix fit_transform(const std::vector<ControlLink> &links,
                           TransformMethod method);

} // namespace geoedit
