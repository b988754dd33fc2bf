#include "affine.hpp"

#include <array>
#include <cmath>
#include <string>

#include "../utility/exceptions.hpp"

namespace geoedit {

constexpr double PI = 3.14159265358979323846;
constexpr double EPS = 1e-12;

namespace {

using Mat3 = std::array<std::array<double, 3>, 3>;
using Vec3 = std::array<double, 3>;

double det3(const Mat3 &m) noexcept {
    return m[0][0] * (m[1][1] * m[2][2] - m[1][2] * m[2][1]) -
           m[0][1] * (m[1][0] * m[2][2] - m[1][2] * m[2][0]) +
           m[0][2] * (m[1][0] * m[2][1] - m[1][1] * m[2][0]);
}

// Cramer's rule; caller checks the determinant.
Vec3 solve3(const Mat3 &m, const Vec3 &rhs, double det) noexcept {
    Vec3 out{};
    for (int col = 0; col < 3; ++col) {
        Mat3 replaced = m;
        for (int row = 0; row < 3; ++row)
            replaced[row][col] = rhs[row];
        out[col] = det3(replaced) / det;
    }
    return out;
}

AffineMatrix fit_similarity(const std::vector<ControlLink> &links) {
    const double n = static_cast<double>(links.size());
    double mx = 0.0, my = 0.0, tx = 0.0, ty = 0.0;
    for (const auto &link : links) {
        mx += link.from.x;
        my += link.from.y;
        tx += link.to.x;
        ty += link.to.y;
    }
    mx /= n;
    my /= n;
    tx /= n;
    ty /= n;

    double norm = 0.0, sa = 0.0, sb = 0.0;
    for (const auto &link : links) {
        const double xs = link.from.x - mx;
        const double ys = link.from.y - my;
        const double xt = link.to.x - tx;
        const double yt = link.to.y - ty;
        norm += xs * xs + ys * ys;
        sa += xs * xt + ys * yt;
        sb += xs * yt - ys * xt;
    }
    if (norm < EPS)
        throw GeometryError("Similarity fit needs distinct source points");

    const double ca = sa / norm;
    const double cb = sb / norm;

    AffineMatrix m;
    m.a = ca;
    m.b = -cb;
    m.c = tx - ca * mx + cb * my;
    m.d = cb;
    m.e = ca;
    m.f = ty - cb * mx - ca * my;
    return m;
}

AffineMatrix fit_affine(const std::vector<ControlLink> &links) {
    Mat3 normal{};
    Vec3 rhs_x{};
    Vec3 rhs_y{};
    for (const auto &link : links) {
        const Vec3 row{link.from.x, link.from.y, 1.0};
        for (int i = 0; i < 3; ++i) {
            for (int j = 0; j < 3; ++j)
                normal[i][j] += row[i] * row[j];
            rhs_x[i] += row[i] * link.to.x;
            rhs_y[i] += row[i] * link.to.y;
        }
    }

    const double det = det3(normal);
    if (std::fabs(det) < EPS)
        throw GeometryError("Affine fit needs non-collinear source points");

    const Vec3 px = solve3(normal, rhs_x, det);
    const Vec3 py = solve3(normal, rhs_y, det);
    return {px[0], px[1], px[2], py[0], py[1], py[2]};
}

} // namespace

AffineMatrix AffineMatrix::translation(double dx, double dy) noexcept {
    AffineMatrix m;
    m.c = dx;
    m.f = dy;
    return m;
}

AffineMatrix AffineMatrix::rotation(const Point &origin,
                                    double degrees) noexcept {
    const double rad = degrees * PI / 180.0;
    const double cs = std::cos(rad);
    const double sn = std::sin(rad);

    AffineMatrix m;
    m.a = cs;
    m.b = -sn;
    m.c = origin.x - cs * origin.x + sn * origin.y;
    m.d = sn;
    m.e = cs;
    m.f = origin.y - sn * origin.x - cs * origin.y;
    return m;
}

AffineMatrix AffineMatrix::scaling(const Point &origin, double sx,
                                   double sy) noexcept {
    AffineMatrix m;
    m.a = sx;
    m.c = origin.x - sx * origin.x;
    m.e = sy;
    m.f = origin.y - sy * origin.y;
    return m;
}

const char *to_string(TransformMethod method) noexcept {
    switch (method) {
    case TransformMethod::Affine:
        return "Affine";
    case TransformMethod::Similarity:
        return "Similarity";
    }
    return "Unknown";
}

AffineMatrix fit_transform(const std::vector<ControlLink> &links,
                           TransformMethod method) {
    const std::size_t needed = method == TransformMethod::Affine ? 3 : 2;
    if (links.size() < needed) {
        throw GeometryError(std::string(to_string(method)) + " fit needs " +
                            std::to_string(needed) + " links, got " +
                            std::to_string(links.size()));
    }

    return method == TransformMethod::Affine ? fit_affine(links)
                                             : fit_similarity(links);
}

} // namespace geoedit
