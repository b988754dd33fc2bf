#include "boost_kernel.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <string>
#include <type_traits>

#include <boost/geometry/geometries/box.hpp>
#include <boost/geometry/geometries/multi_point.hpp>
#include <fmt/format.h>

#include "../utility/exceptions.hpp"
#include "../utility/logger.hpp"

namespace bg = boost::geometry;

namespace geoedit {

constexpr double EPS = 1e-9;

using MultiPoint = bg::model::multi_point<Point>;
using Box = bg::model::box<Point>;

const char *to_string(ClipMode mode) noexcept {
    switch (mode) {
    case ClipMode::PreserveArea:
        return "PreserveArea";
    case ClipMode::DiscardArea:
        return "DiscardArea";
    }
    return "Unknown";
}

const char *to_string(OffsetSide side) noexcept {
    switch (side) {
    case OffsetSide::Left:
        return "Left";
    case OffsetSide::Right:
        return "Right";
    case OffsetSide::Both:
        return "Both";
    }
    return "Unknown";
}

namespace {

// Miters longer than this many offset distances are beveled.
constexpr double MITER_LIMIT = 4.0;

void require_usable(const Geometry &geometry, const char *operation) {
    if (is_degenerate(geometry)) {
        throw GeometryError(fmt::format("Cannot {} a degenerate {}", operation,
                                        to_string(type_of(geometry))));
    }
}

double segment_length(const Point &a, const Point &b) noexcept {
    return std::hypot(b.x - a.x, b.y - a.y);
}

Point lerp(const Point &a, const Point &b, double t) noexcept {
    return {a.x + t * (b.x - a.x), a.y + t * (b.y - a.y)};
}

template <typename G>
G transformed(const G &in, const AffineMatrix &m) {
    bg::strategy::transform::matrix_transformer<double, 2, 2> strategy(
        m.a, m.b, m.c, m.d, m.e, m.f, 0.0, 0.0, 1.0);
    G out;
    if (!bg::transform(in, out, strategy))
        throw GeometryError("Coordinate transform failed");
    return out;
}

Geometry apply_matrix(const Geometry &geometry, const AffineMatrix &m) {
    require_usable(geometry, "transform");
    if (std::fabs(m.determinant()) < EPS &&
        type_of(geometry) != GeometryType::Point) {
        throw GeometryError("Transform collapses the geometry");
    }

    return std::visit(
        [&m](const auto &g) -> Geometry {
            using T = std::decay_t<decltype(g)>;
            T out = transformed(g, m);
            if constexpr (std::is_same_v<T, Polygon>) {
                // Reflections flip the winding.
                bg::correct(out);
            }
            return out;
        },
        geometry);
}

/**
 * @brief Distance along the line of the point on it closest to `p`.
 */
double project_distance(const LineString &line, const Point &p) noexcept {
    double best_dist = std::numeric_limits<double>::max();
    double best_along = 0.0;
    double walked = 0.0;
    for (std::size_t i = 1; i < line.size(); ++i) {
        const Point &a = line[i - 1];
        const Point &b = line[i];
        const double len = segment_length(a, b);
        double t = 0.0;
        if (len > 0.0) {
            t = ((p.x - a.x) * (b.x - a.x) + (p.y - a.y) * (b.y - a.y)) /
                (len * len);
            t = std::clamp(t, 0.0, 1.0);
        }
        const Point q = lerp(a, b, t);
        const double d = segment_length(p, q);
        if (d < best_dist) {
            best_dist = d;
            best_along = walked + t * len;
        }
        walked += len;
    }
    return best_along;
}

/**
 * @brief Cuts a line at the given distances from its start.
 *
 * Distances outside (0, length) and duplicates are ignored. Without any
 * remaining cut the line comes back as the only piece.
 */
std::vector<Geometry> cut_line_at(const LineString &line,
                                  std::vector<double> cuts) {
    const double total = bg::length(line);
    std::sort(cuts.begin(), cuts.end());
    cuts.erase(std::remove_if(cuts.begin(), cuts.end(),
                              [total](double c) {
                                  return c <= EPS || c >= total - EPS;
                              }),
               cuts.end());
    cuts.erase(std::unique(cuts.begin(), cuts.end(),
                           [](double a, double b) {
                               return std::fabs(a - b) <= EPS;
                           }),
               cuts.end());
    if (cuts.empty())
        return {line};

    std::vector<Geometry> pieces;
    LineString current;
    current.push_back(line.front());
    double walked = 0.0;
    std::size_t next_cut = 0;

    for (std::size_t i = 1; i < line.size(); ++i) {
        const Point &p0 = line[i - 1];
        const Point &p1 = line[i];
        const double seg = segment_length(p0, p1);
        if (seg <= 0.0)
            continue;

        while (next_cut < cuts.size() && cuts[next_cut] < walked + seg) {
            const Point cut = lerp(p0, p1, (cuts[next_cut] - walked) / seg);
            if (current.back() != cut)
                current.push_back(cut);
            pieces.emplace_back(current);
            current.clear();
            current.push_back(cut);
            ++next_cut;
        }

        walked += seg;
        if (current.back() != p1)
            current.push_back(p1);
    }
    pieces.emplace_back(current);
    return pieces;
}

std::vector<double> mirrored(std::vector<double> cuts, double total) {
    for (auto &c : cuts)
        c = total - c;
    return cuts;
}

std::vector<double> repeated_cuts(double step, double total,
                                  bool from_start) {
    std::vector<double> cuts;
    for (double at = step; at < total - EPS; at += step)
        cuts.push_back(at);
    return from_start ? cuts : mirrored(cuts, total);
}

std::vector<double> linear_cuts(const LineString &line,
                                const SplitMethod &method) {
    const double total = bg::length(line);
    return std::visit(
        [&](const auto &m) -> std::vector<double> {
            using T = std::decay_t<decltype(m)>;
            if constexpr (std::is_same_v<T, SplitAtPoints>) {
                std::vector<double> cuts;
                for (const auto &p : m.points)
                    cuts.push_back(project_distance(line, p));
                return cuts;
            } else if constexpr (std::is_same_v<T, SplitByLine>) {
                if (m.cutter.size() < 2)
                    throw GeometryError("Cut line needs at least two points");
                MultiPoint crossings;
                bg::intersection(line, m.cutter, crossings);
                if (crossings.empty())
                    throw GeometryError("Cut line does not cross the line");
                std::vector<double> cuts;
                for (const auto &p : crossings)
                    cuts.push_back(project_distance(line, p));
                return cuts;
            } else if constexpr (std::is_same_v<T, SplitByEqualParts>) {
                if (m.parts < 2) {
                    throw GeometryError(
                        fmt::format("Cannot split into {} parts", m.parts));
                }
                std::vector<double> cuts;
                for (int k = 1; k < m.parts; ++k)
                    cuts.push_back(total * k / m.parts);
                return cuts;
            } else if constexpr (std::is_same_v<T, SplitByDistance>) {
                if (m.distance <= 0.0)
                    throw GeometryError("Split distance must be positive");
                return repeated_cuts(m.distance, total, m.from_start);
            } else if constexpr (std::is_same_v<T, SplitByPercentage>) {
                if (m.percentage <= 0.0 || m.percentage >= 100.0) {
                    throw GeometryError(fmt::format(
                        "Split percentage {} out of range", m.percentage));
                }
                return repeated_cuts(total * m.percentage / 100.0, total,
                                     m.from_start);
            } else {
                double sum = 0.0;
                for (double d : m.distances) {
                    if (d <= 0.0)
                        throw GeometryError("Split distances must be positive");
                    sum += d;
                }
                if (m.distances.empty())
                    throw GeometryError("No split distances given");

                const double factor = m.proportion_remainder ? total / sum : 1.0;
                std::vector<double> cuts;
                double at = 0.0;
                for (double d : m.distances) {
                    at += d * factor;
                    cuts.push_back(at);
                }
                return m.from_start ? cuts : mirrored(cuts, total);
            }
        },
        method);
}

std::size_t nearest_vertex(const std::vector<Point> &points, std::size_t count,
                           const Point &p) noexcept {
    std::size_t best = 0;
    double best_dist = std::numeric_limits<double>::max();
    for (std::size_t i = 0; i < count; ++i) {
        const double d = segment_length(points[i], p);
        if (d < best_dist) {
            best_dist = d;
            best = i;
        }
    }
    return best;
}

Polygon half_plane(const Point &a, const Point &u, const Point &n,
                   double reach) {
    return make_polygon({{a.x - u.x * reach, a.y - u.y * reach},
                         {a.x + u.x * reach, a.y + u.y * reach},
                         {a.x + u.x * reach + n.x * reach,
                          a.y + u.y * reach + n.y * reach},
                         {a.x - u.x * reach + n.x * reach,
                          a.y - u.y * reach + n.y * reach}});
}

/**
 * @brief Mitered offset of a line. Positive distances go to the left.
 */
LineString offset_line(const LineString &line, double distance) {
    std::vector<Point> points;
    for (const Point &p : line) {
        if (points.empty() || segment_length(points.back(), p) > EPS)
            points.push_back(p);
    }
    if (points.size() < 2)
        throw GeometryError("Cannot offset a line of zero length");

    std::vector<Point> normals;
    for (std::size_t i = 1; i < points.size(); ++i) {
        const double len = segment_length(points[i - 1], points[i]);
        normals.push_back({-(points[i].y - points[i - 1].y) / len,
                           (points[i].x - points[i - 1].x) / len});
    }

    auto shifted = [](const Point &p, const Point &n, double reach) {
        return Point{p.x + n.x * reach, p.y + n.y * reach};
    };

    LineString out;
    out.push_back(shifted(points.front(), normals.front(), distance));
    for (std::size_t k = 1; k + 1 < points.size(); ++k) {
        const Point &n0 = normals[k - 1];
        const Point &n1 = normals[k];
        Point m{n0.x + n1.x, n0.y + n1.y};
        const double m_len = std::hypot(m.x, m.y);
        if (m_len <= EPS)
            throw GeometryError("Line doubles back on itself");
        m = {m.x / m_len, m.y / m_len};

        const double factor = 1.0 / (m.x * n1.x + m.y * n1.y);
        if (factor > MITER_LIMIT) {
            out.push_back(shifted(points[k], n0, distance));
            out.push_back(shifted(points[k], n1, distance));
        } else {
            out.push_back(shifted(points[k], m, distance * factor));
        }
    }
    out.push_back(shifted(points.back(), normals.back(), distance));
    return out;
}

std::vector<Geometry> by_area_descending(MultiPolygon pieces) {
    std::stable_sort(pieces.begin(), pieces.end(),
                     [](const Polygon &l, const Polygon &r) {
                         return bg::area(l) > bg::area(r);
                     });
    std::vector<Geometry> out;
    for (auto &p : pieces) {
        if (bg::area(p) > EPS)
            out.emplace_back(std::move(p));
    }
    return out;
}

} // namespace

BoostGeometryKernel::BoostGeometryKernel(double merge_tolerance)
    : m_merge_tolerance(merge_tolerance) {}

std::vector<Geometry> BoostGeometryKernel::clip(const Geometry &geometry,
                                                const Polygon &clip_polygon,
                                                ClipMode mode) const {
    require_usable(geometry, "clip");
    if (is_degenerate(clip_polygon))
        throw GeometryError("Clip polygon is degenerate");
    Polygon clipper = clip_polygon;
    bg::correct(clipper);
    const bool keep_inside = mode == ClipMode::PreserveArea;

    switch (type_of(geometry)) {
    case GeometryType::Point: {
        const auto &p = std::get<Point>(geometry);
        if (bg::covered_by(p, clipper) != keep_inside)
            throw GeometryError("Clip removes the point");
        return {p};
    }
    case GeometryType::LineString: {
        MultiLineString parts;
        if (keep_inside)
            bg::intersection(std::get<LineString>(geometry), clipper, parts);
        else
            bg::difference(std::get<LineString>(geometry), clipper, parts);

        std::vector<Geometry> out;
        for (auto &part : parts) {
            if (bg::length(part) > EPS)
                out.emplace_back(std::move(part));
        }
        if (out.empty())
            throw GeometryError("Clip produced an empty line");
        return out;
    }
    case GeometryType::Polygon: {
        Polygon subject = std::get<Polygon>(geometry);
        bg::correct(subject);
        MultiPolygon parts;
        if (keep_inside)
            bg::intersection(subject, clipper, parts);
        else
            bg::difference(subject, clipper, parts);

        auto out = by_area_descending(std::move(parts));
        if (out.empty())
            throw GeometryError("Clip produced an empty polygon");
        return out;
    }
    }
    throw GeometryError("Unsupported geometry for clip");
}

std::vector<Geometry> BoostGeometryKernel::split(
    const Geometry &geometry, const SplitMethod &method) const {
    require_usable(geometry, "split");
    switch (type_of(geometry)) {
    case GeometryType::LineString:
        return split_line(std::get<LineString>(geometry), method);
    case GeometryType::Polygon:
        if (!std::holds_alternative<SplitByLine>(method))
            throw GeometryError("Polygons can only be split by a line");
        return cut_polygon(std::get<Polygon>(geometry),
                           std::get<SplitByLine>(method).cutter);
    case GeometryType::Point:
        break;
    }
    throw GeometryError("Points cannot be split");
}

std::vector<Geometry>
BoostGeometryKernel::split_line(const LineString &line,
                                const SplitMethod &method) const {
    if (bg::length(line) <= EPS)
        throw GeometryError("Cannot split a line of zero length");
    auto pieces = cut_line_at(line, linear_cuts(line, method));
    if (pieces.size() < 2)
        throw GeometryError("Split does not divide the line");
    return pieces;
}

std::vector<Geometry>
BoostGeometryKernel::cut_polygon(const Polygon &polygon,
                                 const LineString &cutter) const {
    if (cutter.size() < 2)
        throw GeometryError("Cut line needs at least two points");

    const Point a = cutter.front();
    const Point b = cutter.back();
    const double len = segment_length(a, b);
    if (len <= EPS)
        throw GeometryError("Cut line end points coincide");

    Box extent;
    bg::envelope(polygon, extent);
    bg::expand(extent, a);
    bg::expand(extent, b);
    const double reach =
        2.0 * segment_length(extent.min_corner(), extent.max_corner()) + 1.0;

    const Point u{(b.x - a.x) / len, (b.y - a.y) / len};
    const Point left{-u.y, u.x};
    const Point right{u.y, -u.x};

    Polygon subject = polygon;
    bg::correct(subject);

    MultiPolygon pieces;
    for (const auto &side : {left, right}) {
        MultiPolygon part;
        bg::intersection(subject, half_plane(a, u, side, reach), part);
        pieces.insert(pieces.end(), part.begin(), part.end());
    }

    auto out = by_area_descending(std::move(pieces));
    if (out.size() < 2)
        throw GeometryError("Cut line does not divide the polygon");
    return out;
}

Geometry BoostGeometryKernel::merge(const std::vector<Geometry> &parts) const {
    if (parts.size() < 2)
        throw GeometryError("Merge needs at least two geometries");

    const GeometryType type = type_of(parts.front());
    for (const auto &part : parts) {
        if (type_of(part) != type)
            throw GeometryError("Cannot merge mixed geometry types");
        require_usable(part, "merge");
    }

    switch (type) {
    case GeometryType::LineString:
        return merge_lines(parts);
    case GeometryType::Polygon:
        return merge_polygons(parts);
    case GeometryType::Point:
        break;
    }
    throw GeometryError("Points cannot be merged");
}

Geometry
BoostGeometryKernel::merge_polygons(const std::vector<Geometry> &parts) const {
    Polygon first = std::get<Polygon>(parts.front());
    bg::correct(first);
    MultiPolygon merged;
    merged.push_back(first);

    for (std::size_t i = 1; i < parts.size(); ++i) {
        Polygon next = std::get<Polygon>(parts[i]);
        bg::correct(next);
        MultiPolygon out;
        bg::union_(merged, next, out);
        merged = std::move(out);
    }

    if (merged.size() != 1) {
        throw GeometryError(fmt::format(
            "Merge result is not contiguous ({} pieces)", merged.size()));
    }
    return merged.front();
}

Geometry
BoostGeometryKernel::merge_lines(const std::vector<Geometry> &parts) const {
    auto close = [this](const Point &l, const Point &r) {
        return segment_length(l, r) <= m_merge_tolerance;
    };

    LineString merged = std::get<LineString>(parts.front());
    std::vector<LineString> pending;
    for (std::size_t i = 1; i < parts.size(); ++i)
        pending.push_back(std::get<LineString>(parts[i]));

    while (!pending.empty()) {
        bool joined = false;
        for (auto it = pending.begin(); it != pending.end(); ++it) {
            LineString next = *it;
            if (close(merged.back(), next.back()) ||
                close(merged.front(), next.front())) {
                std::reverse(next.begin(), next.end());
            }

            if (close(merged.back(), next.front())) {
                merged.insert(merged.end(), next.begin() + 1, next.end());
            } else if (close(merged.front(), next.back())) {
                merged.insert(merged.begin(), next.begin(), next.end() - 1);
            } else {
                continue;
            }

            pending.erase(it);
            joined = true;
            break;
        }

        if (!joined)
            throw GeometryError("Lines to merge do not connect");
    }
    return merged;
}

Geometry BoostGeometryKernel::move(const Geometry &geometry, double dx,
                                   double dy) const {
    return apply_matrix(geometry, AffineMatrix::translation(dx, dy));
}

Geometry BoostGeometryKernel::rotate(const Geometry &geometry,
                                     const Point &origin,
                                     double degrees) const {
    return apply_matrix(geometry, AffineMatrix::rotation(origin, degrees));
}

Geometry BoostGeometryKernel::scale(const Geometry &geometry,
                                    const Point &origin, double sx,
                                    double sy) const {
    if (std::fabs(sx) < EPS || std::fabs(sy) < EPS)
        throw GeometryError(fmt::format("Degenerate scale {}x{}", sx, sy));
    return apply_matrix(geometry, AffineMatrix::scaling(origin, sx, sy));
}

Geometry BoostGeometryKernel::transform(const Geometry &geometry,
                                        const AffineMatrix &matrix) const {
    return apply_matrix(geometry, matrix);
}

Geometry BoostGeometryKernel::reshape(const Geometry &geometry,
                                      const LineString &path) const {
    if (path.size() < 2)
        throw GeometryError("Reshape line needs at least two points");
    require_usable(geometry, "reshape");

    if (type_of(geometry) == GeometryType::LineString) {
        const auto &line = std::get<LineString>(geometry);
        const std::vector<Point> vertices(line.begin(), line.end());
        std::size_t i = nearest_vertex(vertices, vertices.size(), path.front());
        std::size_t j = nearest_vertex(vertices, vertices.size(), path.back());

        LineString replacement = path;
        if (i > j) {
            std::swap(i, j);
            std::reverse(replacement.begin(), replacement.end());
        }

        LineString out(line.begin(), line.begin() + i);
        out.insert(out.end(), replacement.begin(), replacement.end());
        out.insert(out.end(), line.begin() + j + 1, line.end());
        if (bg::length(out) <= EPS)
            throw GeometryError("Reshape produced a degenerate line");
        return out;
    }

    if (type_of(geometry) == GeometryType::Polygon) {
        const auto &polygon = std::get<Polygon>(geometry);
        const std::vector<Point> ring(polygon.outer().begin(),
                                      polygon.outer().end());
        // Ignore the closing vertex.
        const std::size_t count = ring.size() - 1;

        std::size_t i = nearest_vertex(ring, count, path.front());
        std::size_t j = nearest_vertex(ring, count, path.back());
        if (i == j)
            throw GeometryError("Reshape line must touch two vertices");

        std::vector<Point> replacement(path.begin(), path.end());
        if (i > j) {
            std::swap(i, j);
            std::reverse(replacement.begin(), replacement.end());
        }

        // Either replace the arc i..j, or keep it and replace the rest.
        std::vector<Point> outside(ring.begin(), ring.begin() + i);
        outside.insert(outside.end(), replacement.begin(), replacement.end());
        outside.insert(outside.end(), ring.begin() + j + 1,
                       ring.begin() + count);

        std::vector<Point> inside(replacement.begin(), replacement.end());
        for (std::size_t k = j; k-- > i + 1;)
            inside.push_back(ring[k]);

        std::vector<Polygon> candidates;
        for (const auto *outer : {&outside, &inside}) {
            if (outer->size() < 3)
                continue;
            Polygon candidate = make_polygon(*outer);
            candidate.inners() = polygon.inners();
            bg::correct(candidate);
            if (bg::is_valid(candidate) && bg::area(candidate) > EPS)
                candidates.push_back(std::move(candidate));
        }

        if (candidates.empty())
            throw GeometryError("Reshape produced an invalid polygon");

        LOG_DEBUG(fmt::format("Reshape produced {} valid candidate(s)",
                              candidates.size()));
        return *std::max_element(candidates.begin(), candidates.end(),
                                 [](const Polygon &l, const Polygon &r) {
                                     return bg::area(l) < bg::area(r);
                                 });
    }

    throw GeometryError("Points cannot be reshaped");
}

std::vector<Geometry>
BoostGeometryKernel::parallel_offset(const Geometry &geometry, double distance,
                                     OffsetSide side, int iterations) const {
    if (type_of(geometry) != GeometryType::LineString)
        throw GeometryError("Only lines can be offset");
    require_usable(geometry, "offset");
    if (distance <= 0.0)
        throw GeometryError(
            fmt::format("Offset distance {} must be positive", distance));
    if (iterations < 1)
        throw GeometryError(
            fmt::format("Offset needs at least one iteration, got {}",
                        iterations));

    const auto &line = std::get<LineString>(geometry);
    std::vector<Geometry> out;
    for (int k = 1; k <= iterations; ++k) {
        if (side != OffsetSide::Right)
            out.emplace_back(offset_line(line, distance * k));
        if (side != OffsetSide::Left)
            out.emplace_back(offset_line(line, -distance * k));
    }
    return out;
}

std::vector<std::vector<Geometry>>
BoostGeometryKernel::planarize(const std::vector<Geometry> &lines) const {
    std::vector<LineString> input;
    input.reserve(lines.size());
    for (const auto &line : lines) {
        if (type_of(line) != GeometryType::LineString)
            throw GeometryError("Only lines can be planarized");
        require_usable(line, "planarize");
        input.push_back(std::get<LineString>(line));
    }

    std::vector<std::vector<double>> cuts(input.size());
    for (std::size_t i = 0; i < input.size(); ++i) {
        for (std::size_t j = i + 1; j < input.size(); ++j) {
            MultiPoint crossings;
            bg::intersection(input[i], input[j], crossings);
            for (const auto &p : crossings) {
                cuts[i].push_back(project_distance(input[i], p));
                cuts[j].push_back(project_distance(input[j], p));
            }
        }
    }

    std::vector<std::vector<Geometry>> out;
    out.reserve(input.size());
    for (std::size_t i = 0; i < input.size(); ++i)
        out.push_back(cut_line_at(input[i], std::move(cuts[i])));

    LOG_DEBUG(fmt::format("Planarized {} lines", input.size()));
    return out;
}

} // namespace geoedit
