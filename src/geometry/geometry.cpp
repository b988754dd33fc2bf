#include "geometry.hpp"

#include <sstream>

#include "../utility/exceptions.hpp"

namespace bg = boost::geometry;

namespace geoedit {

namespace {

template <typename Range>
bool same_points(const Range &a, const Range &b) noexcept {
    if (a.size() != b.size())
        return false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (a[i] != b[i])
            return false;
    }
    return true;
}

bool same_polygon(const Polygon &a, const Polygon &b) noexcept {
    if (!same_points(a.outer(), b.outer()))
        return false;
    if (a.inners().size() != b.inners().size())
        return false;
    for (std::size_t i = 0; i < a.inners().size(); ++i) {
        if (!same_points(a.inners()[i], b.inners()[i]))
            return false;
    }
    return true;
}

void fill_ring(Ring &ring, const std::vector<Point> &points) {
    ring.assign(points.begin(), points.end());
    if (!ring.empty() && ring.front() != ring.back())
        ring.push_back(ring.front());
}

} // namespace

GeometryType type_of(const Geometry &geometry) noexcept {
    return static_cast<GeometryType>(geometry.index());
}

const char *to_string(GeometryType type) noexcept {
    switch (type) {
    case GeometryType::Point:
        return "Point";
    case GeometryType::LineString:
        return "LineString";
    case GeometryType::Polygon:
        return "Polygon";
    }
    return "Unknown";
}

GeometryType geometry_type_from_string(const std::string &name) {
    if (name == "Point")
        return GeometryType::Point;
    if (name == "LineString")
        return GeometryType::LineString;
    if (name == "Polygon")
        return GeometryType::Polygon;
    throw GeometryError("Unknown geometry type: " + name);
}

bool same_geometry(const Geometry &a, const Geometry &b) noexcept {
    if (a.index() != b.index())
        return false;
    switch (type_of(a)) {
    case GeometryType::Point:
        return std::get<Point>(a) == std::get<Point>(b);
    case GeometryType::LineString:
        return same_points(std::get<LineString>(a), std::get<LineString>(b));
    case GeometryType::Polygon:
        return same_polygon(std::get<Polygon>(a), std::get<Polygon>(b));
    }
    return false;
}

std::size_t point_count(const Geometry &geometry) noexcept {
    return std::visit(
        [](const auto &g) -> std::size_t {
            return static_cast<std::size_t>(bg::num_points(g));
        },
        geometry);
}

bool is_degenerate(const Geometry &geometry) noexcept {
    switch (type_of(geometry)) {
    case GeometryType::Point:
        return false;
    case GeometryType::LineString:
        return std::get<LineString>(geometry).size() < 2;
    case GeometryType::Polygon: {
        const auto &polygon = std::get<Polygon>(geometry);
        if (polygon.outer().size() < 4)
            return true;
        for (const auto &inner : polygon.inners()) {
            if (inner.size() < 4)
                return true;
        }
        return false;
    }
    }
    return true;
}

LineString make_line(const std::vector<Point> &points) {
    return LineString(points.begin(), points.end());
}

Polygon make_polygon(const std::vector<Point> &outer,
                     const std::vector<std::vector<Point>> &holes) {
    Polygon polygon;
    fill_ring(polygon.outer(), outer);
    for (const auto &hole : holes) {
        Ring inner;
        fill_ring(inner, hole);
        polygon.inners().push_back(std::move(inner));
    }
    bg::correct(polygon);
    return polygon;
}

std::string to_wkt(const Geometry &geometry) {
    std::ostringstream out;
    std::visit([&out](const auto &g) { out << bg::wkt(g); }, geometry);
    return out.str();
}

} // namespace geoedit
