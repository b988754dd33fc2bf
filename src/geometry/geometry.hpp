#pragma once

#include <cstddef>
#include <string>
#include <variant>
#include <vector>

#include <boost/geometry.hpp>
#include <boost/geometry/geometries/linestring.hpp>
#include <boost/geometry/geometries/multi_linestring.hpp>
#include <boost/geometry/geometries/multi_polygon.hpp>
#include <boost/geometry/geometries/polygon.hpp>
#include <boost/geometry/geometries/register/point.hpp>
#include <boost/geometry/geometries/ring.hpp>

namespace geoedit {

/**
 * @brief 2D cartesian coordinate.
 */
struct Point {
    double x = 0.0;
    double y = 0.0;
};

inline bool operator==(const Point &a, const Point &b) noexcept {
    return a.x == b.x && a.y == b.y;
}

inline bool operator!=(const Point &a, const Point &b) noexcept {
    return !(a == b);
}

} // namespace geoedit

BOOST_GEOMETRY_REGISTER_POINT_2D(geoedit::Point, double,
                                 boost::geometry::cs::cartesian, x, y)

namespace geoedit {

// Polygons are clockwise and closed (Boost.Geometry defaults).
using LineString = boost::geometry::model::linestring<Point>;
using Ring = boost::geometry::model::ring<Point>;
using Polygon = boost::geometry::model::polygon<Point>;
using MultiLineString = boost::geometry::model::multi_linestring<LineString>;
using MultiPolygon = boost::geometry::model::multi_polygon<Polygon>;

enum class GeometryType { Point, LineString, Polygon };

/**
 * @brief Feature geometry. The alternative index matches GeometryType.
 */
using Geometry = std::variant<Point, LineString, Polygon>;

/**
 * @brief Type tag of a geometry value.
 */
GeometryType type_of(const Geometry &geometry) noexcept;

/**
 * @brief Stable name used in logs and in the JSON store format.
 */
const char *to_string(GeometryType type) noexcept;

/**
 * @brief Parses a geometry type name produced by to_string().
 * @throws GeometryError for unknown names
 */
GeometryType geometry_type_from_string(const std::string &name);

/**
 * @brief Exact coordinate-by-coordinate equality.
 *
 * Unlike boost::geometry::equals this is not topological: the same shape
 * with a different start vertex compares unequal. Undo relies on this.
 */
bool same_geometry(const Geometry &a, const Geometry &b) noexcept;

/**
 * @brief Number of stored vertices, closing vertices included.
 */
std::size_t point_count(const Geometry &geometry) noexcept;

/**
 * @brief Lines with fewer than two vertices, or polygons with a ring of
 * fewer than four (closing vertex included). Points never are.
 */
bool is_degenerate(const Geometry &geometry) noexcept;

LineString make_line(const std::vector<Point> &points);

/**
 * @brief Builds a polygon from an outer ring and optional holes.
 *
 * Rings are closed if needed and orientation is corrected, so callers can
 * pass vertices in either winding.
 */
Polygon make_polygon(const std::vector<Point> &outer,
                     const std::vector<std::vector<Point>> &holes = {});

/**
 * @brief WKT text for logs and diagnostics.
 */
std::string to_wkt(const Geometry &geometry);

} // namespace geoedit
