#pragma once

#include <variant>
#include <vector>

#include "affine.hpp"
#include "geometry.hpp"

namespace geoedit {

enum class ClipMode {
    PreserveArea, // keep the part inside the clip polygon
    DiscardArea   // keep the part outside the clip polygon
};

const char *to_string(ClipMode mode) noexcept;

// Sides are seen walking the line from its first vertex.
enum class OffsetSide { Left, Right, Both };

const char *to_string(OffsetSide side) noexcept;

struct SplitAtPoints {
    std::vector<Point> points;
};

// Polygons are cut along the straight line through the cutter's end points.
struct SplitByLine {
    LineString cutter;
};

struct SplitByEqualParts {
    int parts = 2;
};

// Pieces of `distance` length; the remainder ends up at the far end.
struct SplitByDistance {
    double distance = 0.0;
    bool from_start = true;
};

// Pieces of `percentage` of the total length.
struct SplitByPercentage {
    double percentage = 50.0;
    bool from_start = true;
};

// Successive piece lengths. With proportion_remainder the lengths are scaled
// so that they cover the whole line.
struct SplitByVaryingDistance {
    std::vector<double> distances;
    bool from_start = true;
    bool proportion_remainder = false;
};

using SplitMethod =
    std::variant<SplitAtPoints, SplitByLine, SplitByEqualParts,
                 SplitByDistance, SplitByPercentage, SplitByVaryingDistance>;

/**
 * @brief Geometry algorithms consumed by the edit engine.
 *
 * All operations are pure: inputs are never modified and a new geometry is
 * returned. Failures (degenerate result, unsupported input type) are
 * reported by throwing GeometryError, and so is a degenerate input (see
 * is_degenerate). Operations that may produce several
 * pieces return them ordered so that the first one is the piece the edited
 * feature keeps.
 */
class IGeometryKernel {
  public:
    virtual ~IGeometryKernel() = default;

    virtual std::vector<Geometry> clip(const Geometry &geometry,
                                       const Polygon &clip_polygon,
                                       ClipMode mode) const = 0;

    virtual std::vector<Geometry> split(const Geometry &geometry,
                                        const SplitMethod &method) const = 0;

    virtual Geometry merge(const std::vector<Geometry> &parts) const = 0;

    virtual Geometry move(const Geometry &geometry, double dx,
                          double dy) const = 0;

    virtual Geometry rotate(const Geometry &geometry, const Point &origin,
                            double degrees) const = 0;

    virtual Geometry scale(const Geometry &geometry, const Point &origin,
                           double sx, double sy) const = 0;

    virtual Geometry transform(const Geometry &geometry,
                               const AffineMatrix &matrix) const = 0;

    virtual Geometry reshape(const Geometry &geometry,
                             const LineString &path) const = 0;

    /**
     * @brief Offset copies of a line with mitered corners.
     *
     * Each side gets `iterations` copies, the k-th one `k * distance` away.
     * With OffsetSide::Both the left and right copy of each step alternate.
     */
    virtual std::vector<Geometry> parallel_offset(const Geometry &geometry,
                                                  double distance,
                                                  OffsetSide side,
                                                  int iterations) const = 0;

    /**
     * @brief Splits lines where they cross each other.
     *
     * Entry i of the result holds the pieces of lines[i] in order along it.
     * A line nothing crosses comes back whole.
     */
    virtual std::vector<std::vector<Geometry>>
    planarize(const std::vector<Geometry> &lines) const = 0;
};

} // namespace geoedit
