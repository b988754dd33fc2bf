#pragma once

#include "kernel.hpp"

namespace geoedit {

/**
 * @brief IGeometryKernel backed by Boost.Geometry.
 *
 * Clip and merge use the Boost.Geometry set operations, transforms go
 * through a matrix_transformer. Linear splitting, offsetting and reshaping
 * are done by walking the vertex list.
 */
class BoostGeometryKernel : public IGeometryKernel {
  public:
    /**
     * @param merge_tolerance Maximum end point gap when joining lines.
     */
    explicit BoostGeometryKernel(double merge_tolerance = 1e-9);

    std::vector<Geometry> clip(const Geometry &geometry,
                               const Polygon &clip_polygon,
                               ClipMode mode) const override;

    std::vector<Geometry> split(const Geometry &geometry,
                                const SplitMethod &method) const override;

    Geometry merge(const std::vector<Geometry> &parts) const override;

    Geometry move(const Geometry &geometry, double dx,
                  double dy) const override;

    Geometry rotate(const Geometry &geometry, const Point &origin,
                    double degrees) const override;

    Geometry scale(const Geometry &geometry, const Point &origin, double sx,
                   double sy) const override;

    Geometry transform(const Geometry &geometry,
                       const AffineMatrix &matrix) const override;

    Geometry reshape(const Geometry &geometry,
                     const LineString &path) const override;

    std::vector<Geometry> parallel_offset(const Geometry &geometry,
                                          double distance, OffsetSide side,
                                          int iterations) const override;

    std::vector<std::vector<Geometry>>
    planarize(const std::vector<Geometry> &lines) const override;

  private:
    std::vector<Geometry> split_line(const LineString &line,
                                     const SplitMethod &method) const;
    std::vector<Geometry> cut_polygon(const Polygon &polygon,
                                      const LineString &cutter) const;
    Geometry merge_lines(const std::vector<Geometry> &parts) const;
    Geometry merge_polygons(const std::vector<Geometry> &parts) const;

    double m_merge_tolerance;
};

} // namespace geoedit
