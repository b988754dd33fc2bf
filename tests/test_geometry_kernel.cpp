#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <boost/geometry.hpp>

#include "geometry/boost_kernel.hpp"
#include "test_helpers.hpp"
#include "utility/exceptions.hpp"

using namespace geoedit;
using Catch::Approx;
namespace bg = boost::geometry;

namespace {

double area(const Geometry &g) { return bg::area(std::get<Polygon>(g)); }
double length(const Geometry &g) { return bg::length(std::get<LineString>(g)); }

} // namespace

TEST_CASE("Geometry - Basics", "[geometry]") {
    SECTION("make_polygon closes and orients the ring") {
        const Polygon p = make_polygon({{0, 0}, {1, 0}, {1, 1}, {0, 1}});
        REQUIRE(p.outer().size() == 5);
        REQUIRE(p.outer().front() == p.outer().back());
        REQUIRE(bg::area(p) == Approx(1.0));
    }

    SECTION("Exact equality") {
        const Geometry a = make_line({{0, 0}, {1, 1}});
        const Geometry b = make_line({{0, 0}, {1, 1}});
        const Geometry c = make_line({{0, 0}, {1, 1.0000001}});
        REQUIRE(same_geometry(a, b));
        REQUIRE_FALSE(same_geometry(a, c));
        REQUIRE_FALSE(same_geometry(a, Geometry{Point{0, 0}}));
    }

    SECTION("Type names") {
        REQUIRE(geometry_type_from_string("Polygon") == GeometryType::Polygon);
        REQUIRE(std::string(to_string(GeometryType::LineString)) ==
                "LineString");
        REQUIRE_THROWS_AS(geometry_type_from_string("Circle"), GeometryError);
    }
}

TEST_CASE("BoostGeometryKernel - Affine operations", "[geometry_kernel]") {
    BoostGeometryKernel kernel;

    SECTION("Move") {
        const Geometry moved = kernel.move(Point{1, 2}, 10, -1);
        REQUIRE(std::get<Point>(moved).x == Approx(11));
        REQUIRE(std::get<Point>(moved).y == Approx(1));
    }

    SECTION("Rotate keeps area") {
        const Geometry rotated =
            kernel.rotate(test::square(0, 0, 2), {1, 1}, 45);
        REQUIRE(area(rotated) == Approx(4.0));
    }

    SECTION("Scale") {
        const Geometry scaled =
            kernel.scale(make_line({{0, 0}, {1, 0}}), {0, 0}, 3, 1);
        REQUIRE(length(scaled) == Approx(3.0));
        REQUIRE_THROWS_AS(kernel.scale(test::square(0, 0, 1), {0, 0}, 0, 1),
                          GeometryError);
    }

    SECTION("Mirror transform keeps a valid polygon") {
        AffineMatrix mirror;
        mirror.a = -1.0;
        const Geometry out = kernel.transform(test::square(0, 0, 2), mirror);
        REQUIRE(area(out) == Approx(4.0));
    }
}

TEST_CASE("BoostGeometryKernel - Clip", "[geometry_kernel]") {
    BoostGeometryKernel kernel;
    const Polygon clipper = test::square(1, 0, 4);

    SECTION("Preserve area keeps the inside") {
        auto pieces = kernel.clip(test::square(0, 0, 2), clipper,
                                  ClipMode::PreserveArea);
        REQUIRE(pieces.size() == 1);
        REQUIRE(area(pieces[0]) == Approx(2.0));
    }

    SECTION("Discard area keeps the outside") {
        auto pieces = kernel.clip(test::square(0, 0, 2), clipper,
                                  ClipMode::DiscardArea);
        REQUIRE(pieces.size() == 1);
        REQUIRE(area(pieces[0]) == Approx(2.0));
    }

    SECTION("Line crossing the clip polygon twice") {
        const Geometry line = make_line({{0, 1}, {6, 1}});
        auto outside = kernel.clip(line, clipper, ClipMode::DiscardArea);
        REQUIRE(outside.size() == 2);
    }

    SECTION("Nothing left") {
        REQUIRE_THROWS_AS(kernel.clip(test::square(10, 10, 1), clipper,
                                      ClipMode::PreserveArea),
                          GeometryError);
    }
}

TEST_CASE("BoostGeometryKernel - Split", "[geometry_kernel]") {
    BoostGeometryKernel kernel;
    const Geometry line = make_line({{0, 0}, {10, 0}});

    SECTION("Equal parts") {
        auto pieces = kernel.split(line, SplitByEqualParts{4});
        REQUIRE(pieces.size() == 4);
        for (const auto &piece : pieces)
            REQUIRE(length(piece) == Approx(2.5));
    }

    SECTION("By distance from the end") {
        auto pieces = kernel.split(line, SplitByDistance{4.0, false});
        REQUIRE(pieces.size() == 3);
        REQUIRE(length(pieces[0]) == Approx(2.0));
        REQUIRE(length(pieces[2]) == Approx(4.0));
    }

    SECTION("By percentage") {
        auto pieces = kernel.split(line, SplitByPercentage{30.0, true});
        REQUIRE(pieces.size() == 4);
        REQUIRE(length(pieces[0]) == Approx(3.0));
        REQUIRE(length(pieces[3]) == Approx(1.0));
    }

    SECTION("Varying distances with proportional remainder") {
        auto pieces = kernel.split(
            line, SplitByVaryingDistance{{1.0, 1.0, 3.0}, true, true});
        REQUIRE(pieces.size() == 3);
        REQUIRE(length(pieces[0]) == Approx(2.0));
        REQUIRE(length(pieces[2]) == Approx(6.0));
    }

    SECTION("At points") {
        auto pieces = kernel.split(line, SplitAtPoints{{{3, 1}, {7, -1}}});
        REQUIRE(pieces.size() == 3);
        REQUIRE(length(pieces[1]) == Approx(4.0));
    }

    SECTION("Polygon by a cut line") {
        auto pieces = kernel.split(
            test::square(0, 0, 4), SplitByLine{make_line({{1, -1}, {1, 5}})});
        REQUIRE(pieces.size() == 2);
        REQUIRE(area(pieces[0]) == Approx(12.0));
        REQUIRE(area(pieces[1]) == Approx(4.0));
    }

    SECTION("Unsupported inputs") {
        REQUIRE_THROWS_AS(kernel.split(Point{0, 0}, SplitByEqualParts{2}),
                          GeometryError);
        REQUIRE_THROWS_AS(kernel.split(test::square(0, 0, 1),
                                       SplitByEqualParts{2}),
                          GeometryError);
        REQUIRE_THROWS_AS(kernel.split(line, SplitByEqualParts{1}),
                          GeometryError);
        REQUIRE_THROWS_AS(
            kernel.split(test::square(0, 0, 1),
                         SplitByLine{make_line({{5, -1}, {5, 5}})}),
            GeometryError);
    }
}

TEST_CASE("BoostGeometryKernel - Merge", "[geometry_kernel]") {
    BoostGeometryKernel kernel(1e-6);

    SECTION("Adjacent polygons") {
        const Geometry merged =
            kernel.merge({test::square(0, 0, 1), test::square(1, 0, 1)});
        REQUIRE(area(merged) == Approx(2.0));
    }

    SECTION("Disjoint polygons") {
        REQUIRE_THROWS_AS(
            kernel.merge({test::square(0, 0, 1), test::square(5, 0, 1)}),
            GeometryError);
    }

    SECTION("Lines joined end to end, in any direction") {
        const Geometry merged = kernel.merge(
            {make_line({{0, 0}, {1, 0}}), make_line({{2, 0}, {1, 0}}),
             make_line({{2, 0}, {3, 0}})});
        REQUIRE(length(merged) == Approx(3.0));
        REQUIRE(point_count(merged) == 4);
    }

    SECTION("Points") {
        REQUIRE_THROWS_AS(kernel.merge({Point{0, 0}, Point{1, 1}}),
                          GeometryError);
    }
}

TEST_CASE("BoostGeometryKernel - Reshape", "[geometry_kernel]") {
    BoostGeometryKernel kernel;

    SECTION("Line section replaced") {
        const Geometry line = make_line({{0, 0}, {1, 0}, {2, 0}, {3, 0}});
        const Geometry out =
            kernel.reshape(line, make_line({{1, 0}, {1.5, 1}, {2, 0}}));
        REQUIRE(point_count(out) == 5);
        REQUIRE(std::get<LineString>(out)[2] == Point{1.5, 1});
    }

    SECTION("Polygon edge pushed outwards") {
        const Geometry out = kernel.reshape(
            test::square(0, 0, 2), make_line({{0, 2}, {1, 3}, {2, 2}}));
        REQUIRE(area(out) == Approx(5.0));
    }

    SECTION("Too short") {
        REQUIRE_THROWS_AS(
            kernel.reshape(test::square(0, 0, 2), make_line({{0, 0}})),
            GeometryError);
    }
}

TEST_CASE("BoostGeometryKernel - Degenerate inputs", "[geometry_kernel]") {
    BoostGeometryKernel kernel;
    const Geometry empty_line = LineString{};
    const Geometry one_point = make_line({{0, 0}});
    const Geometry empty_polygon = Polygon{};
    const Geometry line = make_line({{0, 0}, {1, 0}});

    SECTION("Detection") {
        REQUIRE(is_degenerate(empty_line));
        REQUIRE(is_degenerate(one_point));
        REQUIRE(is_degenerate(empty_polygon));
        REQUIRE_FALSE(is_degenerate(line));
        REQUIRE_FALSE(is_degenerate(Point{0, 0}));
        REQUIRE_FALSE(is_degenerate(test::square(0, 0, 1)));
    }

    SECTION("Merge") {
        REQUIRE_THROWS_AS(kernel.merge({empty_line, line}), GeometryError);
        REQUIRE_THROWS_AS(kernel.merge({line, one_point}), GeometryError);
        REQUIRE_THROWS_AS(kernel.merge({empty_polygon, test::square(0, 0, 1)}),
                          GeometryError);
    }

    SECTION("Reshape") {
        const LineString path = make_line({{0, 0}, {1, 1}});
        REQUIRE_THROWS_AS(kernel.reshape(empty_line, path), GeometryError);
        REQUIRE_THROWS_AS(kernel.reshape(one_point, path), GeometryError);
        REQUIRE_THROWS_AS(kernel.reshape(empty_polygon, path), GeometryError);
    }

    SECTION("Clip and split") {
        REQUIRE_THROWS_AS(kernel.clip(empty_line, test::square(0, 0, 1),
                                      ClipMode::PreserveArea),
                          GeometryError);
        REQUIRE_THROWS_AS(kernel.clip(line, Polygon{}, ClipMode::DiscardArea),
                          GeometryError);
        REQUIRE_THROWS_AS(kernel.split(one_point, SplitByEqualParts{2}),
                          GeometryError);
        REQUIRE_THROWS_AS(
            kernel.split(line, SplitByLine{make_line({{0.5, 1}})}),
            GeometryError);
    }

    SECTION("Transforms") {
        REQUIRE_THROWS_AS(kernel.move(empty_line, 1, 1), GeometryError);
        REQUIRE_THROWS_AS(kernel.rotate(empty_polygon, Point{0, 0}, 90),
                          GeometryError);
        REQUIRE_THROWS_AS(
            kernel.transform(one_point, AffineMatrix::translation(1, 0)),
            GeometryError);
    }

    SECTION("Offset and planarize") {
        REQUIRE_THROWS_AS(
            kernel.parallel_offset(empty_line, 1.0, OffsetSide::Left, 1),
            GeometryError);
        REQUIRE_THROWS_AS(kernel.planarize({line, one_point}), GeometryError);
    }
}

TEST_CASE("BoostGeometryKernel - Parallel offset", "[geometry_kernel]") {
    BoostGeometryKernel kernel;
    const Geometry line = make_line({{0, 0}, {10, 0}});

    SECTION("One side") {
        const auto left = kernel.parallel_offset(line, 2.0, OffsetSide::Left, 1);
        REQUIRE(left.size() == 1);
        REQUIRE(std::get<LineString>(left[0])[0] == Point{0, 2});
        REQUIRE(std::get<LineString>(left[0])[1] == Point{10, 2});

        const auto right =
            kernel.parallel_offset(line, 2.0, OffsetSide::Right, 1);
        REQUIRE(std::get<LineString>(right[0])[0] == Point{0, -2});
    }

    SECTION("Both sides, several steps") {
        const auto copies =
            kernel.parallel_offset(line, 2.0, OffsetSide::Both, 2);
        REQUIRE(copies.size() == 4);
        const double expected[] = {2.0, -2.0, 4.0, -4.0};
        for (std::size_t i = 0; i < copies.size(); ++i) {
            REQUIRE(std::get<LineString>(copies[i])[0].y ==
                    Approx(expected[i]));
            REQUIRE(length(copies[i]) == Approx(10.0));
        }
    }

    SECTION("Corners are mitered") {
        const auto copies = kernel.parallel_offset(
            make_line({{0, 0}, {10, 0}, {10, 10}}), 1.0, OffsetSide::Left, 1);
        const auto &out = std::get<LineString>(copies.front());
        REQUIRE(out.size() == 3);
        REQUIRE(out[1].x == Approx(9.0));
        REQUIRE(out[1].y == Approx(1.0));
        REQUIRE(length(copies.front()) == Approx(18.0));
    }

    SECTION("Sharp corners are beveled") {
        const auto copies = kernel.parallel_offset(
            make_line({{0, 0}, {10, 0}, {0, 1}}), 1.0, OffsetSide::Left, 1);
        REQUIRE(point_count(copies.front()) == 4);
    }

    SECTION("Invalid requests") {
        REQUIRE_THROWS_AS(
            kernel.parallel_offset(Point{0, 0}, 1.0, OffsetSide::Left, 1),
            GeometryError);
        REQUIRE_THROWS_AS(
            kernel.parallel_offset(line, 0.0, OffsetSide::Left, 1),
            GeometryError);
        REQUIRE_THROWS_AS(
            kernel.parallel_offset(line, 1.0, OffsetSide::Left, 0),
            GeometryError);
        REQUIRE_THROWS_AS(kernel.parallel_offset(
                              make_line({{0, 0}, {10, 0}, {5, 0}}), 1.0,
                              OffsetSide::Left, 1),
                          GeometryError);
    }
}

TEST_CASE("BoostGeometryKernel - Planarize", "[geometry_kernel]") {
    BoostGeometryKernel kernel;

    SECTION("Crossing lines are cut, others stay whole") {
        const Geometry far = make_line({{20, 0}, {30, 0}});
        const auto pieces =
            kernel.planarize({make_line({{0, 0}, {10, 0}}),
                              make_line({{5, -5}, {5, 5}}), far});
        REQUIRE(pieces.size() == 3);
        REQUIRE(pieces[0].size() == 2);
        REQUIRE(length(pieces[0][0]) == Approx(5.0));
        REQUIRE(length(pieces[0][1]) == Approx(5.0));
        REQUIRE(pieces[1].size() == 2);
        REQUIRE(pieces[2].size() == 1);
        REQUIRE(same_geometry(pieces[2][0], far));
    }

    SECTION("Several crossings on one line") {
        const auto pieces = kernel.planarize(
            {make_line({{0, 0}, {10, 0}}),
             make_line({{2, -1}, {2, 1}, {8, 1}, {8, -1}})});
        REQUIRE(pieces[0].size() == 3);
        REQUIRE(length(pieces[0][0]) == Approx(2.0));
        REQUIRE(length(pieces[0][1]) == Approx(6.0));
        REQUIRE(length(pieces[0][2]) == Approx(2.0));
        REQUIRE(pieces[1].size() == 3);
    }

    SECTION("Lines meeting at an end point") {
        const auto pieces = kernel.planarize(
            {make_line({{0, 0}, {10, 0}}), make_line({{10, 0}, {10, 5}})});
        REQUIRE(pieces[0].size() == 1);
        REQUIRE(pieces[1].size() == 1);
    }

    SECTION("Only lines") {
        REQUIRE_THROWS_AS(kernel.planarize({test::square(0, 0, 1)}),
                          GeometryError);
    }
}
