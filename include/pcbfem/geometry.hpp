// filename: geometry.hpp
// part of PCB to FEMM Mesh Converter
// MIT License

#pragma once

#include <cstddef>
#include <vector>

#include <boost/geometry.hpp>
#include <boost/geometry/geometries/box.hpp>
#include <boost/geometry/geometries/linestring.hpp>
#include <boost/geometry/geometries/multi_polygon.hpp>
#include <boost/geometry/geometries/point_xy.hpp>
#include <boost/geometry/geometries/polygon.hpp>

namespace pcbfem {

namespace bg = boost::geometry;

using Point2 = bg::model::d2::point_xy<double>;
using Ring = bg::model::ring<Point2>;
using Polygon = bg::model::polygon<Point2>;
using MultiPolygon = bg::model::multi_polygon<Polygon>;
using Linestring = bg::model::linestring<Point2>;
using Box = bg::model::box<Point2>;

// Segment count used for full circles, round joins and round caps.
constexpr int kCirclePoints = 64;
constexpr double kPadSimplifyTolerance = 1e-3;
constexpr double kBlockSimplifyTolerance = 0.01;

constexpr std::size_t kShrinkMaxIterations = 10;
constexpr double kShrinkAreaTolerance = 1e-3;

/**
 * @brief 2D affine map x' = a*x + b*y + xoff, y' = d*x + e*y + yoff.
 */
struct Affine2D {
    double a{1.0};
    double b{0.0};
    double d{0.0};
    double e{1.0};
    double xoff{0.0};
    double yoff{0.0};

    [[nodiscard]] Point2 apply(const Point2& p) const {
        return Point2(a * p.x() + b * p.y() + xoff, d * p.x() + e * p.y() + yoff);
    }

    [[nodiscard]] bool flipsOrientation() const { return (a * e - b * d) < 0.0; }

    static Affine2D translation(double dx, double dy);

    // Counter-clockwise rotation by `degrees` about `origin`.
    static Affine2D rotation(double degrees, const Point2& origin);
};

/**
 * @brief Apply a transform to every vertex, keeping vertex order. Rings are
 *        re-oriented only when the map is a reflection.
 */
Polygon transformed(const Polygon& polygon, const Affine2D& transform);

Polygon circleOutline(const Point2& center, double radius);

// Stadium of overall size sizeX x sizeY centred on `center`.
Polygon ovalOutline(const Point2& center, double sizeX, double sizeY);

Polygon rectOutline(const Point2& center, double sizeX, double sizeY);

Polygon trapezoidOutline(const Point2& center, double sizeX, double sizeY, double deltaX, double deltaY);

Polygon roundRectOutline(const Point2& center, double sizeX, double sizeY, double cornerRadius);

// Capsule of the given total width around the segment a-b.
MultiPolygon traceOutline(const Point2& a, const Point2& b, double width);

// Outward (positive) or inward (negative) offset with round joins.
MultiPolygon bufferRound(const Polygon& polygon, double distance);

// Offset with mitred joins; used for area-preserving pad shrinking.
MultiPolygon bufferMitre(const Polygon& polygon, double distance);

MultiPolygon unionAll(std::vector<MultiPolygon> parts);

Polygon simplified(const Polygon& polygon, double tolerance);

/**
 * @brief Largest polygon of a multi-polygon by area.
 * @throws GeometryDegenerate when the multi-polygon is empty.
 */
Polygon largestPolygon(const MultiPolygon& polygons);

/**
 * @brief A point guaranteed to lie inside the polygon (and outside its holes).
 */
Point2 representativePoint(const Polygon& polygon);

Box envelopeOf(const std::vector<Polygon>& polygons);

// Ring vertices without the closing duplicate.
std::vector<Point2> openRing(const Ring& ring);

double distance(const Point2& p, const Point2& q);

/**
 * @brief Non-reflex angle at p2 formed by p1-p2-p3, in degrees.
 */
double vertexAngle(const Point2& p1, const Point2& p2, const Point2& p3);

/**
 * @brief Mesh size hint for segment p2-p3 given its neighbours p1 and p4.
 *
 * Short segments (< 1.0) on a near-straight run (both vertex angles above
 * 150 degrees) get half their length so curved outlines are meshed densely.
 * Returns -1 ("automatic") otherwise.
 */
double calcMeshSize(const Point2& p1, const Point2& p2, const Point2& p3, const Point2& p4);

struct ShrinkResult {
    Polygon polygon;
    std::size_t iterations{0};
};

/**
 * @brief Shrink `copper` with a uniform inward margin until its area equals
 *        `ratio` times the original area.
 *
 * Starts from margin -(A0 - Ag) / P0 and corrects by -(Ai - Ag) / Pi for at
 * most kShrinkMaxIterations offsets, stopping once |1 - Ai/Ag| is below
 * kShrinkAreaTolerance. A ratio of 1 returns the input unchanged.
 *
 * @throws GeometryDegenerate on zero area or perimeter, or when the offset
 *         collapses the polygon.
 */
ShrinkResult shrinkToAreaRatio(const Polygon& copper, double ratio);

}  // namespace pcbfem
