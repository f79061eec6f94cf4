// filename: geometry.cpp
// part of PCB to FEMM Mesh Converter
// MIT License

#include "pcbfem/geometry.hpp"

#include "pcbfem/errors.hpp"
#include "pcbfem/types.hpp"

#include <algorithm>
#include <cmath>
#include <string>
#include <utility>
#include <vector>

#include <boost/geometry/algorithms/point_on_surface.hpp>

namespace pcbfem {
namespace {

namespace bs = bg::strategy::buffer;

MultiPolygon bufferLinestring(const Linestring& line, double radius) {
    MultiPolygon out;
    bg::buffer(line, out,
               bs::distance_symmetric<double>(radius),
               bs::side_straight(),
               bs::join_round(kCirclePoints),
               bs::end_round(kCirclePoints),
               bs::point_circle(kCirclePoints));
    return out;
}

double pythonModulo(double value, double modulus) {
    const double r = std::fmod(value, modulus);
    return (r < 0.0) ? r + modulus : r;
}

}  // namespace

Affine2D Affine2D::translation(double dx, double dy) {
    Affine2D t{};
    t.xoff = dx;
    t.yoff = dy;
    return t;
}

Affine2D Affine2D::rotation(double degrees, const Point2& origin) {
    const double rad = degrees * kPi / 180.0;
    const double c = std::cos(rad);
    const double s = std::sin(rad);
    Affine2D t{};
    t.a = c;
    t.b = -s;
    t.d = s;
    t.e = c;
    t.xoff = origin.x() - c * origin.x() + s * origin.y();
    t.yoff = origin.y() - s * origin.x() - c * origin.y();
    return t;
}

Polygon transformed(const Polygon& polygon, const Affine2D& transform) {
    Polygon out;
    for (const Point2& p : polygon.outer()) {
        out.outer().push_back(transform.apply(p));
    }
    for (const Ring& inner : polygon.inners()) {
        Ring ring;
        for (const Point2& p : inner) {
            ring.push_back(transform.apply(p));
        }
        out.inners().push_back(std::move(ring));
    }
    if (transform.flipsOrientation()) {
        bg::correct(out);
    }
    return out;
}

Polygon circleOutline(const Point2& center, double radius) {
    Polygon out;
    // Clockwise, starting on the +x axis.
    for (int k = 0; k < kCirclePoints; ++k) {
        const double theta = -2.0 * kPi * static_cast<double>(k) / static_cast<double>(kCirclePoints);
        out.outer().emplace_back(center.x() + radius * std::cos(theta), center.y() + radius * std::sin(theta));
    }
    out.outer().push_back(out.outer().front());
    bg::correct(out);
    return out;
}

Polygon ovalOutline(const Point2& center, double sizeX, double sizeY) {
    const double radius = std::min(sizeX, sizeY) / 2.0;
    const Point2 start(center.x() + radius - sizeX / 2.0, center.y() + radius - sizeY / 2.0);
    const Point2 end(center.x() + sizeX / 2.0 - radius, center.y() + sizeY / 2.0 - radius);
    if (bg::equals(start, end)) {
        return circleOutline(center, radius);
    }
    Linestring line;
    line.push_back(start);
    line.push_back(end);
    return largestPolygon(bufferLinestring(line, radius));
}

Polygon rectOutline(const Point2& center, double sizeX, double sizeY) {
    const double minX = center.x() - sizeX / 2.0;
    const double maxX = center.x() + sizeX / 2.0;
    const double minY = center.y() - sizeY / 2.0;
    const double maxY = center.y() + sizeY / 2.0;
    Polygon out;
    out.outer() = {Point2(minX, minY), Point2(minX, maxY), Point2(maxX, maxY), Point2(maxX, minY),
                   Point2(minX, minY)};
    bg::correct(out);
    return out;
}

Polygon trapezoidOutline(const Point2& center, double sizeX, double sizeY, double deltaX, double deltaY) {
    const double cx = center.x();
    const double cy = center.y();
    Polygon out;
    out.outer() = {Point2(cx + (-sizeX - deltaY) / 2.0, cy + (sizeY + deltaX) / 2.0),
                   Point2(cx + (sizeX + deltaY) / 2.0, cy + (sizeY - deltaX) / 2.0),
                   Point2(cx + (sizeX - deltaY) / 2.0, cy + (-sizeY + deltaX) / 2.0),
                   Point2(cx + (-sizeX + deltaY) / 2.0, cy + (-sizeY - deltaX) / 2.0)};
    out.outer().push_back(out.outer().front());
    bg::correct(out);
    return out;
}

Polygon roundRectOutline(const Point2& center, double sizeX, double sizeY, double cornerRadius) {
    const double radius = std::min(cornerRadius, std::min(sizeX, sizeY) / 2.0);
    if (!(radius > 0.0)) {
        return rectOutline(center, sizeX, sizeY);
    }
    const double innerX = sizeX - 2.0 * radius;
    const double innerY = sizeY - 2.0 * radius;
    if (!(innerX > 0.0) || !(innerY > 0.0)) {
        return ovalOutline(center, sizeX, sizeY);
    }
    return largestPolygon(bufferRound(rectOutline(center, innerX, innerY), radius));
}

MultiPolygon traceOutline(const Point2& a, const Point2& b, double width) {
    if (bg::equals(a, b)) {
        MultiPolygon out;
        out.push_back(circleOutline(a, width / 2.0));
        return out;
    }
    Linestring line;
    line.push_back(a);
    line.push_back(b);
    return bufferLinestring(line, width / 2.0);
}

MultiPolygon bufferRound(const Polygon& polygon, double distance) {
    MultiPolygon out;
    bg::buffer(polygon, out,
               bs::distance_symmetric<double>(distance),
               bs::side_straight(),
               bs::join_round(kCirclePoints),
               bs::end_round(kCirclePoints),
               bs::point_circle(kCirclePoints));
    return out;
}

MultiPolygon bufferMitre(const Polygon& polygon, double distance) {
    MultiPolygon out;
    bg::buffer(polygon, out,
               bs::distance_symmetric<double>(distance),
               bs::side_straight(),
               bs::join_miter(),
               bs::end_flat(),
               bs::point_square());
    return out;
}

MultiPolygon unionAll(std::vector<MultiPolygon> parts) {
    if (parts.empty()) {
        return MultiPolygon{};
    }
    // Pairwise reduction keeps each union small.
    while (parts.size() > 1) {
        std::vector<MultiPolygon> next;
        next.reserve(parts.size() / 2 + 1);
        for (std::size_t i = 0; i < parts.size(); i += 2) {
            if (i + 1 < parts.size()) {
                MultiPolygon merged;
                bg::union_(parts[i], parts[i + 1], merged);
                next.push_back(std::move(merged));
            } else {
                next.push_back(std::move(parts[i]));
            }
        }
        parts = std::move(next);
    }
    return std::move(parts.front());
}

Polygon simplified(const Polygon& polygon, double tolerance) {
    Polygon out;
    bg::simplify(polygon, out, tolerance);
    return out;
}

Polygon largestPolygon(const MultiPolygon& polygons) {
    if (polygons.empty()) {
        throw GeometryDegenerate("Expected a non-empty region but the geometry is empty");
    }
    const auto it = std::max_element(polygons.begin(), polygons.end(), [](const Polygon& lhs, const Polygon& rhs) {
        return bg::area(lhs) < bg::area(rhs);
    });
    return *it;
}

Point2 representativePoint(const Polygon& polygon) {
    if (polygon.outer().size() < 4) {
        throw GeometryDegenerate("Cannot place a label inside an empty polygon");
    }
    Point2 point;
    bg::point_on_surface(polygon, point);
    return point;
}

Box envelopeOf(const std::vector<Polygon>& polygons) {
    Box box;
    bg::assign_inverse(box);
    for (const Polygon& polygon : polygons) {
        bg::expand(box, bg::return_envelope<Box>(polygon));
    }
    return box;
}

std::vector<Point2> openRing(const Ring& ring) {
    std::vector<Point2> points(ring.begin(), ring.end());
    if (points.size() > 1 && bg::equals(points.front(), points.back())) {
        points.pop_back();
    }
    return points;
}

double distance(const Point2& p, const Point2& q) {
    return std::hypot(p.x() - q.x(), p.y() - q.y());
}

double vertexAngle(const Point2& p1, const Point2& p2, const Point2& p3) {
    double a = std::atan2(p1.y() - p2.y(), p1.x() - p2.x()) - std::atan2(p3.y() - p2.y(), p3.x() - p2.x());
    a = pythonModulo(a, 2.0 * kPi);
    if (a > kPi) {
        a = 2.0 * kPi - a;
    }
    return a * 180.0 / kPi;
}

double calcMeshSize(const Point2& p1, const Point2& p2, const Point2& p3, const Point2& p4) {
    const double segmentLength = distance(p2, p3);
    if (segmentLength < 1.0 && vertexAngle(p1, p2, p3) > 150.0 && vertexAngle(p2, p3, p4) > 150.0) {
        return segmentLength / 2.0;
    }
    return -1.0;
}

ShrinkResult shrinkToAreaRatio(const Polygon& copper, double ratio) {
    if (!(ratio > 0.0) || ratio > 1.0) {
        throw ConfigurationError("Conductor area ratio must be in (0, 1], got " + std::to_string(ratio));
    }
    const double initialArea = bg::area(copper);
    const double initialPerimeter = bg::perimeter(copper);
    if (!(initialArea > 0.0) || !(initialPerimeter > 0.0)) {
        throw GeometryDegenerate("Cannot shrink a pad outline with zero area or perimeter");
    }

    ShrinkResult result{copper, 0};
    if (ratio == 1.0) {
        return result;
    }

    const double goalArea = ratio * initialArea;
    double margin = -(initialArea - goalArea) / initialPerimeter;

    for (std::size_t i = 0; i < kShrinkMaxIterations; ++i) {
        const MultiPolygon offset = bufferMitre(copper, margin);
        if (offset.empty()) {
            throw GeometryDegenerate("Pad outline collapsed while shrinking to the conductor area");
        }
        result.polygon = largestPolygon(offset);
        result.iterations = i + 1;

        const double area = bg::area(result.polygon);
        const double perimeter = bg::perimeter(result.polygon);
        if (!(perimeter > 0.0)) {
            throw GeometryDegenerate("Pad outline perimeter vanished while shrinking");
        }
        if (std::abs(1.0 - area / goalArea) < kShrinkAreaTolerance) {
            break;
        }
        margin -= (area - goalArea) / perimeter;
    }
    return result;
}

}  // namespace pcbfem
