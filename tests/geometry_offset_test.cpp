// filename: geometry_offset_test.cpp
// part of PCB to FEMM Mesh Converter
// MIT License

#include "pcbfem/errors.hpp"
#include "pcbfem/geometry.hpp"
#include "pcbfem/types.hpp"

#include <cmath>
#include <iostream>

namespace {

bool checkShrink(const char* name, const pcbfem::Polygon& copper, double ratio) {
    using namespace pcbfem;
    const double copperArea = bg::area(copper);
    ShrinkResult result;
    try {
        result = shrinkToAreaRatio(copper, ratio);
    } catch (const std::exception& ex) {
        std::cerr << name << ": shrink failed: " << ex.what() << "\n";
        return false;
    }
    const double area = bg::area(result.polygon);
    const double relError = std::abs(area / (ratio * copperArea) - 1.0);
    if (relError > 0.01) {
        std::cerr << name << ": shrunk area " << area << " misses target " << ratio * copperArea
                  << " (relative error " << relError << ")\n";
        return false;
    }
    if (result.iterations > kShrinkMaxIterations) {
        std::cerr << name << ": shrink used " << result.iterations << " iterations\n";
        return false;
    }
    if (!bg::within(result.polygon, copper)) {
        std::cerr << name << ": shrunk outline leaves the copper\n";
        return false;
    }
    return true;
}

}  // namespace

int main() {
    using namespace pcbfem;

    const Polygon circle = circleOutline(Point2(0.0, 0.0), 1.0);
    const double circleArea = bg::area(circle);
    if (std::abs(circleArea - kPi) / kPi > 0.01) {
        std::cerr << "Circle outline area " << circleArea << " is not close to pi\n";
        return 1;
    }

    if (!checkShrink("circle r=1 ratio=0.5", circle, 0.5)) {
        return 1;
    }
    if (!checkShrink("rect 2x1 ratio=0.5", rectOutline(Point2(3.0, -1.0), 2.0, 1.0), 0.5)) {
        return 1;
    }
    if (!checkShrink("oval 1.5x3 ratio=0.8", ovalOutline(Point2(0.0, 0.0), 1.5, 3.0), 0.8)) {
        return 1;
    }
    if (!checkShrink("roundrect ratio=0.3",
                     roundRectOutline(Point2(0.0, 0.0), 1.6, 0.9, 0.25 * 0.9), 0.3)) {
        return 1;
    }

    // A ratio of one leaves the copper untouched.
    const ShrinkResult unchanged = shrinkToAreaRatio(circle, 1.0);
    if (unchanged.iterations != 0 || std::abs(bg::area(unchanged.polygon) - circleArea) > 1e-12) {
        std::cerr << "Ratio 1 modified the outline\n";
        return 1;
    }

    Polygon flat;
    bg::append(flat.outer(), Point2(0.0, 0.0));
    bg::append(flat.outer(), Point2(1.0, 0.0));
    bg::append(flat.outer(), Point2(2.0, 0.0));
    bg::append(flat.outer(), Point2(0.0, 0.0));
    bool threw = false;
    try {
        (void)shrinkToAreaRatio(flat, 0.5);
    } catch (const GeometryDegenerate&) {
        threw = true;
    }
    if (!threw) {
        std::cerr << "Zero-area copper did not raise GeometryDegenerate\n";
        return 1;
    }

    threw = false;
    try {
        (void)largestPolygon(MultiPolygon{});
    } catch (const GeometryDegenerate&) {
        threw = true;
    }
    if (!threw) {
        std::cerr << "largestPolygon of nothing did not raise GeometryDegenerate\n";
        return 1;
    }

    // The representative point of a ring with a hole must avoid the hole.
    Polygon washer = circleOutline(Point2(0.0, 0.0), 2.0);
    const Polygon inner = circleOutline(Point2(0.0, 0.0), 1.0);
    Ring hole(inner.outer().rbegin(), inner.outer().rend());
    washer.inners().push_back(hole);
    bg::correct(washer);
    const Point2 inside = representativePoint(washer);
    if (!bg::within(inside, washer)) {
        std::cerr << "Representative point (" << inside.x() << ", " << inside.y() << ") is not inside the washer\n";
        return 1;
    }

    std::cout << "Pad offset and polygon helpers validated successfully\n";
    return 0;
}
