// filename: mesh_size_heuristic_test.cpp
// part of PCB to FEMM Mesh Converter
// MIT License

#include "pcbfem/converter.hpp"
#include "pcbfem/geometry.hpp"

#include <cassert>
#include <cmath>
#include <iostream>

int main() {
    using namespace pcbfem;

    const auto near = [](double a, double b) { return std::abs(a - b) < 1e-9; };

    assert(near(vertexAngle(Point2(1.0, 0.0), Point2(0.0, 0.0), Point2(0.0, 1.0)), 90.0));
    assert(near(vertexAngle(Point2(0.0, 1.0), Point2(0.0, 0.0), Point2(1.0, 0.0)), 90.0));
    assert(near(vertexAngle(Point2(1.0, 0.0), Point2(0.0, 0.0), Point2(-1.0, 0.0)), 180.0));
    assert(near(vertexAngle(Point2(1.0, 0.0), Point2(0.0, 0.0), Point2(-1.0, 1.0)), 135.0));

    // Short segment on a straight run: half its length.
    const double straight =
        calcMeshSize(Point2(-0.5, 0.0), Point2(0.0, 0.0), Point2(0.5, 0.0), Point2(1.0, 0.0));
    if (!near(straight, 0.25)) {
        std::cerr << "Expected mesh size 0.25 on a straight short segment, got " << straight << "\n";
        return 1;
    }

    // Long segments are left to the mesher.
    const double longSegment =
        calcMeshSize(Point2(-1.0, 0.0), Point2(0.0, 0.0), Point2(2.0, 0.0), Point2(3.0, 0.0));
    if (longSegment != -1.0) {
        std::cerr << "Expected automatic mesh size on a long segment, got " << longSegment << "\n";
        return 1;
    }

    // A sharp corner at either end disables the hint.
    const double corner =
        calcMeshSize(Point2(0.0, 1.0), Point2(0.0, 0.0), Point2(0.5, 0.0), Point2(1.0, 0.0));
    const double cornerAfter =
        calcMeshSize(Point2(-0.5, 0.0), Point2(0.0, 0.0), Point2(0.5, 0.0), Point2(0.5, 0.5));
    if (corner != -1.0 || cornerAfter != -1.0) {
        std::cerr << "Expected automatic mesh size next to a right angle, got " << corner << " and "
                  << cornerAfter << "\n";
        return 1;
    }

    // Every segment of a small circle gets a hint of half its length.
    const std::vector<Point2> ring = openRing(circleOutline(Point2(2.0, 2.0), 0.5).outer());
    const std::vector<OutlineSegment> segments = ringSegments(ring);
    if (segments.size() != ring.size()) {
        std::cerr << "Closed ring of " << ring.size() << " points gave " << segments.size() << " segments\n";
        return 1;
    }
    for (const OutlineSegment& segment : segments) {
        const double half = distance(segment.start, segment.end) / 2.0;
        if (!near(segment.meshSize, half)) {
            std::cerr << "Circle segment mesh size " << segment.meshSize << " differs from " << half << "\n";
            return 1;
        }
    }

    // The last segment closes the ring.
    if (!bg::equals(segments.back().end, ring.front())) {
        std::cerr << "Ring segments do not close the loop\n";
        return 1;
    }

    std::cout << "Mesh size heuristic validated successfully\n";
    return 0;
}
