// filename: layout_placement_test.cpp
// part of PCB to FEMM Mesh Converter
// MIT License

#include "pcbfem/errors.hpp"
#include "pcbfem/layout.hpp"

#include <cmath>
#include <functional>
#include <iostream>

namespace {

bool near(const pcbfem::Point2& p, double x, double y) {
    return std::abs(p.x() - x) < 1e-9 && std::abs(p.y() - y) < 1e-9;
}

bool throwsConfiguration(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const pcbfem::ConfigurationError&) {
        return true;
    }
    return false;
}

}  // namespace

int main() {
    using namespace pcbfem;

    Layout unconfigured;
    if (!throwsConfiguration([&] { (void)unconfigured.place(Point2(0.0, 0.0), "F.Cu"); })) {
        std::cerr << "Placing on an unconfigured layout did not raise ConfigurationError\n";
        return 1;
    }
    if (!throwsConfiguration([&] { (void)unconfigured.config(); })) {
        std::cerr << "Reading an unconfigured layout did not raise ConfigurationError\n";
        return 1;
    }
    if (!throwsConfiguration([&] { unconfigured.set_bounds(LayerBounds{}, LayerBounds{}); })) {
        std::cerr << "Setting bounds before configure did not raise ConfigurationError\n";
        return 1;
    }
    if (!throwsConfiguration([] { Layout bad(LayoutConfig{}); })) {
        std::cerr << "Layout without layers did not raise ConfigurationError\n";
        return 1;
    }
    if (!throwsConfiguration([] {
            LayoutConfig config;
            config.layers = {"F.Cu", "In1.Cu", "B.Cu"};
            Layout bad(config);
        })) {
        std::cerr << "Layout with three layers did not raise ConfigurationError\n";
        return 1;
    }

    LayoutConfig config;
    config.layers = {"F.Cu", "B.Cu"};
    config.boardThickness = 1.5;
    config.clearance = 0.5;
    Layout layout(config);

    // Configured but without bounds is still not ready.
    if (layout.is_ready() || !throwsConfiguration([&] { (void)layout.place(Point2(1.0, 2.0), "F.Cu"); })) {
        std::cerr << "Layout without bounds accepted a placement\n";
        return 1;
    }

    const LayerBounds bounds{0.0, 0.0, 10.0, 5.0};
    layout.set_bounds(bounds, bounds);
    if (!layout.is_ready()) {
        std::cerr << "Layout not ready after set_bounds\n";
        return 1;
    }

    const Point2 top = layout.place(Point2(1.0, 2.0), "F.Cu");
    if (!near(top, 1.0, -2.0)) {
        std::cerr << "Top layer should mirror y, got (" << top.x() << ", " << top.y() << ")\n";
        return 1;
    }
    const Point2 bottom = layout.place(Point2(1.0, 2.0), "B.Cu");
    if (!near(bottom, 19.5, -2.0)) {
        std::cerr << "Bottom layer should rotate and shift right, got (" << bottom.x() << ", " << bottom.y()
                  << ")\n";
        return 1;
    }
    if (!layout.layer_transform("F.Cu").flipsOrientation() || layout.layer_transform("B.Cu").flipsOrientation()) {
        std::cerr << "Unexpected layer transform orientation\n";
        return 1;
    }
    if (!throwsConfiguration([&] { (void)layout.place(Point2(0.0, 0.0), "In1.Cu"); })) {
        std::cerr << "Unknown layer did not raise ConfigurationError\n";
        return 1;
    }
    if (!layout.spans_both_layers({"B.Cu", "F.Cu"}) || layout.spans_both_layers({"F.Cu"})) {
        std::cerr << "spans_both_layers returned the wrong answer\n";
        return 1;
    }

    // Unrolled vias of 3 x 1.5 are packed in a row below both layers and wrap
    // once the cursor passes the combined layer width.
    const Box viaExtent(Point2(-3.0, -1.5), Point2(0.0, 0.0));
    const double expectedX[] = {3.0, 6.5, 10.0, 13.5, 17.0, 20.5, 3.0};
    const double expectedY[] = {-5.5, -5.5, -5.5, -5.5, -5.5, -5.5, -7.5};
    for (int i = 0; i < 7; ++i) {
        const Affine2D shift = layout.place_via(viaExtent);
        if (std::abs(shift.xoff - expectedX[i]) > 1e-9 || std::abs(shift.yoff - expectedY[i]) > 1e-9) {
            std::cerr << "Via " << i << " placed at shift (" << shift.xoff << ", " << shift.yoff << "), expected ("
                      << expectedX[i] << ", " << expectedY[i] << ")\n";
            return 1;
        }
    }

    // A single-layer layout has no bottom layer and never spans both layers.
    LayoutConfig single;
    single.layers = {"F.Cu"};
    Layout singleLayout(single);
    singleLayout.set_bounds(bounds, LayerBounds{});
    if (singleLayout.bottom_layer() || singleLayout.spans_both_layers({"F.Cu", "B.Cu"})) {
        std::cerr << "Single-layer layout reported a bottom layer\n";
        return 1;
    }

    std::cout << "Layout placement validated successfully\n";
    return 0;
}
