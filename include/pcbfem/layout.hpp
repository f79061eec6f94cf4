// filename: layout.hpp
// part of PCB to FEMM Mesh Converter
// MIT License

#pragma once

#include <optional>
#include <utility>
#include <string>
#include <vector>

#include "pcbfem/geometry.hpp"
#include "pcbfem/types.hpp"

namespace pcbfem {

struct LayerBounds {
    double minX{0.0};
    double minY{0.0};
    double maxX{0.0};
    double maxY{0.0};

    static LayerBounds fromBox(const Box& box);
};

/**
 * @brief Static layout configuration, known before any geometry is read.
 */
struct LayoutConfig {
    std::vector<std::string> layers;  // one or two copper layer names, top first
    double boardThickness{1.5};
    BlockProperty copperProperty{"Copper", kCopperConductivity};
    BlockProperty viaProperty{"Via", kCopperConductivity};
    double clearance{0.5};
};

/**
 * @brief Arranges both copper layers and the unrolled via strips in one plane.
 *
 * The top layer is mirrored across the x-axis, the bottom layer is rotated by
 * 180 degrees and shifted right of the top layer, and unrolled vias are packed
 * in rows below both layers. Initialisation is two-phase: configure() with the
 * static settings, then set_bounds() once the layer extents are known. Placing
 * anything before both phases throws ConfigurationError.
 */
class Layout {
public:
    Layout() = default;

    explicit Layout(LayoutConfig config) { configure(std::move(config)); }

    void configure(LayoutConfig config);

    void set_bounds(const LayerBounds& top, const LayerBounds& bottom);

    [[nodiscard]] bool is_configured() const { return configured_; }
    [[nodiscard]] bool is_ready() const { return configured_ && boundsSet_; }

    [[nodiscard]] const LayoutConfig& config() const;
    [[nodiscard]] const std::vector<std::string>& layers() const { return config().layers; }
    [[nodiscard]] const std::string& top_layer() const;
    [[nodiscard]] std::optional<std::string> bottom_layer() const;
    [[nodiscard]] bool spans_both_layers(const std::vector<std::string>& memberLayers) const;

    [[nodiscard]] Affine2D layer_transform(const std::string& layer) const;

    [[nodiscard]] Point2 place(const Point2& point, const std::string& layer) const;

    /**
     * @brief Reserve the next via slot for geometry with extent `extent` and
     *        return the translation that moves it there.
     */
    Affine2D place_via(const Box& extent);

private:
    void requireReady() const;

    LayoutConfig config_{};
    bool configured_{false};
    bool boundsSet_{false};

    double bottomXOffset_{0.0};
    double viaYMax_{0.0};
    double viaXMin_{0.0};
    double viaRowXMin_{0.0};
    double viaRowXMax_{0.0};
    double viaRowHeight_{0.0};
};

}  // namespace pcbfem
