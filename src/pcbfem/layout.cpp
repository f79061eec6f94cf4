// filename: layout.cpp
// part of PCB to FEMM Mesh Converter
// MIT License

#include "pcbfem/layout.hpp"

#include "pcbfem/errors.hpp"

#include <algorithm>
#include <utility>

namespace pcbfem {

LayerBounds LayerBounds::fromBox(const Box& box) {
    LayerBounds bounds{};
    if (box.min_corner().x() > box.max_corner().x() || box.min_corner().y() > box.max_corner().y()) {
        return bounds;
    }
    bounds.minX = box.min_corner().x();
    bounds.minY = box.min_corner().y();
    bounds.maxX = box.max_corner().x();
    bounds.maxY = box.max_corner().y();
    return bounds;
}

void Layout::configure(LayoutConfig config) {
    if (config.layers.empty()) {
        throw ConfigurationError("Layout has not been given any layers");
    }
    if (config.layers.size() > 2) {
        throw ConfigurationError("Layout supports at most two copper layers");
    }
    if (!(config.boardThickness > 0.0)) {
        throw ConfigurationError("Board thickness must be positive");
    }
    if (config.clearance < 0.0) {
        throw ConfigurationError("Layout clearance must not be negative");
    }
    config_ = std::move(config);
    configured_ = true;
    boundsSet_ = false;
}

void Layout::set_bounds(const LayerBounds& top, const LayerBounds& bottom) {
    if (!configured_) {
        throw ConfigurationError("Layout bounds set before the layout was configured");
    }
    const double clearance = config_.clearance;

    bottomXOffset_ = top.maxX + bottom.maxX + clearance;

    // Via rows start below the lowest layer edge, aligned with the top layer's left edge.
    viaYMax_ = -std::max(top.maxY, bottom.maxY) - clearance;
    viaXMin_ = top.minX;
    viaRowXMin_ = top.minX;
    viaRowXMax_ = top.maxX + bottom.maxX - bottom.minX + clearance;
    viaRowHeight_ = 0.0;

    boundsSet_ = true;
}

const LayoutConfig& Layout::config() const {
    if (!configured_) {
        throw ConfigurationError("Layout has not been configured");
    }
    return config_;
}

const std::string& Layout::top_layer() const {
    return config().layers.front();
}

std::optional<std::string> Layout::bottom_layer() const {
    const auto& layerNames = config().layers;
    if (layerNames.size() < 2) {
        return std::nullopt;
    }
    return layerNames[1];
}

bool Layout::spans_both_layers(const std::vector<std::string>& memberLayers) const {
    const auto& layerNames = config().layers;
    if (layerNames.size() != 2) {
        return false;
    }
    const auto contains = [&](const std::string& name) {
        return std::find(memberLayers.begin(), memberLayers.end(), name) != memberLayers.end();
    };
    return contains(layerNames[0]) && contains(layerNames[1]);
}

void Layout::requireReady() const {
    if (!is_ready()) {
        throw ConfigurationError("Layout has not been initialized");
    }
}

Affine2D Layout::layer_transform(const std::string& layer) const {
    requireReady();
    Affine2D t{};
    if (layer == config_.layers.front()) {
        t.e = -1.0;
        return t;
    }
    if (config_.layers.size() > 1 && layer == config_.layers[1]) {
        t.a = -1.0;
        t.e = -1.0;
        t.xoff = bottomXOffset_;
        return t;
    }
    throw ConfigurationError("Layer <" + layer + "> not found in the layout");
}

Point2 Layout::place(const Point2& point, const std::string& layer) const {
    return layer_transform(layer).apply(point);
}

Affine2D Layout::place_via(const Box& extent) {
    requireReady();
    const double xMin = extent.min_corner().x();
    const double yMin = extent.min_corner().y();
    const double xMax = extent.max_corner().x();
    const double yMax = extent.max_corner().y();
    const double width = xMax - xMin;
    const double height = yMax - yMin;

    const Affine2D shift = Affine2D::translation(viaXMin_ - xMin, viaYMax_ - yMax);

    viaXMin_ += width + config_.clearance;
    viaRowHeight_ = std::max(viaRowHeight_, height);

    if (viaXMin_ > viaRowXMax_) {
        viaYMax_ -= viaRowHeight_ + config_.clearance;
        viaRowHeight_ = 0.0;
        viaXMin_ = viaRowXMin_;
    }
    return shift;
}

}  // namespace pcbfem
