// filename: converter.cpp
// part of PCB to FEMM Mesh Converter
// MIT License

#include "pcbfem/converter.hpp"

#include "pcbfem/errors.hpp"
#include "pcbfem/progress.hpp"

#include <algorithm>
#include <numeric>
#include <string>
#include <tuple>
#include <utility>

namespace pcbfem {
namespace {

Point2 padCenter(const BoardPad& item) {
    if (item.is_via()) {
        return item.at;
    }
    // Footprint-relative: rotate about the footprint origin, then move to the footprint position.
    const Point2 rotated = Affine2D::rotation(-item.componentRotation, Point2(0.0, 0.0)).apply(item.at);
    return Point2(rotated.x() + item.componentAt.x(), rotated.y() + item.componentAt.y());
}

Polygon rotatedAbout(const Polygon& polygon, double degrees, const Point2& origin) {
    return transformed(polygon, Affine2D::rotation(degrees, origin));
}

void addOutlineSegment(MeshDocument& mesh,
                       const OutlineSegment& outline,
                       std::optional<std::size_t> conductor,
                       std::optional<std::size_t> boundary) {
    MeshSegment segment;
    segment.start = mesh.add_point(outline.start);
    segment.end = mesh.add_point(outline.end);
    segment.meshSize = outline.meshSize;
    segment.conductor = conductor;
    segment.boundary = boundary;
    mesh.add_segment(segment);
}

Polygon ringPolygon(const Ring& ring) {
    Polygon polygon;
    polygon.outer().assign(ring.begin(), ring.end());
    bg::correct(polygon);
    return polygon;
}

MultiPolygon single(const Polygon& polygon) {
    MultiPolygon out;
    out.push_back(polygon);
    return out;
}

VtkOutlineLoop outlineLoop(const Polygon& polygon, VtkOutlineLoop::Kind kind, std::string label, std::string layer) {
    VtkOutlineLoop loop;
    loop.kind = kind;
    loop.label = std::move(label);
    loop.layer = std::move(layer);
    for (const Point2& p : openRing(polygon.outer())) {
        loop.xs.push_back(p.x());
        loop.ys.push_back(p.y());
    }
    return loop;
}

}  // namespace

PadBase::PadBase(BoardPad item) : item_(std::move(item)), center_(padCenter(item_)) {}

void PadBase::set_smd_pad_ratio(double ratio) {
    if (!(ratio > 0.0) || ratio > 1.0) {
        throw ConfigurationError("smd_pad_size must be > 0.0 and <= 1.0, got " + std::to_string(ratio));
    }
    smdPadRatio_ = ratio;
    conductor_.reset();
}

Point2 PadBase::hole_center() const {
    if (!is_smd()) {
        return center_;
    }
    Point2 hole = center_;
    if (item_.drill && item_.drill->offset) {
        hole = Point2(hole.x() + item_.drill->offset->x(), hole.y() + item_.drill->offset->y());
    }
    return Affine2D::rotation(-item_.rotation, center_).apply(hole);
}

const Polygon& PadBase::copper_polygon() const {
    if (copper_) {
        return *copper_;
    }
    const double sx = item_.sizeX;
    const double sy = item_.sizeY;
    Polygon outline;
    if (item_.shape == "circle") {
        outline = circleOutline(center_, sx / 2.0);
    } else if (item_.shape == "oval") {
        outline = ovalOutline(center_, sx, sy);
    } else if (item_.shape == "rect") {
        outline = rectOutline(center_, sx, sy);
    } else if (item_.shape == "trapezoid") {
        outline = trapezoidOutline(center_, sx, sy, item_.rectDelta.x(), item_.rectDelta.y());
    } else if (item_.shape == "roundrect") {
        outline = roundRectOutline(center_, sx, sy, item_.roundRectRatio * std::min(sx, sy));
    } else {
        throw ConfigurationError("Unknown pad shape <" + item_.shape + ">");
    }

    if (item_.drill && item_.drill->offset) {
        outline = transformed(outline, Affine2D::translation(item_.drill->offset->x(), item_.drill->offset->y()));
    }
    copper_ = simplified(rotatedAbout(outline, -item_.rotation, center_), kPadSimplifyTolerance);
    return *copper_;
}

const Polygon& PadBase::conductor_polygon() const {
    if (conductor_) {
        return *conductor_;
    }
    if (is_through_hole()) {
        if (!item_.drill) {
            throw InputFormatError("Through-hole pad <" + item_.componentReference + ":" + item_.number +
                                   "> has no drill");
        }
        const BoardDrill& drill = *item_.drill;
        Polygon outline = drill.shape == BoardDrill::Shape::Oval ? ovalOutline(center_, drill.sizeX, drill.sizeY)
                                                                 : circleOutline(center_, drill.sizeX / 2.0);
        conductor_ = simplified(rotatedAbout(outline, -item_.rotation, center_), kPadSimplifyTolerance);
    } else if (is_smd()) {
        conductor_ = shrinkToAreaRatio(copper_polygon(), smdPadRatio_).polygon;
    } else {
        throw ConfigurationError("Unknown pad type <" + item_.type + ">");
    }
    return *conductor_;
}

void Pad::set_conductor(const Conductor& conductor) {
    if (conductor_ != nullptr) {
        throw ConfigurationError("Pad conductor already set to <" + conductor_->name + ">. Cannot set to <" +
                                 conductor.name + ">");
    }
    conductor_ = &conductor;
}

Converter::Converter(std::vector<ConductorSpec> specs, ConverterOptions options)
    : specs_(std::move(specs)), options_(std::move(options)) {
    if (options_.layers.empty() || options_.layers.size() > 2) {
        throw ConfigurationError("Converter needs one or two copper layers");
    }
    checkConductorConsistency(specs_);
}

void Converter::read_in(const Board& board) {
    find_pads(board);
    assign_conductors();
    find_vias();
    find_blocks(board);
    remove_unconnected_pads();
    prune_blocks();
}

void Converter::find_pads(const Board& board) {
    ScopedProgress progress("Finding pads...", options_.quiet);
    const auto consider = [&](const BoardPad& item) {
        if (item.type == "np_thru_hole" || item.type == "connect") {
            return;
        }
        const bool onLayer = std::any_of(options_.layers.begin(), options_.layers.end(),
                                         [&](const std::string& layer) { return item.has_layer(layer); });
        if (!onLayer) {
            return;
        }
        Pad pad(item);
        if (options_.bounds) {
            const Box& bounds = *options_.bounds;
            const Point2& c = pad.center();
            if (!(c.x() > bounds.min_corner().x() && c.x() < bounds.max_corner().x() &&
                  c.y() > bounds.min_corner().y() && c.y() < bounds.max_corner().y())) {
                return;
            }
        }
        pads_.push_back(std::move(pad));
    };
    for (const BoardComponent& component : board.components) {
        for (const BoardPad& item : component.pads) {
            consider(item);
        }
    }
    for (const BoardPad& item : board.vias) {
        consider(item);
    }
}

void Converter::assign_conductors() {
    ScopedProgress progress("Assigning conductors...", options_.quiet);
    for (Pad& pad : pads_) {
        for (const ConductorSpec& spec : specs_) {
            if (!spec.matches(pad.item(), pad.center())) {
                continue;
            }
            pad.set_conductor(spec.conductor);
            if (spec.smdPadRatio) {
                pad.set_smd_pad_ratio(*spec.smdPadRatio);
            }
        }
    }
}

void Converter::find_vias() {
    ScopedProgress progress("Finding vias...", options_.quiet);
    std::vector<Pad> remaining;
    for (Pad& pad : pads_) {
        if (pad.conductor() == nullptr && pad.is_through_hole()) {
            vias_.emplace_back(pad.item());
        } else {
            remaining.push_back(std::move(pad));
        }
    }
    pads_ = std::move(remaining);
}

void Converter::find_blocks(const Board& board) {
    ScopedProgress progress("Finding blocks...", options_.quiet);
    for (const std::string& layer : options_.layers) {
        std::vector<MultiPolygon> parts;
        for (const BoardZone& zone : board.zones) {
            for (const BoardZoneFill& fill : zone.fills) {
                if (fill.layer != layer || fill.points.size() < 3) {
                    continue;
                }
                Ring ring(fill.points.begin(), fill.points.end());
                ring.push_back(fill.points.front());
                parts.push_back(bufferRound(ringPolygon(ring), zone.minThickness / 2.0));
            }
        }
        for (const BoardTrace& trace : board.traces) {
            if (trace.layer == layer) {
                parts.push_back(traceOutline(trace.start, trace.end, trace.width));
            }
        }

        MultiPolygon copper = unionAll(std::move(parts));
        if (options_.bounds) {
            Polygon clip;
            bg::convert(*options_.bounds, clip);
            MultiPolygon clipped;
            bg::intersection(copper, clip, clipped);
            copper = std::move(clipped);
        }

        // Pads and vias are added after clipping so they are never cut.
        std::vector<MultiPolygon> withPads;
        withPads.push_back(std::move(copper));
        for (const Pad& pad : pads_) {
            if (pad.item().has_layer(layer)) {
                withPads.push_back(single(pad.copper_polygon()));
            }
        }
        for (const Via& via : vias_) {
            if (via.item().has_layer(layer)) {
                withPads.push_back(single(via.copper_polygon()));
            }
        }

        for (const Polygon& polygon : unionAll(std::move(withPads))) {
            Block block;
            block.polygon = simplified(polygon, kBlockSimplifyTolerance);
            block.layer = layer;
            blocks_.push_back(std::move(block));
        }
    }
}

void Converter::remove_unconnected_pads() {
    ScopedProgress progress("Removing unconnected pads...", options_.quiet);
    pads_.erase(std::remove_if(pads_.begin(), pads_.end(), [](const Pad& pad) { return pad.conductor() == nullptr; }),
                pads_.end());
}

void Converter::prune_blocks() {
    ScopedProgress progress("Pruning blocks...", options_.quiet);

    std::vector<std::vector<std::size_t>> viaBlocks(vias_.size());
    std::vector<bool> active(blocks_.size(), false);
    std::vector<std::size_t> pending;

    for (std::size_t b = 0; b < blocks_.size(); ++b) {
        Block& block = blocks_[b];
        block.pads.clear();
        block.vias.clear();
        for (std::size_t p = 0; p < pads_.size(); ++p) {
            if (pads_[p].item().has_layer(block.layer) && bg::within(pads_[p].center(), block.polygon)) {
                block.pads.push_back(p);
                if (!active[b]) {
                    active[b] = true;
                    pending.push_back(b);
                }
            }
        }
        for (std::size_t v = 0; v < vias_.size(); ++v) {
            if (vias_[v].item().has_layer(block.layer) && bg::within(vias_[v].center(), block.polygon)) {
                block.vias.push_back(v);
                viaBlocks[v].push_back(b);
            }
        }
    }

    while (!pending.empty()) {
        const std::size_t b = pending.back();
        pending.pop_back();
        for (const std::size_t v : blocks_[b].vias) {
            for (const std::size_t other : viaBlocks[v]) {
                if (!active[other]) {
                    active[other] = true;
                    pending.push_back(other);
                }
            }
        }
    }

    std::vector<bool> viaActive(vias_.size(), false);
    for (std::size_t b = 0; b < blocks_.size(); ++b) {
        if (active[b]) {
            for (const std::size_t v : blocks_[b].vias) {
                viaActive[v] = true;
            }
        }
    }

    std::vector<std::size_t> viaRemap(vias_.size(), 0);
    std::vector<Via> keptVias;
    for (std::size_t v = 0; v < vias_.size(); ++v) {
        if (viaActive[v]) {
            viaRemap[v] = keptVias.size();
            keptVias.push_back(std::move(vias_[v]));
        }
    }
    vias_ = std::move(keptVias);

    std::vector<Block> keptBlocks;
    for (std::size_t b = 0; b < blocks_.size(); ++b) {
        if (!active[b]) {
            continue;
        }
        Block block = std::move(blocks_[b]);
        for (std::size_t& v : block.vias) {
            v = viaRemap[v];
        }
        keptBlocks.push_back(std::move(block));
    }
    blocks_ = std::move(keptBlocks);
}

LayerBounds Converter::layerBounds(const std::string& layer) const {
    std::vector<Polygon> polygons;
    for (const Block& block : blocks_) {
        if (block.layer == layer) {
            polygons.push_back(block.polygon);
        }
    }
    return LayerBounds::fromBox(envelopeOf(polygons));
}

void Converter::write_out(Layout& layout, MeshDocument& mesh) const {
    ScopedProgress progress("Writing FEC output...", options_.quiet);
    if (layout.layers() != options_.layers) {
        throw ConfigurationError("Layout layers do not match the converter layers");
    }

    const LayerBounds top = layerBounds(options_.layers.front());
    const LayerBounds bottom = options_.layers.size() > 1 ? layerBounds(options_.layers[1]) : LayerBounds{};
    layout.set_bounds(top, bottom);

    const std::size_t copperProperty = mesh.add_block_property(layout.config().copperProperty);
    const std::size_t viaProperty = mesh.add_block_property(layout.config().viaProperty);

    for (const Pad& pad : pads_) {
        writePad(mesh, layout, pad);
    }

    // Via index follows board position: by y, then x.
    std::vector<std::size_t> viaOrder(vias_.size());
    std::iota(viaOrder.begin(), viaOrder.end(), std::size_t{0});
    std::stable_sort(viaOrder.begin(), viaOrder.end(), [&](std::size_t lhs, std::size_t rhs) {
        const Point2& a = vias_[lhs].center();
        const Point2& b = vias_[rhs].center();
        return std::make_tuple(a.y(), a.x()) < std::make_tuple(b.y(), b.x());
    });
    std::size_t index = 0;
    for (const std::size_t v : viaOrder) {
        writeVia(mesh, layout, vias_[v], index++, viaProperty);
    }

    for (const Block& block : blocks_) {
        std::vector<Polygon> conductors;
        for (const std::size_t p : block.pads) {
            conductors.push_back(pads_[p].conductor_polygon());
        }
        for (const std::size_t v : block.vias) {
            conductors.push_back(vias_[v].conductor_polygon());
        }
        writeBlock(mesh, layout, block, conductors, copperProperty);
    }
}

std::vector<VtkOutlineLoop> Converter::preview_outlines() const {
    std::vector<VtkOutlineLoop> loops;
    const std::string& topLayer = options_.layers.front();
    for (std::size_t b = 0; b < blocks_.size(); ++b) {
        const Block& block = blocks_[b];
        const auto kind = block.layer == topLayer ? VtkOutlineLoop::Kind::BlockTop : VtkOutlineLoop::Kind::BlockBottom;
        loops.push_back(outlineLoop(block.polygon, kind, "block_" + std::to_string(b), block.layer));
        for (const Ring& inner : block.polygon.inners()) {
            loops.push_back(outlineLoop(ringPolygon(inner), kind, "block_" + std::to_string(b) + "_hole", block.layer));
        }
    }
    for (std::size_t v = 0; v < vias_.size(); ++v) {
        loops.push_back(
            outlineLoop(vias_[v].conductor_polygon(), VtkOutlineLoop::Kind::Via, "via_" + std::to_string(v), ""));
    }
    for (const Pad& pad : pads_) {
        const std::string label = pad.item().componentReference + ":" + pad.item().number;
        const std::string conductor = pad.conductor() != nullptr ? pad.conductor()->name : std::string{};
        loops.push_back(outlineLoop(pad.conductor_polygon(), VtkOutlineLoop::Kind::Pad,
                                    conductor.empty() ? label : label + " (" + conductor + ")", ""));
    }
    return loops;
}

std::vector<OutlineSegment> ringSegments(const std::vector<Point2>& ring) {
    std::vector<OutlineSegment> segments;
    const std::size_t n = ring.size();
    if (n < 2) {
        return segments;
    }
    segments.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        const Point2& p1 = ring[(i + n - 1) % n];
        const Point2& p2 = ring[i];
        const Point2& p3 = ring[(i + 1) % n];
        const Point2& p4 = ring[(i + 2) % n];
        segments.push_back({p2, p3, calcMeshSize(p1, p2, p3, p4)});
    }
    return segments;
}

std::vector<Point2> placeRing(const std::vector<Point2>& ring, const Layout& layout, const std::string& layer) {
    const Affine2D transform = layout.layer_transform(layer);
    std::vector<Point2> placed;
    placed.reserve(ring.size());
    for (const Point2& p : ring) {
        placed.push_back(transform.apply(p));
    }
    return placed;
}

UnrolledVia unrollRing(const std::vector<Point2>& ring, double boardThickness) {
    if (ring.size() < 3) {
        throw GeometryDegenerate("Cannot unroll a via outline with fewer than three points");
    }
    UnrolledVia out;
    double length = 0.0;
    out.top.emplace_back(0.0, 0.0);
    for (std::size_t i = 0; i < ring.size(); ++i) {
        length += distance(ring[i], ring[(i + 1) % ring.size()]);
        // Negative so the per-segment periodic boundaries run the same way as the rolled outline.
        out.top.emplace_back(-length, 0.0);
    }
    if (!(length > 0.0)) {
        throw GeometryDegenerate("Cannot unroll a via outline with zero perimeter");
    }
    for (const Point2& p : out.top) {
        out.bottom.emplace_back(p.x(), p.y() - boardThickness);
    }
    return out;
}

void writePad(MeshDocument& mesh, const Layout& layout, const Pad& pad) {
    std::optional<std::size_t> conductor;
    if (pad.conductor() != nullptr) {
        conductor = mesh.add_conductor(*pad.conductor());
    }
    const std::vector<Point2> ring = openRing(pad.conductor_polygon().outer());
    for (const std::string& layer : layout.layers()) {
        if (!pad.item().has_layer(layer)) {
            continue;
        }
        for (const OutlineSegment& segment : ringSegments(placeRing(ring, layout, layer))) {
            addOutlineSegment(mesh, segment, conductor, std::nullopt);
        }
        const Point2 hole = layout.place(pad.hole_center(), layer);
        mesh.add_hole(hole.x(), hole.y());
    }
}

void writeVia(MeshDocument& mesh, Layout& layout, const Via& via, std::size_t index, std::size_t viaProperty) {
    const std::vector<Point2> ring = openRing(via.conductor_polygon().outer());

    std::vector<std::string> viaLayers;
    std::vector<std::vector<OutlineSegment>> rolled;
    for (const std::string& layer : layout.layers()) {
        if (!via.item().has_layer(layer)) {
            continue;
        }
        viaLayers.push_back(layer);
        rolled.push_back(ringSegments(placeRing(ring, layout, layer)));
        const Point2 hole = layout.place(via.center(), layer);
        mesh.add_hole(hole.x(), hole.y());
    }

    if (!layout.spans_both_layers(viaLayers)) {
        for (const auto& segments : rolled) {
            for (const OutlineSegment& segment : segments) {
                addOutlineSegment(mesh, segment, std::nullopt, std::nullopt);
            }
        }
        return;
    }

    UnrolledVia strip = unrollRing(ring, layout.config().boardThickness);
    Box extent;
    bg::assign_inverse(extent);
    for (const Point2& p : strip.top) {
        bg::expand(extent, p);
    }
    for (const Point2& p : strip.bottom) {
        bg::expand(extent, p);
    }
    const Affine2D shift = layout.place_via(extent);
    for (Point2& p : strip.top) {
        p = shift.apply(p);
    }
    for (Point2& p : strip.bottom) {
        p = shift.apply(p);
    }

    const std::size_t n = rolled.front().size();
    const std::string prefix = "via_" + std::to_string(index);

    const double labelX = (strip.top.front().x() + strip.top.back().x()) / 2.0;
    const double labelY = (strip.top.front().y() + strip.bottom.front().y()) / 2.0;
    mesh.add_block_label(labelX, labelY, viaProperty);

    const std::size_t vertical = mesh.add_boundary(prefix + "_vert");
    addOutlineSegment(mesh, {strip.top.front(), strip.bottom.front(), -1.0}, std::nullopt, vertical);
    addOutlineSegment(mesh, {strip.top.back(), strip.bottom.back(), -1.0}, std::nullopt, vertical);

    for (std::size_t i = 0; i < n; ++i) {
        const OutlineSegment& rolledTop = rolled[0][i];
        const OutlineSegment& rolledBottom = rolled[1][i];
        const std::size_t topBoundary = mesh.add_boundary(prefix + "_s" + std::to_string(i) + "_t");
        const std::size_t bottomBoundary = mesh.add_boundary(prefix + "_s" + std::to_string(i) + "_b");

        addOutlineSegment(mesh, rolledTop, std::nullopt, topBoundary);
        addOutlineSegment(mesh, {strip.top[i], strip.top[i + 1], rolledTop.meshSize}, std::nullopt, topBoundary);
        addOutlineSegment(mesh, rolledBottom, std::nullopt, bottomBoundary);
        addOutlineSegment(mesh, {strip.bottom[i], strip.bottom[i + 1], rolledTop.meshSize}, std::nullopt,
                          bottomBoundary);
    }
}

void writeBlock(MeshDocument& mesh,
                const Layout& layout,
                const Block& block,
                const std::vector<Polygon>& conductorOutlines,
                std::size_t copperProperty) {
    const Affine2D transform = layout.layer_transform(block.layer);

    std::vector<const Ring*> rings;
    rings.push_back(&block.polygon.outer());
    for (const Ring& inner : block.polygon.inners()) {
        rings.push_back(&inner);
    }
    for (const Ring* ring : rings) {
        for (const OutlineSegment& segment : ringSegments(placeRing(openRing(*ring), layout, block.layer))) {
            addOutlineSegment(mesh, segment, std::nullopt, std::nullopt);
        }
    }

    for (const Ring& inner : block.polygon.inners()) {
        const Point2 hole = transform.apply(representativePoint(ringPolygon(inner)));
        mesh.add_hole(hole.x(), hole.y());
    }

    // The label must land on meshed copper, not inside a pad or via conductor.
    std::vector<MultiPolygon> conductorParts;
    for (const Polygon& outline : conductorOutlines) {
        conductorParts.push_back(single(outline));
    }
    const MultiPolygon conductors = unionAll(std::move(conductorParts));
    MultiPolygon remaining;
    bg::difference(block.polygon, conductors, remaining);
    const Point2 label = transform.apply(representativePoint(largestPolygon(remaining)));
    mesh.add_block_label(label.x(), label.y(), copperProperty);
}

}  // namespace pcbfem
