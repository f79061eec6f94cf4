// filename: mesh.cpp
// part of PCB to FEMM Mesh Converter
// MIT License

#include "pcbfem/mesh.hpp"

#include "pcbfem/errors.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <stdexcept>
#include <unordered_map>
#include <utility>
#include <vector>

namespace pcbfem {
namespace {

// Cell size of the spatial hash used to find split points. Must be at least
// twice kSmallDistance so every point near a segment shows up in the cells
// the segment is rasterised into.
constexpr double kOverlapGridSize = 0.1;
static_assert(kOverlapGridSize > 2.0 * kSmallDistance, "overlap grid too fine for the merge distance");

constexpr std::array<std::pair<double, double>, 3> kMergeGridOffsets{{{0.0, 0.5}, {0.5, 0.5}, {0.5, 0.0}}};

using Cell = std::pair<long long, long long>;

struct CellHash {
    std::size_t operator()(const Cell& cell) const noexcept {
        const auto h1 = std::hash<long long>{}(cell.first);
        const auto h2 = std::hash<long long>{}(cell.second);
        return h1 ^ (h2 + 0x9e3779b97f4a7c15ULL + (h1 << 6) + (h1 >> 2));
    }
};

// Cells painted by Bresenham's algorithm along p0-p1 on a grid of `gridSize`.
// No point of the segment is more than half a cell from a painted cell.
std::vector<Cell> rasterCells(const MeshPoint& p0, const MeshPoint& p1, double gridSize) {
    double x0 = p0.x / gridSize;
    double y0 = p0.y / gridSize;
    double x1 = p1.x / gridSize;
    double y1 = p1.y / gridSize;

    const bool steep = !(std::abs(x1 - x0) > std::abs(y1 - y0));
    if (steep) {
        std::swap(x0, y0);
        std::swap(x1, y1);
    }

    long long xSign = 1;
    if (x1 < x0) {
        xSign = -1;
        x0 = -x0 + 1.0;
        x1 = -x1 + 1.0;
    }
    long long ySign = 1;
    if (y1 < y0) {
        ySign = -1;
        y0 = -y0 + 1.0;
        y1 = -y1 + 1.0;
    }

    const double dError = (x1 - x0) != 0.0 ? (y1 - y0) / (x1 - x0) : 0.0;
    const double yStart = dError * (std::floor(x0) + 0.5 - x0) + y0;
    long long y = static_cast<long long>(std::floor(yStart));
    double error = yStart - std::floor(yStart);

    const long long xBegin = static_cast<long long>(std::floor(x0));
    long long xEnd = static_cast<long long>(std::ceil(x1));
    if (xEnd <= xBegin) {
        xEnd = xBegin + 1;
    }

    std::vector<Cell> cells;
    cells.reserve(static_cast<std::size_t>(xEnd - xBegin));
    for (long long x = xBegin; x < xEnd; ++x) {
        if (steep) {
            cells.emplace_back(y * ySign, x * xSign);
        } else {
            cells.emplace_back(x * xSign, y * ySign);
        }
        error += dError;
        if (error >= 1.0) {
            ++y;
            error -= 1.0;
        }
    }
    return cells;
}

// True when `p` projects strictly inside a-b and lies within kSmallDistance of it.
bool splitsSegment(const MeshPoint& a, const MeshPoint& b, const MeshPoint& p) {
    const double dx = b.x - a.x;
    const double dy = b.y - a.y;
    const double lengthSq = dx * dx + dy * dy;
    if (lengthSq == 0.0) {
        return false;
    }
    const double t = ((p.x - a.x) * dx + (p.y - a.y) * dy) / lengthSq;
    if (t <= 0.0 || t >= 1.0) {
        return false;
    }
    const double fx = a.x + t * dx;
    const double fy = a.y + t * dy;
    return std::hypot(p.x - fx, p.y - fy) < kSmallDistance;
}

}  // namespace

MeshDocument::GridKey MeshDocument::quantize(double x, double y) const {
    return {std::llround(x / kSmallDistance + gridOffsetX_), std::llround(y / kSmallDistance + gridOffsetY_)};
}

void MeshDocument::requireEmitting(const char* what) const {
    if (stage_ != Stage::Emitting) {
        throw std::logic_error(std::string("MeshDocument: cannot add ") + what + " after post-processing started");
    }
}

std::size_t MeshDocument::add_point(double x, double y) {
    requireEmitting("points");
    const GridKey key = quantize(x, y);
    const auto it = pointIndex_.find(key);
    if (it != pointIndex_.end()) {
        return it->second;
    }
    points_.push_back({x, y});
    pointIndex_.emplace(key, points_.size() - 1);
    return points_.size() - 1;
}

std::size_t MeshDocument::add_conductor(const Conductor& conductor) {
    requireEmitting("conductors");
    const auto it = conductorIndex_.find(conductor.name);
    if (it != conductorIndex_.end()) {
        const Conductor& existing = conductors_[it->second];
        if (existing.kind != conductor.kind) {
            throw ConfigurationError("Conductor <" + conductor.name + "> is already defined with a different type");
        }
        if (existing.value != conductor.value) {
            throw ConfigurationError("Conductor <" + conductor.name + "> is already defined with a different value");
        }
        return it->second;
    }
    conductors_.push_back(conductor);
    conductorIndex_.emplace(conductor.name, conductors_.size() - 1);
    return conductors_.size() - 1;
}

std::size_t MeshDocument::add_boundary(const std::string& name, BoundaryKind kind) {
    requireEmitting("boundaries");
    const auto it = boundaryIndex_.find(name);
    if (it != boundaryIndex_.end()) {
        if (boundaries_[it->second].kind != kind) {
            throw ConfigurationError("Boundary <" + name + "> is already defined with a different type");
        }
        return it->second;
    }
    boundaries_.push_back({name, kind});
    boundaryIndex_.emplace(name, boundaries_.size() - 1);
    return boundaries_.size() - 1;
}

std::size_t MeshDocument::add_block_property(const BlockProperty& property) {
    requireEmitting("block properties");
    const auto it = blockPropertyIndex_.find(property.name);
    if (it != blockPropertyIndex_.end()) {
        if (blockProperties_[it->second].conductivity != property.conductivity) {
            throw ConfigurationError("Block property <" + property.name +
                                     "> is already defined with a different conductivity");
        }
        return it->second;
    }
    blockProperties_.push_back(property);
    blockPropertyIndex_.emplace(property.name, blockProperties_.size() - 1);
    return blockProperties_.size() - 1;
}

void MeshDocument::add_segment(const MeshSegment& segment) {
    requireEmitting("segments");
    if (segment.start >= points_.size() || segment.end >= points_.size()) {
        throw std::out_of_range("MeshDocument::add_segment point index out of range");
    }
    if (segment.conductor && *segment.conductor >= conductors_.size()) {
        throw std::out_of_range("MeshDocument::add_segment conductor index out of range");
    }
    if (segment.boundary && *segment.boundary >= boundaries_.size()) {
        throw std::out_of_range("MeshDocument::add_segment boundary index out of range");
    }
    insertSegment(segment);
}

void MeshDocument::add_hole(double x, double y) {
    requireEmitting("holes");
    const auto key = std::make_pair(x, y);
    if (holeIndex_.count(key) != 0U) {
        return;
    }
    holes_.push_back({x, y});
    holeIndex_.emplace(key, holes_.size() - 1);
}

void MeshDocument::add_block_label(double x, double y, std::size_t property) {
    requireEmitting("block labels");
    if (property >= blockProperties_.size()) {
        throw std::out_of_range("MeshDocument::add_block_label property index out of range");
    }
    const auto key = std::make_pair(x, y);
    const auto it = blockLabelIndex_.find(key);
    if (it != blockLabelIndex_.end()) {
        const MeshBlockLabel& existing = blockLabels_[it->second];
        if (existing.property != property) {
            throw ConfigurationError("Block <" + blockProperties_[existing.property].name + "> already placed at (" +
                                     std::to_string(x) + ", " + std::to_string(y) + "), can't create block <" +
                                     blockProperties_[property].name + ">");
        }
        return;
    }
    blockLabels_.push_back({x, y, property});
    blockLabelIndex_.emplace(key, blockLabels_.size() - 1);
}

void MeshDocument::assignConductor(MeshSegment& segment, std::size_t conductor) const {
    if (segment.conductor && *segment.conductor == conductor) {
        return;
    }
    if (segment.conductor) {
        throw ConfigurationError("Can't assign segment conductor <" + conductors_[conductor].name +
                                 ">, already has conductor <" + conductors_[*segment.conductor].name + ">");
    }
    if (segment.boundary) {
        throw ConfigurationError("Can't assign segment conductor <" + conductors_[conductor].name +
                                 ">, already has boundary <" + boundaries_[*segment.boundary].name + ">");
    }
    segment.conductor = conductor;
}

void MeshDocument::assignBoundary(MeshSegment& segment, std::size_t boundary) const {
    if (segment.boundary && *segment.boundary == boundary) {
        return;
    }
    if (segment.conductor) {
        throw ConfigurationError("Can't assign segment boundary <" + boundaries_[boundary].name +
                                 ">, already has conductor <" + conductors_[*segment.conductor].name + ">");
    }
    if (segment.boundary) {
        throw ConfigurationError("Can't assign segment boundary <" + boundaries_[boundary].name +
                                 ">, already has boundary <" + boundaries_[*segment.boundary].name + ">");
    }
    segment.boundary = boundary;
}

void MeshDocument::insertSegment(const MeshSegment& segment) {
    const SegmentKey key{segment.start, segment.end};
    const auto it = segmentIndex_.find(key);
    if (it == segmentIndex_.end()) {
        MeshSegment fresh{segment.start, segment.end, segment.meshSize, std::nullopt, std::nullopt};
        if (segment.conductor) {
            assignConductor(fresh, *segment.conductor);
        }
        if (segment.boundary) {
            assignBoundary(fresh, *segment.boundary);
        }
        segments_.push_back(fresh);
        segmentIndex_.emplace(key, segments_.size() - 1);
        return;
    }

    MeshSegment& existing = segments_[it->second];
    if (segment.conductor) {
        assignConductor(existing, *segment.conductor);
    }
    if (segment.boundary) {
        assignBoundary(existing, *segment.boundary);
    }
    existing.meshSize = std::min(existing.meshSize, segment.meshSize);
}

void MeshDocument::rebuildSegments(const std::vector<MeshSegment>& segments) {
    segments_.clear();
    segmentIndex_.clear();
    for (const MeshSegment& segment : segments) {
        insertSegment(segment);
    }
}

const MeshSegment* MeshDocument::find_segment(std::size_t start, std::size_t end) const {
    const auto it = segmentIndex_.find({start, end});
    return it == segmentIndex_.end() ? nullptr : &segments_[it->second];
}

std::optional<std::size_t> MeshDocument::find_boundary(const std::string& name) const {
    const auto it = boundaryIndex_.find(name);
    if (it == boundaryIndex_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<std::size_t> MeshDocument::find_conductor(const std::string& name) const {
    const auto it = conductorIndex_.find(name);
    if (it == conductorIndex_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void MeshDocument::merge_close_points() {
    if (stage_ != Stage::Emitting && stage_ != Stage::PointsMerged) {
        throw std::logic_error("MeshDocument: points can only be merged before overlap resolution");
    }

    for (const auto& [offsetX, offsetY] : kMergeGridOffsets) {
        const std::vector<MeshPoint> previous = std::move(points_);
        points_.clear();
        pointIndex_.clear();
        gridOffsetX_ = offsetX;
        gridOffsetY_ = offsetY;

        std::vector<std::size_t> remap(previous.size());
        for (std::size_t i = 0; i < previous.size(); ++i) {
            const GridKey key = quantize(previous[i].x, previous[i].y);
            const auto it = pointIndex_.find(key);
            if (it != pointIndex_.end()) {
                remap[i] = it->second;
                continue;
            }
            points_.push_back(previous[i]);
            pointIndex_.emplace(key, points_.size() - 1);
            remap[i] = points_.size() - 1;
        }

        std::vector<MeshSegment> updated = segments_;
        for (MeshSegment& segment : updated) {
            segment.start = remap[segment.start];
            segment.end = remap[segment.end];
        }
        rebuildSegments(updated);
    }

    stage_ = Stage::PointsMerged;
}

void MeshDocument::sweep() {
    std::vector<bool> pointUsed(points_.size(), false);
    std::vector<bool> conductorUsed(conductors_.size(), false);
    std::vector<bool> boundaryUsed(boundaries_.size(), false);
    for (const MeshSegment& segment : segments_) {
        pointUsed[segment.start] = true;
        pointUsed[segment.end] = true;
        if (segment.conductor) {
            conductorUsed[*segment.conductor] = true;
        }
        if (segment.boundary) {
            boundaryUsed[*segment.boundary] = true;
        }
    }

    std::vector<std::size_t> pointRemap(points_.size(), 0);
    std::vector<MeshPoint> keptPoints;
    pointIndex_.clear();
    for (std::size_t i = 0; i < points_.size(); ++i) {
        if (!pointUsed[i]) {
            continue;
        }
        pointRemap[i] = keptPoints.size();
        pointIndex_.emplace(quantize(points_[i].x, points_[i].y), keptPoints.size());
        keptPoints.push_back(points_[i]);
    }
    points_ = std::move(keptPoints);

    std::vector<std::size_t> conductorRemap(conductors_.size(), 0);
    std::vector<Conductor> keptConductors;
    conductorIndex_.clear();
    for (std::size_t i = 0; i < conductors_.size(); ++i) {
        if (!conductorUsed[i]) {
            continue;
        }
        conductorRemap[i] = keptConductors.size();
        conductorIndex_.emplace(conductors_[i].name, keptConductors.size());
        keptConductors.push_back(conductors_[i]);
    }
    conductors_ = std::move(keptConductors);

    std::vector<std::size_t> boundaryRemap(boundaries_.size(), 0);
    std::vector<Boundary> keptBoundaries;
    boundaryIndex_.clear();
    for (std::size_t i = 0; i < boundaries_.size(); ++i) {
        if (!boundaryUsed[i]) {
            continue;
        }
        boundaryRemap[i] = keptBoundaries.size();
        boundaryIndex_.emplace(boundaries_[i].name, keptBoundaries.size());
        keptBoundaries.push_back(boundaries_[i]);
    }
    boundaries_ = std::move(keptBoundaries);

    std::vector<MeshSegment> updated = segments_;
    for (MeshSegment& segment : updated) {
        segment.start = pointRemap[segment.start];
        segment.end = pointRemap[segment.end];
        if (segment.conductor) {
            segment.conductor = conductorRemap[*segment.conductor];
        }
        if (segment.boundary) {
            segment.boundary = boundaryRemap[*segment.boundary];
        }
    }
    rebuildSegments(updated);
}

void MeshDocument::resolve_overlapping_segments() {
    if (stage_ != Stage::PointsMerged) {
        throw std::logic_error("MeshDocument: merge close points before resolving overlapping segments");
    }

    // Register each point in its own cell and the eight surrounding cells.
    std::unordered_map<Cell, std::vector<std::size_t>, CellHash> pointMap;
    for (std::size_t i = 0; i < points_.size(); ++i) {
        const long long xBase = static_cast<long long>(std::floor(points_[i].x / kOverlapGridSize));
        const long long yBase = static_cast<long long>(std::floor(points_[i].y / kOverlapGridSize));
        for (long long x = xBase - 1; x <= xBase + 1; ++x) {
            for (long long y = yBase - 1; y <= yBase + 1; ++y) {
                pointMap[{x, y}].push_back(i);
            }
        }
    }

    std::vector<MeshSegment> pending = segments_;
    segments_.clear();
    segmentIndex_.clear();

    std::vector<std::size_t> candidates;
    while (!pending.empty()) {
        const MeshSegment segment = pending.back();
        pending.pop_back();

        const MeshPoint& a = points_[segment.start];
        const MeshPoint& b = points_[segment.end];

        candidates.clear();
        for (const Cell& cell : rasterCells(a, b, kOverlapGridSize)) {
            const auto it = pointMap.find(cell);
            if (it != pointMap.end()) {
                candidates.insert(candidates.end(), it->second.begin(), it->second.end());
            }
        }
        std::sort(candidates.begin(), candidates.end());
        candidates.erase(std::unique(candidates.begin(), candidates.end()), candidates.end());

        bool split = false;
        for (const std::size_t candidate : candidates) {
            if (candidate == segment.start || candidate == segment.end) {
                continue;
            }
            if (!splitsSegment(a, b, points_[candidate])) {
                continue;
            }
            MeshSegment first = segment;
            first.end = candidate;
            MeshSegment second = segment;
            second.start = candidate;
            pending.push_back(first);
            pending.push_back(second);
            split = true;
            break;
        }
        if (!split) {
            insertSegment(segment);
        }
    }

    stage_ = Stage::OverlapsResolved;
}

void MeshDocument::remove_zero_length_segments() {
    if (stage_ != Stage::OverlapsResolved) {
        throw std::logic_error("MeshDocument: resolve overlapping segments before removing zero-length segments");
    }
    std::vector<MeshSegment> kept;
    kept.reserve(segments_.size());
    for (const MeshSegment& segment : segments_) {
        if (segment.start != segment.end) {
            kept.push_back(segment);
        }
    }
    rebuildSegments(kept);
    stage_ = Stage::Finalized;
}

void MeshDocument::finalize() {
    merge_close_points();
    sweep();
    resolve_overlapping_segments();
    remove_zero_length_segments();
    sweep();
}

}  // namespace pcbfem
