// filename: mesh.hpp
// part of PCB to FEMM Mesh Converter
// MIT License

#pragma once

#include <complex>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "pcbfem/geometry.hpp"
#include "pcbfem/types.hpp"

namespace pcbfem {

enum class ConductorKind : int { Current = 0, Voltage = 1 };

struct Conductor {
    std::string name;
    ConductorKind kind{ConductorKind::Voltage};
    std::complex<double> value{0.0, 0.0};
};

enum class BoundaryKind : int { Periodic = 3 };

struct Boundary {
    std::string name;
    BoundaryKind kind{BoundaryKind::Periodic};
};

struct MeshPoint {
    double x{0.0};
    double y{0.0};
};

/**
 * @brief Directed segment between two interned points. A segment carries a
 *        conductor or a boundary, never both.
 */
struct MeshSegment {
    std::size_t start{0};
    std::size_t end{0};
    double meshSize{-1.0};
    std::optional<std::size_t> conductor;
    std::optional<std::size_t> boundary;
};

struct MeshHole {
    double x{0.0};
    double y{0.0};
};

struct MeshBlockLabel {
    double x{0.0};
    double y{0.0};
    std::size_t property{0};
};

/**
 * @brief Interning tables for every FEC mesh primitive.
 *
 * Each add_* call is a lookup-or-insert on the entity's identity key:
 *  - points: coordinate quantised to a kSmallDistance grid (first coordinate wins)
 *  - segments: ordered point pair; conductor/boundary merged (conflicts throw),
 *    minimum mesh size kept
 *  - conductors, boundaries, block properties: name; a redefinition with
 *    different attributes throws ConfigurationError
 *  - holes: exact coordinate; repeated holes are ignored
 *  - block labels: exact coordinate; a different block property throws
 *
 * Post-processing runs in a fixed order: merge_close_points(),
 * resolve_overlapping_segments(), remove_zero_length_segments(). finalize()
 * runs all of them with sweep() passes that drop points, conductors and
 * boundaries no longer referenced by any segment.
 */
class MeshDocument {
public:
    enum class Stage { Emitting, PointsMerged, OverlapsResolved, Finalized };

    MeshDocument() = default;

    std::size_t add_point(double x, double y);
    std::size_t add_point(const Point2& p) { return add_point(p.x(), p.y()); }
    std::size_t add_conductor(const Conductor& conductor);
    std::size_t add_boundary(const std::string& name, BoundaryKind kind = BoundaryKind::Periodic);
    std::size_t add_block_property(const BlockProperty& property);
    void add_segment(const MeshSegment& segment);
    void add_hole(double x, double y);
    void add_block_label(double x, double y, std::size_t property);

    /**
     * @brief Re-quantise every point under the three half-cell offset grids so
     *        near-coincident points that straddle a cell edge collapse together.
     */
    void merge_close_points();

    /**
     * @brief Split every segment that passes within kSmallDistance of another
     *        point, so T-junctions share endpoints.
     */
    void resolve_overlapping_segments();

    void remove_zero_length_segments();

    // Drop points, conductors and boundaries not referenced by a live segment.
    void sweep();

    void finalize();

    [[nodiscard]] Stage stage() const { return stage_; }
    [[nodiscard]] const std::vector<MeshPoint>& points() const { return points_; }
    [[nodiscard]] const std::vector<MeshSegment>& segments() const { return segments_; }
    [[nodiscard]] const std::vector<Conductor>& conductors() const { return conductors_; }
    [[nodiscard]] const std::vector<Boundary>& boundaries() const { return boundaries_; }
    [[nodiscard]] const std::vector<BlockProperty>& block_properties() const { return blockProperties_; }
    [[nodiscard]] const std::vector<MeshHole>& holes() const { return holes_; }
    [[nodiscard]] const std::vector<MeshBlockLabel>& block_labels() const { return blockLabels_; }

    [[nodiscard]] const MeshSegment* find_segment(std::size_t start, std::size_t end) const;
    [[nodiscard]] std::optional<std::size_t> find_boundary(const std::string& name) const;
    [[nodiscard]] std::optional<std::size_t> find_conductor(const std::string& name) const;

private:
    using GridKey = std::pair<long long, long long>;
    using SegmentKey = std::pair<std::size_t, std::size_t>;

    [[nodiscard]] GridKey quantize(double x, double y) const;
    void requireEmitting(const char* what) const;
    void insertSegment(const MeshSegment& segment);
    void assignConductor(MeshSegment& segment, std::size_t conductor) const;
    void assignBoundary(MeshSegment& segment, std::size_t boundary) const;
    void rebuildSegments(const std::vector<MeshSegment>& segments);

    Stage stage_{Stage::Emitting};

    std::vector<MeshPoint> points_;
    std::map<GridKey, std::size_t> pointIndex_;
    double gridOffsetX_{0.0};
    double gridOffsetY_{0.0};

    std::vector<MeshSegment> segments_;
    std::map<SegmentKey, std::size_t> segmentIndex_;

    std::vector<Conductor> conductors_;
    std::unordered_map<std::string, std::size_t> conductorIndex_;

    std::vector<Boundary> boundaries_;
    std::unordered_map<std::string, std::size_t> boundaryIndex_;

    std::vector<BlockProperty> blockProperties_;
    std::unordered_map<std::string, std::size_t> blockPropertyIndex_;

    std::vector<MeshHole> holes_;
    std::map<std::pair<double, double>, std::size_t> holeIndex_;

    std::vector<MeshBlockLabel> blockLabels_;
    std::map<std::pair<double, double>, std::size_t> blockLabelIndex_;
};

}  // namespace pcbfem
