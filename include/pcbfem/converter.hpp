// filename: converter.hpp
// part of PCB to FEMM Mesh Converter
// MIT License

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "pcbfem/board.hpp"
#include "pcbfem/conductor_spec.hpp"
#include "pcbfem/geometry.hpp"
#include "pcbfem/io_vtk.hpp"
#include "pcbfem/layout.hpp"
#include "pcbfem/mesh.hpp"

namespace pcbfem {

constexpr double kDefaultSmdPadRatio = 0.5;

/**
 * @brief Geometry shared by driven pads and vias.
 *
 * Copper and conductor outlines are built on first use and cached. The
 * conductor outline of an SMD pad is its copper shrunk to `smd_pad_ratio()`
 * of the copper area; a through-hole pad uses its drill outline.
 */
class PadBase {
public:
    explicit PadBase(BoardPad item);

    [[nodiscard]] const BoardPad& item() const { return item_; }
    [[nodiscard]] const Point2& center() const { return center_; }
    [[nodiscard]] Point2 hole_center() const;

    [[nodiscard]] bool is_smd() const { return item_.type == "smd"; }
    [[nodiscard]] bool is_through_hole() const { return item_.type == "thru_hole"; }

    [[nodiscard]] double smd_pad_ratio() const { return smdPadRatio_; }
    void set_smd_pad_ratio(double ratio);

    [[nodiscard]] const Polygon& copper_polygon() const;
    [[nodiscard]] const Polygon& conductor_polygon() const;

private:
    BoardPad item_;
    Point2 center_;
    double smdPadRatio_{kDefaultSmdPadRatio};
    mutable std::optional<Polygon> copper_;
    mutable std::optional<Polygon> conductor_;
};

class Pad : public PadBase {
public:
    using PadBase::PadBase;

    [[nodiscard]] const Conductor* conductor() const { return conductor_; }

    // A pad takes at most one conductor; a second assignment throws ConfigurationError.
    void set_conductor(const Conductor& conductor);

private:
    const Conductor* conductor_{nullptr};
};

class Via : public PadBase {
public:
    using PadBase::PadBase;
};

/**
 * @brief A connected copper region on one layer, with the pads and vias whose
 *        centre lies inside it (indices into the converter's lists).
 */
struct Block {
    Polygon polygon;
    std::string layer;
    std::vector<std::size_t> pads;
    std::vector<std::size_t> vias;
};

struct ConverterOptions {
    std::vector<std::string> layers{"F.Cu", "B.Cu"};
    std::optional<Box> bounds;
    bool quiet{false};
};

/**
 * @brief Board-to-mesh pipeline.
 *
 * read_in() runs find_pads, assign_conductors, find_vias, find_blocks,
 * remove_unconnected_pads and prune_blocks in that order. write_out() then
 * fixes the layout bounds from the surviving blocks and emits every pad, via
 * and block into the mesh document.
 */
class Converter {
public:
    Converter(std::vector<ConductorSpec> specs, ConverterOptions options);

    // Pads point at conductors owned by `specs_`.
    Converter(const Converter&) = delete;
    Converter& operator=(const Converter&) = delete;

    void read_in(const Board& board);

    void find_pads(const Board& board);
    void assign_conductors();
    void find_vias();
    void find_blocks(const Board& board);
    void remove_unconnected_pads();
    void prune_blocks();

    void write_out(Layout& layout, MeshDocument& mesh) const;

    [[nodiscard]] std::vector<VtkOutlineLoop> preview_outlines() const;

    [[nodiscard]] const std::vector<Pad>& pads() const { return pads_; }
    [[nodiscard]] const std::vector<Via>& vias() const { return vias_; }
    [[nodiscard]] const std::vector<Block>& blocks() const { return blocks_; }
    [[nodiscard]] const ConverterOptions& options() const { return options_; }

private:
    [[nodiscard]] LayerBounds layerBounds(const std::string& layer) const;

    std::vector<ConductorSpec> specs_;
    ConverterOptions options_;
    std::vector<Pad> pads_;
    std::vector<Via> vias_;
    std::vector<Block> blocks_;
};

struct OutlineSegment {
    Point2 start{0.0, 0.0};
    Point2 end{0.0, 0.0};
    double meshSize{-1.0};
};

// Closed-loop segments of an open ring, each with its calcMeshSize() hint.
std::vector<OutlineSegment> ringSegments(const std::vector<Point2>& ring);

// Point-by-point placement; vertex order is kept so rolled segment i matches across layers.
std::vector<Point2> placeRing(const std::vector<Point2>& ring, const Layout& layout, const std::string& layer);

struct UnrolledVia {
    std::vector<Point2> top;     // N + 1 points at (-arc length, 0)
    std::vector<Point2> bottom;  // `top` shifted down by the board thickness
};

/**
 * @brief Flatten a via barrel: the open ring of N points becomes a strip whose
 *        top edge has one segment per ring segment, in ring order.
 */
UnrolledVia unrollRing(const std::vector<Point2>& ring, double boardThickness);

void writePad(MeshDocument& mesh, const Layout& layout, const Pad& pad);

/**
 * @brief Emit a via's rolled outline on each of its layers and, when it spans
 *        both layout layers, its unrolled strip with the periodic boundaries
 *        via_<index>_vert, via_<index>_s<i>_t and via_<index>_s<i>_b.
 */
void writeVia(MeshDocument& mesh, Layout& layout, const Via& via, std::size_t index, std::size_t viaProperty);

void writeBlock(MeshDocument& mesh,
                const Layout& layout,
                const Block& block,
                const std::vector<Polygon>& conductorOutlines,
                std::size_t copperProperty);

}  // namespace pcbfem
