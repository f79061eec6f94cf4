// filename: board.hpp
// part of PCB to FEMM Mesh Converter
// MIT License

#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "pcbfem/geometry.hpp"

namespace pcbfem {

/**
 * @brief One parenthesised item of a KiCad S-expression file.
 *
 * Bare and quoted string parameters land in `atoms` in file order; nested
 * items land in `children`.
 */
struct SExpr {
    std::string keyword;
    std::vector<std::string> atoms;
    std::vector<SExpr> children;

    // First child with the given keyword, or nullptr.
    [[nodiscard]] const SExpr* child(const std::string& name) const;
    [[nodiscard]] std::vector<const SExpr*> children_named(const std::string& name) const;

    // First child with the given keyword; throws InputFormatError naming `context` when missing.
    [[nodiscard]] const SExpr& require(const std::string& name, const std::string& context) const;

    [[nodiscard]] const std::string& atom(std::size_t index, const std::string& context) const;
    [[nodiscard]] double number(std::size_t index, const std::string& context) const;
};

/**
 * @brief Parse KiCad S-expression text into its root item.
 *
 * Text before the first '(' and after the root's closing ')' is ignored.
 * Quoted strings accept both doubled ("") and backslash-escaped quotes.
 *
 * @throws InputFormatError on a missing root, an empty keyword, or
 *         unbalanced parentheses.
 */
SExpr parseSExpression(const std::string& text);

struct BoardDrill {
    enum class Shape { Circle, Oval };

    Shape shape{Shape::Circle};
    double sizeX{0.0};
    double sizeY{0.0};
    std::optional<Point2> offset;
};

/**
 * @brief A footprint pad or a via, resolved to plain values.
 *
 * Vias are normalised to a through-hole circle of diameter `sizeX` so both
 * item kinds share one geometry path.
 */
struct BoardPad {
    enum class Source { Pad, Via };

    Source source{Source::Pad};
    std::string number;
    std::string type;   // smd, thru_hole, np_thru_hole, connect
    std::string shape;  // circle, oval, rect, trapezoid, roundrect
    Point2 at{0.0, 0.0};
    double rotation{0.0};  // degrees, clockwise on the board
    double sizeX{0.0};
    double sizeY{0.0};
    Point2 rectDelta{0.0, 0.0};
    double roundRectRatio{0.0};
    std::optional<BoardDrill> drill;
    std::vector<std::string> layers;
    std::string netName;

    // Owning footprint, empty for vias.
    std::string componentReference;
    Point2 componentAt{0.0, 0.0};
    double componentRotation{0.0};

    [[nodiscard]] bool is_via() const { return source == Source::Via; }

    /**
     * @brief Layer membership with KiCad wildcards: "*.Cu" matches every
     *        copper layer and "F&B.Cu" matches F.Cu and B.Cu.
     */
    [[nodiscard]] bool has_layer(const std::string& layer) const;
};

struct BoardComponent {
    std::string reference;
    Point2 at{0.0, 0.0};
    double rotation{0.0};
    std::vector<BoardPad> pads;
};

struct BoardTrace {
    Point2 start{0.0, 0.0};
    Point2 end{0.0, 0.0};
    double width{0.0};
    std::string layer;
    std::string netName;
};

struct BoardZoneFill {
    std::string layer;
    std::vector<Point2> points;
};

struct BoardZone {
    std::string netName;
    double minThickness{0.0};
    std::vector<BoardZoneFill> fills;
};

struct Board {
    std::map<std::string, std::string> nets;  // net id -> net name
    std::vector<BoardComponent> components;
    std::vector<BoardPad> vias;
    std::vector<BoardTrace> traces;
    std::vector<BoardZone> zones;
};

/**
 * @brief Resolve a parsed `kicad_pcb` tree into typed board items.
 *
 * Accepts the legacy `module` / `fp_text reference` form and the newer
 * `footprint` / `property "Reference"` form.
 *
 * @throws InputFormatError when the root is not `kicad_pcb` or a required
 *         child item is missing or malformed.
 * @throws ConfigurationError on an unknown drill shape.
 */
Board boardFromSExpr(const SExpr& root);

Board loadBoardFromKicad(const std::string& path);

}  // namespace pcbfem
