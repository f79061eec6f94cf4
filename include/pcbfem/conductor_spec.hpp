// filename: conductor_spec.hpp
// part of PCB to FEMM Mesh Converter
// MIT License

#pragma once

#include <complex>
#include <optional>
#include <string>
#include <vector>

#include "pcbfem/board.hpp"
#include "pcbfem/geometry.hpp"
#include "pcbfem/mesh.hpp"

namespace pcbfem {

struct RegionFilter {
    double minX{0.0};
    double minY{0.0};
    double maxX{0.0};
    double maxY{0.0};

    // Strictly inside; points on the edge do not match.
    [[nodiscard]] bool contains(const Point2& p) const {
        return p.x() > minX && p.x() < maxX && p.y() > minY && p.y() < maxY;
    }
};

struct ModuleFilter {
    std::string reference;
    std::vector<std::string> padNumbers;  // empty: every pad of the component
};

/**
 * @brief Rule assigning one conductor to the pads it matches.
 *
 * A net filter only narrows: a pad on another net never matches, and a pad on
 * the right net still has to fall inside a region or belong to a listed
 * component pad.
 */
struct ConductorSpec {
    Conductor conductor;
    std::string netName;
    std::optional<double> smdPadRatio;
    std::vector<RegionFilter> regions;
    std::vector<ModuleFilter> modules;

    [[nodiscard]] bool matches(const BoardPad& pad, const Point2& center) const;
};

struct ConductorValue {
    ConductorKind kind{ConductorKind::Voltage};
    std::complex<double> value{0.0, 0.0};
};

/**
 * @brief Parse "<number><unit>" where unit is V/v (voltage) or A/a/I/i
 *        (current). The number may be complex, written "re+imj" or "imj".
 * @throws ConfigurationError on an unknown unit or malformed number.
 */
ConductorValue parseConductorValue(const std::string& text);

std::vector<ConductorSpec> parseConductorSpecsFromString(const std::string& text);

std::vector<ConductorSpec> loadConductorSpecsFromJson(const std::string& path);

// Two specs naming the same conductor must agree on kind and value.
void checkConductorConsistency(const std::vector<ConductorSpec>& specs);

}  // namespace pcbfem
