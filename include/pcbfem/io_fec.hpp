// filename: io_fec.hpp
// part of PCB to FEMM Mesh Converter
// MIT License

#pragma once

#include <ostream>
#include <string>

#include "pcbfem/mesh.hpp"

namespace pcbfem {

struct FecHeader {
    double precision{1e-8};
    double frequency{0.0};  // Hz, 0 for DC
    double minAngle{25.0};
    double depth{0.035};  // copper thickness in mm
    std::string comment{"Auto generated by 'pcbfem'."};
};

// Fixed notation with up to 12 decimals and trailing zeros removed ("0.5", "-3", "12.25").
std::string formatNumber(double value);

// FEMM writes precision as "1.0e-08".
std::string formatPrecision(double value);

/**
 * @brief Serialise a finalized mesh document in FEMM .FEC layout.
 *
 * Boundaries, conductors and block properties are sorted by name and numbered
 * from 1 (0 means "none"); points are sorted by (x, y) and numbered from 0;
 * segments are sorted by their point indices, holes and block labels by
 * coordinate, so equal documents always produce byte-identical text.
 *
 * @throws std::logic_error when the document has not been finalized.
 */
void write_fec(std::ostream& os, const MeshDocument& mesh, const FecHeader& header);

// Renders the whole file in memory before opening `path`, so a failure never leaves partial output.
void write_fec(const std::string& path, const MeshDocument& mesh, const FecHeader& header);

}  // namespace pcbfem
