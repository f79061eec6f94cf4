// filename: io_vtk.cpp
// part of PCB to FEMM Mesh Converter
// MIT License

#include "pcbfem/io_vtk.hpp"

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <stdexcept>

namespace pcbfem {
namespace {

std::string csvField(const std::string& text) {
    if (text.find_first_of(",\"\n") == std::string::npos) {
        return text;
    }
    std::string quoted = "\"";
    for (const char c : text) {
        if (c == '"') {
            quoted += '"';
        }
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

}  // namespace

std::string outline_labels_path(const std::string& path) {
    std::filesystem::path base(path);
    return (base.parent_path() / (base.stem().string() + "_labels.csv")).string();
}

void write_vtp_outlines(const std::string& path, const std::vector<VtkOutlineLoop>& loops) {
    std::size_t pointCount = 0;
    for (const auto& loop : loops) {
        if (loop.xs.size() != loop.ys.size()) {
            throw std::invalid_argument("VTK outline '" + loop.label + "' has mismatched coordinate arrays");
        }
        if (loop.xs.size() < 2) {
            throw std::invalid_argument("VTK outline '" + loop.label + "' needs at least two points");
        }
        pointCount += loop.xs.size();
    }

    std::ofstream ofs(path);
    if (!ofs.is_open()) {
        throw std::runtime_error("Failed to open VTK output: " + path);
    }

    ofs << "<?xml version=\"1.0\"?>\n";
    ofs << "<VTKFile type=\"PolyData\" version=\"0.1\" byte_order=\"LittleEndian\">\n";
    ofs << "  <PolyData>\n";
    ofs << "    <Piece NumberOfPoints=\"" << pointCount << "\" NumberOfVerts=\"0\" NumberOfLines=\""
        << loops.size() << "\" NumberOfStrips=\"0\" NumberOfPolys=\"0\">\n";

    ofs << "      <Points>\n";
    ofs << "        <DataArray type=\"Float64\" NumberOfComponents=\"3\" format=\"ascii\">\n";
    ofs << std::setprecision(12);
    for (const auto& loop : loops) {
        for (std::size_t i = 0; i < loop.xs.size(); ++i) {
            ofs << "          " << loop.xs[i] << ' ' << loop.ys[i] << " 0\n";
        }
    }
    ofs << "        </DataArray>\n";
    ofs << "      </Points>\n";

    // Each loop is one closed polyline: its points followed by its first point again.
    ofs << "      <Lines>\n";
    ofs << "        <DataArray type=\"Int64\" Name=\"connectivity\" format=\"ascii\">\n";
    std::size_t base = 0;
    for (const auto& loop : loops) {
        ofs << "         ";
        for (std::size_t i = 0; i < loop.xs.size(); ++i) {
            ofs << ' ' << base + i;
        }
        ofs << ' ' << base << '\n';
        base += loop.xs.size();
    }
    ofs << "        </DataArray>\n";
    ofs << "        <DataArray type=\"Int64\" Name=\"offsets\" format=\"ascii\">\n";
    std::size_t offset = 0;
    ofs << "         ";
    for (const auto& loop : loops) {
        offset += loop.xs.size() + 1;
        ofs << ' ' << offset;
    }
    ofs << '\n';
    ofs << "        </DataArray>\n";
    ofs << "      </Lines>\n";

    ofs << "      <CellData Scalars=\"kind\">\n";
    ofs << "        <DataArray type=\"Int32\" Name=\"kind\" format=\"ascii\">\n";
    ofs << "         ";
    for (const auto& loop : loops) {
        ofs << ' ' << static_cast<int>(loop.kind);
    }
    ofs << '\n';
    ofs << "        </DataArray>\n";
    ofs << "      </CellData>\n";

    ofs << "    </Piece>\n";
    ofs << "  </PolyData>\n";
    ofs << "</VTKFile>\n";
    ofs.flush();
    if (!ofs) {
        throw std::runtime_error("Failed while writing VTK output: " + path);
    }

    const std::string labelsPath = outline_labels_path(path);
    std::ofstream csv(labelsPath);
    if (!csv.is_open()) {
        throw std::runtime_error("Failed to open outline label CSV: " + labelsPath);
    }
    csv << "index,kind,label,layer\n";
    for (std::size_t i = 0; i < loops.size(); ++i) {
        csv << i << ',' << static_cast<int>(loops[i].kind) << ',' << csvField(loops[i].label) << ','
            << csvField(loops[i].layer) << '\n';
    }
}

}  // namespace pcbfem
