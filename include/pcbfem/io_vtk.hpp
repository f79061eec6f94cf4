// filename: io_vtk.hpp
// part of PCB to FEMM Mesh Converter
// MIT License

#pragma once

#include <string>
#include <vector>

namespace pcbfem {

struct VtkOutlineLoop {
    enum class Kind : int {
        BlockTop = 0,
        BlockBottom = 1,
        Pad = 2,
        Via = 3,
    };

    Kind kind{Kind::BlockTop};
    std::string label;
    std::string layer;
    std::vector<double> xs;
    std::vector<double> ys;
};

// Emits a VTK PolyData (.vtp) file containing closed polyline outlines of the
// converted copper (blocks per layer, pad conductors, via barrels). Each loop
// is tagged with a categorical `kind` stored as cell data for filtering in
// ParaView. A companion CSV (`<stem>_labels.csv` next to `path`) lists the
// loop index, kind, label and layer, since VTK string arrays are poorly
// supported by readers.
void write_vtp_outlines(const std::string& path, const std::vector<VtkOutlineLoop>& loops);

std::string outline_labels_path(const std::string& path);

}  // namespace pcbfem
