// filename: through_hole_scenario_test.cpp
// part of PCB to FEMM Mesh Converter
// MIT License

#include "pcbfem/board.hpp"
#include "pcbfem/conductor_spec.hpp"
#include "pcbfem/converter.hpp"
#include "pcbfem/io_fec.hpp"
#include "pcbfem/layout.hpp"
#include "pcbfem/mesh.hpp"

#include <cmath>
#include <filesystem>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>

int main() {
    using namespace pcbfem;

    namespace fs = std::filesystem;
    const fs::path inputDir = (fs::path(__FILE__).parent_path() / "../inputs/tests").lexically_normal();

    // TP1 is a single 1.2 mm through-hole pad with a 0.6 mm drill on net GND.
    Board board;
    std::vector<ConductorSpec> netOnly;
    try {
        board = loadBoardFromKicad((inputDir / "through_hole_pad.kicad_pcb").string());
        netOnly = loadConductorSpecsFromJson((inputDir / "through_hole_pad_conductors.json").string());
    } catch (const std::exception& ex) {
        std::cerr << "Failed to load through-hole inputs: " << ex.what() << "\n";
        return 1;
    }

    ConverterOptions options;
    options.quiet = true;

    // A net filter alone does not drive the pad, so it is treated as a via.
    Converter converter(netOnly, options);
    converter.find_pads(board);
    converter.assign_conductors();
    converter.find_vias();
    if (converter.pads().size() != 0 || converter.vias().size() != 1) {
        std::cerr << "Undriven through-hole pad was not reclassified as a via\n";
        return 1;
    }
    const Via via = converter.vias()[0];
    converter.find_blocks(board);
    if (converter.blocks().size() != 2) {
        std::cerr << "Expected the pad copper on both layers, got " << converter.blocks().size() << " blocks\n";
        return 1;
    }
    converter.remove_unconnected_pads();
    converter.prune_blocks();
    if (!converter.blocks().empty() || !converter.vias().empty()) {
        std::cerr << "Nothing is driven, yet " << converter.blocks().size() << " blocks and "
                  << converter.vias().size() << " vias survived\n";
        return 1;
    }

    LayoutConfig layoutConfig;
    layoutConfig.layers = options.layers;
    Layout emptyLayout(layoutConfig);
    MeshDocument empty;
    converter.write_out(emptyLayout, empty);
    empty.finalize();
    if (!empty.points().empty() || empty.block_properties().size() != 2) {
        std::cerr << "Empty board should only carry the block properties\n";
        return 1;
    }

    // The drill outline has radius 0.3 around the pad centre.
    for (const Point2& p : openRing(via.conductor_polygon().outer())) {
        if (std::abs(distance(p, Point2(5.0, 5.0)) - 0.3) > 1e-6) {
            std::cerr << "Drill outline point off the 0.3 mm radius\n";
            return 1;
        }
    }

    // Drawn on its own, the barrel unrolls with one vertical seam and one
    // boundary per rolled segment on each face.
    const std::size_t n = openRing(via.conductor_polygon().outer()).size();
    Layout layout(layoutConfig);
    const LayerBounds bounds = LayerBounds::fromBox(envelopeOf({via.copper_polygon()}));
    layout.set_bounds(bounds, bounds);
    MeshDocument mesh;
    writeVia(mesh, layout, via, 0, mesh.add_block_property(layoutConfig.viaProperty));
    mesh.finalize();
    std::size_t vertical = 0;
    std::size_t top = 0;
    std::size_t bottom = 0;
    for (const Boundary& boundary : mesh.boundaries()) {
        const std::string& name = boundary.name;
        if (name == "via_0_vert") {
            ++vertical;
        } else if (name.size() > 2 && name.compare(name.size() - 2, 2, "_t") == 0) {
            ++top;
        } else if (name.size() > 2 && name.compare(name.size() - 2, 2, "_b") == 0) {
            ++bottom;
        }
    }
    if (vertical != 1 || top != n || bottom != n) {
        std::cerr << "Expected 1 vertical, " << n << " top and " << n << " bottom boundaries, got " << vertical
                  << ", " << top << " and " << bottom << "\n";
        return 1;
    }

    // Selected by component instead, the pad is a driven conductor on both layers.
    const auto byModule =
        parseConductorSpecsFromString(R"([{"name": "GND", "value": "0V", "modules": [["TP1", "1"]]}])");
    Converter driven(byModule, options);
    driven.read_in(board);
    if (driven.pads().size() != 1 || driven.vias().size() != 0 || driven.blocks().size() != 2) {
        std::cerr << "Driven through-hole pad: expected 1 pad, 0 vias and 2 blocks, got " << driven.pads().size()
                  << ", " << driven.vias().size() << " and " << driven.blocks().size() << "\n";
        return 1;
    }
    Layout drivenLayout(layoutConfig);
    MeshDocument drivenMesh;
    driven.write_out(drivenLayout, drivenMesh);
    drivenMesh.finalize();
    std::ostringstream fec;
    write_fec(fec, drivenMesh, FecHeader{});
    if (drivenMesh.conductors().size() != 1 || drivenMesh.holes().size() != 2 ||
        fec.str().find("<ConductorName> = \"GND\"") == std::string::npos) {
        std::cerr << "Driven through-hole pad not written with its conductor on both layers\n";
        return 1;
    }

    std::cout << "Through-hole pad scenario validated successfully\n";
    return 0;
}
