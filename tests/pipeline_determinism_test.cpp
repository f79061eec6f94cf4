// filename: pipeline_determinism_test.cpp
// part of PCB to FEMM Mesh Converter
// MIT License

#include "pcbfem/board.hpp"
#include "pcbfem/conductor_spec.hpp"
#include "pcbfem/converter.hpp"
#include "pcbfem/io_fec.hpp"
#include "pcbfem/io_vtk.hpp"
#include "pcbfem/layout.hpp"
#include "pcbfem/mesh.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace {

std::string convert(const pcbfem::Board& board, const std::vector<pcbfem::ConductorSpec>& specs) {
    using namespace pcbfem;
    ConverterOptions options;
    options.quiet = true;
    Converter converter(specs, options);
    converter.read_in(board);

    LayoutConfig config;
    config.layers = options.layers;
    Layout layout(config);
    MeshDocument mesh;
    converter.write_out(layout, mesh);
    mesh.finalize();

    std::ostringstream oss;
    write_fec(oss, mesh, FecHeader{});
    return oss.str();
}

std::string readFile(const std::filesystem::path& path) {
    std::ifstream in(path);
    std::ostringstream contents;
    contents << in.rdbuf();
    return contents.str();
}

}  // namespace

int main() {
    using namespace pcbfem;

    namespace fs = std::filesystem;
    const fs::path inputDir = (fs::path(__FILE__).parent_path() / "../inputs/tests").lexically_normal();

    Board board;
    std::vector<ConductorSpec> specs;
    try {
        board = loadBoardFromKicad((inputDir / "connectivity_chain.kicad_pcb").string());
        specs = loadConductorSpecsFromJson((inputDir / "connectivity_chain_conductors.json").string());
    } catch (const std::exception& ex) {
        std::cerr << "Failed to load inputs: " << ex.what() << "\n";
        return 1;
    }

    const std::string first = convert(board, specs);
    const std::string second = convert(board, specs);
    if (first.empty() || first != second) {
        std::cerr << "Two conversions of the same board differ\n";
        return 1;
    }

    const fs::path outDir = fs::temp_directory_path() / "pcbfem_pipeline_determinism_test";
    fs::create_directories(outDir);
    const fs::path fecPath = outDir / "chain.FEC";
    const fs::path vtpPath = outDir / "chain.vtp";

    ConverterOptions options;
    options.quiet = true;
    Converter converter(specs, options);
    converter.read_in(board);
    LayoutConfig config;
    config.layers = options.layers;
    Layout layout(config);
    MeshDocument mesh;
    converter.write_out(layout, mesh);
    mesh.finalize();
    write_fec(fecPath.string(), mesh, FecHeader{});
    if (readFile(fecPath) != first) {
        std::cerr << "FEC file differs from the in-memory rendering\n";
        return 1;
    }

    // Two blocks, one via barrel and one pad conductor.
    const auto loops = converter.preview_outlines();
    if (loops.size() != 4) {
        std::cerr << "Expected 4 preview outlines, got " << loops.size() << "\n";
        return 1;
    }
    write_vtp_outlines(vtpPath.string(), loops);
    const std::string vtp = readFile(vtpPath);
    if (vtp.find("<VTKFile type=\"PolyData\"") == std::string::npos ||
        vtp.find("NumberOfLines=\"4\"") == std::string::npos) {
        std::cerr << "Preview file is not a PolyData outline file\n";
        return 1;
    }
    const std::string labels = readFile(outline_labels_path(vtpPath.string()));
    if (labels.rfind("index,kind,label,layer\n", 0) != 0 || labels.find("U1:1 (VCC)") == std::string::npos) {
        std::cerr << "Preview label table missing the driven pad\n";
        return 1;
    }

    VtkOutlineLoop broken;
    broken.label = "broken";
    broken.xs = {0.0, 1.0};
    broken.ys = {0.0};
    bool threw = false;
    try {
        write_vtp_outlines((outDir / "broken.vtp").string(), {broken});
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    if (!threw) {
        std::cerr << "Mismatched outline arrays did not raise invalid_argument\n";
        return 1;
    }

    std::error_code ec;
    fs::remove_all(outDir, ec);

    std::cout << "Conversion pipeline determinism validated successfully\n";
    return 0;
}
