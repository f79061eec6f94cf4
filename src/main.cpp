// filename: main.cpp
// part of PCB to FEMM Mesh Converter
// MIT License

#include "pcbfem/board.hpp"
#include "pcbfem/conductor_spec.hpp"
#include "pcbfem/converter.hpp"
#include "pcbfem/io_fec.hpp"
#include "pcbfem/io_vtk.hpp"
#include "pcbfem/layout.hpp"
#include "pcbfem/mesh.hpp"
#include "pcbfem/progress.hpp"
#include "pcbfem/types.hpp"

#include <algorithm>
#include <exception>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace {

void printUsage() {
    std::cout << "Usage: pcbfem [-i|--in-file PATH] [-o|--out-file PATH] [-c|--conductor-file PATH]"
                 " [-b|--bounds XMIN YMIN XMAX YMAX] [-f|--frequency HZ] [-t|--thickness UM]"
                 " [-k|--board-thickness MM] [-v|--via-thickness UM] [-l|--layers NAME...]"
                 " [--preview PATH.vtp] [-q|--quiet]\n"
                 "\n"
                 "Example:\n"
                 "  pcbfem -i in.kicad_pcb -o out.FEC -f 0 -t 70 -c conductors.json\n"
                 "    Open 'in.kicad_pcb' and write 'out.FEC' at 0 Hz (DC) with 70um (2oz) copper,\n"
                 "    driving the pads matched by 'conductors.json'.\n";
}

std::optional<double> parseDouble(const std::string& text) {
    try {
        std::size_t used = 0;
        const double value = std::stod(text, &used);
        if (used != text.size()) {
            return std::nullopt;
        }
        return value;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<std::filesystem::path> findBoardInDirectory(const std::filesystem::path& dir) {
    std::vector<std::filesystem::path> candidates;
    std::error_code ec;
    for (const auto& entry : std::filesystem::directory_iterator(dir, ec)) {
        if (entry.is_regular_file() && entry.path().extension() == ".kicad_pcb") {
            candidates.push_back(entry.path());
        }
    }
    if (candidates.empty()) {
        return std::nullopt;
    }
    std::sort(candidates.begin(), candidates.end());
    return candidates.front();
}

}  // namespace

int main(int argc, char** argv) {
    using namespace pcbfem;

    std::optional<std::string> inPath;
    std::optional<std::string> outPath;
    std::optional<std::string> conductorPath;
    std::optional<std::string> previewPath;
    std::optional<Box> bounds;
    double frequency = 0.0;
    double copperThicknessUm = 35.0;
    double boardThicknessMm = 1.5;
    double viaThicknessUm = 17.0;
    std::vector<std::string> layers{"F.Cu", "B.Cu"};
    bool quiet = false;

    const auto requireValue = [&](int& i, const std::string& arg) -> std::optional<std::string> {
        if (i + 1 >= argc) {
            std::cerr << arg << " requires an argument\n";
            printUsage();
            return std::nullopt;
        }
        return std::string(argv[++i]);
    };
    const auto requireNumber = [&](int& i, const std::string& arg) -> std::optional<double> {
        const auto text = requireValue(i, arg);
        if (!text) {
            return std::nullopt;
        }
        const auto value = parseDouble(*text);
        if (!value) {
            std::cerr << arg << " requires a numeric argument, got '" << *text << "'\n";
        }
        return value;
    };

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "-i" || arg == "--in-file") {
            inPath = requireValue(i, arg);
            if (!inPath) {
                return 1;
            }
        } else if (arg == "-o" || arg == "--out-file") {
            outPath = requireValue(i, arg);
            if (!outPath) {
                return 1;
            }
        } else if (arg == "-c" || arg == "--conductor-file") {
            conductorPath = requireValue(i, arg);
            if (!conductorPath) {
                return 1;
            }
        } else if (arg == "--preview") {
            previewPath = requireValue(i, arg);
            if (!previewPath) {
                return 1;
            }
        } else if (arg == "-b" || arg == "--bounds") {
            double values[4];
            for (double& value : values) {
                const auto parsed = requireNumber(i, arg);
                if (!parsed) {
                    return 1;
                }
                value = *parsed;
            }
            bounds = Box(Point2(std::min(values[0], values[2]), std::min(values[1], values[3])),
                         Point2(std::max(values[0], values[2]), std::max(values[1], values[3])));
        } else if (arg == "-f" || arg == "--frequency") {
            const auto value = requireNumber(i, arg);
            if (!value) {
                return 1;
            }
            frequency = *value;
        } else if (arg == "-t" || arg == "--thickness") {
            const auto value = requireNumber(i, arg);
            if (!value) {
                return 1;
            }
            copperThicknessUm = *value;
        } else if (arg == "-k" || arg == "--board-thickness") {
            const auto value = requireNumber(i, arg);
            if (!value) {
                return 1;
            }
            boardThicknessMm = *value;
        } else if (arg == "-v" || arg == "--via-thickness") {
            const auto value = requireNumber(i, arg);
            if (!value) {
                return 1;
            }
            viaThicknessUm = *value;
        } else if (arg == "-l" || arg == "--layers") {
            layers.clear();
            while (i + 1 < argc && argv[i + 1][0] != '-') {
                layers.emplace_back(argv[++i]);
            }
            if (layers.empty()) {
                std::cerr << arg << " requires at least one layer name\n";
                return 1;
            }
        } else if (arg == "-q" || arg == "--quiet") {
            quiet = true;
        } else if (arg == "-h" || arg == "--help") {
            printUsage();
            return 0;
        } else {
            std::cerr << "Unrecognised argument: " << arg << "\n";
            printUsage();
            return 1;
        }
    }

    if (!(frequency >= 0.0)) {
        std::cerr << "--frequency must not be negative\n";
        return 1;
    }
    if (!(copperThicknessUm > 0.0)) {
        std::cerr << "--thickness must be positive\n";
        return 1;
    }
    if (!(viaThicknessUm > 0.0)) {
        std::cerr << "--via-thickness must be positive\n";
        return 1;
    }

    if (!inPath) {
        const auto found = findBoardInDirectory(std::filesystem::current_path());
        if (!found) {
            std::cerr << "Error: no kicad_pcb files found in the current directory\n";
            return 1;
        }
        inPath = found->string();
    }
    if (!outPath) {
        outPath = std::filesystem::path(*inPath).stem().string() + ".FEC";
    }

    if (layers.size() > 2) {
        std::cerr << "WARNING: only the first 2 layers given (" << layers[0] << " and " << layers[1]
                  << ") will be used\n";
        layers.resize(2);
    }

    try {
        const Board board = loadBoardFromKicad(*inPath);
        if (!quiet) {
            std::cout << "Opened input file '" << std::filesystem::absolute(*inPath).string() << "'.\n";
        }

        std::vector<ConductorSpec> specs;
        if (conductorPath) {
            specs = loadConductorSpecsFromJson(*conductorPath);
        } else if (!quiet) {
            std::cerr << "WARNING: no conductor file given, no pad will be driven\n";
        }

        // The solver models one material thickness, so thinner via walls become lower conductivity.
        LayoutConfig layoutConfig;
        layoutConfig.layers = layers;
        layoutConfig.boardThickness = boardThicknessMm;
        layoutConfig.copperProperty = BlockProperty{"Copper", kCopperConductivity};
        layoutConfig.viaProperty = BlockProperty{"Via", kCopperConductivity * viaThicknessUm / copperThicknessUm};
        Layout layout(layoutConfig);

        ConverterOptions options;
        options.layers = layers;
        options.bounds = bounds;
        options.quiet = quiet;

        Converter converter(std::move(specs), options);
        converter.read_in(board);
        if (!quiet) {
            std::cout << "Kept " << converter.blocks().size() << " blocks, " << converter.pads().size()
                      << " driven pads and " << converter.vias().size() << " vias.\n";
        }

        MeshDocument mesh;
        converter.write_out(layout, mesh);
        {
            ScopedProgress progress("FEC post-process: Merging close points...", quiet);
            mesh.merge_close_points();
            mesh.sweep();
        }
        {
            ScopedProgress progress("FEC post-process: Resolving overlapping segments...", quiet);
            mesh.resolve_overlapping_segments();
        }
        {
            ScopedProgress progress("FEC post-process: Removing zero length segments...", quiet);
            mesh.remove_zero_length_segments();
            mesh.sweep();
        }

        FecHeader header;
        header.frequency = frequency;
        header.depth = copperThicknessUm / 1000.0;
        write_fec(*outPath, mesh, header);
        if (!quiet) {
            std::cout << "Wrote output file '" << std::filesystem::absolute(*outPath).string() << "'.\n";
        }

        if (previewPath) {
            write_vtp_outlines(*previewPath, converter.preview_outlines());
            if (!quiet) {
                std::cout << "Wrote preview '" << std::filesystem::absolute(*previewPath).string() << "'.\n";
            }
        }
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }
    return 0;
}
