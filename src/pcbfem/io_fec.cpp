// filename: io_fec.cpp
// part of PCB to FEMM Mesh Converter
// MIT License

#include "pcbfem/io_fec.hpp"

#include <algorithm>
#include <fstream>
#include <iomanip>
#include <numeric>
#include <sstream>
#include <stdexcept>
#include <tuple>
#include <vector>

namespace pcbfem {
namespace {

// Positions of `items` sorted by `less`, stable so ties keep insertion order.
template <typename T, typename Less>
std::vector<std::size_t> sortedOrder(const std::vector<T>& items, Less less) {
    std::vector<std::size_t> order(items.size());
    std::iota(order.begin(), order.end(), std::size_t{0});
    std::stable_sort(order.begin(), order.end(), [&](std::size_t lhs, std::size_t rhs) {
        return less(items[lhs], items[rhs]);
    });
    return order;
}

// Inverse of a sort order: rank[i] is the output position of item i.
std::vector<std::size_t> ranks(const std::vector<std::size_t>& order) {
    std::vector<std::size_t> rank(order.size());
    for (std::size_t pos = 0; pos < order.size(); ++pos) {
        rank[order[pos]] = pos;
    }
    return rank;
}

template <typename T>
bool byName(const T& lhs, const T& rhs) {
    return lhs.name < rhs.name;
}

template <typename T>
bool byCoordinate(const T& lhs, const T& rhs) {
    return std::tie(lhs.x, lhs.y) < std::tie(rhs.x, rhs.y);
}

}  // namespace

std::string formatNumber(double value) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(12) << value;
    std::string text = oss.str();
    if (text.find('.') != std::string::npos) {
        while (!text.empty() && text.back() == '0') {
            text.pop_back();
        }
        if (!text.empty() && text.back() == '.') {
            text.pop_back();
        }
    }
    if (text == "-0") {
        text = "0";
    }
    return text;
}

std::string formatPrecision(double value) {
    std::ostringstream oss;
    oss << std::scientific << std::setprecision(1) << value;
    return oss.str();
}

void write_fec(std::ostream& os, const MeshDocument& mesh, const FecHeader& header) {
    if (mesh.stage() != MeshDocument::Stage::Finalized) {
        throw std::logic_error("write_fec: mesh document must be finalized before writing");
    }

    const auto& boundaries = mesh.boundaries();
    const auto& properties = mesh.block_properties();
    const auto& conductors = mesh.conductors();
    const auto& points = mesh.points();

    const auto boundaryOrder = sortedOrder(boundaries, byName<Boundary>);
    const auto propertyOrder = sortedOrder(properties, byName<BlockProperty>);
    const auto conductorOrder = sortedOrder(conductors, byName<Conductor>);
    const auto pointOrder = sortedOrder(points, byCoordinate<MeshPoint>);

    const auto boundaryRank = ranks(boundaryOrder);
    const auto propertyRank = ranks(propertyOrder);
    const auto conductorRank = ranks(conductorOrder);
    const auto pointRank = ranks(pointOrder);

    os << "[Format]      =  1\n";
    os << "[Precision]   =  " << formatPrecision(header.precision) << '\n';
    os << "[Frequency]   =  " << formatNumber(header.frequency) << '\n';
    os << "[MinAngle]    =  " << formatNumber(header.minAngle) << '\n';
    os << "[Depth]       =  " << formatNumber(header.depth) << '\n';
    os << "[LengthUnits] =  millimeters\n";
    os << "[ProblemType] =  planar\n";
    os << "[Coordinates] =  cartesian\n";
    os << "[Comment]     =  \"" << header.comment << "\"\n";
    os << "[PointProps]  = 0\n";

    os << "[BdryProps] = " << boundaries.size() << '\n';
    for (const std::size_t i : boundaryOrder) {
        const Boundary& boundary = boundaries[i];
        os << "  <BeginBdry>\n";
        os << "    <BdryName> = \"" << boundary.name << "\"\n";
        os << "    <BdryType> = " << static_cast<int>(boundary.kind) << '\n';
        for (const char* field : {"vsr", "vsi", "qsr", "qsi", "c0r", "c0i", "c1r", "c1i"}) {
            os << "    <" << field << "> = 0\n";
        }
        os << "  <EndBdry>\n";
    }

    os << "[BlockProps] = " << properties.size() << '\n';
    for (const std::size_t i : propertyOrder) {
        const BlockProperty& property = properties[i];
        const std::string sigma = formatNumber(property.conductivity);
        os << "  <BeginBlock>\n";
        os << "   <BlockName> = \"" << property.name << "\"\n";
        os << "    <ox> = " << sigma << '\n';
        os << "    <oy> = " << sigma << '\n';
        os << "    <ex> = 1\n";
        os << "    <ey> = 1\n";
        os << "    <ltx> = 0\n";
        os << "    <lty> = 0\n";
        os << "  <EndBlock>\n";
    }

    os << "[ConductorProps] = " << conductors.size() << '\n';
    for (const std::size_t i : conductorOrder) {
        const Conductor& conductor = conductors[i];
        const bool voltage = conductor.kind == ConductorKind::Voltage;
        const double vcr = voltage ? conductor.value.real() : 0.0;
        const double vci = voltage ? conductor.value.imag() : 0.0;
        const double qcr = voltage ? 0.0 : conductor.value.real();
        const double qci = voltage ? 0.0 : conductor.value.imag();
        os << "  <BeginConductor>\n";
        os << "    <ConductorName> = \"" << conductor.name << "\"\n";
        os << "    <vcr> = " << formatNumber(vcr) << '\n';
        os << "    <vci> = " << formatNumber(vci) << '\n';
        os << "    <qcr> = " << formatNumber(qcr) << '\n';
        os << "    <qci> = " << formatNumber(qci) << '\n';
        os << "    <ConductorType> = " << static_cast<int>(conductor.kind) << '\n';
        os << "  <EndConductor>\n";
    }

    os << "[NumPoints] = " << points.size() << '\n';
    for (const std::size_t i : pointOrder) {
        os << formatNumber(points[i].x) << '\t' << formatNumber(points[i].y) << "\t0\t0\t0\n";
    }

    struct SegmentRow {
        std::size_t start;
        std::size_t end;
        const MeshSegment* segment;
    };
    std::vector<SegmentRow> rows;
    rows.reserve(mesh.segments().size());
    for (const MeshSegment& segment : mesh.segments()) {
        rows.push_back({pointRank[segment.start], pointRank[segment.end], &segment});
    }
    std::sort(rows.begin(), rows.end(), [](const SegmentRow& lhs, const SegmentRow& rhs) {
        return std::tie(lhs.start, lhs.end) < std::tie(rhs.start, rhs.end);
    });

    os << "[NumSegments] = " << rows.size() << '\n';
    for (const SegmentRow& row : rows) {
        const MeshSegment& segment = *row.segment;
        const std::size_t boundary = segment.boundary ? boundaryRank[*segment.boundary] + 1 : 0;
        const std::size_t conductor = segment.conductor ? conductorRank[*segment.conductor] + 1 : 0;
        os << row.start << '\t' << row.end << '\t' << formatNumber(segment.meshSize) << '\t' << boundary
           << "\t0\t0\t" << conductor << '\n';
    }

    os << "[NumArcSegments] = 0\n";

    const auto holeOrder = sortedOrder(mesh.holes(), byCoordinate<MeshHole>);
    os << "[NumHoles] = " << holeOrder.size() << '\n';
    for (const std::size_t i : holeOrder) {
        const MeshHole& hole = mesh.holes()[i];
        os << formatNumber(hole.x) << '\t' << formatNumber(hole.y) << "\t0\n";
    }

    const auto labelOrder = sortedOrder(mesh.block_labels(), byCoordinate<MeshBlockLabel>);
    os << "[NumBlockLabels] = " << labelOrder.size() << '\n';
    for (const std::size_t i : labelOrder) {
        const MeshBlockLabel& label = mesh.block_labels()[i];
        os << formatNumber(label.x) << '\t' << formatNumber(label.y) << '\t' << propertyRank[label.property] + 1
           << "\t-1\t0\t0\n";
    }
}

void write_fec(const std::string& path, const MeshDocument& mesh, const FecHeader& header) {
    std::ostringstream buffer;
    write_fec(buffer, mesh, header);

    std::ofstream ofs(path);
    if (!ofs.is_open()) {
        throw std::runtime_error("Failed to open FEC output: " + path);
    }
    ofs << buffer.str();
    ofs.flush();
    if (!ofs) {
        throw std::runtime_error("Failed while writing FEC output: " + path);
    }
}

}  // namespace pcbfem
