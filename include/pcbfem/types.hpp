// filename: types.hpp
// part of PCB to FEMM Mesh Converter
// MIT License

#pragma once

#include <string>

namespace pcbfem {

constexpr double kPi = 3.14159265358979323846;

// Points closer than this are treated as one mesh point.
constexpr double kSmallDistance = 1e-3;

constexpr double kCopperConductivity = 5.8e7;

struct BlockProperty {
    std::string name;
    double conductivity{kCopperConductivity};
};

}  // namespace pcbfem
