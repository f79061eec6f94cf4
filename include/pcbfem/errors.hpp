// filename: errors.hpp
// part of PCB to FEMM Mesh Converter
// MIT License

#pragma once

#include <stdexcept>

namespace pcbfem {

/**
 * @brief Invalid or conflicting configuration: unknown pad shape, ratio out of
 *        range, layout used before initialisation, conflicting redefinition of
 *        a named entity, double conductor/boundary assignment.
 */
class ConfigurationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Malformed board description or missing required child item.
 */
class InputFormatError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Geometry that cannot be processed (zero-area pad, collapsed offset,
 *        empty region where one was expected).
 */
class GeometryDegenerate : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

}  // namespace pcbfem
