// filename: magnet.hpp
// part of Opposed Magnet Flux Plotter
// MIT License

#pragma once

#include <string>

#include "fluxgap/types.hpp"

namespace fluxgap {

/**
 * @brief Geometry and grade of one magnet of an opposed, coaxial pair.
 *
 * Lengths are kept in millimetres as entered; the evaluator converts to metres.
 * Defaults describe a 0.6 in x 0.11 in disc (15.24 mm x 2.794 mm).
 */
struct MagnetGeometry {
    double remanenceTesla{1.21};
    double radiusMm{7.62};
    double thicknessMm{2.794};
    MagnetShape shape{MagnetShape::Cylinder};
};

/**
 * @brief Parse a shape identifier ("cyl", "cylinder", "block", "ring").
 * @throws std::runtime_error for any other identifier.
 */
MagnetShape parseMagnetShape(const std::string& text);

const char* magnetShapeLabel(MagnetShape shape);

// Only opposed cylinders have a closed-form evaluator.
bool isShapeSupported(MagnetShape shape);

/**
 * @brief Build a validated geometry.
 * @throws std::runtime_error naming the field when remanence, radius or
 *         thickness is not a finite, strictly positive number.
 */
MagnetGeometry makeMagnetGeometry(double remanenceTesla, double radiusMm, double thicknessMm,
                                  MagnetShape shape);

}  // namespace fluxgap
