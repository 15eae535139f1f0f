// filename: magnet.cpp
// part of Opposed Magnet Flux Plotter
// MIT License

#include "fluxgap/magnet.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>
#include <string>

namespace fluxgap {
namespace {

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

double requirePositive(const std::string& field, double value) {
    if (!std::isfinite(value) || !(value > 0.0)) {
        throw std::runtime_error(field + " must be a finite positive number");
    }
    return value;
}

}  // namespace

MagnetShape parseMagnetShape(const std::string& text) {
    const std::string value = toLower(text);
    if (value == "cyl" || value == "cylinder") {
        return MagnetShape::Cylinder;
    }
    if (value == "block") {
        return MagnetShape::Block;
    }
    if (value == "ring") {
        return MagnetShape::Ring;
    }
    throw std::runtime_error("Unsupported magnet shape: " + text);
}

const char* magnetShapeLabel(MagnetShape shape) {
    switch (shape) {
        case MagnetShape::Cylinder:
            return "cyl";
        case MagnetShape::Block:
            return "block";
        case MagnetShape::Ring:
            return "ring";
    }
    return "unknown";
}

bool isShapeSupported(MagnetShape shape) {
    return shape == MagnetShape::Cylinder;
}

MagnetGeometry makeMagnetGeometry(double remanenceTesla, double radiusMm, double thicknessMm,
                                  MagnetShape shape) {
    MagnetGeometry magnet{};
    magnet.remanenceTesla = requirePositive("magnet.remanence_T", remanenceTesla);
    magnet.radiusMm = requirePositive("magnet.radius", radiusMm);
    magnet.thicknessMm = requirePositive("magnet.thickness", thicknessMm);
    magnet.shape = shape;
    return magnet;
}

}  // namespace fluxgap
