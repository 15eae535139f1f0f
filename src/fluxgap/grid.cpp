// filename: grid.cpp
// part of Opposed Magnet Flux Plotter
// MIT License

#include "fluxgap/grid.hpp"

#include <stdexcept>

namespace fluxgap {

FluxGrid::FluxGrid(const std::vector<double>& axis)
    : n(axis.size()), axisMm(axis), distanceMm(axis.size() * axis.size(), 0.0),
      positionMm(axis.size() * axis.size(), 0.0), fluxTesla(axis.size() * axis.size(), 0.0) {
    for (std::size_t j = 0; j < n; ++j) {
        for (std::size_t i = 0; i < n; ++i) {
            const std::size_t k = idx(i, j);
            distanceMm[k] = axisMm[i];
            positionMm[k] = axisMm[j];
        }
    }
}

std::vector<double> linspace(double minValue, double maxValue, std::size_t count) {
    if (count < 2) {
        throw std::invalid_argument("linspace requires at least 2 samples");
    }
    if (maxValue < minValue) {
        throw std::invalid_argument("linspace requires maxValue >= minValue");
    }

    const double step = (maxValue - minValue) / static_cast<double>(count - 1);
    std::vector<double> values(count);
    for (std::size_t i = 0; i < count; ++i) {
        values[i] = minValue + static_cast<double>(i) * step;
    }
    values.back() = maxValue;
    return values;
}

}  // namespace fluxgap
