// filename: grid.hpp
// part of Opposed Magnet Flux Plotter
// MIT License

#pragma once

#include <cstddef>
#include <stdexcept>
#include <vector>

namespace fluxgap {

/**
 * @brief Square distance x position sampling grid with its flux values.
 *
 * Both axes share the same sampled values. Sample (i, j) sits at distance
 * axisMm[i] and position axisMm[j] and is stored at j * n + i.
 */
struct FluxGrid {
    std::size_t n{0};
    std::vector<double> axisMm;
    std::vector<double> distanceMm;
    std::vector<double> positionMm;
    std::vector<double> fluxTesla;

    FluxGrid() = default;

    explicit FluxGrid(const std::vector<double>& axis);

    [[nodiscard]] inline std::size_t idx(std::size_t i, std::size_t j) const {
        return j * n + i;
    }

    [[nodiscard]] inline bool inBounds(std::size_t i, std::size_t j) const {
        return i < n && j < n;
    }

    [[nodiscard]] inline std::size_t size() const { return n * n; }

    [[nodiscard]] inline double& flux(std::size_t i, std::size_t j) {
        if (!inBounds(i, j)) {
            throw std::out_of_range("FluxGrid::flux index out of range");
        }
        return fluxTesla[idx(i, j)];
    }

    [[nodiscard]] inline const double& flux(std::size_t i, std::size_t j) const {
        if (!inBounds(i, j)) {
            throw std::out_of_range("FluxGrid::flux index out of range");
        }
        return fluxTesla[idx(i, j)];
    }
};

/**
 * @brief Evenly spaced samples over [minValue, maxValue], both endpoints included.
 *
 * The last sample is exactly maxValue.
 * @throws std::invalid_argument if count < 2 or maxValue < minValue.
 */
std::vector<double> linspace(double minValue, double maxValue, std::size_t count);

}  // namespace fluxgap
