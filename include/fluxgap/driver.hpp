// filename: driver.hpp
// part of Opposed Magnet Flux Plotter
// MIT License

#pragma once

#include <cstddef>
#include <vector>

#include "fluxgap/config.hpp"
#include "fluxgap/grid.hpp"
#include "fluxgap/magnet.hpp"

namespace fluxgap {

struct FluxSummary {
    std::size_t samples{0};
    std::size_t maskedSamples{0};
    std::size_t nanSamples{0};
    bool hasPeak{false};
    double peakTesla{0.0};
    double peakDistanceMm{0.0};
    double peakPositionMm{0.0};
};

struct LineProfile {
    std::vector<double> distanceMm;
    std::vector<double> fluxTesla;
};

/**
 * @brief Sample the configured distance range and evaluate the whole grid once.
 * @param config Validated run configuration.
 * @return Square gridResolution x gridResolution grid.
 */
FluxGrid buildFluxGrid(const PlotterConfig& config);

/**
 * @brief Peak |B| and sample counts for the run log.
 *
 * maskedSamples counts positions beyond the magnet face. The peak ignores NaN
 * samples; hasPeak is false when every sample is NaN.
 */
FluxSummary summarizeFluxGrid(const FluxGrid& grid);

// B(d, 0) for every distance sample of the grid.
LineProfile extractMidlineProfile(const FluxGrid& grid, const MagnetGeometry& magnet);

/**
 * @brief Write one requested output, creating parent directories as needed.
 * @throws std::runtime_error or std::invalid_argument from the writers.
 */
void writeOutput(const OutputRequest& request, const FluxGrid& grid, const MagnetGeometry& magnet);

}  // namespace fluxgap
