// filename: grid_consistency_test.cpp
// part of Opposed Magnet Flux Plotter
// MIT License

#include "fluxgap/config.hpp"
#include "fluxgap/driver.hpp"
#include "fluxgap/flux.hpp"
#include "fluxgap/grid.hpp"

#include <cmath>
#include <iostream>
#include <stdexcept>
#include <vector>

int main() {
    using namespace fluxgap;

    const std::vector<double> axis = linspace(0.0, 25.0, 100);
    if (axis.size() != 100 || axis.front() != 0.0 || axis.back() != 25.0) {
        std::cerr << "grid_consistency_test: linspace endpoints wrong\n";
        return 1;
    }
    for (std::size_t i = 1; i < axis.size(); ++i) {
        const double step = axis[i] - axis[i - 1];
        if (!(step > 0.0) || std::abs(step - 25.0 / 99.0) > 1e-12) {
            std::cerr << "grid_consistency_test: uneven spacing at " << i << '\n';
            return 1;
        }
    }

    const std::vector<double> flat = linspace(3.0, 3.0, 4);
    for (double value : flat) {
        if (value != 3.0) {
            std::cerr << "grid_consistency_test: degenerate range should repeat the endpoint\n";
            return 1;
        }
    }

    const auto expectInvalid = [](auto&& fn, const char* label) {
        try {
            fn();
        } catch (const std::invalid_argument&) {
            return true;
        }
        std::cerr << "grid_consistency_test: " << label << " did not throw\n";
        return false;
    };
    if (!expectInvalid([] { (void)linspace(0.0, 1.0, 1); }, "linspace count 1") ||
        !expectInvalid([] { (void)linspace(2.0, 1.0, 10); }, "linspace reversed range") ||
        !expectInvalid(
            [] {
                (void)flux_density_batch({0.0, 1.0}, {0.0}, MagnetGeometry{});
            },
            "mismatched batch")) {
        return 1;
    }

    PlotterConfig config = defaultConfig();
    const FluxGrid grid = buildFluxGrid(config);
    if (grid.n != config.gridResolution || grid.fluxTesla.size() != grid.n * grid.n ||
        grid.distanceMm.size() != grid.size() || grid.positionMm.size() != grid.size()) {
        std::cerr << "grid_consistency_test: grid arrays have the wrong shape\n";
        return 1;
    }

    for (std::size_t j = 0; j < grid.n; ++j) {
        for (std::size_t i = 0; i < grid.n; ++i) {
            const std::size_t k = grid.idx(i, j);
            if (grid.distanceMm[k] != grid.axisMm[i] || grid.positionMm[k] != grid.axisMm[j]) {
                std::cerr << "grid_consistency_test: layout mismatch at (" << i << ", " << j
                          << ")\n";
                return 1;
            }
            const double scalar = flux_density(grid.axisMm[i], grid.axisMm[j], config.magnet);
            const double batched = grid.flux(i, j);
            if (scalar != batched) {
                std::cerr << "grid_consistency_test: scalar " << scalar << " != batch " << batched
                          << " at (" << i << ", " << j << ")\n";
                return 1;
            }
            if (grid.axisMm[j] > grid.axisMm[i] && batched != 0.0) {
                std::cerr << "grid_consistency_test: mask missing at (" << i << ", " << j << ")\n";
                return 1;
            }
        }
    }

    bool threw = false;
    try {
        (void)grid.flux(grid.n, 0);
    } catch (const std::out_of_range&) {
        threw = true;
    }
    if (!threw) {
        std::cerr << "grid_consistency_test: out-of-range access accepted\n";
        return 1;
    }

    // Independent runs with different configs do not interfere.
    PlotterConfig other = config;
    other.distMaxMm = 10.0;
    other.gridResolution = 11;
    const FluxGrid small = buildFluxGrid(other);
    const FluxGrid again = buildFluxGrid(config);
    if (small.n != 11 || small.axisMm[1] != 1.0 || again.fluxTesla != grid.fluxTesla) {
        std::cerr << "grid_consistency_test: repeated runs disagree\n";
        return 1;
    }

    std::cout << "grid_consistency_test: " << grid.size() << " samples match scalar evaluation\n";
    return 0;
}
