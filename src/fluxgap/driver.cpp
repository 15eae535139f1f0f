// filename: driver.cpp
// part of Opposed Magnet Flux Plotter
// MIT License

#include "fluxgap/driver.hpp"

#include "fluxgap/flux.hpp"
#include "fluxgap/io_csv.hpp"
#include "fluxgap/io_vtk.hpp"

#include <cmath>
#include <filesystem>
#include <stdexcept>
#include <system_error>

namespace fluxgap {
namespace {

void ensureParentDirectory(const std::filesystem::path& path) {
    const std::filesystem::path parent = path.parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            throw std::runtime_error("Failed to create output directory " + parent.string() + ": " +
                                     ec.message());
        }
    }
}

}  // namespace

FluxGrid buildFluxGrid(const PlotterConfig& config) {
    FluxGrid grid(linspace(config.distMinMm, config.distMaxMm, config.gridResolution));
    evaluate_flux_grid(grid, config.magnet);
    return grid;
}

FluxSummary summarizeFluxGrid(const FluxGrid& grid) {
    FluxSummary summary{};
    summary.samples = grid.fluxTesla.size();
    for (std::size_t k = 0; k < grid.fluxTesla.size(); ++k) {
        const double flux = grid.fluxTesla[k];
        if (std::isnan(flux)) {
            ++summary.nanSamples;
            continue;
        }
        if (grid.positionMm[k] > grid.distanceMm[k]) {
            ++summary.maskedSamples;
        }
        if (!summary.hasPeak || std::abs(flux) > std::abs(summary.peakTesla)) {
            summary.hasPeak = true;
            summary.peakTesla = flux;
            summary.peakDistanceMm = grid.distanceMm[k];
            summary.peakPositionMm = grid.positionMm[k];
        }
    }
    return summary;
}

LineProfile extractMidlineProfile(const FluxGrid& grid, const MagnetGeometry& magnet) {
    LineProfile profile{};
    profile.distanceMm = grid.axisMm;
    profile.fluxTesla.reserve(grid.axisMm.size());
    for (double distance : grid.axisMm) {
        profile.fluxTesla.push_back(flux_density(distance, 0.0, magnet));
    }
    return profile;
}

void writeOutput(const OutputRequest& request, const FluxGrid& grid, const MagnetGeometry& magnet) {
    const std::filesystem::path outPath(request.path);
    ensureParentDirectory(outPath);

    switch (request.kind) {
        case OutputRequest::Kind::Surface:
            if (request.format == OutputRequest::Format::Vts) {
                write_vts_surface(outPath.string(), grid);
            } else {
                write_csv_surface(outPath.string(), grid);
            }
            return;
        case OutputRequest::Kind::Midline: {
            if (request.format != OutputRequest::Format::Csv) {
                throw std::invalid_argument("Midline output '" + request.id + "' supports only csv");
            }
            const LineProfile profile = extractMidlineProfile(grid, magnet);
            write_csv_line_profile(outPath.string(), profile.distanceMm, profile.fluxTesla,
                                   "distance_mm", "midpoint_flux_T");
            return;
        }
    }
    throw std::invalid_argument("Unknown output kind for '" + request.id + "'");
}

}  // namespace fluxgap
