// filename: flux.hpp
// part of Opposed Magnet Flux Plotter
// MIT License

#pragma once

#include <vector>

#include "fluxgap/grid.hpp"
#include "fluxgap/magnet.hpp"
#include "fluxgap/types.hpp"

namespace fluxgap {

/**
 * @brief On-axis flux density between two opposed cylindrical magnets.
 *
 * Superposes the axial field of two identical magnets whose inner faces sit
 * distanceMm either side of the common midpoint, sampled positionMm from the
 * midpoint. Samples with positionMm > distanceMm lie inside or behind a magnet
 * and return exactly 0. Shapes other than Cylinder return NaN.
 *
 * @param distanceMm Midpoint to magnet face, in mm.
 * @param positionMm Signed offset from the midpoint, in mm.
 * @param remanenceTesla Remanence of the magnet grade, in T.
 * @param radiusMm Magnet radius, in mm.
 * @param thicknessMm Magnet thickness, in mm.
 * @param shape Magnet shape selector.
 * @return Flux density in T, 0 outside the envelope, NaN for unsupported shapes.
 */
double flux_density(double distanceMm, double positionMm, double remanenceTesla, double radiusMm,
                    double thicknessMm, MagnetShape shape = MagnetShape::Cylinder);

double flux_density(double distanceMm, double positionMm, const MagnetGeometry& magnet);

/**
 * @brief Elementwise flux density over paired sample arrays.
 *
 * No broadcasting: both arrays must have the same length. Element k equals
 * flux_density(distanceMm[k], positionMm[k], magnet) exactly.
 * @throws std::invalid_argument on mismatched lengths.
 */
std::vector<double> flux_density_batch(const std::vector<double>& distanceMm,
                                       const std::vector<double>& positionMm,
                                       const MagnetGeometry& magnet);

// Fills grid.fluxTesla through flux_density_batch.
void evaluate_flux_grid(FluxGrid& grid, const MagnetGeometry& magnet);

}  // namespace fluxgap
