// filename: flux.cpp
// part of Opposed Magnet Flux Plotter
// MIT License

#include "fluxgap/flux.hpp"

#include <cmath>
#include <cstddef>
#include <limits>
#include <stdexcept>
#include <vector>

namespace fluxgap {
namespace {

constexpr double kUnsupported = std::numeric_limits<double>::quiet_NaN();

// Axial field of one cylinder face pair, gap measured from the sample to the
// near face, normalised to Br / 2.
double poleTerm(double gapM, double radiusM, double thicknessM) {
    const double r2 = radiusM * radiusM;
    const double far = thicknessM + gapM;
    return far / std::sqrt(r2 + far * far) - gapM / std::sqrt(r2 + gapM * gapM);
}

// Arguments in SI. Shared by the scalar and batch entry points.
double opposedCylinderFlux(double distanceM, double positionM, double remanenceTesla,
                           double radiusM, double thicknessM) {
    const double halfBr = remanenceTesla / 2.0;
    return halfBr * poleTerm(distanceM + positionM, radiusM, thicknessM) +
           halfBr * poleTerm(distanceM - positionM, radiusM, thicknessM);
}

bool insideOrBehindMagnet(double distanceMm, double positionMm) {
    return positionMm > distanceMm;
}

}  // namespace

double flux_density(double distanceMm, double positionMm, double remanenceTesla, double radiusMm,
                    double thicknessMm, MagnetShape shape) {
    switch (shape) {
        case MagnetShape::Cylinder:
            break;
        case MagnetShape::Block:
        case MagnetShape::Ring:
        default:
            return kUnsupported;
    }

    if (insideOrBehindMagnet(distanceMm, positionMm)) {
        return 0.0;
    }
    return opposedCylinderFlux(distanceMm / kMillimetresPerMetre, positionMm / kMillimetresPerMetre,
                               remanenceTesla, radiusMm / kMillimetresPerMetre,
                               thicknessMm / kMillimetresPerMetre);
}

double flux_density(double distanceMm, double positionMm, const MagnetGeometry& magnet) {
    return flux_density(distanceMm, positionMm, magnet.remanenceTesla, magnet.radiusMm,
                        magnet.thicknessMm, magnet.shape);
}

std::vector<double> flux_density_batch(const std::vector<double>& distanceMm,
                                       const std::vector<double>& positionMm,
                                       const MagnetGeometry& magnet) {
    if (distanceMm.size() != positionMm.size()) {
        throw std::invalid_argument("flux_density_batch: mismatched vector sizes");
    }
    const std::size_t count = distanceMm.size();
    if (!isShapeSupported(magnet.shape)) {
        return std::vector<double>(count, kUnsupported);
    }

    const double radiusM = magnet.radiusMm / kMillimetresPerMetre;
    const double thicknessM = magnet.thicknessMm / kMillimetresPerMetre;

    std::vector<double> flux(count);
    for (std::size_t k = 0; k < count; ++k) {
        flux[k] = opposedCylinderFlux(distanceMm[k] / kMillimetresPerMetre,
                                      positionMm[k] / kMillimetresPerMetre, magnet.remanenceTesla,
                                      radiusM, thicknessM);
    }

    for (std::size_t k = 0; k < count; ++k) {
        if (insideOrBehindMagnet(distanceMm[k], positionMm[k])) {
            flux[k] = 0.0;
        }
    }
    return flux;
}

void evaluate_flux_grid(FluxGrid& grid, const MagnetGeometry& magnet) {
    grid.fluxTesla = flux_density_batch(grid.distanceMm, grid.positionMm, magnet);
}

}  // namespace fluxgap
