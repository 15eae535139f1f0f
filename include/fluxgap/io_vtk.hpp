// filename: io_vtk.hpp
// part of Opposed Magnet Flux Plotter
// MIT License

#pragma once

#include <string>

#include "fluxgap/grid.hpp"

namespace fluxgap {

// Writes a VTK StructuredGrid (.vts) surface whose points are
// (distance mm, position mm, flux T). Unsupported-shape NaN samples are placed
// at z = 0 while the FluxDensity_T point array keeps the NaN. Colour by
// FluxDensity_T with a diverging map (e.g. "Cool to Warm") in ParaView and use
// a Transform filter to stretch z when the mm and T scales differ too much.
void write_vts_surface(const std::string& path, const FluxGrid& grid);

}  // namespace fluxgap
