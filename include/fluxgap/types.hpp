// filename: types.hpp
// part of Opposed Magnet Flux Plotter
// MIT License

#pragma once

namespace fluxgap {

constexpr double kMillimetresPerMetre = 1000.0;

enum class MagnetShape { Cylinder, Block, Ring };

}  // namespace fluxgap
