// filename: fluxgap.hpp
// part of Opposed Magnet Flux Plotter
// MIT License

#pragma once

#include "config.hpp"
#include "driver.hpp"
#include "flux.hpp"
#include "grid.hpp"
#include "magnet.hpp"
#include "types.hpp"
