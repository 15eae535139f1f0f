// filename: config.hpp
// part of Opposed Magnet Flux Plotter
// MIT License

#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "fluxgap/magnet.hpp"

namespace fluxgap {

struct OutputRequest {
    enum class Kind { Surface, Midline };
    enum class Format { Csv, Vts };

    std::string id;
    Kind kind{Kind::Surface};
    Format format{Format::Vts};
    std::string path;
};

/**
 * @brief Immutable description of one plotting run.
 *
 * distMinMm/distMaxMm bound the midpoint distance sweep; the same samples are
 * reused for the position axis.
 */
struct PlotterConfig {
    std::string version{"0.1"};
    MagnetGeometry magnet{};
    double distMinMm{0.0};
    double distMaxMm{25.0};
    std::size_t gridResolution{100};
    std::vector<OutputRequest> outputs;
};

// Built-in constants plus a VTS surface, a CSV surface and a midline CSV under outputs/.
PlotterConfig defaultConfig();

/**
 * @brief Load a plotting run from JSON.
 *
 * Missing magnet and sweep keys fall back to defaultConfig(). The outputs list
 * replaces the default outputs when present.
 * @throws std::runtime_error on unreadable files or invalid values.
 */
PlotterConfig loadConfigFromJson(const std::string& path);

// Throws std::runtime_error naming the first invalid field.
void validateConfig(const PlotterConfig& config);

const char* outputKindLabel(OutputRequest::Kind kind);
const char* outputFormatLabel(OutputRequest::Format format);

}  // namespace fluxgap
