// filename: main.cpp
// part of Opposed Magnet Flux Plotter
// MIT License

#include "fluxgap/config.hpp"
#include "fluxgap/driver.hpp"
#include "fluxgap/flux.hpp"
#include "fluxgap/grid.hpp"
#include "fluxgap/magnet.hpp"

#include <cstddef>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

namespace {

void printUsage() {
    std::cout << "Usage: fluxgap [--config PATH] [--dist-min MM] [--dist-max MM]"
                 " [--resolution N] [--shape {cyl|block|ring}] [--remanence T]"
                 " [--radius MM] [--thickness MM] [--point DIST POS]"
                 " [--list-outputs] [--outputs IDs] [--quiet]\n";
}

std::vector<std::string> splitCommaSeparated(const std::string& text) {
    std::vector<std::string> items;
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

bool parseDoubleArg(const std::string& flag, const char* text, double& value) {
    try {
        std::size_t consumed = 0;
        value = std::stod(text, &consumed);
        if (consumed != std::string(text).size()) {
            throw std::invalid_argument("trailing characters");
        }
    } catch (const std::exception&) {
        std::cerr << flag << " requires a valid floating-point argument\n";
        return false;
    }
    return true;
}

}  // namespace

int main(int argc, char** argv) {
    using namespace fluxgap;

    std::optional<std::string> configPath;
    std::optional<double> distMinOverride;
    std::optional<double> distMaxOverride;
    std::optional<std::size_t> resolutionOverride;
    std::optional<std::string> shapeOverride;
    std::optional<double> remanenceOverride;
    std::optional<double> radiusOverride;
    std::optional<double> thicknessOverride;
    std::optional<std::pair<double, double>> singlePoint;
    std::optional<std::string> outputsFilterArg;
    bool listOutputs = false;
    bool quiet = false;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            printUsage();
            return 0;
        } else if (arg == "--config") {
            if (i + 1 >= argc) {
                std::cerr << "--config requires a path argument\n";
                printUsage();
                return 1;
            }
            configPath = std::string(argv[++i]);
        } else if (arg == "--dist-min" || arg == "--dist-max" || arg == "--remanence" ||
                   arg == "--radius" || arg == "--thickness") {
            if (i + 1 >= argc) {
                std::cerr << arg << " requires a floating-point argument\n";
                printUsage();
                return 1;
            }
            double value = 0.0;
            if (!parseDoubleArg(arg, argv[++i], value)) {
                return 1;
            }
            if (arg == "--dist-min") {
                distMinOverride = value;
            } else if (arg == "--dist-max") {
                distMaxOverride = value;
            } else if (arg == "--remanence") {
                remanenceOverride = value;
            } else if (arg == "--radius") {
                radiusOverride = value;
            } else {
                thicknessOverride = value;
            }
        } else if (arg == "--resolution") {
            if (i + 1 >= argc) {
                std::cerr << "--resolution requires an integer argument\n";
                printUsage();
                return 1;
            }
            long long value = 0;
            try {
                value = std::stoll(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "--resolution requires a valid integer argument\n";
                return 1;
            }
            if (value < 2) {
                std::cerr << "--resolution must be at least 2\n";
                return 1;
            }
            resolutionOverride = static_cast<std::size_t>(value);
        } else if (arg == "--shape") {
            if (i + 1 >= argc) {
                std::cerr << "--shape requires an argument (cyl, block, or ring)\n";
                printUsage();
                return 1;
            }
            shapeOverride = std::string(argv[++i]);
        } else if (arg == "--point") {
            if (i + 2 >= argc) {
                std::cerr << "--point requires a distance and a position in mm\n";
                printUsage();
                return 1;
            }
            double distance = 0.0;
            double position = 0.0;
            if (!parseDoubleArg(arg, argv[++i], distance) ||
                !parseDoubleArg(arg, argv[++i], position)) {
                return 1;
            }
            singlePoint = std::make_pair(distance, position);
        } else if (arg == "--list-outputs") {
            listOutputs = true;
        } else if (arg == "--outputs") {
            if (i + 1 >= argc) {
                std::cerr << "--outputs requires a comma-separated list or 'all'/'none'\n";
                printUsage();
                return 1;
            }
            outputsFilterArg = std::string(argv[++i]);
        } else if (arg == "--quiet") {
            quiet = true;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            printUsage();
            return 1;
        }
    }

    PlotterConfig config;
    try {
        config = configPath ? loadConfigFromJson(*configPath) : defaultConfig();
        if (distMinOverride) {
            config.distMinMm = *distMinOverride;
        }
        if (distMaxOverride) {
            config.distMaxMm = *distMaxOverride;
        }
        if (resolutionOverride) {
            config.gridResolution = *resolutionOverride;
        }
        if (shapeOverride) {
            config.magnet.shape = parseMagnetShape(*shapeOverride);
        }
        if (remanenceOverride) {
            config.magnet.remanenceTesla = *remanenceOverride;
        }
        if (radiusOverride) {
            config.magnet.radiusMm = *radiusOverride;
        }
        if (thicknessOverride) {
            config.magnet.thicknessMm = *thicknessOverride;
        }
        validateConfig(config);
    } catch (const std::exception& ex) {
        std::cerr << "Failed to load configuration: " << ex.what() << "\n";
        return 1;
    }

    const MagnetGeometry& magnet = config.magnet;
    const bool shapeSupported = isShapeSupported(magnet.shape);
    if (!shapeSupported) {
        std::cerr << "Warning: magnet shape '" << magnetShapeLabel(magnet.shape)
                  << "' has no flux model; every sample will be NaN\n";
    }

    if (singlePoint) {
        const double flux = flux_density(singlePoint->first, singlePoint->second, magnet);
        std::cout << std::setprecision(10) << "distance_mm=" << singlePoint->first
                  << ", position_mm=" << singlePoint->second << ", flux_T=" << flux << "\n";
        return shapeSupported ? 0 : 2;
    }

    if (listOutputs) {
        std::cout << "Configured outputs (" << config.outputs.size() << "):\n";
        for (const auto& request : config.outputs) {
            std::cout << "  - [" << outputKindLabel(request.kind) << "] id=" << request.id
                      << ", format=" << outputFormatLabel(request.format)
                      << ", path=" << request.path << "\n";
        }
    }

    std::unordered_set<std::string> requestedOutputIds;
    bool restrictOutputs = false;
    bool skipOutputs = false;
    if (outputsFilterArg) {
        if (outputsFilterArg->empty()) {
            std::cerr << "--outputs argument must not be empty\n";
            return 1;
        }
        if (*outputsFilterArg == "all") {
            restrictOutputs = false;
        } else if (*outputsFilterArg == "none") {
            skipOutputs = true;
        } else {
            const auto ids = splitCommaSeparated(*outputsFilterArg);
            if (ids.empty()) {
                std::cerr << "--outputs requires a comma-separated list of ids or 'all'/'none'\n";
                return 1;
            }
            restrictOutputs = true;
            for (const auto& id : ids) {
                bool found = false;
                for (const auto& request : config.outputs) {
                    found = found || request.id == id;
                }
                if (!found) {
                    std::cerr << "Requested output id not found in configuration: " << id << "\n";
                    return 1;
                }
                requestedOutputIds.insert(id);
            }
        }
    }

    if (!quiet) {
        std::cout << "Magnet: shape=" << magnetShapeLabel(magnet.shape)
                  << ", B_rem=" << magnet.remanenceTesla << " T, radius=" << magnet.radiusMm
                  << " mm, thickness=" << magnet.thicknessMm << " mm\n";
        std::cout << "Sweep: distance [" << config.distMinMm << ", " << config.distMaxMm
                  << "] mm, " << config.gridResolution << " x " << config.gridResolution
                  << " samples\n";
    }

    FluxGrid grid;
    try {
        grid = buildFluxGrid(config);
    } catch (const std::exception& ex) {
        std::cerr << "Flux evaluation failed: " << ex.what() << "\n";
        return 1;
    }

    const FluxSummary summary = summarizeFluxGrid(grid);
    if (!quiet) {
        std::cout << "Evaluated " << summary.samples << " samples (" << summary.maskedSamples
                  << " beyond the magnet face, " << summary.nanSamples << " NaN)\n";
        if (summary.hasPeak) {
            std::cout << "Peak flux density: " << summary.peakTesla << " T at distance "
                      << summary.peakDistanceMm << " mm, position " << summary.peakPositionMm
                      << " mm\n";
        }
    }

    bool outputError = false;
    if (!skipOutputs) {
        for (const auto& request : config.outputs) {
            if (restrictOutputs && requestedOutputIds.count(request.id) == 0U) {
                continue;
            }
            try {
                writeOutput(request, grid, magnet);
                if (!quiet) {
                    std::cout << "Wrote " << outputKindLabel(request.kind) << " '" << request.id
                              << "' to " << request.path << "\n";
                }
            } catch (const std::exception& ex) {
                std::cerr << "Failed to write " << outputKindLabel(request.kind) << " '"
                          << request.id << "': " << ex.what() << "\n";
                outputError = true;
            }
        }
    }

    if (outputError) {
        return 1;
    }
    return shapeSupported ? 0 : 2;
}
