// filename: flux_benchmark.cpp
// part of Opposed Magnet Flux Plotter
// MIT License

#include "fluxgap/fluxgap.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <numeric>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

struct BenchmarkConfig {
    std::size_t resolution{1000};
    double distMin{0.0};
    double distMax{25.0};
    std::size_t repeats{5};
    bool scalar{false};
    bool writeCsv{false};
    std::string csvPath{};
};

void printUsage() {
    std::cout << "flux_benchmark options:\n"
              << "  --resolution <int>     Samples per axis (default 1000)\n"
              << "  --dist-min <float>     Lower end of the distance sweep in mm (default 0)\n"
              << "  --dist-max <float>     Upper end of the distance sweep in mm (default 25)\n"
              << "  --repeats <int>        Number of benchmark repeats (default 5)\n"
              << "  --scalar               Time the scalar entry point instead of the batch one\n"
              << "  --csv <path>           Append benchmark results to CSV file\n"
              << "  --help                 Show this message\n";
}

bool parseArgs(int argc, char** argv, BenchmarkConfig& cfg) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        try {
            if (arg == "--help") {
                printUsage();
                return false;
            } else if (arg == "--resolution" && i + 1 < argc) {
                cfg.resolution = static_cast<std::size_t>(std::stoul(argv[++i]));
            } else if (arg == "--dist-min" && i + 1 < argc) {
                cfg.distMin = std::stod(argv[++i]);
            } else if (arg == "--dist-max" && i + 1 < argc) {
                cfg.distMax = std::stod(argv[++i]);
            } else if (arg == "--repeats" && i + 1 < argc) {
                cfg.repeats = static_cast<std::size_t>(std::stoul(argv[++i]));
            } else if (arg == "--scalar") {
                cfg.scalar = true;
            } else if (arg == "--csv" && i + 1 < argc) {
                cfg.writeCsv = true;
                cfg.csvPath = argv[++i];
            } else {
                std::cerr << "Unknown argument: " << arg << "\n";
                return false;
            }
        } catch (const std::exception& ex) {
            std::cerr << "Failed to parse argument " << arg << ": " << ex.what() << "\n";
            return false;
        }
    }
    return true;
}

void writeCsvResult(const BenchmarkConfig& cfg,
                    std::size_t samples,
                    double avgMs,
                    double minMs,
                    double maxMs,
                    double samplesPerSecond) {
    namespace fs = std::filesystem;
    const fs::path csvPath{cfg.csvPath};
    const bool newFile = !fs::exists(csvPath);
    std::ofstream csv(csvPath, std::ios::app);
    if (!csv) {
        throw std::runtime_error("Failed to open CSV file: " + cfg.csvPath);
    }
    if (newFile) {
        csv << "resolution,samples,mode,avg_ms,min_ms,max_ms,samples_per_second\n";
    }
    csv << cfg.resolution << ',' << samples << ',' << (cfg.scalar ? "scalar" : "batch") << ','
        << avgMs << ',' << minMs << ',' << maxMs << ',' << samplesPerSecond << '\n';
}

}  // namespace

int main(int argc, char** argv) {
    BenchmarkConfig cfg{};
    if (!parseArgs(argc, argv, cfg)) {
        return 1;
    }
    if (cfg.repeats == 0) {
        std::cerr << "--repeats must be at least 1.\n";
        return 1;
    }

    fluxgap::PlotterConfig plot = fluxgap::defaultConfig();
    plot.distMinMm = cfg.distMin;
    plot.distMaxMm = cfg.distMax;
    plot.gridResolution = cfg.resolution;
    try {
        fluxgap::validateConfig(plot);
    } catch (const std::exception& ex) {
        std::cerr << "Invalid benchmark sweep: " << ex.what() << "\n";
        return 1;
    }

    fluxgap::FluxGrid grid(fluxgap::linspace(plot.distMinMm, plot.distMaxMm, plot.gridResolution));

    std::vector<double> durationsMs;
    durationsMs.reserve(cfg.repeats);
    double checksum = 0.0;

    for (std::size_t repeat = 0; repeat < cfg.repeats; ++repeat) {
        const auto start = std::chrono::steady_clock::now();
        if (cfg.scalar) {
            for (std::size_t k = 0; k < grid.size(); ++k) {
                grid.fluxTesla[k] =
                    fluxgap::flux_density(grid.distanceMm[k], grid.positionMm[k], plot.magnet);
            }
        } else {
            fluxgap::evaluate_flux_grid(grid, plot.magnet);
        }
        const auto end = std::chrono::steady_clock::now();
        durationsMs.push_back(std::chrono::duration<double, std::milli>(end - start).count());
        checksum = std::accumulate(grid.fluxTesla.begin(), grid.fluxTesla.end(), 0.0);
    }

    const std::size_t samples = grid.size();
    const double avgMs = std::accumulate(durationsMs.begin(), durationsMs.end(), 0.0) /
                         static_cast<double>(durationsMs.size());
    const auto [minIt, maxIt] = std::minmax_element(durationsMs.begin(), durationsMs.end());
    const double minMs = *minIt;
    const double maxMs = *maxIt;
    const double samplesPerSecond = static_cast<double>(samples) / (avgMs / 1000.0);

    const fluxgap::FluxSummary summary = fluxgap::summarizeFluxGrid(grid);

    std::cout << std::fixed << std::setprecision(3);
    std::cout << "Grid: " << cfg.resolution << " x " << cfg.resolution << " (" << samples
              << " samples, " << (cfg.scalar ? "scalar" : "batch") << " path)\n";
    std::cout << "Average evaluation time: " << avgMs << " ms (min=" << minMs
              << " ms, max=" << maxMs << " ms)\n";
    std::cout << "Throughput: " << samplesPerSecond / 1.0e6 << "e6 samples/s\n";
    std::cout << "Checksum: " << std::scientific << std::setprecision(6) << checksum
              << ", peak=" << summary.peakTesla << " T\n";

    if (cfg.writeCsv) {
        try {
            writeCsvResult(cfg, samples, avgMs, minMs, maxMs, samplesPerSecond);
        } catch (const std::exception& ex) {
            std::cerr << "Warning: " << ex.what() << "\n";
        }
    }

    return std::isfinite(checksum) ? 0 : 2;
}
