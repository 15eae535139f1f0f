// filename: output_writer_test.cpp
// part of Opposed Magnet Flux Plotter
// MIT License

#include "fluxgap/config.hpp"
#include "fluxgap/driver.hpp"
#include "fluxgap/io_csv.hpp"
#include "fluxgap/io_vtk.hpp"

#include <cstdint>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

namespace {

std::vector<std::string> readLines(const std::filesystem::path& path) {
    std::ifstream ifs(path);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(ifs, line)) {
        lines.push_back(line);
    }
    return lines;
}

}  // namespace

int main() {
    using namespace fluxgap;
    namespace fs = std::filesystem;

    const fs::path tempDir = fs::temp_directory_path() / "output_writer_test";
    std::error_code ec;
    fs::remove_all(tempDir, ec);
    fs::create_directories(tempDir, ec);

    PlotterConfig config = defaultConfig();
    config.distMinMm = 0.0;
    config.distMaxMm = 3.0;
    config.gridResolution = 4;
    const FluxGrid grid = buildFluxGrid(config);

    const fs::path csvPath = tempDir / "surface.csv";
    write_csv_surface(csvPath.string(), grid);
    const auto csvLines = readLines(csvPath);
    if (csvLines.size() != 17) {
        std::cerr << "Expected header plus 16 rows, got " << csvLines.size() << " lines\n";
        return 1;
    }
    if (csvLines[0] != "distance_mm,position_mm,flux_T") {
        std::cerr << "Unexpected CSV header: " << csvLines[0] << '\n';
        return 1;
    }
    if (csvLines[1].rfind("0,0,0.41654812", 0) != 0) {
        std::cerr << "Unexpected first CSV row: " << csvLines[1] << '\n';
        return 1;
    }
    // Row for d=0, p=1 lies beyond the face.
    if (csvLines[5] != "0,1,0") {
        std::cerr << "Masked CSV row not written as zero: " << csvLines[5] << '\n';
        return 1;
    }

    const std::vector<double> xs{0.0, 1.0, 2.0};
    const std::vector<double> vs{0.5, 0.25};
    bool threw = false;
    try {
        write_csv_line_profile((tempDir / "bad.csv").string(), xs, vs, "x", "v");
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    if (!threw) {
        std::cerr << "Mismatched profile sizes were accepted\n";
        return 1;
    }

    threw = false;
    try {
        write_csv_surface((tempDir / "missing_dir" / "nested" / "x.csv").string(), grid);
    } catch (const std::runtime_error&) {
        threw = true;
    }
    if (!threw) {
        std::cerr << "Writing into a missing directory should fail\n";
        return 1;
    }

    const fs::path vtsPath = tempDir / "surface.vts";
    write_vts_surface(vtsPath.string(), grid);
    std::ifstream vts(vtsPath, std::ios::binary);
    const std::string contents((std::istreambuf_iterator<char>(vts)), std::istreambuf_iterator<char>());
    for (const char* token : {"type=\"StructuredGrid\"", "WholeExtent=\"0 3 0 3 0 0\"",
                              "Name=\"FluxDensity_T\"", "NumberOfComponents=\"3\"",
                              "header_type=\"UInt64\"", "</VTKFile>"}) {
        if (contents.find(token) == std::string::npos) {
            std::cerr << "VTS output missing token " << token << '\n';
            return 1;
        }
    }
    const std::size_t dataStart = contents.find('_', contents.find("<AppendedData"));
    if (dataStart == std::string::npos) {
        std::cerr << "VTS appended data marker missing\n";
        return 1;
    }
    std::uint64_t firstBlockBytes = 0;
    std::memcpy(&firstBlockBytes, contents.data() + dataStart + 1, sizeof(firstBlockBytes));
    if (firstBlockBytes != 16 * sizeof(double)) {
        std::cerr << "VTS first block has " << firstBlockBytes << " bytes\n";
        return 1;
    }
    // 3 scalar arrays + 3-component points, each preceded by its byte count.
    const std::size_t payload = 3 * (8 + 16 * 8) + (8 + 48 * 8);
    if (contents.size() < dataStart + 1 + payload) {
        std::cerr << "VTS appended data truncated\n";
        return 1;
    }

    threw = false;
    try {
        FluxGrid single(std::vector<double>{1.0});
        write_vts_surface((tempDir / "single.vts").string(), single);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    if (!threw) {
        std::cerr << "1x1 VTS export should be rejected\n";
        return 1;
    }

    // Driver-level dispatch creates nested directories.
    OutputRequest midline{};
    midline.id = "midline";
    midline.kind = OutputRequest::Kind::Midline;
    midline.format = OutputRequest::Format::Csv;
    midline.path = (tempDir / "nested" / "deeper" / "midline.csv").string();
    writeOutput(midline, grid, config.magnet);
    const auto midLines = readLines(midline.path);
    if (midLines.size() != 5 || midLines[0] != "distance_mm,midpoint_flux_T") {
        std::cerr << "Midline CSV malformed\n";
        return 1;
    }

    PlotterConfig ringConfig = config;
    ringConfig.magnet.shape = MagnetShape::Ring;
    const FluxGrid ringGrid = buildFluxGrid(ringConfig);
    const fs::path ringCsv = tempDir / "ring.csv";
    write_csv_surface(ringCsv.string(), ringGrid);
    const auto ringLines = readLines(ringCsv);
    std::istringstream row(ringLines.at(1));
    std::string d, p, b;
    std::getline(row, d, ',');
    std::getline(row, p, ',');
    std::getline(row, b, ',');
    if (b != "nan" && b != "-nan") {
        std::cerr << "Unsupported shape should write NaN, got " << b << '\n';
        return 1;
    }
    OutputRequest ringSurface{};
    ringSurface.id = "ring_surface";
    ringSurface.kind = OutputRequest::Kind::Surface;
    ringSurface.format = OutputRequest::Format::Vts;
    ringSurface.path = (tempDir / "ring.vts").string();
    writeOutput(ringSurface, ringGrid, ringConfig.magnet);
    if (!fs::exists(ringSurface.path)) {
        std::cerr << "Ring VTS surface not written\n";
        return 1;
    }

    std::cout << "Output writers validated successfully\n";
    return 0;
}
