// filename: io_vtk.cpp
// part of Opposed Magnet Flux Plotter
// MIT License

#include "fluxgap/io_vtk.hpp"

#include <cmath>
#include <cstdint>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace fluxgap {
namespace {

bool isLittleEndian() {
    const std::uint16_t value = 1;
    return reinterpret_cast<const std::uint8_t*>(&value)[0] == 1;
}

struct DataArrayView {
    std::string name;
    int components{1};
    const std::vector<double>* values{nullptr};
};

void writeArrayHeader(std::ofstream& ofs, const DataArrayView& array, std::uint64_t offset) {
    ofs << "        <DataArray type=\"Float64\" Name=\"" << array.name << "\"";
    if (array.components > 1) {
        ofs << " NumberOfComponents=\"" << array.components << "\"";
    }
    ofs << " format=\"appended\" offset=\"" << offset << "\"/>\n";
}

}  // namespace

void write_vts_surface(const std::string& path, const FluxGrid& grid) {
    const std::size_t count = grid.size();
    if (grid.n < 2) {
        throw std::invalid_argument("VTK export requires at least a 2x2 grid");
    }
    if (grid.distanceMm.size() != count || grid.positionMm.size() != count ||
        grid.fluxTesla.size() != count) {
        throw std::invalid_argument("VTK export requires node-aligned grid arrays");
    }

    std::vector<double> points(3 * count);
    for (std::size_t k = 0; k < count; ++k) {
        const double flux = grid.fluxTesla[k];
        points[3 * k + 0] = grid.distanceMm[k];
        points[3 * k + 1] = grid.positionMm[k];
        points[3 * k + 2] = std::isnan(flux) ? 0.0 : flux;
    }

    const std::vector<DataArrayView> pointData = {
        {"FluxDensity_T", 1, &grid.fluxTesla},
        {"Distance_mm", 1, &grid.distanceMm},
        {"Position_mm", 1, &grid.positionMm},
    };
    const DataArrayView pointCoords{"Points", 3, &points};

    std::ofstream ofs(path, std::ios::binary);
    if (!ofs.is_open()) {
        throw std::runtime_error("Failed to open VTK output: " + path);
    }

    const std::size_t last = grid.n - 1;
    const bool littleEndian = isLittleEndian();
    ofs << "<?xml version=\"1.0\"?>\n";
    ofs << "<VTKFile type=\"StructuredGrid\" version=\"1.0\" byte_order=\""
        << (littleEndian ? "LittleEndian" : "BigEndian") << "\" header_type=\"UInt64\">\n";
    ofs << "  <StructuredGrid WholeExtent=\"0 " << last << " 0 " << last << " 0 0\">\n";
    ofs << "    <Piece Extent=\"0 " << last << " 0 " << last << " 0 0\">\n";
    ofs << "      <PointData Scalars=\"FluxDensity_T\">\n";

    std::uint64_t offset = 0;
    const auto advance = [&offset](const DataArrayView& array) {
        offset += sizeof(std::uint64_t) +
                  static_cast<std::uint64_t>(array.values->size()) * sizeof(double);
    };
    for (const auto& array : pointData) {
        writeArrayHeader(ofs, array, offset);
        advance(array);
    }
    ofs << "      </PointData>\n";
    ofs << "      <Points>\n";
    writeArrayHeader(ofs, pointCoords, offset);
    ofs << "      </Points>\n";
    ofs << "    </Piece>\n";
    ofs << "  </StructuredGrid>\n";
    ofs << "  <AppendedData encoding=\"raw\">\n";
    ofs << '_';

    const auto writeRaw = [&ofs](const DataArrayView& array) {
        const std::uint64_t bytes =
            static_cast<std::uint64_t>(array.values->size()) * sizeof(double);
        ofs.write(reinterpret_cast<const char*>(&bytes), sizeof(bytes));
        ofs.write(reinterpret_cast<const char*>(array.values->data()),
                  static_cast<std::streamsize>(bytes));
    };
    for (const auto& array : pointData) {
        writeRaw(array);
    }
    writeRaw(pointCoords);

    ofs << "\n";
    ofs << "  </AppendedData>\n";
    ofs << "</VTKFile>\n";
    ofs.flush();
    if (!ofs) {
        throw std::runtime_error("Failed while writing VTK output: " + path);
    }
}

}  // namespace fluxgap
