// filename: io_csv.cpp
// part of Opposed Magnet Flux Plotter
// MIT License

#include "fluxgap/io_csv.hpp"

#include <fstream>
#include <iomanip>
#include <stdexcept>

namespace fluxgap {

void write_csv_columns(const std::string& path, const std::vector<CsvColumnView>& columns) {
    if (columns.empty()) {
        throw std::invalid_argument("write_csv_columns: no columns supplied");
    }
    for (const auto& column : columns) {
        if (column.values == nullptr) {
            throw std::invalid_argument("write_csv_columns: null column pointer for '" +
                                        column.header + "'");
        }
    }
    const std::size_t n = columns.front().values->size();
    for (const auto& column : columns) {
        if (column.values->size() != n) {
            throw std::invalid_argument("write_csv_columns: column size mismatch for '" +
                                        column.header + "'");
        }
    }

    std::ofstream ofs(path);
    if (!ofs.is_open()) {
        throw std::runtime_error("Failed to open CSV output: " + path);
    }

    for (std::size_t c = 0; c < columns.size(); ++c) {
        if (c > 0) {
            ofs << ',';
        }
        ofs << columns[c].header;
    }
    ofs << '\n';

    ofs << std::setprecision(10);
    for (std::size_t i = 0; i < n; ++i) {
        for (std::size_t c = 0; c < columns.size(); ++c) {
            if (c > 0) {
                ofs << ',';
            }
            ofs << (*(columns[c].values))[i];
        }
        ofs << '\n';
    }

    ofs.flush();
    if (!ofs) {
        throw std::runtime_error("Failed while writing CSV output: " + path);
    }
}

void write_csv_line_profile(const std::string& path,
                            const std::vector<double>& x,
                            const std::vector<double>& v,
                            const std::string& xHeader,
                            const std::string& vHeader) {
    if (x.size() != v.size()) {
        throw std::invalid_argument("write_csv_line_profile: mismatched vector sizes");
    }
    write_csv_columns(path, {{xHeader, &x}, {vHeader, &v}});
}

void write_csv_surface(const std::string& path, const FluxGrid& grid) {
    if (grid.distanceMm.size() != grid.size() || grid.positionMm.size() != grid.size() ||
        grid.fluxTesla.size() != grid.size()) {
        throw std::invalid_argument("write_csv_surface: grid arrays do not match n x n");
    }
    write_csv_columns(path, {{"distance_mm", &grid.distanceMm},
                             {"position_mm", &grid.positionMm},
                             {"flux_T", &grid.fluxTesla}});
}

}  // namespace fluxgap
