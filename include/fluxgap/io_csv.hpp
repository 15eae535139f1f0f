// filename: io_csv.hpp
// part of Opposed Magnet Flux Plotter
// MIT License

#pragma once

#include <string>
#include <vector>

#include "fluxgap/grid.hpp"

namespace fluxgap {

struct CsvColumnView {
    std::string header;
    const std::vector<double>* values{nullptr};
};

// Writes one row per index across equally sized columns. NaN is written as "nan".
void write_csv_columns(const std::string& path, const std::vector<CsvColumnView>& columns);

void write_csv_line_profile(const std::string& path,
                            const std::vector<double>& x,
                            const std::vector<double>& v,
                            const std::string& xHeader,
                            const std::string& vHeader);

// Long format: distance_mm,position_mm,flux_T, distance varying fastest.
void write_csv_surface(const std::string& path, const FluxGrid& grid);

}  // namespace fluxgap
