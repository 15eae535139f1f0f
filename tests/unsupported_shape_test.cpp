// filename: unsupported_shape_test.cpp
// part of Opposed Magnet Flux Plotter
// MIT License

#include "fluxgap/flux.hpp"
#include "fluxgap/magnet.hpp"

#include <cmath>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

int main() {
    using namespace fluxgap;

    const std::vector<MagnetShape> unsupported = {MagnetShape::Block, MagnetShape::Ring,
                                                  static_cast<MagnetShape>(42)};

    const std::vector<double> ds{0.0, 1.0, 5.0, 10.0, 0.0};
    const std::vector<double> ps{0.0, -0.5, 2.0, 10.0, 5.0};

    for (MagnetShape shape : unsupported) {
        if (isShapeSupported(shape)) {
            std::cerr << "unsupported_shape_test: shape " << magnetShapeLabel(shape)
                      << " reported as supported\n";
            return 1;
        }

        // NaN wins over the envelope mask, including at d=0, p=5.
        for (std::size_t k = 0; k < ds.size(); ++k) {
            const double value = flux_density(ds[k], ps[k], 1.21, 7.62, 2.794, shape);
            if (!std::isnan(value)) {
                std::cerr << "unsupported_shape_test: scalar " << magnetShapeLabel(shape)
                          << " returned " << value << '\n';
                return 1;
            }
        }

        MagnetGeometry magnet{};
        magnet.shape = shape;
        const std::vector<double> batch = flux_density_batch(ds, ps, magnet);
        if (batch.size() != ds.size()) {
            std::cerr << "unsupported_shape_test: batch size mismatch\n";
            return 1;
        }
        for (double value : batch) {
            if (!std::isnan(value)) {
                std::cerr << "unsupported_shape_test: batch " << magnetShapeLabel(shape)
                          << " returned " << value << '\n';
                return 1;
            }
        }

        if (!flux_density_batch({}, {}, magnet).empty()) {
            std::cerr << "unsupported_shape_test: empty batch should stay empty\n";
            return 1;
        }
    }

    if (!isShapeSupported(MagnetShape::Cylinder)) {
        std::cerr << "unsupported_shape_test: cylinder must be supported\n";
        return 1;
    }

    if (parseMagnetShape("cyl") != MagnetShape::Cylinder ||
        parseMagnetShape("CYLINDER") != MagnetShape::Cylinder ||
        parseMagnetShape("block") != MagnetShape::Block ||
        parseMagnetShape("Ring") != MagnetShape::Ring) {
        std::cerr << "unsupported_shape_test: shape identifiers not parsed\n";
        return 1;
    }
    if (std::string(magnetShapeLabel(MagnetShape::Ring)) != "ring") {
        std::cerr << "unsupported_shape_test: ring label wrong\n";
        return 1;
    }

    bool threw = false;
    try {
        (void)parseMagnetShape("hexagon");
    } catch (const std::runtime_error&) {
        threw = true;
    }
    if (!threw) {
        std::cerr << "unsupported_shape_test: unknown identifier accepted\n";
        return 1;
    }

    std::cout << "unsupported_shape_test: block and ring produce NaN\n";
    return 0;
}
