// filename: config.cpp
// part of Opposed Magnet Flux Plotter
// MIT License

#include "fluxgap/config.hpp"

#include <cmath>
#include <fstream>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <vector>

#include <nlohmann/json.hpp>

namespace fluxgap {
namespace {

OutputRequest::Kind parseOutputKind(const std::string& value) {
    if (value == "surface") {
        return OutputRequest::Kind::Surface;
    }
    if (value == "midline") {
        return OutputRequest::Kind::Midline;
    }
    throw std::runtime_error("Unsupported output type: " + value);
}

OutputRequest::Format parseOutputFormat(const std::string& value) {
    if (value == "csv") {
        return OutputRequest::Format::Csv;
    }
    if (value == "vts") {
        return OutputRequest::Format::Vts;
    }
    throw std::runtime_error("Unsupported output format: " + value);
}

std::string requireNonEmpty(const std::string& field, const std::string& value) {
    if (value.empty()) {
        throw std::runtime_error(field + " must be a non-empty string");
    }
    return value;
}

std::string defaultOutputPath(const std::string& id, OutputRequest::Format format) {
    return "outputs/" + id + "." + outputFormatLabel(format);
}

OutputRequest makeRequest(const std::string& id, OutputRequest::Kind kind,
                          OutputRequest::Format format) {
    OutputRequest request{};
    request.id = id;
    request.kind = kind;
    request.format = format;
    request.path = defaultOutputPath(id, format);
    return request;
}

}  // namespace

const char* outputKindLabel(OutputRequest::Kind kind) {
    switch (kind) {
        case OutputRequest::Kind::Surface:
            return "surface";
        case OutputRequest::Kind::Midline:
            return "midline";
    }
    return "unknown";
}

const char* outputFormatLabel(OutputRequest::Format format) {
    switch (format) {
        case OutputRequest::Format::Csv:
            return "csv";
        case OutputRequest::Format::Vts:
            return "vts";
    }
    return "unknown";
}

PlotterConfig defaultConfig() {
    PlotterConfig config{};
    config.outputs.push_back(
        makeRequest("flux_surface", OutputRequest::Kind::Surface, OutputRequest::Format::Vts));
    config.outputs.push_back(
        makeRequest("flux_surface_csv", OutputRequest::Kind::Surface, OutputRequest::Format::Csv));
    config.outputs.push_back(
        makeRequest("midline_profile", OutputRequest::Kind::Midline, OutputRequest::Format::Csv));
    return config;
}

void validateConfig(const PlotterConfig& config) {
    (void)makeMagnetGeometry(config.magnet.remanenceTesla, config.magnet.radiusMm,
                             config.magnet.thicknessMm, config.magnet.shape);

    if (!std::isfinite(config.distMinMm) || !std::isfinite(config.distMaxMm)) {
        throw std::runtime_error("sweep.dist_range must contain finite values");
    }
    if (config.distMinMm < 0.0) {
        throw std::runtime_error("sweep.dist_range minimum must be non-negative");
    }
    if (config.distMaxMm < config.distMinMm) {
        throw std::runtime_error("sweep.dist_range maximum must not be below the minimum");
    }
    if (config.gridResolution < 2) {
        throw std::runtime_error("sweep.resolution must be at least 2");
    }

    std::unordered_set<std::string> ids;
    for (const auto& request : config.outputs) {
        requireNonEmpty("outputs.id", request.id);
        requireNonEmpty("outputs.path", request.path);
        if (!ids.insert(request.id).second) {
            throw std::runtime_error("Duplicate output id: " + request.id);
        }
        if (request.kind == OutputRequest::Kind::Midline &&
            request.format != OutputRequest::Format::Csv) {
            throw std::runtime_error("Output '" + request.id + "': midline output supports only csv");
        }
    }
}

PlotterConfig loadConfigFromJson(const std::string& path) {
    std::ifstream input(path);
    if (!input) {
        throw std::runtime_error("Failed to open config JSON: " + path);
    }

    nlohmann::json json;
    input >> json;

    PlotterConfig config = defaultConfig();
    config.version = json.value("version", std::string{});
    if (config.version.empty()) {
        throw std::runtime_error("Config JSON missing required field: version");
    }
    if (config.version != "0.1") {
        throw std::runtime_error("Unsupported config version: " + config.version);
    }

    const std::string units = json.value("units", std::string{"mm"});
    if (units != "mm") {
        throw std::runtime_error("Unsupported units: " + units + ". Only mm is supported.");
    }

    if (json.contains("magnet")) {
        const auto& magnet = json.at("magnet");
        const double remanence = magnet.value("remanence_T", config.magnet.remanenceTesla);
        const double radius = magnet.value("radius", config.magnet.radiusMm);
        const double thickness = magnet.value("thickness", config.magnet.thicknessMm);
        const MagnetShape shape = parseMagnetShape(
            magnet.value("shape", std::string{magnetShapeLabel(config.magnet.shape)}));
        config.magnet = makeMagnetGeometry(remanence, radius, thickness, shape);
    }

    if (json.contains("sweep")) {
        const auto& sweep = json.at("sweep");
        if (sweep.contains("dist_range")) {
            const auto& range = sweep.at("dist_range");
            if (!range.is_array() || range.size() != 2) {
                throw std::runtime_error("sweep.dist_range must be a [min, max] array");
            }
            config.distMinMm = range.at(0).get<double>();
            config.distMaxMm = range.at(1).get<double>();
        }
        if (sweep.contains("resolution")) {
            const auto& resolution = sweep.at("resolution");
            if (!resolution.is_number_integer() || resolution.get<long long>() < 2) {
                throw std::runtime_error("sweep.resolution must be an integer of at least 2");
            }
            config.gridResolution = resolution.get<std::size_t>();
        }
    }

    if (json.contains("outputs")) {
        const auto& outputs = json.at("outputs");
        if (!outputs.is_array()) {
            throw std::runtime_error("outputs must be an array");
        }
        config.outputs.clear();
        for (const auto& entry : outputs) {
            const std::string id = requireNonEmpty("outputs.id", entry.at("id").get<std::string>());
            const auto kind = parseOutputKind(entry.value("type", std::string{"surface"}));
            const auto format = parseOutputFormat(entry.value("format", std::string{"csv"}));
            OutputRequest request = makeRequest(id, kind, format);
            if (entry.contains("path")) {
                request.path = requireNonEmpty("outputs.path", entry.at("path").get<std::string>());
            }
            config.outputs.push_back(request);
        }
    }

    validateConfig(config);
    return config;
}

}  // namespace fluxgap
