/**
 * @file GeoJsonLayerCodec.cpp
 * @brief Implementation of GeoJsonLayerCodec.
 */

#include "infrastructure/GeoJsonLayerCodec.hpp"

#include <cmath>
#include <stdexcept>

#include "infrastructure/AtomicFileWriter.hpp"

namespace geoflow::infrastructure {

using json = nlohmann::json;

namespace {

constexpr const char* kDefaultCrs = "EPSG:4326";

void RoundCoordinates(json& node, double scale) {
    if (node.is_array()) {
        for (auto& child : node) {
            RoundCoordinates(child, scale);
        }
    } else if (node.is_number_float()) {
        node = std::round(node.get<double>() * scale) / scale;
    }
}

} // namespace

std::unique_ptr<domain::GeoLayer> GeoJsonLayerCodec::readLayer(const std::filesystem::path& path) {
    json document;
    try {
        document = json::parse(AtomicFileWriter::Read(path));
    } catch (const json::parse_error& e) {
        throw std::runtime_error("Invalid GeoJSON in " + path.string() + ": " + e.what());
    }
    auto layer = FromJson(document);
    layer->sourcePath = path;
    return layer;
}

void GeoJsonLayerCodec::writeLayer(const domain::GeoLayer& layer, const std::filesystem::path& path, int precision) {
    AtomicFileWriter::Write(path, ToJson(layer, precision).dump(2) + "\n");
}

std::unique_ptr<domain::GeoLayer> GeoJsonLayerCodec::FromJson(const json& document) {
    auto layer = std::make_unique<domain::GeoLayer>();
    const std::string type = document.value("type", std::string());

    if (type == "FeatureCollection") {
        if (!document.contains("features") || !document["features"].is_array()) {
            throw std::runtime_error("FeatureCollection has no features array.");
        }
        layer->features = document["features"];
    } else if (type == "Feature") {
        layer->features = json::array({document});
    } else {
        throw std::runtime_error("Unsupported GeoJSON type \"" + type + "\".");
    }

    layer->crs = kDefaultCrs;
    if (document.contains("crs") && document["crs"].is_object()) {
        const json& crs = document["crs"];
        if (crs.contains("properties") && crs["properties"].is_object() && crs["properties"].contains("name")) {
            layer->crs = NormalizeCrs(crs["properties"]["name"].get<std::string>());
        }
    }
    layer->geometry = domain::DetectGeometryKind(layer->features);
    if (document.contains("name") && document["name"].is_string()) {
        layer->name = document["name"].get<std::string>();
    }
    return layer;
}

json GeoJsonLayerCodec::ToJson(const domain::GeoLayer& layer, int precision) {
    json features = layer.features;
    if (precision >= 0) {
        const double scale = std::pow(10.0, precision);
        for (auto& feature : features) {
            if (feature.contains("geometry") && feature["geometry"].is_object() &&
                feature["geometry"].contains("coordinates")) {
                RoundCoordinates(feature["geometry"]["coordinates"], scale);
            }
        }
    }

    json document = {
        {"type", "FeatureCollection"},
        {"name", layer.name.empty() ? layer.id : layer.name},
        {"features", features}
    };
    if (!layer.crs.empty()) {
        document["crs"] = {
            {"type", "name"},
            {"properties", {{"name", layer.crs}}}
        };
    }
    return document;
}

std::string GeoJsonLayerCodec::NormalizeCrs(const std::string& name) {
    // urn:ogc:def:crs:<authority>:<version>:<code>
    const std::string prefix = "urn:ogc:def:crs:";
    if (name.rfind(prefix, 0) != 0) {
        return name;
    }
    const std::string rest = name.substr(prefix.size());
    const std::size_t authorityEnd = rest.find(':');
    const std::size_t codeStart = rest.find_last_of(':');
    if (authorityEnd == std::string::npos || codeStart == std::string::npos) {
        return name;
    }
    const std::string authority = rest.substr(0, authorityEnd);
    const std::string code = rest.substr(codeStart + 1);
    if (authority == "OGC" && code == "CRS84") {
        return kDefaultCrs;
    }
    return authority + ":" + code;
}

} // namespace geoflow::infrastructure
