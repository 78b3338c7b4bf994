/**
 * @file GeoLayer.hpp
 * @brief Vector layer held in the GeoLayer registry.
 */

#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "domain/PropertyStore.hpp"

namespace geoflow::domain {

/**
 * @enum GeometryKind
 * @brief Geometry type shared by the features of a layer.
 */
enum class GeometryKind {
    Unknown,
    Point,
    MultiPoint,
    LineString,
    MultiLineString,
    Polygon,
    MultiPolygon,
    Mixed
};

inline std::string GeometryKindToString(GeometryKind kind) {
    switch (kind) {
        case GeometryKind::Point: return "Point";
        case GeometryKind::MultiPoint: return "MultiPoint";
        case GeometryKind::LineString: return "LineString";
        case GeometryKind::MultiLineString: return "MultiLineString";
        case GeometryKind::Polygon: return "Polygon";
        case GeometryKind::MultiPolygon: return "MultiPolygon";
        case GeometryKind::Mixed: return "Mixed";
        default: return "Unknown";
    }
}

/** @brief Parses a GeoJSON geometry type name; anything unrecognized is Unknown. */
inline GeometryKind GeometryKindFromString(const std::string& text) {
    if (text == "Point") return GeometryKind::Point;
    if (text == "MultiPoint") return GeometryKind::MultiPoint;
    if (text == "LineString") return GeometryKind::LineString;
    if (text == "MultiLineString") return GeometryKind::MultiLineString;
    if (text == "Polygon") return GeometryKind::Polygon;
    if (text == "MultiPolygon") return GeometryKind::MultiPolygon;
    if (text == "Mixed") return GeometryKind::Mixed;
    return GeometryKind::Unknown;
}

/** @brief Multi-part kind of the same family (Polygon -> MultiPolygon); other kinds are returned unchanged. */
inline GeometryKind MultiPartKind(GeometryKind kind) {
    switch (kind) {
        case GeometryKind::Point: return GeometryKind::MultiPoint;
        case GeometryKind::LineString: return GeometryKind::MultiLineString;
        case GeometryKind::Polygon: return GeometryKind::MultiPolygon;
        default: return kind;
    }
}

/**
 * @brief Geometry kind shared by the features of a GeoJSON features array.
 *
 * Single- and multi-part geometries of one family give the multi-part kind.
 * Different families, or a geometry type outside the supported set, give Mixed.
 * Features without geometry are ignored; no geometry at all gives Unknown.
 */
inline GeometryKind DetectGeometryKind(const nlohmann::json& features) {
    std::optional<GeometryKind> common;
    for (const auto& feature : features) {
        if (!feature.contains("geometry") || !feature["geometry"].is_object()) continue;
        const GeometryKind kind = GeometryKindFromString(feature["geometry"].value("type", std::string()));
        if (kind == GeometryKind::Unknown || kind == GeometryKind::Mixed) {
            return GeometryKind::Mixed;
        }
        if (!common) {
            common = kind;
        } else if (*common != kind) {
            if (MultiPartKind(*common) != MultiPartKind(kind)) {
                return GeometryKind::Mixed;
            }
            common = MultiPartKind(kind);
        }
    }
    return common.value_or(GeometryKind::Unknown);
}

/**
 * @struct GeoLayer
 * @brief Features plus the metadata commands read and write.
 *
 * Features are kept as a GeoJSON "features" array; the workflow core treats
 * them as opaque and only codecs and geometry engines look inside.
 */
struct GeoLayer {
    std::string id;
    std::string name;
    std::string description;
    std::string crs;                    ///< Authority code, e.g. "EPSG:4326".
    GeometryKind geometry = GeometryKind::Unknown;
    std::filesystem::path sourcePath;   ///< Empty for layers created in memory.
    nlohmann::json features = nlohmann::json::array();
    std::map<std::string, PropertyValue> properties;

    std::size_t featureCount() const { return features.size(); }
};

} // namespace geoflow::domain
