/**
 * @file GeoJsonLayerCodec.hpp
 * @brief LayerCodec for GeoJSON FeatureCollections.
 */

#pragma once

#include <nlohmann/json.hpp>

#include "domain/LayerCodec.hpp"

namespace geoflow::infrastructure {

/**
 * @class GeoJsonLayerCodec
 * @brief Reads and writes GeoJSON with nlohmann::json.
 *
 * The CRS is taken from the legacy "crs.properties.name" member (URN or
 * "EPSG:n" form) and defaults to EPSG:4326 as RFC 7946 prescribes.
 */
class GeoJsonLayerCodec : public domain::LayerCodec {
public:
    std::unique_ptr<domain::GeoLayer> readLayer(const std::filesystem::path& path) override;
    void writeLayer(const domain::GeoLayer& layer, const std::filesystem::path& path, int precision) override;

    /** @brief Builds a layer from a parsed FeatureCollection (or single Feature). */
    static std::unique_ptr<domain::GeoLayer> FromJson(const nlohmann::json& document);

    /** @brief FeatureCollection for @p layer with coordinates rounded to @p precision (negative: unchanged). */
    static nlohmann::json ToJson(const domain::GeoLayer& layer, int precision);

    /** @brief "urn:ogc:def:crs:EPSG::26913" -> "EPSG:26913"; other text is returned as is. */
    static std::string NormalizeCrs(const std::string& name);
};

} // namespace geoflow::infrastructure
