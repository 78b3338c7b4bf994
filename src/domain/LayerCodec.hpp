/**
 * @file LayerCodec.hpp
 * @brief Interface for reading and writing vector layer files.
 */

#pragma once

#include <filesystem>
#include <memory>

#include "domain/GeoLayer.hpp"

namespace geoflow::domain {

class LayerCodec {
public:
    virtual ~LayerCodec() = default;

    /** @throws std::runtime_error when the file cannot be read or parsed. */
    virtual std::unique_ptr<GeoLayer> readLayer(const std::filesystem::path& path) = 0;

    /**
     * @param precision Number of decimals kept for coordinates; negative keeps them unchanged.
     * @throws std::runtime_error when the file cannot be written.
     */
    virtual void writeLayer(const GeoLayer& layer, const std::filesystem::path& path, int precision) = 0;
};

} // namespace geoflow::domain
