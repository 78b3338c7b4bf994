/**
 * @file GeometryEngine.hpp
 * @brief Interface to the external geometry algorithm provider.
 */

#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "domain/GeoLayer.hpp"

namespace geoflow::domain {

/**
 * @struct AlgorithmInputs
 * @brief Layers and named parameters handed to an algorithm.
 */
struct AlgorithmInputs {
    std::vector<const GeoLayer*> layers;
    std::map<std::string, std::string> parameters;
};

/**
 * @struct AlgorithmOutputs
 * @brief Result of an algorithm: an optional output layer plus named values.
 */
struct AlgorithmOutputs {
    std::unique_ptr<GeoLayer> layer;
    std::map<std::string, std::string> values;
};

/**
 * @class GeometryEngine
 * @brief Opaque algorithm runner ("clip", "simplify", "reproject").
 */
class GeometryEngine {
public:
    virtual ~GeometryEngine() = default;

    /**
     * @brief Runs the named algorithm.
     * @throws std::runtime_error when the algorithm is unknown or fails.
     */
    virtual AlgorithmOutputs runAlgorithm(const std::string& name, const AlgorithmInputs& inputs) = 0;
};

} // namespace geoflow::domain
