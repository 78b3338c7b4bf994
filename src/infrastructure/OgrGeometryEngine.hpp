/**
 * @file OgrGeometryEngine.hpp
 * @brief GeometryEngine that delegates to GDAL's ogr2ogr program.
 */

#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include "domain/GeometryEngine.hpp"
#include "domain/ProgramRunner.hpp"
#include "infrastructure/GeoJsonLayerCodec.hpp"

namespace geoflow::infrastructure {

/**
 * @class OgrGeometryEngine
 * @brief Stages input layers as GeoJSON in a work folder, runs ogr2ogr and reads the result back.
 *
 * Algorithms: "clip" (two layers), "simplify" (parameter "tolerance"),
 * "reproject" (parameter "crs").
 */
class OgrGeometryEngine : public domain::GeometryEngine {
public:
    OgrGeometryEngine(std::shared_ptr<domain::ProgramRunner> runner, std::filesystem::path workDir,
                      std::string program = "ogr2ogr");

    domain::AlgorithmOutputs runAlgorithm(const std::string& name, const domain::AlgorithmInputs& inputs) override;

    /**
     * @brief ogr2ogr arguments specific to @p name (after the output and input paths).
     * @param secondInput Staged second layer, used by "clip".
     * @throws std::invalid_argument for an unknown algorithm or missing parameter.
     */
    static std::string AlgorithmArguments(const std::string& name, const domain::AlgorithmInputs& inputs,
                                          const std::filesystem::path& secondInput);

private:
    std::shared_ptr<domain::ProgramRunner> m_runner;
    std::filesystem::path m_workDir;
    std::string m_program;
    GeoJsonLayerCodec m_codec;
};

} // namespace geoflow::infrastructure
