/**
 * @file GeoFlowApp.hpp
 * @brief Command-line front end for GeoFlow.
 */

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "application/WorkflowContext.hpp"
#include "infrastructure/ConfigLoader.hpp"

namespace geoflow::app {

/**
 * @struct AppOptions
 * @brief Parsed command-line arguments.
 */
struct AppOptions {
    std::optional<std::filesystem::path> commandFile;
    std::optional<std::filesystem::path> configFile;
    std::vector<std::pair<std::string, std::string>> properties; ///< -p Name=Value, in order.
    bool showVersion = false;
    bool showHelp = false;
};

/**
 * @class GeoFlowApp
 * @brief Loads settings, wires the infrastructure services and runs one command file.
 */
class GeoFlowApp {
public:
    /**
     * @brief Runs the application.
     * @return 0 when every command succeeded, 1 when any command failed, 2 on usage errors.
     */
    int Run(int argc, char** argv);

    /**
     * @brief Parses @p args (without the program name).
     * @throws std::invalid_argument on an unknown option or a missing value.
     */
    static AppOptions ParseArguments(const std::vector<std::string>& args);

    static std::string Usage();

private:
    /**
     * @brief Builds the production adapters (GeoJSON, delimited text, ogr2ogr, unzip/tar, HTTP).
     */
    static application::WorkflowServices BuildServices(const infrastructure::GeoFlowConfig& config,
                                                       const std::filesystem::path& tempDir);

    int Execute(const AppOptions& options);
};

} // namespace geoflow::app
