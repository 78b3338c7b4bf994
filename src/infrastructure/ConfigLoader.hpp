/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading the GeoFlow configuration (settings.json).
 *
 * Keeps JSON parsing of settings in one place; the rest of the program
 * only sees the GeoFlowConfig struct.
 */

#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>

#include "domain/PropertyStore.hpp"

namespace geoflow::infrastructure {

/**
 * @struct GeoFlowConfig
 * @brief Settings read from settings.json. Every field has a usable default.
 */
struct GeoFlowConfig {
    std::optional<std::filesystem::path> logFile;
    std::optional<std::filesystem::path> tempDir;
    std::map<std::string, domain::PropertyValue> properties;
    std::string ogr2ogrProgram = "ogr2ogr";
    int httpTimeoutSeconds = 60;
};

class ConfigLoader {
public:
    /**
     * @brief Default settings path: $XDG_CONFIG_HOME/geoflow/settings.json (or ~/.config/...).
     */
    static std::filesystem::path DefaultConfigPath();

    /**
     * @brief Loads settings from @p explicitPath or, when absent, the default path.
     *
     * A missing default file yields defaults. A malformed file is reported
     * and yields defaults.
     * @throws std::runtime_error if @p explicitPath is given but does not exist.
     */
    static GeoFlowConfig Load(const std::optional<std::filesystem::path>& explicitPath);

    /** @brief Parses settings from JSON text. Unknown keys are ignored. */
    static GeoFlowConfig Parse(const std::string& jsonText);
};

} // namespace geoflow::infrastructure
