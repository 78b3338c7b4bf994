/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/PathUtils.hpp"
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace geoflow::infrastructure {

namespace fs = std::filesystem;

std::filesystem::path ConfigLoader::DefaultConfigPath() {
    return PathUtils::GetConfigHome() / "geoflow" / "settings.json";
}

GeoFlowConfig ConfigLoader::Load(const std::optional<fs::path>& explicitPath) {
    const fs::path configPath = explicitPath.value_or(DefaultConfigPath());
    if (!fs::exists(configPath)) {
        if (explicitPath) {
            throw std::runtime_error("Config file not found: " + configPath.string());
        }
        return GeoFlowConfig{};
    }

    try {
        std::ifstream f(configPath);
        std::stringstream buffer;
        buffer << f.rdbuf();
        return Parse(buffer.str());
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error reading " << configPath.string() << ": " << e.what() << std::endl;
    }
    return GeoFlowConfig{};
}

GeoFlowConfig ConfigLoader::Parse(const std::string& jsonText) {
    GeoFlowConfig config;
    const nlohmann::json j = nlohmann::json::parse(jsonText);

    if (j.contains("log_file") && j["log_file"].is_string()) {
        config.logFile = fs::path(j["log_file"].get<std::string>());
    }
    if (j.contains("temp_dir") && j["temp_dir"].is_string()) {
        config.tempDir = fs::path(j["temp_dir"].get<std::string>());
    }
    if (j.contains("ogr2ogr") && j["ogr2ogr"].is_string()) {
        config.ogr2ogrProgram = j["ogr2ogr"].get<std::string>();
    }
    if (j.contains("http_timeout_seconds") && j["http_timeout_seconds"].is_number_integer()) {
        config.httpTimeoutSeconds = j["http_timeout_seconds"].get<int>();
    }

    if (j.contains("properties") && j["properties"].is_object()) {
        for (const auto& item : j["properties"].items()) {
            const std::string& name = item.key();
            const nlohmann::json& value = item.value();
            if (value.is_string()) {
                config.properties[name] = value.get<std::string>();
            } else if (value.is_boolean()) {
                config.properties[name] = value.get<bool>();
            } else if (value.is_number_integer()) {
                config.properties[name] = value.get<std::int64_t>();
            } else if (value.is_number()) {
                config.properties[name] = value.get<double>();
            } else {
                std::cerr << "[ConfigLoader] Ignoring property " << name << ": unsupported value type." << std::endl;
            }
        }
    }
    return config;
}

} // namespace geoflow::infrastructure
