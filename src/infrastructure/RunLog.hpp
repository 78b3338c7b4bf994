/**
 * @file RunLog.hpp
 * @brief Process log: "[Component] message" lines to the console and an optional log file.
 */

#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace geoflow::infrastructure {

/**
 * @class RunLog
 * @brief Static logging helpers shared by every layer above the domain.
 *
 * Info goes to std::cout, Warn and Error to std::cerr. When a log file is
 * open every line is also appended to it with its level.
 */
class RunLog {
public:
    static void Info(const std::string& component, const std::string& message);
    static void Warn(const std::string& component, const std::string& message);
    static void Error(const std::string& component, const std::string& message);

    /**
     * @brief Opens (truncates) @p path as the log file, closing any previous one.
     * @throws std::runtime_error if the file cannot be opened.
     */
    static void OpenFile(const std::filesystem::path& path);

    static void CloseFile();

    static std::optional<std::filesystem::path> CurrentFile();

private:
    static void Write(const char* level, const std::string& component, const std::string& message);
};

} // namespace geoflow::infrastructure
