// PathUtils Header
#pragma once
#include <string>
#include <filesystem>

namespace geoflow::infrastructure {

class PathUtils {
public:
    static std::filesystem::path GetConfigHome();
    static std::filesystem::path GetHomeDir();

    /** @brief Per-process scratch folder under the system temp directory; created on demand. */
    static std::filesystem::path GetTempDir();

    /** @brief Unique file name in @p folder: geoflow_<timestamp>_<counter><suffix>. */
    static std::filesystem::path MakeTempFilePath(const std::filesystem::path& folder, const std::string& suffix);

    /** @brief Single-quotes @p text for /bin/sh. */
    static std::string ShellQuote(const std::string& text);
};

} // namespace geoflow::infrastructure
