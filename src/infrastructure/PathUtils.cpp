#include "infrastructure/PathUtils.hpp"
#include <chrono>
#include <cstdlib>
#include <filesystem>

#include <unistd.h>

namespace geoflow::infrastructure {

namespace fs = std::filesystem;

fs::path PathUtils::GetConfigHome() {
    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfigHome && *xdgConfigHome) {
        return fs::path(xdgConfigHome);
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home) / ".config";
    }
    return fs::current_path();
}

fs::path PathUtils::GetHomeDir() {
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home);
    }
    return fs::current_path(); // Fallback
}

fs::path PathUtils::GetTempDir() {
    fs::path base = fs::temp_directory_path() / ("geoflow-" + std::to_string(::getpid()));
    std::error_code ec;
    fs::create_directories(base, ec);
    if (ec) {
        // Caller will fail on first use; fall back to the shared temp folder
        return fs::temp_directory_path();
    }
    return base;
}

fs::path PathUtils::MakeTempFilePath(const fs::path& folder, const std::string& suffix) {
    static unsigned long counter = 0;
    const auto now = std::chrono::high_resolution_clock::now().time_since_epoch().count();
    return folder / ("geoflow_" + std::to_string(now) + "_" + std::to_string(++counter) + suffix);
}

std::string PathUtils::ShellQuote(const std::string& text) {
    std::string out = "'";
    for (char c : text) {
        if (c == '\'') {
            out += "'\\''";
        } else {
            out += c;
        }
    }
    return out + "'";
}

} // namespace geoflow::infrastructure
