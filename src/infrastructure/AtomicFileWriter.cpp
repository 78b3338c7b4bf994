/**
 * @file AtomicFileWriter.cpp
 * @brief Implementation of AtomicFileWriter.
 */

#include "infrastructure/AtomicFileWriter.hpp"

#include <chrono>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace geoflow::infrastructure {

namespace fs = std::filesystem;

void AtomicFileWriter::Write(const fs::path& path, const std::string& content) {
    // Unique temp path per write: <file>.<timestamp>.tmp
    const auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path tempPath = path;
    tempPath += "." + std::to_string(timestamp) + ".tmp";

    if (path.has_parent_path() && !fs::exists(path.parent_path())) {
        fs::create_directories(path.parent_path());
    }

    {
        std::ofstream ofs(tempPath, std::ios::out | std::ios::binary | std::ios::trunc);
        if (!ofs.is_open()) {
            throw std::runtime_error("Failed to open temp file: " + tempPath.string());
        }
        ofs << content;
        ofs.flush();
        if (ofs.fail()) {
            ofs.close();
            std::error_code ec;
            fs::remove(tempPath, ec);
            throw std::runtime_error("Write failed: " + tempPath.string());
        }
    }

    try {
        fs::rename(tempPath, path);
    } catch (const fs::filesystem_error& e) {
        std::error_code ec;
        fs::remove(tempPath, ec);
        std::cerr << "[AtomicFileWriter] Rename failed: " << e.what() << std::endl;
        throw std::runtime_error("Unable to replace " + path.string() + ": " + e.what());
    }
}

void AtomicFileWriter::Append(const fs::path& path, const std::string& content) {
    std::string existing;
    if (fs::exists(path)) {
        existing = Read(path);
    }
    Write(path, existing + content);
}

std::string AtomicFileWriter::Read(const fs::path& path) {
    std::ifstream ifs(path, std::ios::in | std::ios::binary);
    if (!ifs.is_open()) {
        throw std::runtime_error("Unable to read file: " + path.string());
    }
    std::ostringstream buffer;
    buffer << ifs.rdbuf();
    return buffer.str();
}

} // namespace geoflow::infrastructure
