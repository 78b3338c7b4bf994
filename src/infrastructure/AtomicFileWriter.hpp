/**
 * @file AtomicFileWriter.hpp
 * @brief Atomic text file writes (temp file, then rename).
 */

#pragma once

#include <filesystem>
#include <string>

namespace geoflow::infrastructure {

/**
 * @class AtomicFileWriter
 * @brief Writes a file so readers never observe a partially written result.
 */
class AtomicFileWriter {
public:
    /**
     * @brief Replaces @p path with @p content, creating missing parent folders.
     * @throws std::runtime_error when any step fails; the temp file is removed.
     */
    static void Write(const std::filesystem::path& path, const std::string& content);

    /**
     * @brief Appends @p content to the existing file (if any) and writes atomically.
     */
    static void Append(const std::filesystem::path& path, const std::string& content);

    /** @brief Whole file as a string. @throws std::runtime_error if unreadable. */
    static std::string Read(const std::filesystem::path& path);
};

} // namespace geoflow::infrastructure
