/**
 * @file ArchiveService.hpp
 * @brief Interface for extracting archives.
 */

#pragma once

#include <filesystem>
#include <string>

namespace geoflow::domain {

enum class ArchiveFormat { Zip, Tar };

class ArchiveService {
public:
    virtual ~ArchiveService() = default;

    /** @throws std::runtime_error when extraction fails. */
    virtual void extract(const std::filesystem::path& archive, const std::filesystem::path& destination,
                         ArchiveFormat format) = 0;
};

} // namespace geoflow::domain
