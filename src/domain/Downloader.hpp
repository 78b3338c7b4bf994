/**
 * @file Downloader.hpp
 * @brief Interface for network retrieval.
 */

#pragma once

#include <filesystem>
#include <string>

namespace geoflow::domain {

class Downloader {
public:
    virtual ~Downloader() = default;

    /**
     * @brief Saves the resource at @p url to @p destination.
     * @throws std::runtime_error on connection or HTTP errors.
     */
    virtual void download(const std::string& url, const std::filesystem::path& destination) = 0;
};

} // namespace geoflow::domain
