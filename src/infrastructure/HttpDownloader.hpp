/**
 * @file HttpDownloader.hpp
 * @brief Downloader built on cpp-httplib.
 */

#pragma once

#include <string>
#include <utility>

#include "domain/Downloader.hpp"

namespace geoflow::infrastructure {

/**
 * @class HttpDownloader
 * @brief GET with redirects followed; anything but HTTP 200 is an error.
 */
class HttpDownloader : public domain::Downloader {
public:
    explicit HttpDownloader(int readTimeoutSeconds = 60);

    void download(const std::string& url, const std::filesystem::path& destination) override;

    /**
     * @brief Splits "scheme://host[:port]/path?query" into "scheme://host[:port]" and "/path?query".
     * @throws std::invalid_argument for anything that is not an http or https URL.
     */
    static std::pair<std::string, std::string> SplitUrl(const std::string& url);

private:
    int m_readTimeoutSeconds;
};

} // namespace geoflow::infrastructure
