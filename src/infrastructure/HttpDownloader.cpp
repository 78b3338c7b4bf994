/**
 * @file HttpDownloader.cpp
 * @brief Implementation of HttpDownloader.
 */

#include "infrastructure/HttpDownloader.hpp"

#include <httplib.h>
#include <stdexcept>

#include "infrastructure/AtomicFileWriter.hpp"
#include "infrastructure/RunLog.hpp"

namespace geoflow::infrastructure {

HttpDownloader::HttpDownloader(int readTimeoutSeconds) : m_readTimeoutSeconds(readTimeoutSeconds) {}

std::pair<std::string, std::string> HttpDownloader::SplitUrl(const std::string& url) {
    const std::size_t schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos) {
        throw std::invalid_argument("URL has no scheme: " + url);
    }
    const std::string scheme = url.substr(0, schemeEnd);
    if (scheme != "http" && scheme != "https") {
        throw std::invalid_argument("Only http and https URLs are supported: " + url);
    }
    const std::size_t pathStart = url.find_first_of("/?#", schemeEnd + 3);
    if (pathStart == std::string::npos) {
        return {url, "/"};
    }
    std::string path = url.substr(pathStart);
    path = path.substr(0, path.find('#'));
    if (path.empty() || path.front() != '/') {
        path = "/" + path;
    }
    return {url.substr(0, pathStart), path};
}

void HttpDownloader::download(const std::string& url, const std::filesystem::path& destination) {
    const auto [base, path] = SplitUrl(url);

    httplib::Client cli(base);
    if (!cli.is_valid()) {
        throw std::runtime_error("Cannot create an HTTP client for " + base);
    }
    cli.set_follow_location(true);
    cli.set_read_timeout(m_readTimeoutSeconds, 0);

    RunLog::Info("HttpDownloader", "GET " + url);
    auto res = cli.Get(path);
    if (!res) {
        throw std::runtime_error("Connection failed for " + url + ": error " + std::to_string(static_cast<int>(res.error())));
    }
    if (res->status != 200) {
        throw std::runtime_error("HTTP Error " + std::to_string(res->status) + " for " + url);
    }
    AtomicFileWriter::Write(destination, res->body);
}

} // namespace geoflow::infrastructure
