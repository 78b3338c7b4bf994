/**
 * @file SystemArchiveService.cpp
 * @brief Implementation of SystemArchiveService.
 */

#include "infrastructure/SystemArchiveService.hpp"

#include <stdexcept>

#include "infrastructure/PathUtils.hpp"

namespace geoflow::infrastructure {

SystemArchiveService::SystemArchiveService(std::shared_ptr<domain::ProgramRunner> runner)
    : m_runner(std::move(runner)) {
    if (!m_runner) {
        throw std::invalid_argument("SystemArchiveService needs a program runner.");
    }
}

void SystemArchiveService::extract(const std::filesystem::path& archive, const std::filesystem::path& destination,
                                   domain::ArchiveFormat format) {
    const int exitCode = m_runner->run(BuildCommandLine(archive, destination, format));
    if (exitCode != 0) {
        throw std::runtime_error("Extracting " + archive.string() + " failed with exit code " +
                                 std::to_string(exitCode) + ".");
    }
}

std::string SystemArchiveService::BuildCommandLine(const std::filesystem::path& archive,
                                                   const std::filesystem::path& destination,
                                                   domain::ArchiveFormat format) {
    if (format == domain::ArchiveFormat::Zip) {
        return "unzip -o -q " + PathUtils::ShellQuote(archive.string()) + " -d " +
               PathUtils::ShellQuote(destination.string());
    }
    return "tar -xf " + PathUtils::ShellQuote(archive.string()) + " -C " + PathUtils::ShellQuote(destination.string());
}

} // namespace geoflow::infrastructure
