/**
 * @file SystemArchiveService.hpp
 * @brief ArchiveService backed by the unzip and tar programs.
 */

#pragma once

#include <memory>

#include "domain/ArchiveService.hpp"
#include "domain/ProgramRunner.hpp"

namespace geoflow::infrastructure {

class SystemArchiveService : public domain::ArchiveService {
public:
    explicit SystemArchiveService(std::shared_ptr<domain::ProgramRunner> runner);

    void extract(const std::filesystem::path& archive, const std::filesystem::path& destination,
                 domain::ArchiveFormat format) override;

    /** @brief Command line that extracts @p archive into @p destination. */
    static std::string BuildCommandLine(const std::filesystem::path& archive,
                                        const std::filesystem::path& destination, domain::ArchiveFormat format);

private:
    std::shared_ptr<domain::ProgramRunner> m_runner;
};

} // namespace geoflow::infrastructure
