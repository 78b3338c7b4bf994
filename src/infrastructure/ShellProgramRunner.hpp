/**
 * @file ShellProgramRunner.hpp
 * @brief ProgramRunner that runs command lines through /bin/sh.
 */

#pragma once

#include "domain/ProgramRunner.hpp"

namespace geoflow::infrastructure {

/**
 * @class ShellProgramRunner
 * @brief Runs a command line with popen, forwarding its combined output to the run log.
 */
class ShellProgramRunner : public domain::ProgramRunner {
public:
    int run(const std::string& commandLine) override;
};

} // namespace geoflow::infrastructure
