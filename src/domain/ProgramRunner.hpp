/**
 * @file ProgramRunner.hpp
 * @brief Interface for running external programs.
 */

#pragma once

#include <string>

namespace geoflow::domain {

class ProgramRunner {
public:
    virtual ~ProgramRunner() = default;

    /**
     * @brief Runs @p commandLine and waits for it.
     * @return The program's exit code.
     * @throws std::runtime_error when the program could not be started.
     */
    virtual int run(const std::string& commandLine) = 0;
};

} // namespace geoflow::domain
