/**
 * @file ShellProgramRunner.cpp
 * @brief Implementation of ShellProgramRunner.
 */

#include "infrastructure/ShellProgramRunner.hpp"

#include <cstdio>
#include <stdexcept>

#include <sys/wait.h>

#include "infrastructure/RunLog.hpp"

namespace geoflow::infrastructure {

int ShellProgramRunner::run(const std::string& commandLine) {
    RunLog::Info("ShellProgramRunner", "Running: " + commandLine);
    const std::string cmd = commandLine + " 2>&1";
    FILE* pipe = popen(cmd.c_str(), "r");
    if (!pipe) {
        throw std::runtime_error("popen failed to start command: " + commandLine);
    }
    char buffer[256];
    while (fgets(buffer, sizeof(buffer), pipe) != nullptr) {
        std::string line(buffer);
        // Trim newline
        if (!line.empty() && line.back() == '\n') line.pop_back();
        RunLog::Info("ShellProgramRunner", line);
    }
    const int status = pclose(pipe);
    if (status == -1) {
        throw std::runtime_error("Unable to collect exit status of: " + commandLine);
    }
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    return -1;
}

} // namespace geoflow::infrastructure
