/**
 * @file WorkflowProcessor.cpp
 * @brief Implementation of WorkflowProcessor.
 */

#include "application/WorkflowProcessor.hpp"

#include <cstdlib>
#include <fstream>
#include <stdexcept>

#include <unistd.h>

#include "application/Version.hpp"
#include "infrastructure/RunLog.hpp"

namespace geoflow::application {

namespace fs = std::filesystem;
using infrastructure::RunLog;

namespace {

constexpr const char* kInitialWorkingDir = "InitialWorkingDir";

std::string EnvOrEmpty(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

std::string HostName() {
    char buffer[256] = {};
    if (gethostname(buffer, sizeof(buffer) - 1) != 0) {
        return std::string();
    }
    return std::string(buffer);
}

} // namespace

WorkflowProcessor::WorkflowProcessor(WorkflowServices services) {
    m_context.services = std::move(services);
    m_context.commands = &m_commands;
}

void WorkflowProcessor::addCommand(std::unique_ptr<Command> command) {
    if (!command) {
        throw std::invalid_argument("Cannot add a null command to the workflow.");
    }
    m_commands.push_back(std::move(command));
}

void WorkflowProcessor::load(const std::vector<std::string>& lines) {
    for (const auto& line : lines) {
        m_commands.push_back(m_factory.create(line));
    }
}

void WorkflowProcessor::loadFile(const fs::path& file) {
    std::ifstream in(file);
    if (!in.is_open()) {
        throw std::runtime_error("Unable to open command file: " + file.string());
    }
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(line);
    }

    clearCommands();
    load(lines);

    m_workingDir = fs::absolute(file).parent_path().lexically_normal();
    m_context.properties.clear();
    RunLog::Info("WorkflowProcessor", "Read " + std::to_string(m_commands.size()) + " commands from " + file.string());
}

void WorkflowProcessor::clearCommands() {
    m_commands.clear();
}

void WorkflowProcessor::setInitialProperty(const std::string& name, domain::PropertyValue value) {
    m_initialProperties[name] = std::move(value);
}

void WorkflowProcessor::setTempDir(const fs::path& tempDir) {
    m_tempDir = tempDir;
}

RunSummary WorkflowProcessor::executeAll() {
    resetContext();

    RunSummary summary;
    const std::size_t total = m_commands.size();
    bool inCommentBlock = false;

    for (std::size_t i = 0; i < total; ++i) {
        Command& command = *m_commands[i];
        command.reset();

        if (command.opensCommentBlock()) {
            inCommentBlock = true;
        } else if (command.closesCommentBlock()) {
            inCommentBlock = false;
        } else if (inCommentBlock) {
            continue;
        }

        RunLog::Info("WorkflowProcessor", "-> Start processing command " + std::to_string(i + 1) + " of " +
                     std::to_string(total) + ": " + command.toString());
        ++summary.executed;

        auto recordFailure = [&](const std::string& message) {
            ++summary.failed;
            summary.failures.push_back(CommandFailure{i + 1, command.getName(), message});
        };

        try {
            const CommandOutcome validation = command.validate(m_context.properties);
            if (validation.isParameterError()) {
                RunLog::Warn("WorkflowProcessor", validation.message);
                recordFailure(validation.message);
                continue;
            }

            const CommandOutcome outcome = command.run(m_context);
            summary.warnings += outcome.warningCount;
            if (outcome.isRunError()) {
                RunLog::Warn("WorkflowProcessor", outcome.message);
                recordFailure(outcome.message);
            }
        } catch (const std::exception& e) {
            RunLog::Error("WorkflowProcessor", std::string("Unexpected error processing command: ") + e.what());
            command.recordUnexpectedFailure(e.what());
            summary.warnings += 1;
            recordFailure("Unexpected error processing command - unable to complete command.");
        }
    }

    RunLog::Info("WorkflowProcessor", "Processed " + std::to_string(summary.executed) + " commands, " +
                 std::to_string(summary.failed) + " with errors or warnings.");
    return summary;
}

domain::Severity WorkflowProcessor::getMaxSeverity() const {
    domain::Severity worst = domain::Severity::Unknown;
    for (const auto& command : m_commands) {
        worst = domain::MaxSeverity(worst, command->getStatus().getOverallSeverity());
    }
    return worst;
}

void WorkflowProcessor::resetContext() {
    m_context.clearEntities();
    m_context.properties.clear({domain::PropertyStore::kWorkingDir, kInitialWorkingDir});

    const fs::path workingDir = m_workingDir.value_or(fs::current_path());
    if (!m_context.properties.contains(domain::PropertyStore::kWorkingDir)) {
        m_context.properties.set(domain::PropertyStore::kWorkingDir, workingDir.generic_string());
    }
    if (!m_context.properties.contains(kInitialWorkingDir)) {
        m_context.properties.set(kInitialWorkingDir, workingDir.generic_string());
    }

    const fs::path tempDir = m_tempDir.value_or(fs::temp_directory_path());
    m_context.properties.set(domain::PropertyStore::kTempDir, tempDir.generic_string());
    m_context.properties.set("UserHomeDir", EnvOrEmpty("HOME"));
    std::string user = EnvOrEmpty("USER");
    if (user.empty()) {
        user = EnvOrEmpty("LOGNAME");
    }
    m_context.properties.set("UserName", user);
    m_context.properties.set("ComputerName", HostName());
    m_context.properties.set("ProgramVersionString", std::string(kVersionString));

    for (const auto& [name, value] : m_initialProperties) {
        if (domain::PropertyStore::IsWriteOnce(name)) {
            RunLog::Warn("WorkflowProcessor", "Initial property " + name + " is built in and was ignored.");
            continue;
        }
        m_context.properties.set(name, value);
    }
}

} // namespace geoflow::application
