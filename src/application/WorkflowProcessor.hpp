/**
 * @file WorkflowProcessor.hpp
 * @brief Holds the ordered command list and runs it against one shared context.
 */

#pragma once

#include <cstddef>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "application/Command.hpp"
#include "application/CommandFactory.hpp"
#include "application/WorkflowContext.hpp"

namespace geoflow::application {

/**
 * @struct CommandFailure
 * @brief A parameter or run error recorded against one command.
 */
struct CommandFailure {
    std::size_t index = 0;  ///< 1-based position in the command list.
    std::string commandName;
    std::string message;
};

/**
 * @struct RunSummary
 * @brief Result of WorkflowProcessor::executeAll().
 */
struct RunSummary {
    int executed = 0;
    int failed = 0;
    int warnings = 0;  ///< RUN warning and failure records over all commands.
    std::vector<CommandFailure> failures;

    bool succeeded() const { return failed == 0; }
};

/**
 * @class WorkflowProcessor
 * @brief Runs commands strictly in list order; one command's failure never stops the loop.
 *
 * Each executeAll() starts from empty registries and a fresh set of
 * built-in and initial properties. WorkingDir and InitialWorkingDir survive
 * between runs.
 */
class WorkflowProcessor {
public:
    explicit WorkflowProcessor(WorkflowServices services = {});

    WorkflowProcessor(const WorkflowProcessor&) = delete;
    WorkflowProcessor& operator=(const WorkflowProcessor&) = delete;

    CommandFactory& getFactory() { return m_factory; }

    void addCommand(std::unique_ptr<Command> command);

    /** @brief Appends one command per line. */
    void load(const std::vector<std::string>& lines);

    /**
     * @brief Replaces the command list with the lines of @p file.
     * WorkingDir becomes the file's folder.
     * @throws std::runtime_error if the file cannot be read.
     */
    void loadFile(const std::filesystem::path& file);

    void clearCommands();

    /** @brief Property applied at the start of every run (command line, config file). */
    void setInitialProperty(const std::string& name, domain::PropertyValue value);

    /** @brief Overrides the TempDir built-in. */
    void setTempDir(const std::filesystem::path& tempDir);

    RunSummary executeAll();

    const std::vector<std::unique_ptr<Command>>& getCommands() const { return m_commands; }
    WorkflowContext& getContext() { return m_context; }
    const WorkflowContext& getContext() const { return m_context; }

    /** @brief Worst overall severity over every command of the last run. */
    domain::Severity getMaxSeverity() const;

private:
    void resetContext();

    WorkflowContext m_context;
    CommandFactory m_factory;
    std::vector<std::unique_ptr<Command>> m_commands;
    std::map<std::string, domain::PropertyValue> m_initialProperties;
    std::optional<std::filesystem::path> m_workingDir;
    std::optional<std::filesystem::path> m_tempDir;
};

} // namespace geoflow::application
