/**
 * @file WorkflowCommands.hpp
 * @brief Commands that act on the workflow itself: messages, logging, properties, external programs.
 */

#pragma once

#include "application/Command.hpp"

namespace geoflow::application::commands {

/** Message(Message, CommandStatus): logs a message, optionally as a warning or failure. */
class Message : public Command {
public:
    Message();

protected:
    void runCommand(WorkflowContext& context) override;
};

/** StartLog(LogFile): (re)opens the process log file. */
class StartLog : public Command {
public:
    StartLog();

protected:
    void runCommand(WorkflowContext& context) override;
};

/**
 * SetProperty(PropertyName, PropertyType, PropertyValue | PropertyValues).
 * Exactly one of PropertyValue and PropertyValues must be given; the list form stores a list.
 */
class SetProperty : public Command {
public:
    SetProperty();

protected:
    void checkParameters(const domain::PropertyStore& properties) override;
    void runCommand(WorkflowContext& context) override;
};

/** WritePropertiesToFile(OutputFile, IncludeProperties, FileFormat, WriteMode). */
class WritePropertiesToFile : public Command {
public:
    WritePropertiesToFile();

protected:
    void runCommand(WorkflowContext& context) override;
};

/** RunProgram(CommandLine, ExpectedExitCode). */
class RunProgram : public Command {
public:
    RunProgram();

protected:
    void runCommand(WorkflowContext& context) override;
};

/** WriteCommandSummaryToFile(OutputFile): JSON report of every command's status. */
class WriteCommandSummaryToFile : public Command {
public:
    WriteCommandSummaryToFile();

protected:
    void runCommand(WorkflowContext& context) override;
};

} // namespace geoflow::application::commands
