/**
 * @file WorkflowCommands.cpp
 * @brief Implementation of the workflow-level commands.
 */

#include "application/commands/WorkflowCommands.hpp"

#include <nlohmann/json.hpp>

#include "application/commands/CommandUtil.hpp"
#include "infrastructure/AtomicFileWriter.hpp"
#include "infrastructure/RunLog.hpp"

namespace geoflow::application::commands {

using domain::Severity;
using infrastructure::AtomicFileWriter;
using infrastructure::RunLog;

namespace {

nlohmann::json PropertyToJson(const domain::PropertyValue& value) {
    if (const auto* text = std::get_if<std::string>(&value)) return *text;
    if (const auto* flag = std::get_if<bool>(&value)) return *flag;
    if (const auto* number = std::get_if<std::int64_t>(&value)) return *number;
    if (const auto* real = std::get_if<double>(&value)) return *real;
    if (const auto* path = std::get_if<std::filesystem::path>(&value)) return path->generic_string();
    if (const auto* list = std::get_if<std::vector<std::string>>(&value)) return *list;
    return nullptr;
}

bool IsTextual(const domain::PropertyValue& value) {
    return std::holds_alternative<std::string>(value) || std::holds_alternative<std::filesystem::path>(value);
}

} // namespace

// --- Message ---

Message::Message()
    : Command("Message", {
          {"Message", ParameterType::String, true, {}, "Message text; may contain ${Property} references."},
          {"CommandStatus", ParameterType::Choice, false, {"Success", "Warning", "Failure"}, "Status to record."}
      }) {}

void Message::runCommand(WorkflowContext& context) {
    const std::string text = resolveParameter(context, "Message");
    const std::string status = stringParameter("CommandStatus", "Success");

    if (status == "Warning") {
        logRun(Severity::Warning, text, "See the message text.");
    } else if (status == "Failure") {
        logRun(Severity::Failure, text, "See the message text.");
    } else {
        RunLog::Info(getName(), text);
    }
}

// --- StartLog ---

StartLog::StartLog()
    : Command("StartLog", {
          {"LogFile", ParameterType::String, true, {}, "Log file to open; replaces the current log file."}
      }) {}

void StartLog::runCommand(WorkflowContext& context) {
    const std::string logFile = resolvePathParameter(context, "LogFile");
    require(context, checks::ParentFolderExists{logFile}, FailPolicy::Fail);
    if (isBlocked()) return;

    RunLog::OpenFile(logFile);
}

// --- SetProperty ---

SetProperty::SetProperty()
    : Command("SetProperty", {
          {"PropertyName", ParameterType::String, true, {}, "Property name."},
          {"PropertyType", ParameterType::Choice, false, PropertyTypeChoices(), "Type of the value (default str)."},
          {"PropertyValue", ParameterType::String, false, {}, "Single value."},
          {"PropertyValues", ParameterType::List, false, {}, "Comma-separated list of values."}
      }) {}

void SetProperty::checkParameters(const domain::PropertyStore&) {
    const bool single = hasParameter("PropertyValue");
    const bool list = hasParameter("PropertyValues");
    if (single == list) {
        logInitFailure("Exactly one of PropertyValue and PropertyValues must be specified.",
                       "Specify either PropertyValue or PropertyValues.");
    }
}

void SetProperty::runCommand(WorkflowContext& context) {
    const std::string name = resolveParameter(context, "PropertyName");
    const std::string type = stringParameter("PropertyType", "str");

    domain::PropertyValue value;
    if (hasParameter("PropertyValues")) {
        value = listParameter("PropertyValues");
    } else {
        const std::string text = resolveParameter(context, "PropertyValue");
        const auto parsed = ParseTypedValue(type, text);
        if (!parsed) {
            blockRun(Severity::Failure, "PropertyValue \"" + text + "\" is not a valid " + type + " value.",
                     "Specify a value that matches PropertyType.");
            return;
        }
        value = *parsed;
    }

    try {
        context.properties.set(name, std::move(value));
    } catch (const domain::ImmutablePropertyError& e) {
        blockRun(Severity::Failure, e.what(), "Use a different property name.");
    }
}

// --- WritePropertiesToFile ---

WritePropertiesToFile::WritePropertiesToFile()
    : Command("WritePropertiesToFile", {
          {"OutputFile", ParameterType::String, true, {}, "File to write."},
          {"IncludeProperties", ParameterType::List, false, {}, "Glob patterns of properties to write (default all)."},
          {"FileFormat", ParameterType::Choice, false, {"NameValue", "JSON"}, "Output format (default NameValue)."},
          {"WriteMode", ParameterType::Choice, false, {"Overwrite", "Append"}, "Overwrite (default) or append."}
      }) {}

void WritePropertiesToFile::runCommand(WorkflowContext& context) {
    const std::string outputFile = resolvePathParameter(context, "OutputFile");
    std::vector<std::string> patterns = listParameter("IncludeProperties");
    if (patterns.empty()) {
        patterns.push_back("*");
    }
    const std::string format = stringParameter("FileFormat", "NameValue");
    const bool append = stringParameter("WriteMode", "Overwrite") == "Append";

    require(context, checks::ParentFolderExists{outputFile}, FailPolicy::Fail);
    if (isBlocked()) return;

    nlohmann::json json = nlohmann::json::object();
    std::string text;
    for (const auto& name : context.properties.names()) {
        bool included = false;
        for (const auto& pattern : patterns) {
            if (GlobMatch(pattern, name)) {
                included = true;
                break;
            }
        }
        if (!included) continue;

        const domain::PropertyValue& value = context.properties.get(name);
        if (format == "JSON") {
            json[name] = PropertyToJson(value);
        } else if (IsTextual(value)) {
            text += name + "=\"" + domain::PropertyValueToString(value) + "\"\n";
        } else {
            text += name + "=" + domain::PropertyValueToString(value) + "\n";
        }
    }
    if (format == "JSON") {
        text = json.dump(4) + "\n";
    }

    if (append) {
        AtomicFileWriter::Append(outputFile, text);
    } else {
        AtomicFileWriter::Write(outputFile, text);
    }
}

// --- RunProgram ---

RunProgram::RunProgram()
    : Command("RunProgram", {
          {"CommandLine", ParameterType::String, true, {}, "Program and arguments, run through the shell."},
          {"ExpectedExitCode", ParameterType::Int, false, {}, "Exit code that indicates success (default 0)."}
      }) {}

void RunProgram::runCommand(WorkflowContext& context) {
    const std::string commandLine = resolveParameter(context, "CommandLine");
    const std::int64_t expected = intParameter("ExpectedExitCode", 0);

    domain::ProgramRunner& runner = RequireService(context.services.programRunner, "program runner");
    const int exitCode = runner.run(commandLine);
    if (exitCode != expected) {
        logRun(Severity::Failure,
               "Program exited with code " + std::to_string(exitCode) + " (expected " + std::to_string(expected) + ").",
               "Check the program output in the log file.");
    }
}

// --- WriteCommandSummaryToFile ---

WriteCommandSummaryToFile::WriteCommandSummaryToFile()
    : Command("WriteCommandSummaryToFile", {
          {"OutputFile", ParameterType::String, true, {}, "JSON file to write."}
      }) {}

void WriteCommandSummaryToFile::runCommand(WorkflowContext& context) {
    const std::string outputFile = resolvePathParameter(context, "OutputFile");
    require(context, checks::ParentFolderExists{outputFile}, FailPolicy::Fail);
    if (isBlocked()) return;

    nlohmann::json summary = nlohmann::json::array();
    if (context.commands) {
        std::size_t index = 0;
        for (const auto& command : *context.commands) {
            ++index;
            const domain::CommandStatus& status = command->getStatus();
            nlohmann::json entry = {
                {"index", index},
                {"command", command->toString()},
                {"state", CommandStateToString(command->getState())},
                {"severity", domain::SeverityToString(status.getOverallSeverity())}
            };
            nlohmann::json phases = nlohmann::json::object();
            for (domain::Phase phase : domain::kAllPhases) {
                nlohmann::json records = nlohmann::json::array();
                for (const auto& record : status.getLog(phase)) {
                    records.push_back({
                        {"severity", domain::SeverityToString(record.getSeverity())},
                        {"message", record.getMessage()},
                        {"recommendation", record.getRecommendation()}
                    });
                }
                phases[domain::PhaseToString(phase)] = {
                    {"severity", domain::SeverityToString(status.getPhaseSeverity(phase))},
                    {"records", records}
                };
            }
            entry["phases"] = phases;
            summary.push_back(entry);
        }
    }

    AtomicFileWriter::Write(outputFile, summary.dump(4) + "\n");
}

} // namespace geoflow::application::commands
