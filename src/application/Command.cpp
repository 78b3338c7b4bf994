/**
 * @file Command.cpp
 * @brief Implementation of the command lifecycle.
 */

#include "application/Command.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <stdexcept>

#include "application/CommandParser.hpp"
#include "application/Validator.hpp"
#include "domain/PathFormatter.hpp"
#include "infrastructure/RunLog.hpp"

namespace geoflow::application {

using domain::Phase;
using domain::Severity;
using infrastructure::RunLog;

namespace {

std::string ToLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::string TrimCopy(const std::string& text) {
    const auto first = text.find_first_not_of(" \t");
    if (first == std::string::npos) return std::string();
    const auto last = text.find_last_not_of(" \t");
    return text.substr(first, last - first + 1);
}

std::vector<std::string> SplitList(const std::string& text) {
    std::vector<std::string> items;
    std::size_t start = 0;
    while (start <= text.size()) {
        std::size_t comma = text.find(',', start);
        if (comma == std::string::npos) comma = text.size();
        std::string item = TrimCopy(text.substr(start, comma - start));
        if (!item.empty()) items.push_back(item);
        start = comma + 1;
    }
    return items;
}

std::string JoinNames(const std::vector<std::string>& names) {
    std::string out;
    for (std::size_t i = 0; i < names.size(); ++i) {
        if (i > 0) out += ", ";
        out += names[i];
    }
    return out;
}

} // namespace

Command::Command(std::string name, std::vector<ParameterMetadata> metadata)
    : m_name(std::move(name)), m_metadata(std::move(metadata)) {}

void Command::initialize(const std::string& commandText) {
    m_parameters.clear();
    m_syntaxError.reset();
    try {
        ParsedCommand parsed = CommandParser::Parse(commandText);
        m_indent = parsed.indent;
        m_parameters = std::move(parsed.parameters);
    } catch (const CommandSyntaxError& e) {
        m_syntaxError = e.what();
    }
}

void Command::setParameter(const std::string& name, const std::string& value) {
    m_parameters[name] = value;
}

std::string Command::toString() const {
    std::vector<std::string> order;
    order.reserve(m_metadata.size());
    for (const auto& meta : m_metadata) {
        order.push_back(meta.name);
    }
    return CommandParser::Render(m_name, m_parameters, order, m_indent);
}

void Command::reset() {
    m_status.clearAll();
    m_typed.clear();
    m_state = CommandState::Created;
    m_warningCount = 0;
    m_blocked = false;
}

CommandOutcome Command::validate(const domain::PropertyStore& properties) {
    if (m_state != CommandState::Created) {
        throw std::logic_error("Command " + m_name + " cannot be validated from state " +
                               CommandStateToString(m_state) + ".");
    }
    m_state = CommandState::Validating;
    m_status.clearLog(Phase::Initialization);
    m_typed.clear();

    if (m_syntaxError) {
        logInitFailure(*m_syntaxError, "Correct the command syntax: " + m_name + "(Name=\"Value\",...).");
    } else {
        for (const auto& [name, value] : m_parameters) {
            if (!findMetadata(name)) {
                logInitFailure("\"" + name + "\" is not a valid parameter.",
                               "Remove the parameter or correct its name.");
            }
        }
        for (const auto& meta : m_metadata) {
            if (meta.required && !hasParameter(meta.name)) {
                logInitFailure("Required parameter " + meta.name + " is not specified.",
                               "Specify the " + meta.name + " parameter.");
            }
        }
        coerceParameters(properties);
        if (m_status.getPhaseSeverity(Phase::Initialization) != Severity::Failure) {
            checkParameters(properties);
        }
    }

    CommandOutcome outcome;
    if (m_status.getPhaseSeverity(Phase::Initialization) == Severity::Failure) {
        m_state = CommandState::ValidationFailed;
        const std::size_t count = m_status.getLogCount(Phase::Initialization, Severity::Failure);
        outcome.message = "Parameter validation failed for " + m_name + " (" + std::to_string(count) +
                          (count == 1 ? " problem)." : " problems).");
    } else {
        m_status.refreshPhaseSeverity(Phase::Initialization, Severity::Success);
        m_state = CommandState::Ready;
    }
    outcome.state = m_state;
    return outcome;
}

CommandOutcome Command::run(WorkflowContext& context) {
    if (m_state != CommandState::Ready) {
        throw std::logic_error("Command " + m_name + " cannot run from state " +
                               CommandStateToString(m_state) + ".");
    }
    m_state = CommandState::Running;
    m_status.clearLog(Phase::Run);
    m_warningCount = 0;
    m_blocked = false;

    try {
        runCommand(context);
    } catch (const std::exception& e) {
        RunLog::Error(m_name, e.what());
        logRun(Severity::Failure, "Unexpected error running " + m_name + ".", "Check the log file for details.");
    }

    m_state = m_blocked ? CommandState::Skipped : CommandState::Completed;
    m_status.refreshPhaseSeverity(Phase::Run, Severity::Success);

    CommandOutcome outcome;
    outcome.state = m_state;
    outcome.warningCount = m_warningCount;
    if (m_warningCount > 0) {
        outcome.message = "There were " + std::to_string(m_warningCount) + " warnings processing the command.";
    }
    return outcome;
}

void Command::recordUnexpectedFailure(const std::string& detail) {
    RunLog::Error(m_name, detail);
    m_status.addLog(domain::LogRecord(Phase::Run, Severity::Failure,
                                      "Unexpected error processing command - unable to complete command.",
                                      "See the log file for details."));
    ++m_warningCount;
    if (m_state == CommandState::Validating) {
        m_state = CommandState::ValidationFailed;
    } else if (m_state == CommandState::Running) {
        m_state = CommandState::Skipped;
    }
}

void Command::checkParameters(const domain::PropertyStore&) {}

void Command::logInitFailure(const std::string& message, const std::string& recommendation) {
    RunLog::Warn(m_name, message);
    m_status.addLog(domain::LogRecord(Phase::Initialization, Severity::Failure, message, recommendation));
}

bool Command::hasParameter(const std::string& name) const {
    auto it = m_parameters.find(name);
    return it != m_parameters.end() && !it->second.empty();
}

std::string Command::stringParameter(const std::string& name, const std::string& fallback) const {
    if (const ParameterValue* value = typedValue(name)) {
        if (const auto* text = std::get_if<std::string>(value)) {
            return *text;
        }
    }
    return hasParameter(name) ? m_parameters.at(name) : fallback;
}

bool Command::boolParameter(const std::string& name, bool fallback) const {
    if (const ParameterValue* value = typedValue(name)) {
        if (const auto* flag = std::get_if<bool>(value)) {
            return *flag;
        }
    }
    return fallback;
}

std::int64_t Command::intParameter(const std::string& name, std::int64_t fallback) const {
    if (const ParameterValue* value = typedValue(name)) {
        if (const auto* number = std::get_if<std::int64_t>(value)) {
            return *number;
        }
    }
    return fallback;
}

std::vector<std::string> Command::listParameter(const std::string& name) const {
    if (const ParameterValue* value = typedValue(name)) {
        if (const auto* list = std::get_if<std::vector<std::string>>(value)) {
            return *list;
        }
    }
    return {};
}

domain::CollisionPolicy Command::collisionPolicy(const std::string& name) const {
    return domain::CollisionPolicyFromString(stringParameter(name, "Replace")).value_or(domain::CollisionPolicy::Replace);
}

std::string Command::resolveParameter(WorkflowContext& context, const std::string& name, const std::string& fallback) {
    const std::string raw = stringParameter(name, fallback);
    const domain::ExpansionResult expanded = context.properties.expand(raw);
    for (const auto& token : expanded.unresolved) {
        logRun(Severity::Warning,
               name + " references property ${" + token + "} which is not defined; the text was left unchanged.",
               "Define the property before this command or correct its name.");
    }
    return expanded.value;
}

std::string Command::resolvePath(const WorkflowContext& context, const std::string& path) const {
    if (path.empty()) {
        return path;
    }
    std::filesystem::path p(path);
    if (p.is_relative()) {
        const auto workingDir = context.properties.find(domain::PropertyStore::kWorkingDir);
        const std::filesystem::path base = workingDir
            ? std::filesystem::path(domain::PropertyValueToString(*workingDir))
            : std::filesystem::current_path();
        p = base / p;
    }
    return p.lexically_normal().generic_string();
}

std::string Command::resolvePathParameter(WorkflowContext& context, const std::string& name, const std::string& fallback) {
    return resolvePath(context, resolveParameter(context, name, fallback));
}

std::string Command::applyFormatter(const std::string& pattern, const std::string& absolutePath) {
    try {
        return domain::FormatPath(absolutePath, pattern);
    } catch (const domain::UnknownFormatterError& e) {
        blockRun(Severity::Failure, e.what(), "Use one of the formatter codes %F, %f, %P, %p, %E.");
        return std::string();
    }
}

bool Command::require(const WorkflowContext& context, const CheckCondition& condition, FailPolicy policy) {
    const CheckResult result = Validator(context).evaluate(condition, policy);
    if (result.passed) {
        return true;
    }
    logRun(result.severity(), result.message, result.recommendation);
    if (result.blocksRun()) {
        m_blocked = true;
    }
    return false;
}

void Command::logRun(Severity severity, const std::string& message, const std::string& recommendation) {
    if (severity == Severity::Warning) {
        RunLog::Warn(m_name, message);
        ++m_warningCount;
    } else if (severity == Severity::Failure) {
        RunLog::Error(m_name, message);
        ++m_warningCount;
    } else {
        RunLog::Info(m_name, message);
    }
    m_status.addLog(domain::LogRecord(Phase::Run, severity, message, recommendation));
}

void Command::blockRun(Severity severity, const std::string& message, const std::string& recommendation) {
    logRun(severity, message, recommendation);
    m_blocked = true;
}

bool Command::checkOutputId(const WorkflowContext& context, EntityKind kind, const std::string& id,
                            domain::CollisionPolicy policy) {
    if (id.empty()) {
        const std::string label = EntityKindToString(kind);
        blockRun(Severity::Failure, "The output " + label + "ID is empty.",
                 "Specify a non-empty " + label + "ID or check the properties and formatter codes it uses.");
        return false;
    }
    if (!context.exists(kind, id)) {
        return true;
    }
    const std::string label = EntityKindToString(kind);
    const std::string message = "The " + label + "ID (" + id + ") already exists.";
    switch (policy) {
        case domain::CollisionPolicy::Replace:
        case domain::CollisionPolicy::ReplaceAndWarn:
            return true;
        case domain::CollisionPolicy::Warn:
            blockRun(Severity::Warning, message + " The command was not run.",
                     "Specify a new " + label + "ID or change the If" + label + "IDExists parameter.");
            return false;
        case domain::CollisionPolicy::Fail:
            blockRun(Severity::Failure, message,
                     "Specify a new " + label + "ID or change the If" + label + "IDExists parameter.");
            return false;
    }
    return true;
}

void Command::reportRegistration(EntityKind kind, const std::string& id, const domain::RegisterOutcome& outcome) {
    const std::string label = EntityKindToString(kind);
    if (outcome.failed) {
        logRun(Severity::Failure, "The " + label + "ID (" + id + ") already exists.",
               "Specify a new " + label + "ID or change the If" + label + "IDExists parameter.");
    } else if (outcome.warned && outcome.inserted) {
        logRun(Severity::Warning, "The " + label + "ID (" + id + ") already existed and was replaced.",
               "Specify a new " + label + "ID to keep the existing " + label + ".");
    } else if (outcome.warned) {
        logRun(Severity::Warning, "The " + label + "ID (" + id + ") already exists and was not replaced.",
               "Specify a new " + label + "ID or change the If" + label + "IDExists parameter.");
    }
}

void Command::coerceParameters(const domain::PropertyStore& properties) {
    for (const auto& meta : m_metadata) {
        if (!hasParameter(meta.name)) {
            continue;
        }
        const std::string& raw = m_parameters.at(meta.name);
        if (meta.type == ParameterType::String) {
            m_typed[meta.name] = raw;
            continue;
        }

        const domain::ExpansionResult expanded = properties.expand(raw);
        if (!expanded.isComplete()) {
            logInitFailure(meta.name + " value \"" + raw + "\" references undefined property ${" +
                           expanded.unresolved.front() + "}.",
                           "Define the property before this command or correct its name.");
            continue;
        }
        const std::string text = TrimCopy(expanded.value);

        switch (meta.type) {
            case ParameterType::Bool: {
                const std::string lowered = ToLower(text);
                if (lowered == "true" || lowered == "false") {
                    m_typed[meta.name] = (lowered == "true");
                } else {
                    logInitFailure(meta.name + " value \"" + text + "\" is not a valid boolean.",
                                   "Specify True or False.");
                }
                break;
            }
            case ParameterType::Int: {
                try {
                    std::size_t used = 0;
                    const long long number = std::stoll(text, &used);
                    if (used != text.size()) throw std::invalid_argument(text);
                    m_typed[meta.name] = static_cast<std::int64_t>(number);
                } catch (const std::exception&) {
                    logInitFailure(meta.name + " value \"" + text + "\" is not a valid integer.",
                                   "Specify an integer.");
                }
                break;
            }
            case ParameterType::List:
                m_typed[meta.name] = SplitList(text);
                break;
            case ParameterType::Choice: {
                const std::string lowered = ToLower(text);
                auto match = std::find_if(meta.allowedValues.begin(), meta.allowedValues.end(),
                                          [&](const std::string& allowed) { return ToLower(allowed) == lowered; });
                if (match != meta.allowedValues.end()) {
                    m_typed[meta.name] = *match;
                } else {
                    logInitFailure(meta.name + " value \"" + text + "\" is not valid.",
                                   "Specify one of: " + JoinNames(meta.allowedValues) + ".");
                }
                break;
            }
            case ParameterType::String:
                break;
        }
    }
}

const ParameterMetadata* Command::findMetadata(const std::string& name) const {
    for (const auto& meta : m_metadata) {
        if (meta.name == name) return &meta;
    }
    return nullptr;
}

const ParameterValue* Command::typedValue(const std::string& name) const {
    auto it = m_typed.find(name);
    return (it == m_typed.end()) ? nullptr : &it->second;
}

} // namespace geoflow::application
