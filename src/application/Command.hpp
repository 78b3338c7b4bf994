/**
 * @file Command.hpp
 * @brief Base class of every workflow command: parameter metadata, validation and run lifecycle.
 */

#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "application/CheckCondition.hpp"
#include "application/Parameter.hpp"
#include "application/WorkflowContext.hpp"
#include "domain/CollisionPolicy.hpp"
#include "domain/CommandStatus.hpp"

namespace geoflow::application {

/**
 * @enum CommandState
 * @brief Lifecycle of one invocation.
 *
 * Created -> Validating -> (ValidationFailed | Ready) -> Running -> (Completed | Skipped).
 */
enum class CommandState {
    Created,
    Validating,
    ValidationFailed,
    Ready,
    Running,
    Completed,
    Skipped
};

inline std::string CommandStateToString(CommandState state) {
    switch (state) {
        case CommandState::Created: return "Created";
        case CommandState::Validating: return "Validating";
        case CommandState::ValidationFailed: return "ValidationFailed";
        case CommandState::Ready: return "Ready";
        case CommandState::Running: return "Running";
        case CommandState::Completed: return "Completed";
        case CommandState::Skipped: return "Skipped";
        default: return "Created";
    }
}

/**
 * @struct CommandOutcome
 * @brief Result of validate() or run().
 *
 * A ValidationFailed state is the parameter error; a nonzero warning count
 * after run() is the run error. Everything else stays in the CommandStatus.
 */
struct CommandOutcome {
    CommandState state = CommandState::Created;
    int warningCount = 0;
    std::string message;

    bool isParameterError() const { return state == CommandState::ValidationFailed; }
    bool isRunError() const { return warningCount > 0; }
    bool succeeded() const { return !isParameterError() && !isRunError(); }
};

/**
 * @class Command
 * @brief One unit of work with declared parameters, validated then run against a WorkflowContext.
 *
 * Subclasses declare their parameters in the constructor, may add
 * cross-parameter checks in checkParameters() and implement runCommand().
 * runCommand() evaluates its preconditions with require() and returns
 * without touching the context once isBlocked() is true.
 */
class Command {
public:
    Command(std::string name, std::vector<ParameterMetadata> metadata);
    virtual ~Command() = default;

    Command(const Command&) = delete;
    Command& operator=(const Command&) = delete;

    /**
     * @brief Parses the command text. Syntax errors are kept and reported by validate().
     */
    virtual void initialize(const std::string& commandText);

    /** @brief Sets one raw parameter; used when building commands in code. */
    void setParameter(const std::string& name, const std::string& value);

    const std::string& getName() const { return m_name; }
    const ParameterMap& getParameters() const { return m_parameters; }
    const std::vector<ParameterMetadata>& getMetadata() const { return m_metadata; }

    /** @brief Command text with parameters in metadata order. */
    virtual std::string toString() const;

    virtual bool opensCommentBlock() const { return false; }
    virtual bool closesCommentBlock() const { return false; }

    /** @brief Returns to Created and drops every log record, keeping the parameters. */
    void reset();

    /**
     * @brief Checks parameter names, presence, types and allowed values.
     *
     * Non-string parameters are property-expanded before their type is checked.
     * Every problem is an INITIALIZATION failure.
     * @throws std::logic_error unless the command is in Created.
     */
    CommandOutcome validate(const domain::PropertyStore& properties);

    /**
     * @brief Runs the command. Effect errors are recorded, never propagated.
     * @throws std::logic_error unless the command is Ready.
     */
    CommandOutcome run(WorkflowContext& context);

    /** @brief Records a failure that escaped the command's own handling. */
    void recordUnexpectedFailure(const std::string& detail);

    CommandState getState() const { return m_state; }
    const domain::CommandStatus& getStatus() const { return m_status; }
    int getWarningCount() const { return m_warningCount; }

protected:
    virtual void checkParameters(const domain::PropertyStore& properties);
    virtual void runCommand(WorkflowContext& context) = 0;

    void logInitFailure(const std::string& message, const std::string& recommendation);

    /** @brief True when the parameter was given a non-empty value. */
    bool hasParameter(const std::string& name) const;
    std::string stringParameter(const std::string& name, const std::string& fallback = "") const;
    bool boolParameter(const std::string& name, bool fallback) const;
    std::int64_t intParameter(const std::string& name, std::int64_t fallback) const;
    std::vector<std::string> listParameter(const std::string& name) const;
    domain::CollisionPolicy collisionPolicy(const std::string& name) const;

    /**
     * @brief Expands properties in a string parameter. Unresolved tokens are a RUN warning.
     */
    std::string resolveParameter(WorkflowContext& context, const std::string& name, const std::string& fallback = "");

    /** @brief Makes @p path absolute against the WorkingDir property. */
    std::string resolvePath(const WorkflowContext& context, const std::string& path) const;

    /** @brief resolveParameter() followed by resolvePath(); empty stays empty. */
    std::string resolvePathParameter(WorkflowContext& context, const std::string& name, const std::string& fallback = "");

    /**
     * @brief Applies formatter codes in @p pattern to @p absolutePath.
     * An unknown code is a blocking RUN failure and yields "".
     */
    std::string applyFormatter(const std::string& pattern, const std::string& absolutePath);

    /**
     * @brief Evaluates @p condition and records a failed check at RUN.
     * @return True when the check passed.
     */
    bool require(const WorkflowContext& context, const CheckCondition& condition, FailPolicy policy);

    /** @brief Adds a RUN record; warnings and failures count toward the warning count. */
    void logRun(domain::Severity severity, const std::string& message, const std::string& recommendation);

    /** @brief logRun() and mark the effect as not to be executed. */
    void blockRun(domain::Severity severity, const std::string& message, const std::string& recommendation);

    bool isBlocked() const { return m_blocked; }

    /**
     * @brief Pre-effect collision check of an output ID under @p policy.
     * Warn and Fail block the effect when the ID exists; the replace policies never do.
     */
    bool checkOutputId(const WorkflowContext& context, EntityKind kind, const std::string& id,
                       domain::CollisionPolicy policy);

    /** @brief Registers @p entity and turns the registry outcome into RUN records. */
    template <typename T>
    bool registerOutput(domain::EntityRegistry<T>& registry, EntityKind kind, const std::string& id,
                        std::unique_ptr<T> entity, domain::CollisionPolicy policy) {
        const domain::RegisterOutcome outcome = registry.registerEntity(id, std::move(entity), policy);
        reportRegistration(kind, id, outcome);
        return outcome.inserted;
    }

private:
    void reportRegistration(EntityKind kind, const std::string& id, const domain::RegisterOutcome& outcome);
    void coerceParameters(const domain::PropertyStore& properties);
    const ParameterMetadata* findMetadata(const std::string& name) const;
    const ParameterValue* typedValue(const std::string& name) const;

    std::string m_name;
    std::vector<ParameterMetadata> m_metadata;
    std::string m_indent;
    ParameterMap m_parameters;
    std::optional<std::string> m_syntaxError;

    std::map<std::string, ParameterValue> m_typed;
    domain::CommandStatus m_status;
    CommandState m_state = CommandState::Created;
    int m_warningCount = 0;
    bool m_blocked = false;
};

} // namespace geoflow::application
