#undef NDEBUG
#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>

#include "application/Command.hpp"

using namespace geoflow::application;
using geoflow::domain::Phase;
using geoflow::domain::Severity;

namespace {

// Requires a GeoLayer that never exists, under the policy named by its Policy parameter.
class GuardedCommand : public Command {
public:
    GuardedCommand()
        : Command("GuardedCommand", {
              {"Policy", ParameterType::Choice, true, {"Fail", "Warn", "WarnButDoNotRun"}, ""}
          }) {}

protected:
    void runCommand(WorkflowContext& context) override {
        const std::string policy = stringParameter("Policy");
        const FailPolicy failPolicy = policy == "Warn" ? FailPolicy::Warn
            : policy == "WarnButDoNotRun" ? FailPolicy::WarnButDoNotRun : FailPolicy::Fail;
        require(context, checks::IdExists{EntityKind::GeoLayer, "missing"}, failPolicy);
        if (isBlocked()) return;
        context.properties.set("EffectRan", true);
    }
};

// Records its coerced parameters as properties.
class TypedCommand : public Command {
public:
    TypedCommand()
        : Command("TypedCommand", {
              {"Name", ParameterType::String, true, {}, ""},
              {"Count", ParameterType::Int, false, {}, ""},
              {"Flag", ParameterType::Bool, false, {}, ""},
              {"Mode", ParameterType::Choice, false, {"Alpha", "Beta"}, ""},
              {"Items", ParameterType::List, false, {}, ""}
          }) {}

    bool throwOnRun = false;

protected:
    void runCommand(WorkflowContext& context) override {
        if (throwOnRun) {
            throw std::runtime_error("disk on fire");
        }
        context.properties.set("Name", resolveParameter(context, "Name"));
        context.properties.set("Count", intParameter("Count", -1));
        context.properties.set("Flag", boolParameter("Flag", false));
        context.properties.set("Mode", stringParameter("Mode", "none"));
        context.properties.set("Items", listParameter("Items"));
    }
};

CommandOutcome RunGuarded(const std::string& policy, WorkflowContext& context, GuardedCommand& command) {
    command.initialize("GuardedCommand(Policy=\"" + policy + "\")");
    const CommandOutcome validation = command.validate(context.properties);
    assert(validation.state == CommandState::Ready);
    return command.run(context);
}

void TestFailPolicies() {
    std::cout << "[Test] Failed check under each policy..." << std::endl;
    {
        WorkflowContext context;
        GuardedCommand command;
        const CommandOutcome outcome = RunGuarded("warn", context, command);
        assert(outcome.state == CommandState::Completed);
        assert(outcome.warningCount == 1);
        assert(outcome.isRunError());
        assert(command.getStatus().getPhaseSeverity(Phase::Run) == Severity::Warning);
        assert(context.properties.contains("EffectRan"));
    }
    {
        WorkflowContext context;
        GuardedCommand command;
        const CommandOutcome outcome = RunGuarded("Fail", context, command);
        assert(outcome.state == CommandState::Skipped);
        assert(command.getStatus().getPhaseSeverity(Phase::Run) == Severity::Failure);
        assert(command.getStatus().getLog(Phase::Run).front().getMessage() == "The GeoLayerID (missing) does not exist.");
        assert(!context.properties.contains("EffectRan"));
    }
    {
        WorkflowContext context;
        GuardedCommand command;
        const CommandOutcome outcome = RunGuarded("WarnButDoNotRun", context, command);
        assert(outcome.state == CommandState::Skipped);
        assert(command.getStatus().getPhaseSeverity(Phase::Run) == Severity::Warning);
        assert(!context.properties.contains("EffectRan"));
        assert(outcome.message == "There were 1 warnings processing the command.");
    }
    std::cout << "[PASS] Fail policies." << std::endl;
}

void TestCoercion() {
    std::cout << "[Test] Parameter coercion..." << std::endl;
    WorkflowContext context;
    context.properties.set("N", std::int64_t{7});
    context.properties.set("Who", std::string("basin"));

    TypedCommand command;
    command.initialize("TypedCommand(Name=\"${Who}\",Count=\"${N}\",Flag=\"TRUE\",Mode=\"beta\",Items=\"a, b ,c\")");
    const CommandOutcome validation = command.validate(context.properties);
    assert(validation.state == CommandState::Ready);
    assert(command.getStatus().getPhaseSeverity(Phase::Initialization) == Severity::Success);

    const CommandOutcome outcome = command.run(context);
    assert(outcome.succeeded());
    assert(outcome.state == CommandState::Completed);
    assert(command.getStatus().getPhaseSeverity(Phase::Run) == Severity::Success);
    assert(std::get<std::string>(context.properties.get("Name")) == "basin");
    assert(std::get<std::int64_t>(context.properties.get("Count")) == 7);
    assert(std::get<bool>(context.properties.get("Flag")));
    assert(std::get<std::string>(context.properties.get("Mode")) == "Beta");
    const auto items = std::get<std::vector<std::string>>(context.properties.get("Items"));
    assert(items.size() == 3 && items[1] == "b");
    std::cout << "[PASS] Coercion." << std::endl;
}

void TestValidationFailures() {
    std::cout << "[Test] Validation failures..." << std::endl;
    WorkflowContext context;

    TypedCommand command;
    command.initialize("TypedCommand(Count=\"x7\",Flag=\"yes\",Mode=\"Gamma\",Bogus=\"1\",Items=\"${Undefined}\")");
    const CommandOutcome outcome = command.validate(context.properties);
    assert(outcome.isParameterError());
    assert(command.getState() == CommandState::ValidationFailed);
    // Bogus, missing Name, Count, Flag, Mode, Items.
    assert(command.getStatus().getLogCount(Phase::Initialization, Severity::Failure) == 6);
    assert(outcome.message == "Parameter validation failed for TypedCommand (6 problems).");

    bool threw = false;
    try {
        command.run(context);
    } catch (const std::logic_error&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        command.validate(context.properties);
    } catch (const std::logic_error&) {
        threw = true;
    }
    assert(threw);

    TypedCommand broken;
    broken.initialize("TypedCommand(Name=\"a\"");
    assert(broken.validate(context.properties).isParameterError());
    assert(broken.getStatus().getLogCount(Phase::Initialization, Severity::Failure) == 1);
    std::cout << "[PASS] Validation failures." << std::endl;
}

void TestUnexpectedErrorsAndReset() {
    std::cout << "[Test] Unexpected run errors and reset..." << std::endl;
    WorkflowContext context;
    TypedCommand command;
    command.throwOnRun = true;
    command.initialize("TypedCommand(Name=\"n\")");
    assert(command.validate(context.properties).state == CommandState::Ready);

    const CommandOutcome outcome = command.run(context);
    assert(outcome.state == CommandState::Completed);
    assert(outcome.isRunError());
    const auto& log = command.getStatus().getLog(Phase::Run);
    assert(log.size() == 1);
    assert(log[0].getSeverity() == Severity::Failure);
    assert(log[0].getMessage() == "Unexpected error running TypedCommand.");
    assert(log[0].getRecommendation() == "Check the log file for details.");

    command.reset();
    assert(command.getState() == CommandState::Created);
    assert(command.getStatus().getOverallSeverity() == Severity::Unknown);
    assert(command.getParameters().at("Name") == "n");
    assert(command.toString() == "TypedCommand(Name=\"n\")");

    command.throwOnRun = false;
    assert(command.validate(context.properties).state == CommandState::Ready);
    assert(command.run(context).succeeded());
    std::cout << "[PASS] Unexpected errors and reset." << std::endl;
}

} // namespace

int main() {
    TestFailPolicies();
    TestCoercion();
    TestValidationFailures();
    TestUnexpectedErrorsAndReset();
    std::cout << "[PASS] CommandLifecycleTest" << std::endl;
    return 0;
}
