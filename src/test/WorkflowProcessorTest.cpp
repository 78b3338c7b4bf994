#undef NDEBUG
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "application/Version.hpp"
#include "application/WorkflowProcessor.hpp"
#include "domain/ProgramRunner.hpp"

using namespace geoflow::application;
using geoflow::domain::Phase;
using geoflow::domain::PropertyValueToString;
using geoflow::domain::Severity;

namespace fs = std::filesystem;

namespace {

// Mock program runner: records command lines and answers with a fixed exit code.
class MockProgramRunner : public geoflow::domain::ProgramRunner {
public:
    int run(const std::string& commandLine) override {
        calls.push_back(commandLine);
        return exitCode;
    }

    std::vector<std::string> calls;
    int exitCode = 0;
};

std::string ReadFile(const fs::path& path) {
    std::ifstream in(path);
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

void TestPartialFailureContinues() {
    std::cout << "[Test] A parameter error does not stop the workflow..." << std::endl;
    WorkflowProcessor processor;
    processor.load({
        "SetProperty(PropertyName=\"A\",PropertyValue=\"1\")",
        "Message()",
        "SetProperty(PropertyName=\"B\",PropertyValue=\"${A}2\")"
    });

    const RunSummary summary = processor.executeAll();
    assert(summary.executed == 3);
    assert(summary.failed == 1);
    assert(!summary.succeeded());
    assert(summary.failures.size() == 1);
    assert(summary.failures[0].index == 2);
    assert(summary.failures[0].commandName == "Message");

    const auto& commands = processor.getCommands();
    assert(commands[0]->getState() == CommandState::Completed);
    assert(commands[1]->getState() == CommandState::ValidationFailed);
    assert(commands[2]->getState() == CommandState::Completed);
    assert(PropertyValueToString(processor.getContext().properties.get("B")) == "12");
    assert(processor.getMaxSeverity() == Severity::Failure);

    // A second run starts from a fresh context and gives the same answer.
    const RunSummary again = processor.executeAll();
    assert(again.executed == 3 && again.failed == 1);
    std::cout << "[PASS] Partial failure." << std::endl;
}

void TestCommentsAndUnknownCommands() {
    std::cout << "[Test] Comments, comment blocks and unknown commands..." << std::endl;
    WorkflowProcessor processor;
    processor.load({
        "# Header comment",
        "",
        "/*",
        "Message(Message=\"hidden\",CommandStatus=\"Failure\")",
        "*/",
        "NotARealCommand(A=\"1\")",
        "message(Message=\"case-insensitive\",CommandStatus=\"warning\")"
    });

    const auto& commands = processor.getCommands();
    assert(commands[0]->getName() == "Comment");
    assert(commands[1]->getName() == "Blank");
    assert(commands[2]->opensCommentBlock());
    assert(commands[4]->closesCommentBlock());
    assert(commands[5]->getName() == "UnknownCommand");
    assert(commands[5]->toString() == "NotARealCommand(A=\"1\")");
    assert(commands[6]->getName() == "Message");

    const RunSummary summary = processor.executeAll();
    assert(summary.executed == 6);
    assert(summary.failed == 2);
    assert(summary.warnings == 1);
    assert(commands[3]->getState() == CommandState::Created);
    assert(commands[3]->getStatus().getOverallSeverity() == Severity::Unknown);
    const auto& unknownLog = commands[5]->getStatus().getLog(Phase::Initialization);
    assert(unknownLog.size() == 1);
    assert(unknownLog[0].getMessage() == "Command \"NotARealCommand\" is not a recognized command.");
    assert(commands[6]->getStatus().getPhaseSeverity(Phase::Run) == Severity::Warning);
    assert(commands[0]->getStatus().getOverallSeverity() == Severity::Success);
    std::cout << "[PASS] Comments." << std::endl;
}

void TestBuiltInAndInitialProperties() {
    std::cout << "[Test] Built-in and initial properties..." << std::endl;
    const fs::path root = fs::temp_directory_path() / "geoflow_processor_test";
    fs::remove_all(root);
    fs::create_directories(root / "work");
    const fs::path commandFile = root / "work" / "workflow.gf";
    std::ofstream(commandFile) << "SetProperty(PropertyName=\"Greeting\",PropertyValue=\"hello ${Who}\")\r\n"
                               << "SetProperty(PropertyName=\"WorkingDir\",PropertyValue=\"/elsewhere\")\r\n"
                               << "WritePropertiesToFile(OutputFile=\"props.txt\",IncludeProperties=\"Greeting,Who\")\r\n"
                               << "WritePropertiesToFile(OutputFile=\"props.json\",IncludeProperties=\"Greeting,Count\",FileFormat=\"json\")\r\n"
                               << "WriteCommandSummaryToFile(OutputFile=\"${TempDir}/summary.json\")\r\n";

    WorkflowProcessor processor;
    processor.setTempDir(root / "tmp");
    fs::create_directories(root / "tmp");
    processor.setInitialProperty("Who", std::string("world"));
    processor.setInitialProperty("Count", std::int64_t{3});
    processor.setInitialProperty("WorkingDir", std::string("/ignored"));
    processor.loadFile(commandFile);
    assert(processor.getCommands().size() == 5);

    const RunSummary summary = processor.executeAll();
    assert(summary.executed == 5);
    assert(summary.failed == 1);
    assert(summary.failures[0].index == 2);

    const auto& properties = processor.getContext().properties;
    const std::string workingDir = PropertyValueToString(properties.get("WorkingDir"));
    assert(fs::equivalent(workingDir, root / "work"));
    assert(PropertyValueToString(properties.get("InitialWorkingDir")) == workingDir);
    assert(fs::equivalent(PropertyValueToString(properties.get("TempDir")), root / "tmp"));
    assert(PropertyValueToString(properties.get("ProgramVersionString")) == kVersionString);
    assert(properties.contains("UserName"));
    assert(properties.contains("ComputerName"));
    assert(properties.contains("UserHomeDir"));

    const std::string text = ReadFile(root / "work" / "props.txt");
    assert(text == "Greeting=\"hello world\"\nWho=\"world\"\n");

    const auto json = nlohmann::json::parse(ReadFile(root / "work" / "props.json"));
    assert(json["Greeting"] == "hello world");
    assert(json["Count"] == 3);

    const auto report = nlohmann::json::parse(ReadFile(root / "tmp" / "summary.json"));
    assert(report.is_array() && report.size() == 5);
    assert(report[1]["state"] == "Skipped");
    assert(report[1]["severity"] == "FAILURE");
    assert(report[0]["phases"]["RUN"]["severity"] == "SUCCESS");

    fs::remove_all(root);
    std::cout << "[PASS] Properties." << std::endl;
}

void TestRunProgram() {
    std::cout << "[Test] RunProgram uses the configured runner..." << std::endl;
    auto runner = std::make_shared<MockProgramRunner>();
    WorkflowServices services;
    services.programRunner = runner;
    WorkflowProcessor processor(services);
    processor.load({
        "SetProperty(PropertyName=\"Tool\",PropertyValue=\"gdalinfo\")",
        "RunProgram(CommandLine=\"${Tool} --version\")",
        "RunProgram(CommandLine=\"false\",ExpectedExitCode=\"1\")"
    });

    runner->exitCode = 1;
    const RunSummary summary = processor.executeAll();
    assert(runner->calls.size() == 2);
    assert(runner->calls[0] == "gdalinfo --version");
    assert(summary.failed == 1);
    assert(summary.failures[0].index == 2);
    assert(processor.getCommands()[2]->getStatus().getPhaseSeverity(Phase::Run) == Severity::Success);

    WorkflowProcessor unconfigured;
    unconfigured.load({"RunProgram(CommandLine=\"true\")"});
    const RunSummary noRunner = unconfigured.executeAll();
    assert(noRunner.failed == 1);
    assert(unconfigured.getCommands()[0]->getStatus().getLog(Phase::Run)[0].getMessage() ==
           "Unexpected error running RunProgram.");
    std::cout << "[PASS] RunProgram." << std::endl;
}

} // namespace

int main() {
    TestPartialFailureContinues();
    TestCommentsAndUnknownCommands();
    TestBuiltInAndInitialProperties();
    TestRunProgram();
    std::cout << "[PASS] WorkflowProcessorTest" << std::endl;
    return 0;
}
