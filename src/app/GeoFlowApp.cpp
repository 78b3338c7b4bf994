/**
 * @file GeoFlowApp.cpp
 * @brief Implementation of the GeoFlowApp class.
 */
#include "app/GeoFlowApp.hpp"

#include <iostream>
#include <memory>
#include <stdexcept>

#include "application/Version.hpp"
#include "application/WorkflowProcessor.hpp"
#include "infrastructure/DelimitedTableCodec.hpp"
#include "infrastructure/GeoJsonLayerCodec.hpp"
#include "infrastructure/HttpDownloader.hpp"
#include "infrastructure/OgrGeometryEngine.hpp"
#include "infrastructure/PathUtils.hpp"
#include "infrastructure/RunLog.hpp"
#include "infrastructure/ShellProgramRunner.hpp"
#include "infrastructure/SystemArchiveService.hpp"

namespace geoflow::app {

using infrastructure::RunLog;

namespace {

const std::string& NextValue(const std::vector<std::string>& args, std::size_t& i) {
    if (i + 1 >= args.size()) {
        throw std::invalid_argument("Option " + args[i] + " needs a value.");
    }
    return args[++i];
}

} // namespace

AppOptions GeoFlowApp::ParseArguments(const std::vector<std::string>& args) {
    AppOptions options;
    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "-c" || arg == "--commands") {
            options.commandFile = NextValue(args, i);
        } else if (arg == "--config") {
            options.configFile = NextValue(args, i);
        } else if (arg == "-p" || arg == "--property") {
            const std::string& assignment = NextValue(args, i);
            const auto eq = assignment.find('=');
            if (eq == std::string::npos || eq == 0) {
                throw std::invalid_argument("Property \"" + assignment + "\" must have the form Name=Value.");
            }
            options.properties.emplace_back(assignment.substr(0, eq), assignment.substr(eq + 1));
        } else if (arg == "--version") {
            options.showVersion = true;
        } else if (arg == "-h" || arg == "--help") {
            options.showHelp = true;
        } else {
            throw std::invalid_argument("Unknown option \"" + arg + "\".");
        }
    }
    return options;
}

std::string GeoFlowApp::Usage() {
    return "Usage: geoflow --commands FILE [-p Name=Value]... [--config FILE]\n"
           "       geoflow --version\n"
           "       geoflow --help\n";
}

int GeoFlowApp::Run(int argc, char** argv) {
    AppOptions options;
    try {
        options = ParseArguments(std::vector<std::string>(argv + 1, argv + argc));
    } catch (const std::invalid_argument& e) {
        std::cerr << "[GeoFlow] " << e.what() << "\n" << Usage();
        return 2;
    }

    if (options.showHelp) {
        std::cout << Usage();
        return 0;
    }
    if (options.showVersion) {
        std::cout << "geoflow " << application::kVersionString << "\n";
        return 0;
    }
    if (!options.commandFile) {
        std::cerr << "[GeoFlow] No command file given.\n" << Usage();
        return 2;
    }

    try {
        return Execute(options);
    } catch (const std::exception& e) {
        RunLog::Error("GeoFlow", e.what());
        RunLog::CloseFile();
        return 2;
    }
}

application::WorkflowServices GeoFlowApp::BuildServices(const infrastructure::GeoFlowConfig& config,
                                                        const std::filesystem::path& tempDir) {
    auto runner = std::make_shared<infrastructure::ShellProgramRunner>();

    application::WorkflowServices services;
    services.layerCodec = std::make_shared<infrastructure::GeoJsonLayerCodec>();
    services.tableCodec = std::make_shared<infrastructure::DelimitedTableCodec>();
    services.programRunner = runner;
    services.geometryEngine =
        std::make_shared<infrastructure::OgrGeometryEngine>(runner, tempDir / "geometry", config.ogr2ogrProgram);
    services.archiveService = std::make_shared<infrastructure::SystemArchiveService>(runner);
    services.downloader = std::make_shared<infrastructure::HttpDownloader>(config.httpTimeoutSeconds);
    return services;
}

int GeoFlowApp::Execute(const AppOptions& options) {
    const infrastructure::GeoFlowConfig config = infrastructure::ConfigLoader::Load(options.configFile);
    if (config.logFile) {
        RunLog::OpenFile(*config.logFile);
    }
    RunLog::Info("GeoFlow", std::string("GeoFlow ") + application::kVersionString);

    const std::filesystem::path tempDir = config.tempDir ? *config.tempDir : infrastructure::PathUtils::GetTempDir();

    application::WorkflowProcessor processor(BuildServices(config, tempDir));
    processor.setTempDir(tempDir);
    for (const auto& [name, value] : config.properties) {
        processor.setInitialProperty(name, value);
    }
    for (const auto& [name, value] : options.properties) {
        processor.setInitialProperty(name, value);
    }

    processor.loadFile(*options.commandFile);
    RunLog::Info("GeoFlow", "Running " + std::to_string(processor.getCommands().size()) + " commands from " +
                                options.commandFile->string());

    const application::RunSummary summary = processor.executeAll();

    RunLog::Info("GeoFlow", "Processed " + std::to_string(summary.executed) + " commands, " +
                                std::to_string(summary.failed) + " failed, " + std::to_string(summary.warnings) +
                                " warnings.");
    for (const auto& failure : summary.failures) {
        RunLog::Warn("GeoFlow", "Command " + std::to_string(failure.index) + " (" + failure.commandName +
                                    "): " + failure.message);
    }
    RunLog::CloseFile();
    return summary.succeeded() ? 0 : 1;
}

} // namespace geoflow::app
