/**
 * @file OgrGeometryEngine.cpp
 * @brief Implementation of OgrGeometryEngine.
 */

#include "infrastructure/OgrGeometryEngine.hpp"

#include <stdexcept>
#include <vector>

#include "infrastructure/PathUtils.hpp"

namespace geoflow::infrastructure {

namespace fs = std::filesystem;

namespace {

/** Removes the staged files when the algorithm finishes or throws. */
class StagedFiles {
public:
    ~StagedFiles() {
        for (const auto& path : m_paths) {
            std::error_code ec;
            fs::remove(path, ec);
        }
    }

    const fs::path& add(fs::path path) {
        m_paths.push_back(std::move(path));
        return m_paths.back();
    }

private:
    std::vector<fs::path> m_paths;
};

const std::string& RequireParameter(const domain::AlgorithmInputs& inputs, const std::string& name,
                                    const std::string& algorithm) {
    auto it = inputs.parameters.find(name);
    if (it == inputs.parameters.end() || it->second.empty()) {
        throw std::invalid_argument("Algorithm " + algorithm + " needs the \"" + name + "\" parameter.");
    }
    return it->second;
}

} // namespace

OgrGeometryEngine::OgrGeometryEngine(std::shared_ptr<domain::ProgramRunner> runner, fs::path workDir,
                                     std::string program)
    : m_runner(std::move(runner)), m_workDir(std::move(workDir)), m_program(std::move(program)) {
    if (!m_runner) {
        throw std::invalid_argument("OgrGeometryEngine needs a program runner.");
    }
}

domain::AlgorithmOutputs OgrGeometryEngine::runAlgorithm(const std::string& name,
                                                         const domain::AlgorithmInputs& inputs) {
    const std::size_t needed = (name == "clip") ? 2 : 1;
    if (inputs.layers.size() < needed) {
        throw std::invalid_argument("Algorithm " + name + " needs " + std::to_string(needed) + " input layers.");
    }
    for (const domain::GeoLayer* layer : inputs.layers) {
        if (!layer) throw std::invalid_argument("Algorithm " + name + " was given a null layer.");
    }

    StagedFiles staged;
    fs::create_directories(m_workDir);
    const fs::path input = staged.add(PathUtils::MakeTempFilePath(m_workDir, "_in.geojson"));
    m_codec.writeLayer(*inputs.layers[0], input, -1);

    fs::path second;
    if (needed == 2) {
        second = staged.add(PathUtils::MakeTempFilePath(m_workDir, "_clip.geojson"));
        m_codec.writeLayer(*inputs.layers[1], second, -1);
    }
    const fs::path output = staged.add(PathUtils::MakeTempFilePath(m_workDir, "_out.geojson"));

    const std::string commandLine = m_program + " -f GeoJSON " + PathUtils::ShellQuote(output.string()) + " " +
                                    PathUtils::ShellQuote(input.string()) + " " +
                                    AlgorithmArguments(name, inputs, second);
    const int exitCode = m_runner->run(commandLine);
    if (exitCode != 0) {
        throw std::runtime_error(m_program + " failed for algorithm " + name + " with exit code " +
                                 std::to_string(exitCode) + ".");
    }

    domain::AlgorithmOutputs outputs;
    outputs.layer = m_codec.readLayer(output);
    outputs.layer->sourcePath.clear();
    outputs.values["featureCount"] = std::to_string(outputs.layer->featureCount());
    return outputs;
}

std::string OgrGeometryEngine::AlgorithmArguments(const std::string& name, const domain::AlgorithmInputs& inputs,
                                                  const fs::path& secondInput) {
    if (name == "clip") {
        return "-clipsrc " + PathUtils::ShellQuote(secondInput.string());
    }
    if (name == "simplify") {
        return "-simplify " + PathUtils::ShellQuote(RequireParameter(inputs, "tolerance", name));
    }
    if (name == "reproject") {
        std::string args;
        if (!inputs.layers.empty() && inputs.layers[0] && !inputs.layers[0]->crs.empty()) {
            args = "-s_srs " + PathUtils::ShellQuote(inputs.layers[0]->crs) + " ";
        }
        return args + "-t_srs " + PathUtils::ShellQuote(RequireParameter(inputs, "crs", name));
    }
    throw std::invalid_argument("Unsupported geometry algorithm \"" + name + "\".");
}

} // namespace geoflow::infrastructure
