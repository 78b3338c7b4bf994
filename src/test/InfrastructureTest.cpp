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

#include "app/GeoFlowApp.hpp"
#include "domain/GeoLayer.hpp"
#include "infrastructure/AtomicFileWriter.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/DelimitedTableCodec.hpp"
#include "infrastructure/GeoJsonLayerCodec.hpp"
#include "infrastructure/HttpDownloader.hpp"
#include "infrastructure/OgrGeometryEngine.hpp"
#include "infrastructure/PathUtils.hpp"
#include "infrastructure/RunLog.hpp"
#include "infrastructure/ShellProgramRunner.hpp"
#include "infrastructure/SystemArchiveService.hpp"

using namespace geoflow;
using namespace geoflow::infrastructure;

namespace fs = std::filesystem;

namespace {

// Mock runner that behaves like "ogr2ogr -f GeoJSON 'out' 'in' ...": copies the input to the output.
class CopyingProgramRunner : public domain::ProgramRunner {
public:
    int run(const std::string& commandLine) override {
        calls.push_back(commandLine);
        if (exitCode != 0) {
            return exitCode;
        }
        std::vector<std::string> quoted;
        std::size_t pos = 0;
        while ((pos = commandLine.find('\'', pos)) != std::string::npos) {
            const std::size_t end = commandLine.find('\'', pos + 1);
            quoted.push_back(commandLine.substr(pos + 1, end - pos - 1));
            pos = end + 1;
        }
        if (quoted.size() >= 2) {
            fs::copy_file(quoted[1], quoted[0], fs::copy_options::overwrite_existing);
        }
        return 0;
    }

    std::vector<std::string> calls;
    int exitCode = 0;
};

void TestConfigParse() {
    std::cout << "[Test] ConfigLoader::Parse..." << std::endl;
    const GeoFlowConfig config = ConfigLoader::Parse(R"({
        "log_file": "/tmp/geoflow.log",
        "temp_dir": "/tmp/gf",
        "ogr2ogr": "/opt/gdal/bin/ogr2ogr",
        "http_timeout_seconds": 15,
        "properties": {"Basin": "Poudre", "Year": 2024, "Scale": 0.5, "Debug": true, "Ignored": [1, 2]},
        "unknown_key": 1
    })");
    assert(config.logFile && *config.logFile == "/tmp/geoflow.log");
    assert(config.tempDir && *config.tempDir == "/tmp/gf");
    assert(config.ogr2ogrProgram == "/opt/gdal/bin/ogr2ogr");
    assert(config.httpTimeoutSeconds == 15);
    assert(config.properties.size() == 4);
    assert(std::get<std::string>(config.properties.at("Basin")) == "Poudre");
    assert(std::get<std::int64_t>(config.properties.at("Year")) == 2024);
    assert(std::get<double>(config.properties.at("Scale")) == 0.5);
    assert(std::get<bool>(config.properties.at("Debug")));

    const GeoFlowConfig defaults = ConfigLoader::Parse("{}");
    assert(!defaults.logFile && !defaults.tempDir);
    assert(defaults.ogr2ogrProgram == "ogr2ogr");
    assert(defaults.httpTimeoutSeconds == 60);

    bool threw = false;
    try {
        ConfigLoader::Load(fs::path("/nonexistent/geoflow/settings.json"));
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);
    std::cout << "[PASS] ConfigLoader." << std::endl;
}

void TestCodecs() {
    std::cout << "[Test] GeoJSON and delimited codecs..." << std::endl;
    assert(GeoJsonLayerCodec::NormalizeCrs("urn:ogc:def:crs:EPSG::26913") == "EPSG:26913");
    assert(GeoJsonLayerCodec::NormalizeCrs("urn:ogc:def:crs:OGC:1.3:CRS84") == "EPSG:4326");
    assert(GeoJsonLayerCodec::NormalizeCrs("EPSG:3857") == "EPSG:3857");

    const auto feature = nlohmann::json::parse(
        R"({"type": "Feature", "properties": {}, "geometry": {"type": "MultiPolygon", "coordinates": []}})");
    auto layer = GeoJsonLayerCodec::FromJson(feature);
    assert(layer->featureCount() == 1);
    assert(layer->crs == "EPSG:4326");
    assert(layer->geometry == domain::GeometryKind::MultiPolygon);

    const auto mixed = nlohmann::json::parse(R"({"type": "FeatureCollection", "features": [
        {"type": "Feature", "geometry": {"type": "Point", "coordinates": [1.123456, 2]}},
        {"type": "Feature", "geometry": {"type": "LineString", "coordinates": [[0, 0], [1, 1]]}}]})");
    auto mixedLayer = GeoJsonLayerCodec::FromJson(mixed);
    assert(mixedLayer->geometry == domain::GeometryKind::Mixed);
    mixedLayer->id = "mixed";
    const auto rounded = GeoJsonLayerCodec::ToJson(*mixedLayer, 1);
    assert(rounded["name"] == "mixed");
    assert(rounded["features"][0]["geometry"]["coordinates"][0].get<double>() == 1.1);

    bool threw = false;
    try {
        GeoJsonLayerCodec::FromJson(nlohmann::json::parse(R"({"type": "Topology"})"));
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);

    const auto records = DelimitedTableCodec::ParseRecords("a,b\n\n\"x \"\"y\"\"\",\"1\n2\"\n,\n", ',');
    assert(records.size() == 3);
    assert(records[1][0] == "x \"y\"");
    assert(records[1][1] == "1\n2");
    assert(records[2].size() == 2 && records[2][0].empty());
    assert(DelimitedTableCodec::FormatRecord({"plain", "has,comma", "has\"quote"}, ',') ==
           "plain,\"has,comma\",\"has\"\"quote\"\n");

    threw = false;
    try {
        DelimitedTableCodec::ParseRecords("a,\"open\n", ',');
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);
    std::cout << "[PASS] Codecs." << std::endl;
}

domain::GeometryKind KindOf(const std::vector<std::string>& types) {
    nlohmann::json features = nlohmann::json::array();
    for (const auto& type : types) {
        features.push_back({{"type", "Feature"}, {"geometry", {{"type", type}, {"coordinates", nlohmann::json::array()}}}});
    }
    return domain::DetectGeometryKind(features);
}

void TestGeometryKindDetection() {
    std::cout << "[Test] Geometry kind detection..." << std::endl;
    using domain::GeometryKind;
    assert(KindOf({}) == GeometryKind::Unknown);
    assert(KindOf({"Point", "Point"}) == GeometryKind::Point);
    assert(KindOf({"Polygon", "MultiPolygon"}) == GeometryKind::MultiPolygon);
    assert(KindOf({"MultiPolygon", "Polygon", "Polygon"}) == GeometryKind::MultiPolygon);
    assert(KindOf({"LineString", "MultiLineString"}) == GeometryKind::MultiLineString);
    assert(KindOf({"Point", "Polygon"}) == GeometryKind::Mixed);
    assert(KindOf({"MultiPoint", "Polygon"}) == GeometryKind::Mixed);
    assert(KindOf({"GeometryCollection", "Point"}) == GeometryKind::Mixed);
    assert(KindOf({"Point", "GeometryCollection"}) == GeometryKind::Mixed);

    // Features without geometry do not take part.
    nlohmann::json features = nlohmann::json::array();
    features.push_back({{"type", "Feature"}, {"geometry", nullptr}});
    features.push_back({{"type", "Feature"}, {"geometry", {{"type", "Polygon"}, {"coordinates", nlohmann::json::array()}}}});
    assert(domain::DetectGeometryKind(features) == GeometryKind::Polygon);
    std::cout << "[PASS] Geometry kind detection." << std::endl;
}

void TestCommandLines() {
    std::cout << "[Test] External program command lines..." << std::endl;
    assert(PathUtils::ShellQuote("it's") == "'it'\\''s'");
    assert(SystemArchiveService::BuildCommandLine("/d/a.zip", "/d/out", domain::ArchiveFormat::Zip) ==
           "unzip -o -q '/d/a.zip' -d '/d/out'");
    assert(SystemArchiveService::BuildCommandLine("/d/a.tar.gz", "/d/out", domain::ArchiveFormat::Tar) ==
           "tar -xf '/d/a.tar.gz' -C '/d/out'");

    auto runner = std::make_shared<CopyingProgramRunner>();
    SystemArchiveService archives(runner);
    archives.extract("/d/a.zip", "/d/out", domain::ArchiveFormat::Zip);
    assert(runner->calls.size() == 1);
    runner->exitCode = 9;
    bool threw = false;
    try {
        archives.extract("/d/a.zip", "/d/out", domain::ArchiveFormat::Zip);
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);

    domain::AlgorithmInputs inputs;
    domain::GeoLayer layer;
    layer.crs = "EPSG:4326";
    inputs.layers.push_back(&layer);
    inputs.parameters["tolerance"] = "0.5";
    inputs.parameters["crs"] = "EPSG:26913";
    assert(OgrGeometryEngine::AlgorithmArguments("simplify", inputs, {}) == "-simplify '0.5'");
    assert(OgrGeometryEngine::AlgorithmArguments("reproject", inputs, {}) == "-s_srs 'EPSG:4326' -t_srs 'EPSG:26913'");
    assert(OgrGeometryEngine::AlgorithmArguments("clip", inputs, "/t/c.geojson") == "-clipsrc '/t/c.geojson'");
    threw = false;
    try {
        OgrGeometryEngine::AlgorithmArguments("buffer", inputs, {});
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    const auto [base, path] = HttpDownloader::SplitUrl("https://example.com:8443/data/file.zip?v=2#top");
    assert(base == "https://example.com:8443");
    assert(path == "/data/file.zip?v=2");
    assert(HttpDownloader::SplitUrl("http://example.com").second == "/");
    threw = false;
    try {
        HttpDownloader::SplitUrl("ftp://example.com/file");
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    ShellProgramRunner shell;
    assert(shell.run("exit 3") == 3);
    assert(shell.run("echo geoflow") == 0);
    std::cout << "[PASS] Command lines." << std::endl;
}

void TestGeometryEngineRoundTrip() {
    std::cout << "[Test] OgrGeometryEngine stages layers and reads the result..." << std::endl;
    const fs::path work = fs::temp_directory_path() / "geoflow_ogr_test";
    fs::remove_all(work);

    auto runner = std::make_shared<CopyingProgramRunner>();
    OgrGeometryEngine engine(runner, work, "ogr2ogr");

    domain::GeoLayer input;
    input.id = "in";
    input.crs = "EPSG:26913";
    input.features = nlohmann::json::parse(R"([
        {"type": "Feature", "properties": {"k": 1}, "geometry": {"type": "Point", "coordinates": [1, 2]}}])");
    domain::AlgorithmInputs inputs;
    inputs.layers.push_back(&input);
    inputs.parameters["tolerance"] = "2";

    domain::AlgorithmOutputs outputs = engine.runAlgorithm("simplify", inputs);
    assert(outputs.layer);
    assert(outputs.layer->featureCount() == 1);
    assert(outputs.layer->crs == "EPSG:26913");
    assert(outputs.values.at("featureCount") == "1");
    assert(runner->calls.size() == 1);
    assert(runner->calls[0].rfind("ogr2ogr -f GeoJSON '", 0) == 0);
    // Staged files are removed afterwards.
    assert(fs::is_empty(work));

    bool threw = false;
    try {
        engine.runAlgorithm("clip", inputs);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    runner->exitCode = 1;
    threw = false;
    try {
        engine.runAlgorithm("simplify", inputs);
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);
    assert(fs::is_empty(work));

    fs::remove_all(work);
    std::cout << "[PASS] Geometry engine." << std::endl;
}

void TestFilesAndLog() {
    std::cout << "[Test] AtomicFileWriter and RunLog..." << std::endl;
    const fs::path root = fs::temp_directory_path() / "geoflow_files_test";
    fs::remove_all(root);

    AtomicFileWriter::Write(root / "nested" / "a.txt", "one\n");
    AtomicFileWriter::Append(root / "nested" / "a.txt", "two\n");
    assert(AtomicFileWriter::Read(root / "nested" / "a.txt") == "one\ntwo\n");
    AtomicFileWriter::Write(root / "nested" / "a.txt", "three\n");
    assert(AtomicFileWriter::Read(root / "nested" / "a.txt") == "three\n");

    const fs::path logPath = root / "run.log";
    RunLog::OpenFile(logPath);
    assert(RunLog::CurrentFile() && *RunLog::CurrentFile() == logPath);
    RunLog::Warn("Tester", "something odd");
    RunLog::CloseFile();
    assert(!RunLog::CurrentFile());
    const std::string log = AtomicFileWriter::Read(logPath);
    assert(log.find("WARNING [Tester] something odd\n") != std::string::npos);

    fs::remove_all(root);
    std::cout << "[PASS] Files and log." << std::endl;
}

void TestArguments() {
    std::cout << "[Test] Command-line arguments..." << std::endl;
    const app::AppOptions options = app::GeoFlowApp::ParseArguments(
        {"--commands", "run.gf", "-p", "Basin=Poudre", "-p", "Expr=a=b", "--config", "settings.json"});
    assert(options.commandFile && *options.commandFile == "run.gf");
    assert(options.configFile && *options.configFile == "settings.json");
    assert(options.properties.size() == 2);
    assert(options.properties[1].first == "Expr" && options.properties[1].second == "a=b");
    assert(app::GeoFlowApp::ParseArguments({"--version"}).showVersion);

    bool threw = false;
    try {
        app::GeoFlowApp::ParseArguments({"-p", "=value"});
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
    threw = false;
    try {
        app::GeoFlowApp::ParseArguments({"--commands"});
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
    std::cout << "[PASS] Arguments." << std::endl;
}

} // namespace

int main() {
    TestConfigParse();
    TestCodecs();
    TestGeometryKindDetection();
    TestCommandLines();
    TestGeometryEngineRoundTrip();
    TestFilesAndLog();
    TestArguments();
    std::cout << "[PASS] InfrastructureTest" << std::endl;
    return 0;
}
