#undef NDEBUG
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>

#include "application/Validator.hpp"

using namespace geoflow::application;
using geoflow::domain::GeoLayer;
using geoflow::domain::GeometryKind;
using geoflow::domain::Severity;

namespace fs = std::filesystem;

namespace {

std::unique_ptr<GeoLayer> MakeLayer(const std::string& id, const std::string& crs, GeometryKind geometry) {
    auto layer = std::make_unique<GeoLayer>();
    layer->id = id;
    layer->crs = crs;
    layer->geometry = geometry;
    return layer;
}

void TestEscalation() {
    std::cout << "[Test] Fail policy escalation..." << std::endl;
    WorkflowContext context;
    Validator validator(context);
    const checks::IdExists missing{EntityKind::GeoLayer, "rivers"};

    const CheckResult fail = validator.evaluate(missing, FailPolicy::Fail);
    assert(!fail.passed);
    assert(fail.severity() == Severity::Failure);
    assert(fail.blocksRun());
    assert(fail.message == "The GeoLayerID (rivers) does not exist.");
    assert(!fail.recommendation.empty());

    const CheckResult warn = validator.evaluate(missing, FailPolicy::Warn);
    assert(warn.severity() == Severity::Warning);
    assert(!warn.blocksRun());

    const CheckResult skip = validator.evaluate(missing, FailPolicy::WarnButDoNotRun);
    assert(skip.severity() == Severity::Warning);
    assert(skip.blocksRun());

    context.geoLayers.registerEntity("rivers", MakeLayer("rivers", "EPSG:4326", GeometryKind::LineString),
                                     geoflow::domain::CollisionPolicy::Fail);
    const CheckResult pass = validator.evaluate(missing, FailPolicy::Fail);
    assert(pass.passed);
    assert(pass.severity() == Severity::Success);
    assert(!pass.blocksRun());

    const CheckResult unique = validator.evaluate(checks::IdIsUnique{EntityKind::GeoLayer, "rivers"}, FailPolicy::Fail);
    assert(!unique.passed);
    assert(unique.message == "The GeoLayerID (rivers) already exists.");
    std::cout << "[PASS] Escalation." << std::endl;
}

void TestUnknownCheckIsProgrammingError() {
    std::cout << "[Test] Unknown check names..." << std::endl;
    WorkflowContext context;
    Validator validator(context);
    const CheckResult result = validator.evaluateNamed("FileIsPurple", "x", {}, FailPolicy::Warn);
    assert(!result.passed);
    assert(result.programmingError);
    assert(result.policy == FailPolicy::Fail);
    assert(result.severity() == Severity::Failure);
    assert(result.blocksRun());
    assert(result.message == "Check FileIsPurple is not a valid check in the validators library.");

    const CheckResult badBounds = validator.evaluateNamed("IntInRange", "5", {"1"}, FailPolicy::WarnButDoNotRun);
    assert(badBounds.programmingError);
    assert(badBounds.policy == FailPolicy::Fail);
    std::cout << "[PASS] Unknown check." << std::endl;
}

void TestNamedChecks() {
    std::cout << "[Test] Named checks..." << std::endl;
    const fs::path root = fs::temp_directory_path() / "geoflow_validator_test";
    fs::remove_all(root);
    fs::create_directories(root);
    const fs::path file = root / "data.csv";
    std::ofstream(file) << "a,b\n";

    WorkflowContext context;
    context.properties.set("Existing", std::string("yes"));
    context.geoLayers.registerEntity("a", MakeLayer("a", "EPSG:4326", GeometryKind::Polygon),
                                     geoflow::domain::CollisionPolicy::Replace);
    context.geoLayers.registerEntity("b", MakeLayer("b", "epsg:4326", GeometryKind::Polygon),
                                     geoflow::domain::CollisionPolicy::Replace);
    context.geoLayers.registerEntity("c", MakeLayer("c", "EPSG:26913", GeometryKind::Point),
                                     geoflow::domain::CollisionPolicy::Replace);
    Validator validator(context);

    // Every advertised name is dispatched, whatever its arguments.
    for (const auto& name : Validator::ConditionNames()) {
        const CheckResult result = validator.evaluateNamed(name, "", {"0", "1"}, FailPolicy::Warn);
        assert(result.message.find("is not a valid check") == std::string::npos);
    }

    assert(validator.evaluateNamed("FileExists", file.string(), {}, FailPolicy::Fail).passed);
    const CheckResult noFile = validator.evaluateNamed("fileexists", (root / "nope.csv").string(), {}, FailPolicy::Fail);
    assert(!noFile.passed);
    assert(noFile.message == "The file (" + (root / "nope.csv").string() + ") does not exist.");
    assert(!validator.evaluateNamed("FileExists", root.string(), {}, FailPolicy::Fail).passed);
    assert(validator.evaluateNamed("FolderExists", root.string(), {}, FailPolicy::Fail).passed);
    assert(validator.evaluateNamed("ParentFolderExists", (root / "new.csv").string(), {}, FailPolicy::Fail).passed);
    assert(!validator.evaluateNamed("ParentFolderExists", (root / "x" / "new.csv").string(), {}, FailPolicy::Fail).passed);

    assert(validator.evaluateNamed("ValueInSet", "warn", {"Ignore", "Warn", "Fail"}, FailPolicy::Fail).passed);
    assert(!validator.evaluateNamed("ValueInSet", "Maybe", {"Ignore", "Warn", "Fail"}, FailPolicy::Fail).passed);

    assert(validator.evaluateNamed("LayersShareCrs", "a", {"b"}, FailPolicy::Fail).passed);
    assert(!validator.evaluateNamed("LayersShareCrs", "a", {"c"}, FailPolicy::Fail).passed);
    assert(!validator.evaluateNamed("LayersShareCrs", "a", {"missing"}, FailPolicy::Fail).passed);
    assert(validator.evaluateNamed("LayerGeometryIn", "a", {"Polygon", "MultiPolygon"}, FailPolicy::Fail).passed);
    assert(!validator.evaluateNamed("LayerGeometryIn", "c", {"Polygon"}, FailPolicy::Fail).passed);
    assert(validator.evaluateNamed("LayerGeometryIn", "a", {"Blob"}, FailPolicy::Fail).programmingError);

    assert(validator.evaluateNamed("CrsCodeValid", "EPSG:4326", {}, FailPolicy::Fail).passed);
    assert(validator.evaluateNamed("CrsCodeValid", "esri:102003", {}, FailPolicy::Fail).passed);
    assert(!validator.evaluateNamed("CrsCodeValid", "WGS84", {}, FailPolicy::Fail).passed);

    assert(validator.evaluateNamed("IntInRange", "15", {"0", "15"}, FailPolicy::Fail).passed);
    assert(!validator.evaluateNamed("IntInRange", "16", {"0", "15"}, FailPolicy::Fail).passed);
    const CheckResult notInt = validator.evaluateNamed("IntInRange", "five", {"0", "15"}, FailPolicy::Warn);
    assert(!notInt.passed && !notInt.programmingError && notInt.policy == FailPolicy::Warn);

    assert(validator.evaluateNamed("ListLengthIs", "a, b,c", {"3"}, FailPolicy::Fail).passed);
    assert(!validator.evaluateNamed("ListLengthIs", "a,b", {"3"}, FailPolicy::Fail).passed);

    assert(validator.evaluateNamed("PropertyUnique", "Fresh", {}, FailPolicy::Fail).passed);
    assert(!validator.evaluateNamed("PropertyUnique", "Existing", {}, FailPolicy::Fail).passed);

    assert(validator.evaluateNamed("UrlValid", "https://example.com/data/file.zip", {}, FailPolicy::Fail).passed);
    assert(validator.evaluateNamed("UrlValid", "http://localhost:8080/x?y=1", {}, FailPolicy::Fail).passed);
    assert(!validator.evaluateNamed("UrlValid", "file:///etc/passwd", {}, FailPolicy::Fail).passed);
    assert(!validator.evaluateNamed("UrlValid", "not a url", {}, FailPolicy::Fail).passed);

    assert(validator.evaluateNamed("TableIdIsUnique", "t1", {}, FailPolicy::Fail).passed);
    assert(!validator.evaluateNamed("DataStoreIdExists", "ds", {}, FailPolicy::Fail).passed);

    fs::remove_all(root);
    std::cout << "[PASS] Named checks." << std::endl;
}

} // namespace

int main() {
    TestEscalation();
    TestUnknownCheckIsProgrammingError();
    TestNamedChecks();
    std::cout << "[PASS] ValidatorTest" << std::endl;
    return 0;
}
