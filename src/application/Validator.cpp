/**
 * @file Validator.cpp
 * @brief Implementation of the check dispatcher.
 */

#include "application/Validator.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <optional>
#include <regex>

namespace geoflow::application {

namespace fs = std::filesystem;

namespace {

std::string ToLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::string Join(const std::vector<std::string>& items) {
    std::string out;
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out += ", ";
        out += items[i];
    }
    return out;
}

CheckResult Pass() {
    return CheckResult{};
}

CheckResult Failed(std::string message, std::string recommendation) {
    CheckResult result;
    result.passed = false;
    result.message = std::move(message);
    result.recommendation = std::move(recommendation);
    return result;
}

std::optional<std::int64_t> ParseInt(const std::string& text) {
    try {
        std::size_t used = 0;
        const long long value = std::stoll(text, &used);
        if (used != text.size()) return std::nullopt;
        return static_cast<std::int64_t>(value);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::vector<std::string> SplitList(const std::string& text) {
    std::vector<std::string> items;
    std::size_t start = 0;
    while (start <= text.size()) {
        std::size_t comma = text.find(',', start);
        if (comma == std::string::npos) comma = text.size();
        std::string item = text.substr(start, comma - start);
        item.erase(0, item.find_first_not_of(" \t"));
        item.erase(item.find_last_not_of(" \t") + 1);
        if (!item.empty()) items.push_back(item);
        start = comma + 1;
    }
    return items;
}

} // namespace

Validator::Validator(const WorkflowContext& context) : m_context(context) {}

CheckResult Validator::evaluate(const CheckCondition& condition, FailPolicy policy) const {
    CheckResult result = std::visit([this](const auto& c) { return check(c); }, condition);
    if (!result.passed) {
        result.policy = policy;
    }
    return result;
}

CheckResult Validator::evaluateNamed(const std::string& conditionName, const std::string& value,
                                     const std::vector<std::string>& contextValues, FailPolicy policy) const {
    const std::string name = ToLower(conditionName);

    auto entityCheck = [&](EntityKind kind, bool mustExist) -> CheckResult {
        if (mustExist) return evaluate(checks::IdExists{kind, value}, policy);
        return evaluate(checks::IdIsUnique{kind, value}, policy);
    };

    if (name == "fileexists") return evaluate(checks::FileExists{value}, policy);
    if (name == "folderexists") return evaluate(checks::FolderExists{value}, policy);
    if (name == "parentfolderexists") return evaluate(checks::ParentFolderExists{value}, policy);
    if (name == "valueinset") return evaluate(checks::ValueInSet{"Value", value, contextValues}, policy);
    if (name == "geolayeridexists") return entityCheck(EntityKind::GeoLayer, true);
    if (name == "tableidexists") return entityCheck(EntityKind::Table, true);
    if (name == "datastoreidexists") return entityCheck(EntityKind::DataStore, true);
    if (name == "geolayeridisunique") return entityCheck(EntityKind::GeoLayer, false);
    if (name == "tableidisunique") return entityCheck(EntityKind::Table, false);
    if (name == "datastoreidisunique") return entityCheck(EntityKind::DataStore, false);
    if (name == "crscodevalid") return evaluate(checks::CrsCodeValid{value}, policy);
    if (name == "propertyunique") return evaluate(checks::PropertyUnique{value}, policy);
    if (name == "urlvalid") return evaluate(checks::UrlValid{value}, policy);

    if (name == "layerssharecrs") {
        std::vector<std::string> ids{value};
        ids.insert(ids.end(), contextValues.begin(), contextValues.end());
        return evaluate(checks::LayersShareCrs{ids}, policy);
    }
    if (name == "layergeometryin") {
        std::vector<domain::GeometryKind> kinds;
        for (const auto& text : contextValues) {
            const domain::GeometryKind kind = domain::GeometryKindFromString(text);
            if (kind == domain::GeometryKind::Unknown) {
                return ProgrammingError("Check LayerGeometryIn was given an unknown geometry \"" + text + "\".");
            }
            kinds.push_back(kind);
        }
        return evaluate(checks::LayerGeometryIn{value, kinds}, policy);
    }
    if (name == "intinrange") {
        const auto number = ParseInt(value);
        if (contextValues.size() != 2) {
            return ProgrammingError("Check IntInRange expects a minimum and a maximum.");
        }
        const auto low = ParseInt(contextValues[0]);
        const auto high = ParseInt(contextValues[1]);
        if (!low || !high) {
            return ProgrammingError("Check IntInRange was given non-integer bounds.");
        }
        if (!number) {
            CheckResult result = Failed("Value \"" + value + "\" is not an integer.",
                                        "Specify an integer between " + contextValues[0] + " and " +
                                        contextValues[1] + ".");
            result.policy = policy;
            return result;
        }
        return evaluate(checks::IntInRange{"Value", *number, *low, *high}, policy);
    }
    if (name == "listlengthis") {
        const auto expected = contextValues.size() == 1 ? ParseInt(contextValues[0]) : std::nullopt;
        if (!expected || *expected < 0) {
            return ProgrammingError("Check ListLengthIs expects one non-negative expected length.");
        }
        return evaluate(checks::ListLengthIs{"Value", SplitList(value).size(),
                                             static_cast<std::size_t>(*expected)}, policy);
    }

    return ProgrammingError("Check " + conditionName + " is not a valid check in the validators library.");
}

const std::vector<std::string>& Validator::ConditionNames() {
    static const std::vector<std::string> names = {
        "FileExists", "FolderExists", "ParentFolderExists", "ValueInSet",
        "GeoLayerIdExists", "TableIdExists", "DataStoreIdExists",
        "GeoLayerIdIsUnique", "TableIdIsUnique", "DataStoreIdIsUnique",
        "LayersShareCrs", "LayerGeometryIn", "CrsCodeValid", "IntInRange",
        "ListLengthIs", "PropertyUnique", "UrlValid"
    };
    return names;
}

CheckResult Validator::ProgrammingError(const std::string& message) {
    CheckResult result = Failed(message, "Contact the maintainers of the GeoFlow software.");
    result.policy = FailPolicy::Fail;
    result.programmingError = true;
    return result;
}

CheckResult Validator::check(const checks::FileExists& c) const {
    std::error_code ec;
    if (fs::is_regular_file(c.path, ec)) return Pass();
    return Failed("The file (" + c.path + ") does not exist.", "Specify the path of an existing file.");
}

CheckResult Validator::check(const checks::FolderExists& c) const {
    std::error_code ec;
    if (fs::is_directory(c.path, ec)) return Pass();
    return Failed("The folder (" + c.path + ") does not exist.", "Specify the path of an existing folder.");
}

CheckResult Validator::check(const checks::ParentFolderExists& c) const {
    const fs::path parent = fs::path(c.path).parent_path();
    std::error_code ec;
    if (parent.empty() || fs::is_directory(parent, ec)) return Pass();
    return Failed("The folder of (" + c.path + ") does not exist.",
                  "Create the folder " + parent.generic_string() + " or specify another location.");
}

CheckResult Validator::check(const checks::ValueInSet& c) const {
    const std::string value = ToLower(c.value);
    for (const auto& allowed : c.allowed) {
        if (ToLower(allowed) == value) return Pass();
    }
    return Failed(c.parameter + " value \"" + c.value + "\" is not valid.",
                  "Specify one of: " + Join(c.allowed) + ".");
}

CheckResult Validator::check(const checks::IdExists& c) const {
    if (m_context.exists(c.kind, c.id)) return Pass();
    const std::string kind = EntityKindToString(c.kind);
    return Failed("The " + kind + "ID (" + c.id + ") does not exist.",
                  "Specify the ID of an existing " + kind + ".");
}

CheckResult Validator::check(const checks::IdIsUnique& c) const {
    if (!m_context.exists(c.kind, c.id)) return Pass();
    const std::string kind = EntityKindToString(c.kind);
    return Failed("The " + kind + "ID (" + c.id + ") already exists.",
                  "Specify a " + kind + "ID that is not in use.");
}

CheckResult Validator::check(const checks::LayersShareCrs& c) const {
    std::string reference;
    std::string referenceId;
    for (const auto& id : c.layerIds) {
        const domain::GeoLayer* layer = m_context.geoLayers.get(id);
        if (!layer) {
            return Failed("The GeoLayerID (" + id + ") does not exist.",
                          "Specify the ID of an existing GeoLayer.");
        }
        if (referenceId.empty()) {
            reference = layer->crs;
            referenceId = id;
        } else if (ToLower(layer->crs) != ToLower(reference)) {
            return Failed("The GeoLayers (" + referenceId + ", " + id + ") do not share a coordinate reference system (" +
                          reference + " vs " + layer->crs + ").",
                          "Set the CRS of the GeoLayers so they match.");
        }
    }
    return Pass();
}

CheckResult Validator::check(const checks::LayerGeometryIn& c) const {
    const domain::GeoLayer* layer = m_context.geoLayers.get(c.layerId);
    if (!layer) {
        return Failed("The GeoLayerID (" + c.layerId + ") does not exist.",
                      "Specify the ID of an existing GeoLayer.");
    }
    if (std::find(c.allowed.begin(), c.allowed.end(), layer->geometry) != c.allowed.end()) {
        return Pass();
    }
    std::vector<std::string> names;
    for (auto kind : c.allowed) names.push_back(domain::GeometryKindToString(kind));
    return Failed("The GeoLayer (" + c.layerId + ") has geometry " + domain::GeometryKindToString(layer->geometry) +
                  ".", "Use a GeoLayer with one of these geometries: " + Join(names) + ".");
}

CheckResult Validator::check(const checks::CrsCodeValid& c) const {
    static const std::regex pattern("^(EPSG|ESRI):[0-9]+$", std::regex::icase);
    if (std::regex_match(c.code, pattern)) return Pass();
    return Failed("The CRS code (" + c.code + ") is not valid.",
                  "Specify a code such as EPSG:4326.");
}

CheckResult Validator::check(const checks::IntInRange& c) const {
    if (c.value >= c.min && c.value <= c.max) return Pass();
    return Failed(c.parameter + " value (" + std::to_string(c.value) + ") is out of range.",
                  "Specify a value between " + std::to_string(c.min) + " and " + std::to_string(c.max) + ".");
}

CheckResult Validator::check(const checks::ListLengthIs& c) const {
    if (c.actual == c.expected) return Pass();
    return Failed(c.parameter + " has " + std::to_string(c.actual) + " items but " +
                  std::to_string(c.expected) + " are expected.",
                  "Specify exactly " + std::to_string(c.expected) + " items.");
}

CheckResult Validator::check(const checks::PropertyUnique& c) const {
    if (!m_context.properties.contains(c.name)) return Pass();
    return Failed("The property (" + c.name + ") already exists.", "Specify a property name that is not in use.");
}

CheckResult Validator::check(const checks::UrlValid& c) const {
    static const std::regex pattern("^(https?|ftp)://[^\\s/?#:]+(:[0-9]+)?([/?#][^\\s]*)?$", std::regex::icase);
    if (std::regex_match(c.url, pattern)) return Pass();
    return Failed("The URL (" + c.url + ") is not valid.", "Specify a URL starting with http://, https:// or ftp://.");
}

} // namespace geoflow::application
