/**
 * @file CheckCondition.hpp
 * @brief Closed set of runtime preconditions a command can ask the Validator to evaluate.
 */

#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include "application/WorkflowContext.hpp"
#include "domain/GeoLayer.hpp"
#include "domain/Severity.hpp"

namespace geoflow::application {

/**
 * @enum FailPolicy
 * @brief How a failed check escalates.
 */
enum class FailPolicy {
    Fail,             ///< FAILURE record, effect must not run.
    Warn,             ///< WARNING record, effect may still run.
    WarnButDoNotRun   ///< WARNING record, effect must not run.
};

inline std::string FailPolicyToString(FailPolicy policy) {
    switch (policy) {
        case FailPolicy::Fail: return "Fail";
        case FailPolicy::Warn: return "Warn";
        case FailPolicy::WarnButDoNotRun: return "WarnButDoNotRun";
        default: return "Fail";
    }
}

/** @brief Severity of the record a failed check under @p policy produces. */
inline domain::Severity SeverityFor(FailPolicy policy) {
    return policy == FailPolicy::Fail ? domain::Severity::Failure : domain::Severity::Warning;
}

/** @brief Whether a failed check under @p policy prevents the effect. */
inline bool BlocksRun(FailPolicy policy) {
    return policy != FailPolicy::Warn;
}

namespace checks {

/** Path exists and is a regular file. */
struct FileExists { std::string path; };
/** Path exists and is a directory. */
struct FolderExists { std::string path; };
/** The folder that would contain the path exists. */
struct ParentFolderExists { std::string path; };
/** Value is one of the allowed values (case-insensitive). */
struct ValueInSet { std::string parameter; std::string value; std::vector<std::string> allowed; };
/** Referenced input ID is present in the registry. */
struct IdExists { EntityKind kind; std::string id; };
/** Referenced input ID is absent from the registry. */
struct IdIsUnique { EntityKind kind; std::string id; };
/** Every referenced layer exists and uses the same CRS. */
struct LayersShareCrs { std::vector<std::string> layerIds; };
/** Referenced layer's geometry kind is one of the allowed kinds. */
struct LayerGeometryIn { std::string layerId; std::vector<domain::GeometryKind> allowed; };
/** Value is an authority code such as EPSG:4326. */
struct CrsCodeValid { std::string code; };
/** Value lies in [min, max]. */
struct IntInRange { std::string parameter; std::int64_t value; std::int64_t min; std::int64_t max; };
/** List has exactly the expected number of items. */
struct ListLengthIs { std::string parameter; std::size_t actual; std::size_t expected; };
/** No property with this name exists yet. */
struct PropertyUnique { std::string name; };
/** Value is a syntactically valid http, https or ftp URL. */
struct UrlValid { std::string url; };

} // namespace checks

using CheckCondition = std::variant<
    checks::FileExists,
    checks::FolderExists,
    checks::ParentFolderExists,
    checks::ValueInSet,
    checks::IdExists,
    checks::IdIsUnique,
    checks::LayersShareCrs,
    checks::LayerGeometryIn,
    checks::CrsCodeValid,
    checks::IntInRange,
    checks::ListLengthIs,
    checks::PropertyUnique,
    checks::UrlValid>;

/**
 * @struct CheckResult
 * @brief Outcome of one evaluation.
 *
 * A programming error (unknown condition name, malformed arguments) always
 * carries FailPolicy::Fail whatever policy the caller asked for.
 */
struct CheckResult {
    bool passed = true;
    std::string message;
    std::string recommendation;
    FailPolicy policy = FailPolicy::Fail;
    bool programmingError = false;

    domain::Severity severity() const {
        return passed ? domain::Severity::Success : SeverityFor(policy);
    }

    bool blocksRun() const {
        return !passed && BlocksRun(policy);
    }
};

} // namespace geoflow::application
