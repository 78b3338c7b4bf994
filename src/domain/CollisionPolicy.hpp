/**
 * @file CollisionPolicy.hpp
 * @brief What happens when an ID being registered already exists.
 */

#pragma once

#include <algorithm>
#include <cctype>
#include <optional>
#include <string>

namespace geoflow::domain {

enum class CollisionPolicy {
    Replace,         ///< Overwrite silently.
    ReplaceAndWarn,  ///< Overwrite and report a warning.
    Warn,            ///< Keep the existing entry and report a warning.
    Fail             ///< Keep the existing entry and report a failure.
};

/**
 * @struct RegisterOutcome
 * @brief Result of EntityRegistry::registerEntity(). Translated into log records by the caller.
 */
struct RegisterOutcome {
    bool inserted = false;
    bool warned = false;
    bool failed = false;
};

inline std::string CollisionPolicyToString(CollisionPolicy policy) {
    switch (policy) {
        case CollisionPolicy::Replace: return "Replace";
        case CollisionPolicy::ReplaceAndWarn: return "ReplaceAndWarn";
        case CollisionPolicy::Warn: return "Warn";
        case CollisionPolicy::Fail: return "Fail";
        default: return "Replace";
    }
}

/**
 * @brief Case-insensitive parse of a collision policy parameter value.
 */
inline std::optional<CollisionPolicy> CollisionPolicyFromString(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (text == "replace") return CollisionPolicy::Replace;
    if (text == "replaceandwarn") return CollisionPolicy::ReplaceAndWarn;
    if (text == "warn") return CollisionPolicy::Warn;
    if (text == "fail") return CollisionPolicy::Fail;
    return std::nullopt;
}

} // namespace geoflow::domain
