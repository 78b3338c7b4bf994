/**
 * @file CommandUtil.hpp
 * @brief Small helpers shared by the built-in commands.
 */

#pragma once

#include <memory>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include "domain/GeoLayer.hpp"
#include "domain/PropertyStore.hpp"

namespace geoflow::application::commands {

inline const std::vector<std::string>& CollisionChoices() {
    static const std::vector<std::string> choices = {"Replace", "ReplaceAndWarn", "Warn", "Fail"};
    return choices;
}

inline const std::vector<std::string>& NotFoundChoices() {
    static const std::vector<std::string> choices = {"Ignore", "Warn", "Fail"};
    return choices;
}

inline const std::vector<std::string>& PropertyTypeChoices() {
    static const std::vector<std::string> choices = {"str", "bool", "int", "float"};
    return choices;
}

/**
 * @brief Wildcard match supporting '*' and '?'. Case-sensitive.
 */
inline bool GlobMatch(const std::string& pattern, const std::string& text) {
    std::size_t p = 0, t = 0;
    std::size_t star = std::string::npos, mark = 0;
    while (t < text.size()) {
        if (p < pattern.size() && (pattern[p] == '?' || pattern[p] == text[t])) {
            ++p;
            ++t;
        } else if (p < pattern.size() && pattern[p] == '*') {
            star = p++;
            mark = t;
        } else if (star != std::string::npos) {
            p = star + 1;
            t = ++mark;
        } else {
            return false;
        }
    }
    while (p < pattern.size() && pattern[p] == '*') {
        ++p;
    }
    return p == pattern.size();
}

/**
 * @brief Converts @p text to a property value of @p type ("str", "bool", "int", "float").
 * @return nullopt when the text does not parse as the type.
 */
std::optional<domain::PropertyValue> ParseTypedValue(const std::string& type, const std::string& text);

/** @brief Single delimiter character; "\t" (backslash t) means tab. */
std::optional<char> ParseDelimiter(const std::string& text);

/** @brief Attribute names used by any feature of @p layer. */
std::set<std::string> AttributeNames(const domain::GeoLayer& layer);

/**
 * @brief Dereferences a collaborator, throwing when it was not configured.
 */
template <typename T>
T& RequireService(const std::shared_ptr<T>& service, const std::string& what) {
    if (!service) {
        throw std::runtime_error("No " + what + " is configured for this workflow.");
    }
    return *service;
}

} // namespace geoflow::application::commands
