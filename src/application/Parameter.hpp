/**
 * @file Parameter.hpp
 * @brief Parameter metadata and the typed values produced by validation.
 */

#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace geoflow::application {

/** @brief Raw parameter strings as written in the command text, keyed by name. */
using ParameterMap = std::map<std::string, std::string>;

/**
 * @brief Value of a parameter after validation. String parameters keep their
 * unexpanded text; they are resolved against properties at run time.
 */
using ParameterValue = std::variant<std::string, bool, std::int64_t, std::vector<std::string>>;

enum class ParameterType {
    String,  ///< Free text, expanded at run time.
    Bool,    ///< "True"/"False", case-insensitive.
    Int,     ///< Signed integer.
    List,    ///< Comma-separated items, trimmed, empty items dropped.
    Choice   ///< One of ParameterMetadata::allowedValues, case-insensitive.
};

inline std::string ParameterTypeToString(ParameterType type) {
    switch (type) {
        case ParameterType::String: return "string";
        case ParameterType::Bool: return "boolean";
        case ParameterType::Int: return "integer";
        case ParameterType::List: return "list";
        case ParameterType::Choice: return "choice";
        default: return "string";
    }
}

/**
 * @struct ParameterMetadata
 * @brief Static description of one parameter a command accepts.
 */
struct ParameterMetadata {
    std::string name;
    ParameterType type = ParameterType::String;
    bool required = false;
    std::vector<std::string> allowedValues;  ///< Only for Choice.
    std::string description;
};

} // namespace geoflow::application
