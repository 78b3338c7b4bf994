/**
 * @file CommandUtil.cpp
 * @brief Implementation of the command helpers.
 */

#include "application/commands/CommandUtil.hpp"

#include <algorithm>
#include <cctype>

namespace geoflow::application::commands {

std::optional<domain::PropertyValue> ParseTypedValue(const std::string& type, const std::string& text) {
    if (type == "bool") {
        std::string lowered = text;
        std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (lowered == "true") return domain::PropertyValue(true);
        if (lowered == "false") return domain::PropertyValue(false);
        return std::nullopt;
    }
    if (type == "int") {
        try {
            std::size_t used = 0;
            const long long value = std::stoll(text, &used);
            if (used != text.size()) return std::nullopt;
            return domain::PropertyValue(static_cast<std::int64_t>(value));
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }
    if (type == "float") {
        try {
            std::size_t used = 0;
            const double value = std::stod(text, &used);
            if (used != text.size()) return std::nullopt;
            return domain::PropertyValue(value);
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }
    return domain::PropertyValue(text);
}

std::optional<char> ParseDelimiter(const std::string& text) {
    if (text == "\\t") return '\t';
    if (text.size() == 1) return text[0];
    return std::nullopt;
}

std::set<std::string> AttributeNames(const domain::GeoLayer& layer) {
    std::set<std::string> names;
    for (const auto& feature : layer.features) {
        if (feature.contains("properties") && feature["properties"].is_object()) {
            for (const auto& item : feature["properties"].items()) {
                names.insert(item.key());
            }
        }
    }
    return names;
}

} // namespace geoflow::application::commands
