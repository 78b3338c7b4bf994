/**
 * @file PathFormatter.hpp
 * @brief Formatter codes that derive names from a resolved absolute path.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace geoflow::domain {

/**
 * @enum FormatterCode
 * @brief Fixed set of path components a formatter can select.
 */
enum class FormatterCode {
    FileNameWithExtension,  ///< %F  -> "c.geojson"
    FileName,               ///< %f  -> "c"
    FullPath,               ///< %P  -> "/a/b/c.geojson"
    ParentPath,             ///< %p  -> "/a/b"
    Extension               ///< %E  -> ".geojson" (empty for extensionless paths)
};

class UnknownFormatterError : public std::invalid_argument {
public:
    explicit UnknownFormatterError(const std::string& code)
        : std::invalid_argument("Formatter code \"" + code + "\" is not recognized.") {}
};

/**
 * @brief Parses a two character code such as "%f".
 * @throws UnknownFormatterError for anything else.
 */
FormatterCode ParseFormatterCode(const std::string& code);

/**
 * @brief Selects one component of @p path. Never fails; may return "".
 */
std::string ApplyFormatter(const std::string& path, FormatterCode code);

/** @brief ParseFormatterCode() followed by ApplyFormatter(). */
std::string ApplyFormatter(const std::string& path, const std::string& code);

/**
 * @brief Replaces every formatter code embedded in @p pattern ("%f_clip", "%p/%f.csv").
 *
 * "%%" produces a literal percent sign. Any other "%x" throws UnknownFormatterError.
 */
std::string FormatPath(const std::string& path, const std::string& pattern);

} // namespace geoflow::domain
