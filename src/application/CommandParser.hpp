/**
 * @file CommandParser.hpp
 * @brief Text form of a command: CommandName(Param1="value1",Param2="value2").
 */

#pragma once

#include <stdexcept>
#include <string>
#include <vector>

#include "application/Parameter.hpp"

namespace geoflow::application {

class CommandSyntaxError : public std::invalid_argument {
public:
    explicit CommandSyntaxError(const std::string& message) : std::invalid_argument(message) {}
};

/**
 * @struct ParsedCommand
 * @brief One command line split into its parts.
 */
struct ParsedCommand {
    std::string indent;       ///< Leading whitespace of the line, kept for rendering.
    std::string name;
    ParameterMap parameters;
};

/**
 * @class CommandParser
 * @brief Static parse/render helpers for the command text format.
 *
 * Values are double-quoted; inside a value \" and \\ are the only escapes.
 */
class CommandParser {
public:
    /**
     * @brief Parses a full command line.
     * @throws CommandSyntaxError on missing parentheses, unquoted or unterminated
     * values, and repeated parameter names.
     */
    static ParsedCommand Parse(const std::string& text);

    /**
     * @brief Returns the command name of @p text: the trimmed text before "(" or the
     * whole trimmed line when there is no parenthesis. Never throws.
     */
    static std::string ExtractName(const std::string& text);

    /**
     * @brief Renders a command. Parameters appear in @p order first, then any other
     * names alphabetically. Empty values are omitted.
     */
    static std::string Render(const std::string& name, const ParameterMap& parameters,
                              const std::vector<std::string>& order, const std::string& indent = "");

    static std::string EscapeValue(const std::string& value);
};

} // namespace geoflow::application
