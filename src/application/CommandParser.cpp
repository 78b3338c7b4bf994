/**
 * @file CommandParser.cpp
 * @brief Implementation of CommandParser.
 */

#include "application/CommandParser.hpp"

#include <algorithm>
#include <cctype>

namespace geoflow::application {

namespace {

bool IsSpace(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool IsNameChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

std::string Trim(const std::string& text) {
    auto begin = std::find_if_not(text.begin(), text.end(), IsSpace);
    auto end = std::find_if_not(text.rbegin(), text.rend(), IsSpace).base();
    return (begin < end) ? std::string(begin, end) : std::string();
}

void SkipSpaces(const std::string& text, std::size_t& pos) {
    while (pos < text.size() && IsSpace(text[pos])) {
        ++pos;
    }
}

} // namespace

ParsedCommand CommandParser::Parse(const std::string& text) {
    ParsedCommand parsed;

    std::size_t pos = 0;
    SkipSpaces(text, pos);
    parsed.indent = text.substr(0, pos);

    const std::size_t open = text.find('(', pos);
    if (open == std::string::npos) {
        throw CommandSyntaxError("Command is missing the opening parenthesis.");
    }
    parsed.name = Trim(text.substr(pos, open - pos));
    if (parsed.name.empty() || !std::all_of(parsed.name.begin(), parsed.name.end(), IsNameChar)) {
        throw CommandSyntaxError("Command name \"" + parsed.name + "\" is not valid.");
    }

    const std::string trimmed = Trim(text);
    if (trimmed.empty() || trimmed.back() != ')') {
        throw CommandSyntaxError("Command is missing the closing parenthesis.");
    }
    const std::size_t close = text.find_last_of(')');

    pos = open + 1;
    while (true) {
        SkipSpaces(text, pos);
        if (pos >= close) {
            break;
        }

        const std::size_t equals = text.find('=', pos);
        if (equals == std::string::npos || equals > close) {
            throw CommandSyntaxError("Expected Name=\"Value\" after \"" + text.substr(0, pos) + "\".");
        }
        std::string key = Trim(text.substr(pos, equals - pos));
        if (key.empty() || !std::all_of(key.begin(), key.end(), IsNameChar)) {
            throw CommandSyntaxError("Parameter name \"" + key + "\" is not valid.");
        }

        pos = equals + 1;
        SkipSpaces(text, pos);
        if (pos >= close || text[pos] != '"') {
            throw CommandSyntaxError("Value for parameter \"" + key + "\" must be enclosed in double quotes.");
        }
        ++pos;

        std::string value;
        bool terminated = false;
        while (pos < text.size()) {
            const char c = text[pos];
            if (c == '\\' && pos + 1 < text.size() && (text[pos + 1] == '"' || text[pos + 1] == '\\')) {
                value += text[pos + 1];
                pos += 2;
                continue;
            }
            if (c == '"') {
                terminated = true;
                ++pos;
                break;
            }
            value += c;
            ++pos;
        }
        if (!terminated || pos > close) {
            throw CommandSyntaxError("Value for parameter \"" + key + "\" is missing its closing quote.");
        }

        if (!parsed.parameters.emplace(key, value).second) {
            throw CommandSyntaxError("Parameter \"" + key + "\" is specified more than once.");
        }

        SkipSpaces(text, pos);
        if (pos < close) {
            if (text[pos] != ',') {
                throw CommandSyntaxError("Expected a comma after the value of parameter \"" + key + "\".");
            }
            ++pos;
            SkipSpaces(text, pos);
            if (pos >= close) {
                throw CommandSyntaxError("Expected another Name=\"Value\" after the comma following \"" + key + "\".");
            }
        }
    }
    return parsed;
}

std::string CommandParser::ExtractName(const std::string& text) {
    const std::size_t open = text.find('(');
    return Trim(open == std::string::npos ? text : text.substr(0, open));
}

std::string CommandParser::Render(const std::string& name, const ParameterMap& parameters,
                                  const std::vector<std::string>& order, const std::string& indent) {
    std::vector<std::string> names;
    for (const auto& key : order) {
        if (parameters.count(key)) names.push_back(key);
    }
    for (const auto& [key, value] : parameters) {
        if (std::find(order.begin(), order.end(), key) == order.end()) names.push_back(key);
    }

    std::string out = indent + name + "(";
    bool first = true;
    for (const auto& key : names) {
        const std::string& value = parameters.at(key);
        if (value.empty()) continue;
        if (!first) out += ",";
        out += key + "=\"" + EscapeValue(value) + "\"";
        first = false;
    }
    return out + ")";
}

std::string CommandParser::EscapeValue(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (char c : value) {
        if (c == '"' || c == '\\') out += '\\';
        out += c;
    }
    return out;
}

} // namespace geoflow::application
