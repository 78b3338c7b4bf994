/**
 * @file CommandFactory.cpp
 * @brief Implementation of CommandFactory.
 */

#include "application/CommandFactory.hpp"

#include <algorithm>
#include <cctype>

#include "application/CommandParser.hpp"
#include "application/commands/CommentCommands.hpp"

namespace geoflow::application {

namespace {

std::string ToLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

bool StartsWith(const std::string& text, const char* prefix) {
    return text.rfind(prefix, 0) == 0;
}

} // namespace

CommandFactory::CommandFactory() {
    RegisterBuiltInCommands(*this);
}

void CommandFactory::registerCommand(const std::string& name, Creator creator) {
    m_creators[ToLower(name)] = Entry{name, std::move(creator)};
}

std::unique_ptr<Command> CommandFactory::create(const std::string& line) const {
    const auto first = line.find_first_not_of(" \t\r\n");
    const std::string trimmed = (first == std::string::npos) ? std::string() : line.substr(first);

    std::unique_ptr<Command> command;
    if (trimmed.empty()) {
        command = std::make_unique<commands::Blank>();
    } else if (StartsWith(trimmed, "#")) {
        command = std::make_unique<commands::Comment>();
    } else if (StartsWith(trimmed, "/*")) {
        command = std::make_unique<commands::CommentBlockStart>();
    } else if (StartsWith(trimmed, "*/")) {
        command = std::make_unique<commands::CommentBlockEnd>();
    } else {
        auto it = m_creators.find(ToLower(CommandParser::ExtractName(trimmed)));
        if (it != m_creators.end()) {
            command = it->second.creator();
        } else {
            command = std::make_unique<commands::UnknownCommand>();
        }
    }
    command->initialize(line);
    return command;
}

bool CommandFactory::isRegistered(const std::string& name) const {
    return m_creators.count(ToLower(name)) > 0;
}

std::vector<std::string> CommandFactory::commandNames() const {
    std::vector<std::string> names;
    names.reserve(m_creators.size());
    for (const auto& [key, entry] : m_creators) {
        names.push_back(entry.name);
    }
    return names;
}

} // namespace geoflow::application
