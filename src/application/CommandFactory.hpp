/**
 * @file CommandFactory.hpp
 * @brief Builds command objects from command file lines.
 */

#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "application/Command.hpp"

namespace geoflow::application {

/**
 * @class CommandFactory
 * @brief Maps command names (case-insensitive) to constructors.
 *
 * The default constructor registers every built-in command. Lines that are
 * blank, comments or comment-block markers get their own command types; an
 * unregistered name becomes an UnknownCommand that fails validation.
 */
class CommandFactory {
public:
    using Creator = std::function<std::unique_ptr<Command>()>;

    CommandFactory();

    /** @brief Adds or replaces a command type. */
    void registerCommand(const std::string& name, Creator creator);

    /** @brief Creates and initializes the command for one line. Never returns null. */
    std::unique_ptr<Command> create(const std::string& line) const;

    bool isRegistered(const std::string& name) const;

    /** @brief Registered command names as declared, sorted case-insensitively. */
    std::vector<std::string> commandNames() const;

private:
    struct Entry {
        std::string name;
        Creator creator;
    };
    std::map<std::string, Entry> m_creators;  ///< Keyed by lower-case name.
};

/** @brief Registers the fixed set of built-in commands. */
void RegisterBuiltInCommands(CommandFactory& factory);

} // namespace geoflow::application
