/**
 * @file CommentCommands.cpp
 * @brief Implementation of UnknownCommand.
 */

#include "application/commands/CommentCommands.hpp"

#include "application/CommandParser.hpp"

namespace geoflow::application::commands {

void UnknownCommand::checkParameters(const domain::PropertyStore&) {
    logInitFailure("Command \"" + CommandParser::ExtractName(toString()) + "\" is not a recognized command.",
                   "Check the command name for spelling errors.");
}

} // namespace geoflow::application::commands
