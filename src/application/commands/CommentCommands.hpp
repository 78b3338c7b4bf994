/**
 * @file CommentCommands.hpp
 * @brief Lines that are kept in the workflow but do no work: comments, blanks, unknown commands.
 */

#pragma once

#include <string>

#include "application/Command.hpp"

namespace geoflow::application::commands {

/**
 * @class TextLineCommand
 * @brief Command whose text is kept verbatim instead of being parsed.
 */
class TextLineCommand : public Command {
public:
    explicit TextLineCommand(std::string name) : Command(std::move(name), {}) {}

    void initialize(const std::string& commandText) override { m_text = commandText; }
    std::string toString() const override { return m_text; }

protected:
    void runCommand(WorkflowContext&) override {}

private:
    std::string m_text;
};

/** "# ..." line. */
class Comment : public TextLineCommand {
public:
    Comment() : TextLineCommand("Comment") {}
};

class Blank : public TextLineCommand {
public:
    Blank() : TextLineCommand("Blank") {}
};

/** Opens a comment block: following commands are not processed until the block ends. */
class CommentBlockStart : public TextLineCommand {
public:
    CommentBlockStart() : TextLineCommand("CommentBlockStart") {}
    bool opensCommentBlock() const override { return true; }
};

class CommentBlockEnd : public TextLineCommand {
public:
    CommentBlockEnd() : TextLineCommand("CommentBlockEnd") {}
    bool closesCommentBlock() const override { return true; }
};

/**
 * @class UnknownCommand
 * @brief Placeholder for a line whose command name is not registered. Always fails validation.
 */
class UnknownCommand : public TextLineCommand {
public:
    UnknownCommand() : TextLineCommand("UnknownCommand") {}

protected:
    void checkParameters(const domain::PropertyStore& properties) override;
};

} // namespace geoflow::application::commands
