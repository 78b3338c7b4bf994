#undef NDEBUG
#include <cassert>
#include <iostream>
#include <string>

#include "application/CommandParser.hpp"

using namespace geoflow::application;

namespace {

bool ThrowsSyntaxError(const std::string& text) {
    try {
        CommandParser::Parse(text);
    } catch (const CommandSyntaxError&) {
        return true;
    }
    return false;
}

void TestRenderAndParse() {
    std::cout << "[Test] Render then Parse..." << std::endl;
    const ParameterMap parameters = {{"A", "1"}, {"B", "x"}};
    const std::string text = CommandParser::Render("CommandName", parameters, {"A", "B"});
    assert(text == "CommandName(A=\"1\",B=\"x\")");

    const ParsedCommand parsed = CommandParser::Parse(text);
    assert(parsed.name == "CommandName");
    assert(parsed.parameters == parameters);
    assert(parsed.indent.empty());

    assert(CommandParser::Render("CommandName", {}, {}) == "CommandName()");
    assert(CommandParser::Parse("CommandName()").parameters.empty());
    std::cout << "[PASS] Render and Parse." << std::endl;
}

void TestRenderOrder() {
    std::cout << "[Test] Render follows metadata order and omits empty values..." << std::endl;
    const ParameterMap parameters = {{"Zeta", "z"}, {"Alpha", "a"}, {"Extra", "e"}, {"Empty", ""}};
    const std::string text = CommandParser::Render("Cmd", parameters, {"Zeta", "Alpha", "Empty"}, "    ");
    assert(text == "    Cmd(Zeta=\"z\",Alpha=\"a\",Extra=\"e\")");
    std::cout << "[PASS] Render order." << std::endl;
}

void TestWhitespaceAndEscapes() {
    std::cout << "[Test] Whitespace, indentation and escapes..." << std::endl;
    const ParsedCommand parsed =
        CommandParser::Parse("  Message( Message = \"say \\\"hi\\\" to C:\\\\data\" , CommandStatus=\"Warning\" )");
    assert(parsed.indent == "  ");
    assert(parsed.name == "Message");
    assert(parsed.parameters.at("Message") == "say \"hi\" to C:\\data");
    assert(parsed.parameters.at("CommandStatus") == "Warning");

    const std::string rendered = CommandParser::Render(parsed.name, parsed.parameters, {"Message"});
    assert(CommandParser::Parse(rendered).parameters == parsed.parameters);

    // Commas and parentheses inside quotes belong to the value.
    const ParsedCommand quoted = CommandParser::Parse("SetProperty(PropertyValues=\"a,b,(c)\")");
    assert(quoted.parameters.at("PropertyValues") == "a,b,(c)");
    std::cout << "[PASS] Whitespace and escapes." << std::endl;
}

void TestSyntaxErrors() {
    std::cout << "[Test] Syntax errors..." << std::endl;
    assert(ThrowsSyntaxError("Message"));
    assert(ThrowsSyntaxError("Message(Message=\"x\""));
    assert(ThrowsSyntaxError("Message(Message=x)"));
    assert(ThrowsSyntaxError("Message(Message=\"x)"));
    assert(ThrowsSyntaxError("Message(Message=\"x\",Message=\"y\")"));
    assert(ThrowsSyntaxError("Message(Message=\"x\" CommandStatus=\"Warning\")"));
    assert(ThrowsSyntaxError("Bad Name(A=\"1\")"));
    assert(ThrowsSyntaxError("(A=\"1\")"));
    assert(ThrowsSyntaxError("Message(Message=\"x\",)"));
    assert(ThrowsSyntaxError("Message(Message=\"x\" , )"));
    assert(ThrowsSyntaxError("Message(,)"));
    std::cout << "[PASS] Syntax errors." << std::endl;
}

void TestExtractName() {
    std::cout << "[Test] ExtractName never throws..." << std::endl;
    assert(CommandParser::ExtractName("  ReadGeoLayerFromGeoJSON(InputFile=\"a\")") == "ReadGeoLayerFromGeoJSON");
    assert(CommandParser::ExtractName("NoParentheses") == "NoParentheses");
    assert(CommandParser::ExtractName("Broken(A=") == "Broken");
    assert(CommandParser::ExtractName("").empty());
    assert(CommandParser::EscapeValue("a\"b\\c") == "a\\\"b\\\\c");
    std::cout << "[PASS] ExtractName." << std::endl;
}

} // namespace

int main() {
    TestRenderAndParse();
    TestRenderOrder();
    TestWhitespaceAndEscapes();
    TestSyntaxErrors();
    TestExtractName();
    std::cout << "[PASS] CommandParserTest" << std::endl;
    return 0;
}
