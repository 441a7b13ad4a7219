/**
 * @file CommandParser.hpp
 * @brief Turns one line of shell input into a Command.
 */

#pragma once

#include "application/CommandCatalog.hpp"
#include <optional>
#include <string>
#include <vector>

namespace souldos::application {

/**
 * @struct Command
 * @brief A parsed command with its positional arguments.
 */
struct Command {
    CommandKind kind;
    std::vector<std::string> arguments;

    bool hasArg(std::size_t index) const { return index < arguments.size(); }
    const std::string& arg(std::size_t index) const { return arguments.at(index); }
};

class CommandParser {
public:
    /** @brief Splits on any run of whitespace. */
    static std::vector<std::string> Tokenize(const std::string& line);

    /**
     * @brief Matches a line against the command grammar.
     * @param line Raw input line.
     * @param errorOut Receives a printable message when parsing fails.
     * @return The command, or nullopt on failure.
     */
    static std::optional<Command> Parse(const std::string& line, std::string& errorOut);
};

} // namespace souldos::application
