/**
 * @file CommandParser.cpp
 * @brief Implementation of the CommandParser class.
 */

#include "application/CommandParser.hpp"
#include <sstream>

namespace souldos::application {

namespace {

const CommandSpec& VersionFlagSpec() {
    static const CommandSpec spec{"--version", CommandKind::Version, {}, {}, "Prints version"};
    return spec;
}

const CommandSpec* ResolveToken(const std::string& token) {
    if (token == "-h" || token == "--help") {
        return CommandCatalog::Find("help");
    }
    if (token == "-V" || token == "--version") {
        return &VersionFlagSpec();
    }
    return CommandCatalog::Find(token);
}

} // namespace

std::vector<std::string> CommandParser::Tokenize(const std::string& line) {
    std::vector<std::string> tokens;
    std::istringstream ss(line);
    std::string token;
    while (ss >> token) {
        tokens.push_back(token);
    }
    return tokens;
}

std::optional<Command> CommandParser::Parse(const std::string& line, std::string& errorOut) {
    std::vector<std::string> tokens = Tokenize(line);
    if (tokens.empty()) {
        errorOut = "error: no command given\n\nType 'help' for available commands.";
        return std::nullopt;
    }

    const CommandSpec* spec = ResolveToken(tokens[0]);
    if (!spec) {
        errorOut = "error: unrecognized command '" + tokens[0] + "'\n\nType 'help' for available commands.";
        return std::nullopt;
    }

    std::vector<std::string> args(tokens.begin() + 1, tokens.end());

    if (args.size() < spec->requiredArgs.size()) {
        std::ostringstream ss;
        ss << "error: the following required arguments were not provided:\n";
        for (std::size_t i = args.size(); i < spec->requiredArgs.size(); ++i) {
            ss << "  <" << spec->requiredArgs[i] << ">\n";
        }
        ss << "\nUsage: " << spec->usage();
        errorOut = ss.str();
        return std::nullopt;
    }

    if (args.size() > spec->maxArgs()) {
        errorOut = "error: unexpected argument '" + args[spec->maxArgs()] + "' found\n\nUsage: " + spec->usage();
        return std::nullopt;
    }

    errorOut.clear();
    return Command{spec->kind, std::move(args)};
}

} // namespace souldos::application
