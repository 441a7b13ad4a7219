/**
 * @file CommandCatalog.hpp
 * @brief Central table of shell commands, their arguments and help texts.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace souldos::application {

/**
 * @enum CommandKind
 * @brief Closed set of operations the shell can dispatch.
 */
enum class CommandKind {
    Help,
    Version,              ///< -V / --version.
    Ver,
    Date,
    Time,
    ClearScreen,          ///< cls, clear.
    List,                 ///< ls, dir.
    Status,               ///< status, mem.
    CheckModuleIntegrity,
    SystemIntegrityCheck,
    Ping,
    InitNpu,
    MapEmotion,
    CollapseTruth,
    RunOnnxTest
};

/**
 * @struct CommandSpec
 * @brief Grammar and documentation of one command token.
 */
struct CommandSpec {
    std::string name;
    CommandKind kind;
    std::vector<std::string> requiredArgs; ///< Positional, in order.
    std::vector<std::string> optionalArgs; ///< Follow the required ones.
    std::string description;

    /** @brief e.g. "collapse-truth <emotion> <mode> <time>". */
    std::string usage() const;
    std::size_t maxArgs() const { return requiredArgs.size() + optionalArgs.size(); }
};

class CommandCatalog {
public:
    static constexpr const char* kProgramName = "SoulDOS";
    static constexpr const char* kVersion = "0.0.1-alpha";
    static constexpr const char* kAbout = "CLI for SoulWare OS";

    /** @brief All commands in help order. Aliases are separate entries. */
    static const std::vector<CommandSpec>& All();

    /** @brief Finds a command by its exact token (case-sensitive). */
    static const CommandSpec* Find(const std::string& name);

    /** @brief Full help listing. */
    static std::string HelpText();

    /** @brief Usage and description of one command, or nullopt if unknown. */
    static std::optional<std::string> CommandHelp(const std::string& name);

    /** @brief "SoulDOS 0.0.1-alpha". */
    static std::string VersionText();
};

} // namespace souldos::application
