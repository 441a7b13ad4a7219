/**
 * @file SoulDosApp.hpp
 * @brief Main application class for SoulDOS.
 */

#pragma once

#include "application/ShellServices.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include <istream>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace souldos::app {

/**
 * @class SoulDosApp
 * @brief Orchestrates the shell lifecycle: banner, boot sequence and the read-eval-print loop.
 */
class SoulDosApp {
public:
    /**
     * @param hal HAL the shell dispatches to.
     * @param settings Presentation settings.
     * @param in Source of command lines.
     * @param out Destination of all user-facing output.
     */
    SoulDosApp(std::unique_ptr<domain::Hal> hal, infrastructure::ShellSettings settings,
               std::istream& in, std::ostream& out);

    /**
     * @brief Boots the system and runs the loop until exit/quit or end of input.
     * @return Exit code (0 for success).
     */
    int Run();

    /**
     * @brief Handles process arguments before the shell starts.
     * Only a single -h/--help or -V/--version is accepted.
     * @return Exit code when the process should stop, nullopt to start the shell.
     */
    static std::optional<int> HandleInvocation(const std::vector<std::string>& args, std::ostream& out,
                                               std::ostream& err);

private:
    /** @brief Prints the banner and runs the fixed boot sequence. */
    void Init();

    void PrintBanner();

    /**
     * @brief Handles one input line.
     * @return False when the shell should stop.
     */
    bool HandleLine(const std::string& line);

    infrastructure::ShellSettings m_settings;
    std::istream& m_in;
    std::ostream& m_out;
    application::ShellServices m_services;
};

} // namespace souldos::app
