/**
 * @file ShellService.hpp
 * @brief Executes parsed commands against the HAL.
 */

#pragma once

#include "application/CommandParser.hpp"
#include "application/IntegrityCheckService.hpp"
#include "domain/Hal.hpp"
#include <chrono>
#include <functional>
#include <ostream>

namespace souldos::application {

/**
 * @class ShellService
 * @brief Dispatches one Command and prints its result.
 *
 * Commands only print; none of them modifies the HAL or the manifest.
 */
class ShellService {
public:
    /// Source of the current time; system_clock::now when empty.
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    ShellService(const domain::Hal& hal, IntegrityCheckService& integrity, std::ostream& out,
                 Clock clock = nullptr);

    /** @brief Runs the command. HAL errors are printed, never propagated. */
    void Execute(const Command& command);

private:
    void PrintHelp(const Command& command);
    void PrintDate(const char* format);
    void ClearScreen();
    void ShowStatus();
    void CheckModuleIntegrity(const Command& command);
    void InitNpu();
    void MapEmotion();
    void CollapseTruth(const Command& command);
    void RunOnnxTest(const Command& command);

    const domain::Hal& m_hal;
    IntegrityCheckService& m_integrity;
    std::ostream& m_out;
    Clock m_clock;
};

} // namespace souldos::application
