/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading the shell configuration (settings.json).
 *
 * Keeps JSON parsing out of the shell and the HAL. A missing or broken file
 * never stops the shell; defaults are used instead.
 */

#pragma once

#include <filesystem>
#include <string>

namespace souldos::infrastructure {

/**
 * @struct ShellSettings
 * @brief User-tunable presentation settings.
 */
struct ShellSettings {
    std::string prompt = "SoulDOS> "; ///< Text printed before each input line.
    bool halDiagnostics = true;       ///< Echo "MockHAL:" trace lines.
};

class ConfigLoader {
public:
    /**
     * @brief Reads settings from the given file.
     * @param configPath Path to a settings.json file.
     * @return Settings with defaults for every key that is absent or invalid.
     */
    static ShellSettings Load(const std::filesystem::path& configPath);

    /** @brief Reads settings from PathUtils::GetSettingsFile(). */
    static ShellSettings LoadDefault();
};

} // namespace souldos::infrastructure
