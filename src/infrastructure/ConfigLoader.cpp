/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/PathUtils.hpp"
#include <fstream>
#include <system_error>
#include <nlohmann/json.hpp>
#include <iostream>

namespace souldos::infrastructure {

ShellSettings ConfigLoader::Load(const std::filesystem::path& configPath) {
    ShellSettings settings;
    std::error_code ec;
    if (!std::filesystem::exists(configPath, ec)) {
        if (ec) {
            std::cerr << "[ConfigLoader] Cannot access " << configPath.string() << ": " << ec.message()
                      << ". Using defaults." << std::endl;
        }
        return settings;
    }

    try {
        std::ifstream f(configPath);
        nlohmann::json j;
        f >> j;

        if (!j.is_object()) {
            std::cerr << "[ConfigLoader] Ignoring " << configPath.string() << ": top level is not an object." << std::endl;
            return settings;
        }

        if (j.contains("prompt")) {
            if (j["prompt"].is_string()) {
                settings.prompt = j["prompt"].get<std::string>();
            } else {
                std::cerr << "[ConfigLoader] 'prompt' must be a string. Keeping default." << std::endl;
            }
        }

        if (j.contains("hal_diagnostics")) {
            if (j["hal_diagnostics"].is_boolean()) {
                settings.halDiagnostics = j["hal_diagnostics"].get<bool>();
            } else {
                std::cerr << "[ConfigLoader] 'hal_diagnostics' must be a boolean. Keeping default." << std::endl;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error reading " << configPath.string() << ": " << e.what() << std::endl;
        return ShellSettings{};
    }

    return settings;
}

ShellSettings ConfigLoader::LoadDefault() {
    return Load(PathUtils::GetSettingsFile());
}

} // namespace souldos::infrastructure
