#include "infrastructure/PathUtils.hpp"
#include <cstdlib>
#include <filesystem>

namespace souldos::infrastructure {

namespace fs = std::filesystem;

fs::path PathUtils::GetConfigHome() {
    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfigHome && *xdgConfigHome) {
        return fs::path(xdgConfigHome);
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home) / ".config";
    }
    return fs::current_path();
}

fs::path PathUtils::GetSettingsFile() {
    const char* explicitPath = std::getenv("SOULDOS_CONFIG");
    if (explicitPath && *explicitPath) {
        return fs::path(explicitPath);
    }
    return GetConfigHome() / "SoulDOS" / "settings.json";
}

} // namespace souldos::infrastructure
