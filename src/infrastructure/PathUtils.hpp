// PathUtils Header
#pragma once
#include <string>
#include <filesystem>

namespace souldos::infrastructure {

class PathUtils {
public:
    static std::filesystem::path GetConfigHome();
    static std::filesystem::path GetSettingsFile();
};

} // namespace souldos::infrastructure
