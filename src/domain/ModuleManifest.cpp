/**
 * @file ModuleManifest.cpp
 * @brief Implementation of the ModuleManifest class.
 */

#include "domain/ModuleManifest.hpp"
#include <utility>

namespace souldos::domain {

ModuleManifest::ModuleManifest(Entries entries)
    : m_entries(std::move(entries)) {}

ModuleManifest ModuleManifest::Default() {
    Entries entries = {
        {"SoulOS_Core", {"hash_core_123_abc", "gh://soulware/core/v1.0"}},
        {"TensorMemoryDriver", {"hash_tensor_xyz_789", "gh://soulware/tensor/v0.9"}},
        {"EmotionalResonanceEngine", {"hash_ere_qwerty_456", "gh://soulware/ere/v0.5"}},
        {"UserInterfaceModule", {"hash_ui_zxcv_321", "gh://soulware/ui/v1.1"}},
    };
    return ModuleManifest(std::move(entries));
}

const ManifestEntry* ModuleManifest::find(const std::string& moduleName) const {
    auto it = m_entries.find(moduleName);
    if (it == m_entries.end()) {
        return nullptr;
    }
    return &it->second;
}

bool ModuleManifest::contains(const std::string& moduleName) const {
    return m_entries.count(moduleName) > 0;
}

std::vector<std::string> ModuleManifest::moduleNames() const {
    std::vector<std::string> names;
    names.reserve(m_entries.size());
    for (const auto& item : m_entries) {
        names.push_back(item.first);
    }
    return names;
}

} // namespace souldos::domain
