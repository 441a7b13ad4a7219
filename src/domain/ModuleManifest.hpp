/**
 * @file ModuleManifest.hpp
 * @brief Immutable table of known modules and their published signatures.
 */

#pragma once
#include <map>
#include <string>
#include <vector>

namespace souldos::domain {

/**
 * @struct ManifestEntry
 * @brief Published signature of a module and where it was published.
 */
struct ManifestEntry {
    std::string expectedSignature; ///< Opaque signature token.
    std::string provenanceUrl;     ///< Location the signature was taken from.
};

/**
 * @class ModuleManifest
 * @brief Read-only mapping from module name to ManifestEntry.
 *
 * Entries are fixed at construction; no operation modifies them afterwards.
 */
class ModuleManifest {
public:
    using Entries = std::map<std::string, ManifestEntry>;

    explicit ModuleManifest(Entries entries);

    /** @brief Returns the manifest shipped with SoulWare. */
    static ModuleManifest Default();

    /**
     * @brief Looks up a module.
     * @return Pointer to the entry, or nullptr if the module is not listed.
     */
    const ManifestEntry* find(const std::string& moduleName) const;

    bool contains(const std::string& moduleName) const;
    std::size_t size() const { return m_entries.size(); }

    /** @brief Module names in lexical order. */
    std::vector<std::string> moduleNames() const;

private:
    const Entries m_entries;
};

} // namespace souldos::domain
