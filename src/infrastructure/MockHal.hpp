/**
 * @file MockHal.hpp
 * @brief In-memory HAL that answers with canned data.
 */

#pragma once
#include "domain/Hal.hpp"
#include "domain/ModuleManifest.hpp"
#include <ostream>
#include <string>

namespace souldos::infrastructure {

/**
 * @class MockHal
 * @brief Implements domain::Hal without touching any hardware.
 *
 * Signature checks run against the module manifest; the locally computed
 * signature is simulated and equals the expected one except for
 * kForcedFailureModule.
 */
class MockHal : public domain::Hal {
public:
    /// Module whose simulated local signature never matches the manifest.
    static constexpr const char* kForcedFailureModule = "UserInterfaceModule";
    /// Core module accepted by internal checks without a manifest entry.
    static constexpr const char* kInternalOnlyModule = "RustHAL_Interface";

    /**
     * @brief Constructor for MockHal.
     * @param manifest Module manifest to verify against.
     * @param diagnostics Stream for "MockHAL:" trace lines, or nullptr for silence.
     */
    explicit MockHal(domain::ModuleManifest manifest = domain::ModuleManifest::Default(),
                     std::ostream* diagnostics = nullptr);

    /** @see domain::Hal::getSystemStatus */
    std::string getSystemStatus() const override;

    /** @brief Looks the module up in the manifest or the internal list. @see domain::Hal::verifyModuleSignature */
    domain::VerificationResult verifyModuleSignature(const std::string& moduleName,
                                                     const std::string& signatureSource) const override;

    /** @see domain::Hal::getEmotionalMap */
    std::vector<std::string> getEmotionalMap() const override;

    /** @see domain::Hal::collapseTruthWaveform */
    std::string collapseTruthWaveform(const std::string& emotion,
                                      const std::string& mode,
                                      const std::string& timeVector) const override;

    /** @see domain::Hal::initializeNpu */
    std::string initializeNpu() const override;

    /** @see domain::Hal::runOnnxModel */
    domain::TensorData runOnnxModel(const std::string& modelPath, const domain::TensorData& inputs) const override;

    const domain::ModuleManifest& manifest() const { return m_manifest; }

private:
    domain::VerificationResult verifyAgainstLedger(const std::string& moduleName, const std::string& source) const;
    domain::VerificationResult verifyInternal(const std::string& moduleName, const std::string& source) const;

    /** @brief Placeholder for a real digest of the installed module. */
    std::string computeLocalSignature(const std::string& moduleName, const domain::ManifestEntry& entry) const;

    void trace(const std::string& line) const;

    const domain::ModuleManifest m_manifest; ///< Immutable after construction.
    std::ostream* m_diagnostics; ///< Not owned.
};

} // namespace souldos::infrastructure
