/**
 * @file MockHal.cpp
 * @brief Implementation of the MockHal class.
 */
#include "infrastructure/MockHal.hpp"
#include "domain/SignatureSource.hpp"
#include <utility>

namespace souldos::infrastructure {

namespace {

std::string Quote(const std::string& value) {
    return "'" + value + "'";
}

} // namespace

MockHal::MockHal(domain::ModuleManifest manifest, std::ostream* diagnostics)
    : m_manifest(std::move(manifest)), m_diagnostics(diagnostics) {}

void MockHal::trace(const std::string& line) const {
    if (m_diagnostics) {
        *m_diagnostics << "MockHAL: " << line << "\n";
    }
}

std::string MockHal::getSystemStatus() const {
    return "MockStatus: System Optimal, Resonance Field Stable.";
}

domain::VerificationResult MockHal::verifyModuleSignature(const std::string& moduleName,
                                                          const std::string& signatureSource) const {
    if (signatureSource == domain::signature_source::kLedger) {
        return verifyAgainstLedger(moduleName, signatureSource);
    }
    if (signatureSource == domain::signature_source::kInternal) {
        return verifyInternal(moduleName, signatureSource);
    }
    return domain::VerificationResult::Error("Unknown signature source: " + signatureSource);
}

domain::VerificationResult MockHal::verifyAgainstLedger(const std::string& moduleName, const std::string& source) const {
    trace("Accessing GitHub manifest for module " + Quote(moduleName) + " via " + Quote(source) + "...");

    const domain::ManifestEntry* entry = m_manifest.find(moduleName);
    if (!entry) {
        trace("Module " + Quote(moduleName) + " not found in GitHub manifest.");
        return domain::VerificationResult::Error(
            "Module " + Quote(moduleName) + " not listed in the simulated GitHub Blockchain Ledger.");
    }

    trace("Found entry. Expected signature (from " + entry->provenanceUrl + "): " + entry->expectedSignature);
    std::string local = computeLocalSignature(moduleName, *entry);
    trace("Calculated local signature for " + Quote(moduleName) + ": " + local);

    if (local == entry->expectedSignature) {
        trace("Signature VERIFIED for " + Quote(moduleName) + ".");
        return domain::VerificationResult::Verified();
    }

    trace("SIGNATURE MISMATCH for " + Quote(moduleName) + "! Expected " + Quote(entry->expectedSignature) +
          ", got " + Quote(local) + ".");
    return domain::VerificationResult::Failed();
}

domain::VerificationResult MockHal::verifyInternal(const std::string& moduleName, const std::string& source) const {
    trace("Performing internal integrity check for core module " + Quote(moduleName) + " against " +
          Quote(source) + "...");

    if (m_manifest.contains(moduleName) || moduleName == kInternalOnlyModule) {
        trace("Core module " + Quote(moduleName) + " integrity VERIFIED internally.");
        return domain::VerificationResult::Verified();
    }

    trace("Core module " + Quote(moduleName) + " not recognized for internal check.");
    return domain::VerificationResult::Error("Core module " + Quote(moduleName) + " not recognized for internal check.");
}

std::string MockHal::computeLocalSignature(const std::string& moduleName, const domain::ManifestEntry& entry) const {
    // Simulated mismatch; no digest is actually computed.
    if (moduleName == kForcedFailureModule) {
        return "hash_ui_zxcv_FAIL";
    }
    return entry.expectedSignature;
}

std::vector<std::string> MockHal::getEmotionalMap() const {
    return {"Joy: Bright Cloud", "Sadness: Blue Mist"};
}

std::string MockHal::collapseTruthWaveform(const std::string& emotion,
                                           const std::string& mode,
                                           const std::string& timeVector) const {
    trace("Collapsing truth waveform for emotion " + Quote(emotion) + ", mode " + Quote(mode) +
          ", time_vector " + Quote(timeVector));
    return "MockHAL: Waveform collapsed to 'MockMemoryNode'";
}

std::string MockHal::initializeNpu() const {
    return "MockHAL: NPU initialized and ready for ONNX models.";
}

domain::TensorData MockHal::runOnnxModel(const std::string& modelPath, const domain::TensorData& inputs) const {
    trace("Running ONNX model " + modelPath + " with input info: " + Quote(inputs.info));
    return domain::TensorData{"MockHAL: ONNX model " + modelPath + " processed with input " + inputs.info};
}

} // namespace souldos::infrastructure
