#include <cassert>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "domain/SignatureSource.hpp"
#include "infrastructure/MockHal.hpp"

using namespace souldos::domain;
using souldos::infrastructure::MockHal;

int main() {
    std::cout << "[Test] Starting Signature Verification Test..." << std::endl;

    MockHal hal;
    const ModuleManifest& manifest = hal.manifest();
    assert(manifest.size() == 4);
    std::vector<std::string> names = manifest.moduleNames();
    assert(names.size() == 4);
    assert(names.front() == "EmotionalResonanceEngine" && names.back() == "UserInterfaceModule");

    // Ledger: every listed module verifies except the forced failure.
    for (const auto& name : manifest.moduleNames()) {
        VerificationResult result = hal.verifyModuleSignature(name, signature_source::kLedger);
        if (name == MockHal::kForcedFailureModule) {
            assert(result.isFailed());
            assert(result.reason.empty());
        } else {
            assert(result.isVerified());
        }
    }

    VerificationResult ghost = hal.verifyModuleSignature("GhostModule", signature_source::kLedger);
    assert(ghost.isError());
    assert(ghost.reason == "Module 'GhostModule' not listed in the simulated GitHub Blockchain Ledger.");

    // The internal-only module is not on the ledger.
    assert(hal.verifyModuleSignature(MockHal::kInternalOnlyModule, signature_source::kLedger).isError());

    // Internal: manifest membership or the internal-only identifier.
    for (const auto& name : manifest.moduleNames()) {
        assert(hal.verifyModuleSignature(name, signature_source::kInternal).isVerified());
    }
    assert(hal.verifyModuleSignature(MockHal::kInternalOnlyModule, signature_source::kInternal).isVerified());
    assert(hal.verifyModuleSignature("RustHAL_Interface", signature_source::kInternal).isVerified());

    VerificationResult unknownCore = hal.verifyModuleSignature("GhostModule", signature_source::kInternal);
    assert(unknownCore.isError());
    assert(unknownCore.reason == "Core module 'GhostModule' not recognized for internal check.");

    // Unknown sources fail before any lookup, whatever the module.
    for (const std::string source : {"", "ledger", "internalmanifest", "PGP Keyring"}) {
        VerificationResult r1 = hal.verifyModuleSignature("SoulOS_Core", source);
        VerificationResult r2 = hal.verifyModuleSignature("GhostModule", source);
        assert(r1.isError() && r2.isError());
        assert(r1.reason == "Unknown signature source: " + source);
    }

    // Custom manifest: no forced failure unless the special module is listed.
    MockHal custom(ModuleManifest(ModuleManifest::Entries{{"Bootloader", {"hash_boot", "gh://soulware/boot/v2"}}}));
    assert(custom.verifyModuleSignature("Bootloader", signature_source::kLedger).isVerified());
    assert(custom.verifyModuleSignature("SoulOS_Core", signature_source::kLedger).isError());
    assert(custom.verifyModuleSignature("SoulOS_Core", signature_source::kInternal).isError());

    // Diagnostics go to the supplied stream only.
    std::ostringstream trace;
    MockHal traced(ModuleManifest::Default(), &trace);
    traced.verifyModuleSignature("UserInterfaceModule", signature_source::kLedger);
    std::string log = trace.str();
    assert(log.find("MockHAL: Found entry. Expected signature (from gh://soulware/ui/v1.1): hash_ui_zxcv_321") !=
           std::string::npos);
    assert(log.find("SIGNATURE MISMATCH for 'UserInterfaceModule'! Expected 'hash_ui_zxcv_321', got "
                    "'hash_ui_zxcv_FAIL'.") != std::string::npos);

    // Unknown source short-circuits without touching the manifest.
    trace.str("");
    traced.verifyModuleSignature("SoulOS_Core", "Nowhere");
    assert(trace.str().empty());

    assert(StatusToString(VerificationStatus::Verified) == "VERIFIED");
    assert(StatusToString(VerificationStatus::Failed) == "FAILED");

    std::cout << "[PASS] Signature Verification Test." << std::endl;
    return 0;
}
