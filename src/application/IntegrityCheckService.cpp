#include "application/IntegrityCheckService.hpp"
#include "domain/SignatureSource.hpp"

namespace souldos::application {

using domain::VerificationResult;
using domain::VerificationStatus;
namespace source = domain::signature_source;

IntegrityCheckService::IntegrityCheckService(const domain::Hal& hal, std::ostream& out)
    : m_hal(hal), m_out(out) {}

const std::vector<std::string>& IntegrityCheckService::CoreModules() {
    static const std::vector<std::string> modules = {"SoulOS_Core", "TensorMemoryDriver", "RustHAL_Interface"};
    return modules;
}

const std::vector<std::string>& IntegrityCheckService::LedgerModules() {
    // The last two exercise the mismatch and the unknown-module paths.
    static const std::vector<std::string> modules = {"EmotionalResonanceEngine", "UserInterfaceModule",
                                                     "NonExistentModule"};
    return modules;
}

VerificationResult IntegrityCheckService::CheckModule(const std::string& moduleName) {
    m_out << "\nVerifying module '" << moduleName << "' using " << source::kLedger << "...\n";
    VerificationResult result = m_hal.verifyModuleSignature(moduleName, source::kLedger);

    if (result.isError()) {
        m_out << "Error during verification for '" << moduleName << "': " << result.reason << "\n";
    } else {
        m_out << "Verification Result for '" << moduleName << "': " << domain::StatusToString(result.status) << "\n";
    }
    return result;
}

void IntegrityCheckService::RunBootChecks() {
    for (const auto& moduleName : CoreModules()) {
        VerificationResult result = m_hal.verifyModuleSignature(moduleName, source::kInternal);
        switch (result.status) {
        case VerificationStatus::Verified:
            m_out << "  " << moduleName << " integrity: Verified\n";
            break;
        case VerificationStatus::Failed:
            m_out << "  " << moduleName << " integrity: Check FAILED\n";
            break;
        case VerificationStatus::Error:
            m_out << "  " << moduleName << " integrity: Check FAILED - " << result.reason << "\n";
            break;
        }
    }
}

void IntegrityCheckService::RunSystemCheck() {
    m_out << "\nPerforming comprehensive system integrity check...\n";

    m_out << "\n--- Internal Manifest Checks ---\n";
    for (const auto& moduleName : CoreModules()) {
        reportLine(moduleName, source::kInternal);
    }

    m_out << "\n--- GitHub Blockchain Ledger (Simulated) Checks ---\n";
    for (const auto& moduleName : LedgerModules()) {
        reportLine(moduleName, source::kLedger);
    }

    m_out << "\nSystem integrity check complete.\n";
}

void IntegrityCheckService::reportLine(const std::string& moduleName, const std::string& sourceName) {
    m_out << "  Checking '" << moduleName << "' (source: " << sourceName << "): ";
    m_out.flush();
    VerificationResult result = m_hal.verifyModuleSignature(moduleName, sourceName);
    if (result.isError()) {
        m_out << "ERROR - " << result.reason << "\n";
    } else {
        m_out << domain::StatusToString(result.status) << "\n";
    }
}

} // namespace souldos::application
