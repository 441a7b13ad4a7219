/**
 * @file SignatureSource.hpp
 * @brief Names of the trust sources understood by the HAL.
 */

#pragma once

namespace souldos::domain::signature_source {

/// Simulated distributed ledger backed by the module manifest.
constexpr const char* kLedger = "GitHubBlockchainLedger (Simulated)";

/// Internal manifest of core modules shipped with the system.
constexpr const char* kInternal = "InternalManifest";

} // namespace souldos::domain::signature_source
