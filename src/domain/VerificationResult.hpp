/**
 * @file VerificationResult.hpp
 * @brief Value Object describing the outcome of a module signature check.
 */

#pragma once

#include <string>

namespace souldos::domain {

/**
 * @enum VerificationStatus
 * @brief Tri-state outcome of a signature verification.
 */
enum class VerificationStatus {
    Verified, ///< Local and expected signatures match.
    Failed,   ///< Module is known but the signatures differ.
    Error     ///< Module or signature source not recognized.
};

/**
 * @brief Helper to convert status to string for display/logging.
 */
inline std::string StatusToString(VerificationStatus status) {
    switch (status) {
        case VerificationStatus::Verified: return "VERIFIED";
        case VerificationStatus::Failed: return "FAILED";
        case VerificationStatus::Error: return "ERROR";
        default: return "UNKNOWN";
    }
}

/**
 * @struct VerificationResult
 * @brief Status plus the reason text reported for Error outcomes.
 */
struct VerificationResult {
    VerificationStatus status = VerificationStatus::Error;
    std::string reason; ///< Empty unless status is Error.

    static VerificationResult Verified() { return {VerificationStatus::Verified, ""}; }
    static VerificationResult Failed() { return {VerificationStatus::Failed, ""}; }
    static VerificationResult Error(const std::string& why) { return {VerificationStatus::Error, why}; }

    bool isVerified() const { return status == VerificationStatus::Verified; }
    bool isFailed() const { return status == VerificationStatus::Failed; }
    bool isError() const { return status == VerificationStatus::Error; }
};

} // namespace souldos::domain
