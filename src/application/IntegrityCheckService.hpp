/**
 * @file IntegrityCheckService.hpp
 * @brief Runs module signature checks through the HAL and reports them.
 */

#pragma once

#include "domain/Hal.hpp"
#include <ostream>
#include <string>
#include <vector>

namespace souldos::application {

/**
 * @class IntegrityCheckService
 * @brief Formats the outcome of single-module, boot and full-system checks.
 */
class IntegrityCheckService {
public:
    IntegrityCheckService(const domain::Hal& hal, std::ostream& out);

    /** @brief Core modules checked against the internal manifest at boot. */
    static const std::vector<std::string>& CoreModules();

    /** @brief Modules checked against the ledger by the full system check. */
    static const std::vector<std::string>& LedgerModules();

    /** @brief Verifies one module against the ledger and prints the verdict. */
    domain::VerificationResult CheckModule(const std::string& moduleName);

    /** @brief Internal checks run once during boot. */
    void RunBootChecks();

    /** @brief Internal section followed by the ledger section. */
    void RunSystemCheck();

private:
    void reportLine(const std::string& moduleName, const std::string& sourceName);

    const domain::Hal& m_hal;
    std::ostream& m_out;
};

} // namespace souldos::application
