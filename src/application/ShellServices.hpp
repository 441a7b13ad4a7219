/**
 * @file ShellServices.hpp
 * @brief Container for application-level services to facilitate dependency injection.
 */

#pragma once

#include <memory>
#include "application/IntegrityCheckService.hpp"
#include "application/ShellService.hpp"
#include "domain/Hal.hpp"

namespace souldos::application {

struct ShellServices {
    std::unique_ptr<domain::Hal> hal;
    std::unique_ptr<IntegrityCheckService> integrityService;
    std::unique_ptr<ShellService> shellService;
};

} // namespace souldos::application
