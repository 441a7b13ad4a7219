/**
 * @file HalError.hpp
 * @brief Exception raised by HAL operations that cannot produce a result.
 */

#pragma once
#include <stdexcept>
#include <string>

namespace souldos::domain {

class HalError : public std::runtime_error {
public:
    explicit HalError(const std::string& reason) : std::runtime_error(reason) {}
};

} // namespace souldos::domain
