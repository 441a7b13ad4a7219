/**
 * @file TensorData.hpp
 * @brief Placeholder for tensor payloads exchanged with the NPU.
 */

#pragma once
#include <string>

namespace souldos::domain {

/**
 * @struct TensorData
 * @brief Carries a textual description of a tensor in place of real data.
 */
struct TensorData {
    std::string info; ///< Human-readable description of the payload.
};

} // namespace souldos::domain
