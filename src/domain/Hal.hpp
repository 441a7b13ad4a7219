/**
 * @file Hal.hpp
 * @brief Interface of the SoulWare hardware abstraction layer.
 */

#pragma once
#include <string>
#include <vector>
#include "HalError.hpp"
#include "TensorData.hpp"
#include "VerificationResult.hpp"

namespace souldos::domain {

/**
 * @class Hal
 * @brief Abstract capability set the shell talks to.
 *
 * Operations that cannot produce a value throw HalError. Signature
 * verification never throws; its failures are part of the returned value.
 */
class Hal {
public:
    virtual ~Hal() = default;

    /** @brief Returns a one-line description of the overall system state. */
    virtual std::string getSystemStatus() const = 0;

    /**
     * @brief Checks a module signature against a trust source.
     * @param moduleName Module to check.
     * @param signatureSource One of the names in signature_source.
     * @return Verified, Failed, or Error with a reason.
     */
    virtual VerificationResult verifyModuleSignature(const std::string& moduleName,
                                                     const std::string& signatureSource) const = 0;

    /** @brief Returns the entries currently held in the emotional map. */
    virtual std::vector<std::string> getEmotionalMap() const = 0;

    /**
     * @brief Collapses the truth waveform for the given coordinates.
     * @return Name of the memory node the waveform collapsed to.
     */
    virtual std::string collapseTruthWaveform(const std::string& emotion,
                                              const std::string& mode,
                                              const std::string& timeVector) const = 0;

    /** @brief Brings the NPU up and returns its readiness message. */
    virtual std::string initializeNpu() const = 0;

    /**
     * @brief Runs an ONNX model on the NPU.
     * @param modelPath Path of the model file.
     * @param inputs Input tensor.
     * @return Output tensor.
     */
    virtual TensorData runOnnxModel(const std::string& modelPath, const TensorData& inputs) const = 0;
};

} // namespace souldos::domain
