/**
 * =============================================================================
 * OnnxModel.hpp - ONNX Runtime Implementation of Model
 * =============================================================================
 *
 * Loads a .onnx file into an Ort::Session and runs it on the CPU.
 *
 * DESIGN PATTERN: PIMPL (Pointer to Implementation)
 * -------------------------------------------------
 * No ONNX Runtime header is included here. The Ort::Env, Ort::Session and
 * memory info live in the Impl struct defined in OnnxModel.cpp, so code that
 * only uses the Model interface does not need onnxruntime_cxx_api.h.
 *
 * USAGE EXAMPLE:
 * ```cpp
 * OnnxModel model("model/model.onnx");
 * model.setInput(0, std::move(input));
 * model.run();
 * auto outputs = model.getOutputTensors();
 * ```
 *
 * @file OnnxModel.hpp
 * @author Multi-Language AI System
 * @version 2.0.0
 */

#ifndef ONNX_MODEL_HPP
#define ONNX_MODEL_HPP

#include "Model.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>   // std::unique_ptr for PIMPL
#include <string>
#include <vector>

class OnnxModel : public Model {
public:
    /**
     * Session settings.
     */
    struct Options {
        int intraOpThreads = 1;        // single image: one thread is enough
        bool optimizeGraph = true;     // ORT_ENABLE_ALL vs ORT_DISABLE_ALL
    };

    /**
     * Load and prepare a model.
     *
     * @param modelPath Path to the .onnx file
     * @throws InferenceError(InferenceFailure) if the file cannot be loaded
     */
    explicit OnnxModel(const std::string& modelPath);
    OnnxModel(const std::string& modelPath, const Options& options);

    /**
     * Destructor defined in the .cpp, where Impl is a complete type.
     */
    ~OnnxModel() override;

    OnnxModel(const OnnxModel&) = delete;
    OnnxModel& operator=(const OnnxModel&) = delete;

    void setInput(std::size_t slot, Tensor tensor) override;
    void run() override;
    std::vector<Tensor> getOutputTensors() const override;

    std::size_t inputCount() const;
    std::size_t outputCount() const;

    /**
     * Declared shape of an input. Dynamic axes are reported as -1.
     * @throws InferenceError(InferenceFailure) if slot does not exist
     */
    std::vector<int64_t> inputShape(std::size_t slot) const;

    const std::string& modelPath() const;

private:
    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

#endif // ONNX_MODEL_HPP
