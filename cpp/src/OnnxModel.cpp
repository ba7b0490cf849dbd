/**
 * =============================================================================
 * OnnxModel.cpp - ONNX Runtime Backed Model
 * =============================================================================
 *
 * ONNX RUNTIME OVERVIEW:
 * ----------------------
 * - Env: global state (logging, thread pools); one per model here
 * - Session: a loaded, optimized graph ready for inference
 * - Value: a tensor handed to or returned from Session::Run()
 *
 * Input Values are created over the memory of the Tensors stored by
 * setInput() (no copy). Output Values are copied into fresh Tensors so the
 * results stay valid after the Ort::Value vector is released.
 *
 * Every Ort::Exception is translated to InferenceError(InferenceFailure).
 *
 * @file OnnxModel.cpp
 * @author Multi-Language AI System
 * @version 2.0.0
 */

#include "OnnxModel.hpp"
#include "InferenceError.hpp"

#include <cstring>     // std::memcpy for output copies
#include <iostream>    // std::cout for load diagnostics
#include <sstream>
#include <utility>

#include <onnxruntime_cxx_api.h>

namespace {

/**
 * Wrap a Tensor's storage in an Ort::Value without copying.
 * The Tensor must outlive the returned Value.
 */
Ort::Value toOrtValue(const Ort::MemoryInfo& memoryInfo, Tensor& tensor) {
    const std::vector<int64_t>& shape = tensor.shape();

    switch (tensor.elementType()) {
        case ElementType::Float32:
            return Ort::Value::CreateTensor<float>(memoryInfo, tensor.data<float>(),
                                                   tensor.elementCount(), shape.data(), shape.size());
        case ElementType::Float64:
            return Ort::Value::CreateTensor<double>(memoryInfo, tensor.data<double>(),
                                                    tensor.elementCount(), shape.data(), shape.size());
        case ElementType::UInt8:
            return Ort::Value::CreateTensor<uint8_t>(memoryInfo, tensor.data<uint8_t>(),
                                                     tensor.elementCount(), shape.data(), shape.size());
        case ElementType::Int32:
            return Ort::Value::CreateTensor<int32_t>(memoryInfo, tensor.data<int32_t>(),
                                                     tensor.elementCount(), shape.data(), shape.size());
        case ElementType::Int64:
            return Ort::Value::CreateTensor<int64_t>(memoryInfo, tensor.data<int64_t>(),
                                                     tensor.elementCount(), shape.data(), shape.size());
    }
    throw InferenceError(ErrorCode::InferenceFailure, "unknown input element type");
}

/**
 * Map an ONNX element type onto ElementType.
 */
ElementType fromOnnxType(ONNXTensorElementDataType type) {
    switch (type) {
        case ONNX_TENSOR_ELEMENT_DATA_TYPE_FLOAT:  return ElementType::Float32;
        case ONNX_TENSOR_ELEMENT_DATA_TYPE_DOUBLE: return ElementType::Float64;
        case ONNX_TENSOR_ELEMENT_DATA_TYPE_UINT8:  return ElementType::UInt8;
        case ONNX_TENSOR_ELEMENT_DATA_TYPE_INT32:  return ElementType::Int32;
        case ONNX_TENSOR_ELEMENT_DATA_TYPE_INT64:  return ElementType::Int64;
        default:
            break;
    }
    std::ostringstream msg;
    msg << "unsupported ONNX output element type " << static_cast<int>(type);
    throw InferenceError(ErrorCode::InferenceFailure, msg.str());
}

/**
 * Copy an output Ort::Value into an owned Tensor.
 */
Tensor fromOrtValue(const Ort::Value& value) {
    if (!value.IsTensor()) {
        throw InferenceError(ErrorCode::InferenceFailure, "model output is not a tensor");
    }

    auto info = value.GetTensorTypeAndShapeInfo();
    Tensor tensor(fromOnnxType(info.GetElementType()), info.GetShape());

    if (tensor.byteSize() > 0) {
        switch (tensor.elementType()) {
            case ElementType::Float32:
                std::memcpy(tensor.data<float>(), value.GetTensorData<float>(), tensor.byteSize());
                break;
            case ElementType::Float64:
                std::memcpy(tensor.data<double>(), value.GetTensorData<double>(), tensor.byteSize());
                break;
            case ElementType::UInt8:
                std::memcpy(tensor.data<uint8_t>(), value.GetTensorData<uint8_t>(), tensor.byteSize());
                break;
            case ElementType::Int32:
                std::memcpy(tensor.data<int32_t>(), value.GetTensorData<int32_t>(), tensor.byteSize());
                break;
            case ElementType::Int64:
                std::memcpy(tensor.data<int64_t>(), value.GetTensorData<int64_t>(), tensor.byteSize());
                break;
        }
    }
    return tensor;
}

} // namespace

// ============================================================================
// PIMPL IMPLEMENTATION CLASS
// ============================================================================

struct OnnxModel::Impl {
    /** Path of the loaded .onnx file */
    std::string modelPath;

    /**
     * ONNX Runtime environment. WARNING level keeps ORT's own logging quiet
     * unless something goes wrong.
     */
    Ort::Env env{ORT_LOGGING_LEVEL_WARNING, "EmotionEngine"};

    /** The loaded model. */
    std::unique_ptr<Ort::Session> session;

    /** Input tensors live in plain CPU memory. */
    Ort::MemoryInfo memoryInfo = Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault);

    /** Node names queried from the session at load time. */
    std::vector<std::string> inputNames;
    std::vector<std::string> outputNames;

    /** Tensors handed over by setInput(), one slot per model input. */
    std::vector<Tensor> inputs;
    std::vector<bool> inputSet;

    /** Results of the last successful run(). */
    std::vector<Tensor> outputs;

    void checkSlot(std::size_t slot) const {
        if (slot >= inputNames.size()) {
            throw InferenceError(ErrorCode::InferenceFailure,
                                 "input slot " + std::to_string(slot) + " out of range; model has " +
                                 std::to_string(inputNames.size()) + " input(s)");
        }
    }
};

// ============================================================================
// CONSTRUCTORS & DESTRUCTOR
// ============================================================================

OnnxModel::OnnxModel(const std::string& modelPath)
    : OnnxModel(modelPath, Options{})
{
}

OnnxModel::OnnxModel(const std::string& modelPath, const Options& options) {
    try {
        // Ort::Env is created here, inside the try, so its failures are reported too
        pImpl = std::make_unique<Impl>();
        pImpl->modelPath = modelPath;

        Ort::SessionOptions sessionOptions;
        sessionOptions.SetIntraOpNumThreads(options.intraOpThreads);
        sessionOptions.SetGraphOptimizationLevel(options.optimizeGraph
                                                     ? GraphOptimizationLevel::ORT_ENABLE_ALL
                                                     : GraphOptimizationLevel::ORT_DISABLE_ALL);
        sessionOptions.SetExecutionMode(ExecutionMode::ORT_SEQUENTIAL);

        pImpl->session = std::make_unique<Ort::Session>(pImpl->env, modelPath.c_str(), sessionOptions);

        // Names are needed for every Run() call; read them once here
        Ort::AllocatorWithDefaultOptions allocator;
        for (std::size_t i = 0; i < pImpl->session->GetInputCount(); ++i) {
            auto name = pImpl->session->GetInputNameAllocated(i, allocator);
            pImpl->inputNames.emplace_back(name.get());
        }
        for (std::size_t i = 0; i < pImpl->session->GetOutputCount(); ++i) {
            auto name = pImpl->session->GetOutputNameAllocated(i, allocator);
            pImpl->outputNames.emplace_back(name.get());
        }
    } catch (const Ort::Exception& e) {
        throw InferenceError(ErrorCode::InferenceFailure,
                             "failed to load model " + modelPath + ": " + e.what());
    }

    pImpl->inputs.resize(pImpl->inputNames.size());
    pImpl->inputSet.assign(pImpl->inputNames.size(), false);

    std::cout << "Model loaded: " << modelPath
              << " (" << pImpl->inputNames.size() << " input(s), "
              << pImpl->outputNames.size() << " output(s))" << std::endl;
}

OnnxModel::~OnnxModel() = default;

// ============================================================================
// MODEL INTERFACE
// ============================================================================

void OnnxModel::setInput(std::size_t slot, Tensor tensor) {
    pImpl->checkSlot(slot);
    pImpl->inputs[slot] = std::move(tensor);
    pImpl->inputSet[slot] = true;
}

void OnnxModel::run() {
    for (std::size_t slot = 0; slot < pImpl->inputs.size(); ++slot) {
        if (!pImpl->inputSet[slot]) {
            throw InferenceError(ErrorCode::InferenceFailure,
                                 "input '" + pImpl->inputNames[slot] + "' was not set");
        }
    }

    std::vector<const char*> inputNames;
    std::vector<const char*> outputNames;
    for (const auto& name : pImpl->inputNames) inputNames.push_back(name.c_str());
    for (const auto& name : pImpl->outputNames) outputNames.push_back(name.c_str());

    try {
        std::vector<Ort::Value> inputValues;
        inputValues.reserve(pImpl->inputs.size());
        for (Tensor& tensor : pImpl->inputs) {
            inputValues.push_back(toOrtValue(pImpl->memoryInfo, tensor));
        }

        auto outputValues = pImpl->session->Run(
            Ort::RunOptions{nullptr},
            inputNames.data(), inputValues.data(), inputValues.size(),
            outputNames.data(), outputNames.size()
        );

        std::vector<Tensor> outputs;
        outputs.reserve(outputValues.size());
        for (const Ort::Value& value : outputValues) {
            outputs.push_back(fromOrtValue(value));
        }
        pImpl->outputs = std::move(outputs);
    } catch (const Ort::Exception& e) {
        throw InferenceError(ErrorCode::InferenceFailure, std::string("inference failed: ") + e.what());
    }
}

std::vector<Tensor> OnnxModel::getOutputTensors() const {
    return pImpl->outputs;
}

// ============================================================================
// ACCESSOR METHODS
// ============================================================================

std::size_t OnnxModel::inputCount() const {
    return pImpl->inputNames.size();
}

std::size_t OnnxModel::outputCount() const {
    return pImpl->outputNames.size();
}

std::vector<int64_t> OnnxModel::inputShape(std::size_t slot) const {
    pImpl->checkSlot(slot);
    try {
        Ort::TypeInfo typeInfo = pImpl->session->GetInputTypeInfo(slot);
        return typeInfo.GetTensorTypeAndShapeInfo().GetShape();
    } catch (const Ort::Exception& e) {
        throw InferenceError(ErrorCode::InferenceFailure,
                             std::string("cannot read input shape: ") + e.what());
    }
}

const std::string& OnnxModel::modelPath() const {
    return pImpl->modelPath;
}
