/**
 * =============================================================================
 * EmotionEngine.cpp - Single-Image Emotion Classification Pipeline
 * =============================================================================
 *
 * PIPELINE:
 * 1. Allocate a zeroed (1, 1, H, W) input tensor
 * 2. Encode the grayscale pixels into it
 * 3. Hand it to the model and run the forward pass
 * 4. Take output tensor 0 as the raw class scores
 * 5. Softmax, then rank against the label table
 *
 * Every step throws on failure; a partially computed result is never
 * returned.
 *
 * @file EmotionEngine.cpp
 * @author Multi-Language AI System
 * @version 2.0.0
 */

#include "EmotionEngine.hpp"
#include "InferenceError.hpp"
#include "Softmax.hpp"
#include "TensorUtils.hpp"

#include <chrono>      // timing of the forward pass
#include <stdexcept>
#include <utility>

EmotionEngine::EmotionEngine(std::unique_ptr<Model> model, EngineConfig config)
    : model_(std::move(model))
    , config_(std::move(config))
{
    if (!model_) {
        throw std::invalid_argument("EmotionEngine requires a model");
    }
}

std::vector<Ranking::Prediction> EmotionEngine::classify(const ImageUtils::GrayImage& image) {
    // ========================================================================
    // ENCODE
    // ========================================================================

    Tensor input(config_.inputType, {1, 1, config_.inputHeight, config_.inputWidth});
    TensorUtils::grayToBCHW(image, &input);

    // ========================================================================
    // RUN INFERENCE
    // ========================================================================

    model_->setInput(config_.inputSlot, std::move(input));

    auto start = std::chrono::steady_clock::now();
    model_->run();
    auto end = std::chrono::steady_clock::now();
    lastInferenceMillis_ = std::chrono::duration<double, std::milli>(end - start).count();

    std::vector<Tensor> outputs = model_->getOutputTensors();
    if (outputs.empty()) {
        throw InferenceError(ErrorCode::InferenceFailure, "model produced no output tensors");
    }

    // ========================================================================
    // DECODE OUTPUT
    // ========================================================================

    std::vector<float> scores = TensorUtils::toScores(outputs[0]);
    std::vector<float> probabilities = SoftmaxUtils::softmax(scores);
    return Ranking::rank(config_.labels, probabilities);
}

std::vector<Ranking::Prediction> EmotionEngine::classifyFile(const std::string& imagePath) {
    return classify(ImageUtils::loadGrayImage(imagePath));
}
