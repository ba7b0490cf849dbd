/**
 * =============================================================================
 * EmotionEngine.hpp - Grayscale Face -> Ranked Emotions
 * =============================================================================
 *
 * EmotionEngine runs the whole single-image pipeline:
 *
 *   GrayImage
 *     -> TensorUtils::grayToBCHW   (1, 1, H, W) input tensor
 *     -> Model::setInput / run     raw logits (output tensor 0)
 *     -> SoftmaxUtils::softmax     probabilities
 *     -> Ranking::rank             predictions sorted by confidence
 *
 * Each classify() call allocates its own tensors; nothing but the last
 * timing figure is kept between calls. Use one engine per thread.
 *
 * USAGE EXAMPLE:
 * ```cpp
 * EmotionEngine engine(std::make_unique<OnnxModel>("model/model.onnx"));
 * auto image = ImageUtils::loadGrayImage("face64.png");
 * auto ranking = engine.classify(image);
 * std::cout << Ranking::formatPrediction(ranking[0]) << std::endl;
 * ```
 *
 * @file EmotionEngine.hpp
 * @author Multi-Language AI System
 * @version 2.0.0
 */

#ifndef EMOTION_ENGINE_HPP
#define EMOTION_ENGINE_HPP

#include "ImageUtils.hpp"
#include "Model.hpp"
#include "Ranking.hpp"
#include "Tensor.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

/**
 * Pipeline settings. Defaults match the FER+ emotion model.
 */
struct EngineConfig {
    int64_t inputHeight = 64;
    int64_t inputWidth = 64;
    ElementType inputType = ElementType::Float32;
    std::size_t inputSlot = 0;
    Ranking::LabelTable labels = Ranking::defaultEmotionLabels();
};

class EmotionEngine {
public:
    /**
     * @param model  Backend to run; the engine takes ownership
     * @param config Input geometry and label table
     * @throws std::invalid_argument if model is null
     */
    explicit EmotionEngine(std::unique_ptr<Model> model, EngineConfig config = EngineConfig{});

    /**
     * Classify one face image.
     *
     * @param image Grayscale image of exactly inputHeight x inputWidth
     * @return All labels ranked by descending confidence
     * @throws InferenceError on any pipeline failure (see InferenceError.hpp)
     */
    std::vector<Ranking::Prediction> classify(const ImageUtils::GrayImage& image);

    /**
     * Load an image file ("-" for stdin) and classify it.
     */
    std::vector<Ranking::Prediction> classifyFile(const std::string& imagePath);

    /** Wall-clock duration of the last Model::run(), in milliseconds. */
    double lastInferenceMillis() const { return lastInferenceMillis_; }

    const EngineConfig& config() const { return config_; }

private:
    std::unique_ptr<Model> model_;
    EngineConfig config_;
    double lastInferenceMillis_ = 0.0;
};

#endif // EMOTION_ENGINE_HPP
