/**
 * =============================================================================
 * main.cpp - Command-Line Interface for the Emotion Classifier
 * =============================================================================
 *
 * Classifies the facial expression in a 64x64 grayscale image with an ONNX
 * emotion model (FER+) and prints the most likely emotions.
 *
 * USAGE:
 *   ./emotion_classify -model model/model.onnx -input face.png
 *   cat face.png | ./emotion_classify -input -
 *
 * OUTPUT:
 *   Computation time: 3.21 ms
 *   neutral / 51.35%
 *   happiness / 6.95%
 *
 * @file main.cpp
 * @author Multi-Language AI System
 * @version 2.0.0
 */

#include "EmotionEngine.hpp"
#include "InferenceError.hpp"
#include "OnnxModel.hpp"
#include "Options.hpp"
#include "Ranking.hpp"

#include <fstream>     // std::ifstream for existence checks
#include <iostream>
#include <memory>
#include <stdexcept>

namespace {

bool fileExists(const std::string& path) {
    std::ifstream file(path);
    return file.good();
}

} // namespace

int main(int argc, char* argv[]) {
    // ========================================================================
    // ARGUMENT PARSING
    // ========================================================================

    Options options;
    try {
        options = parseOptions(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << "\n" << usage(argv[0]);
        return 1;
    }

    if (options.help) {
        std::cout << usage(argv[0]);
        return 0;
    }

    if (!fileExists(options.modelPath)) {
        std::cerr << options.modelPath << " does not exist" << std::endl;
        return 1;
    }
    if (options.inputPath != "-" && !fileExists(options.inputPath)) {
        std::cerr << options.inputPath << " does not exist" << std::endl;
        return 1;
    }

    // ========================================================================
    // MAIN PROCESSING
    // ========================================================================

    try {
        EngineConfig config;
        if (!options.labelsPath.empty()) {
            config.labels = Ranking::loadLabels(options.labelsPath);
        }

        EmotionEngine engine(std::make_unique<OnnxModel>(options.modelPath), config);

        auto ranking = engine.classifyFile(options.inputPath);

        std::cout << "Computation time: " << engine.lastInferenceMillis() << " ms" << std::endl;
        for (const auto& prediction : Ranking::topPredictions(ranking, static_cast<std::size_t>(options.top))) {
            std::cout << Ranking::formatPrediction(prediction) << std::endl;
        }
        return 0;

    } catch (const InferenceError& e) {
        std::cerr << "Error [" << e.codeName() << "]: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
