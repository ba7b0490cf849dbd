/**
 * =============================================================================
 * Ranking.cpp - Label Tables and Descending-Confidence Ordering
 * =============================================================================
 *
 * @file Ranking.cpp
 * @author Multi-Language AI System
 * @version 2.0.0
 */

#include "Ranking.hpp"
#include "InferenceError.hpp"

#include <algorithm>   // std::stable_sort, std::min
#include <cstdio>      // std::snprintf
#include <fstream>     // std::ifstream for label files
#include <stdexcept>

namespace Ranking {

const LabelTable& defaultEmotionLabels() {
    static const LabelTable labels = {
        "neutral",
        "happiness",
        "surprise",
        "sadness",
        "anger",
        "disgust",
        "fear",
        "contempt",
    };
    return labels;
}

LabelTable loadLabels(const std::string& labelsPath) {
    std::ifstream file(labelsPath);
    if (!file.is_open()) {
        throw std::runtime_error("Could not load labels from " + labelsPath);
    }

    LabelTable labels;
    std::string line;
    while (std::getline(file, line)) {
        // Tolerate CRLF files
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (!line.empty()) {
            labels.push_back(line);
        }
    }

    if (labels.empty()) {
        throw std::runtime_error("No labels found in " + labelsPath);
    }
    return labels;
}

std::vector<Prediction> rank(const LabelTable& labels, const std::vector<float>& probabilities) {
    if (labels.size() != probabilities.size()) {
        throw InferenceError(ErrorCode::LabelCountMismatch,
                             "model produced " + std::to_string(probabilities.size()) +
                             " scores but the label table has " +
                             std::to_string(labels.size()) + " entries");
    }

    std::vector<Prediction> predictions;
    predictions.reserve(labels.size());
    for (std::size_t i = 0; i < labels.size(); ++i) {
        predictions.push_back(Prediction{labels[i], probabilities[i]});
    }

    std::stable_sort(predictions.begin(), predictions.end(),
                     [](const Prediction& a, const Prediction& b) {
                         return a.weight > b.weight;
                     });
    return predictions;
}

std::vector<Prediction> topPredictions(const std::vector<Prediction>& ranking, std::size_t k) {
    std::size_t count = std::min(k, ranking.size());
    return std::vector<Prediction>(ranking.begin(), ranking.begin() + static_cast<std::ptrdiff_t>(count));
}

std::string formatPrediction(const Prediction& prediction) {
    char percent[32];
    std::snprintf(percent, sizeof(percent), "%.2f", static_cast<double>(prediction.weight) * 100.0);
    return prediction.label + " / " + percent + "%";
}

} // namespace Ranking
