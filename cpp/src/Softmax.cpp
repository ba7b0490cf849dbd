/**
 * =============================================================================
 * Softmax.cpp - Implementation of the Softmax Normalizer
 * =============================================================================
 *
 * @file Softmax.cpp
 * @author Multi-Language AI System
 * @version 2.0.0
 */

#include "Softmax.hpp"

#include <algorithm>   // std::max_element
#include <cmath>       // std::exp

namespace SoftmaxUtils {

/**
 * softmax(x_i) = exp(x_i - max) / Σ exp(x_j - max)
 *
 * Same value as exp(x_i) / Σ exp(x_j); the shift only keeps exp() in range.
 */
std::vector<float> softmax(const std::vector<float>& scores) {
    if (scores.empty()) {
        return {};
    }

    // ========================================================================
    // STEP 1: Exponentials and their sum, in double
    // ========================================================================

    const double maxScore = *std::max_element(scores.begin(), scores.end());

    std::vector<double> exps;
    exps.reserve(scores.size());
    double sumExp = 0.0;

    for (float score : scores) {
        double e = std::exp(static_cast<double>(score) - maxScore);
        exps.push_back(e);
        sumExp += e;
    }

    // ========================================================================
    // STEP 2: Normalize, narrowing only the final ratio
    // ========================================================================

    std::vector<float> probabilities;
    probabilities.reserve(scores.size());
    for (double e : exps) {
        probabilities.push_back(static_cast<float>(e / sumExp));
    }

    return probabilities;
}

} // namespace SoftmaxUtils
