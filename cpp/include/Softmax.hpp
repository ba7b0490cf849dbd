/**
 * =============================================================================
 * Softmax.hpp - Neural Network Output Normalization
 * =============================================================================
 *
 * The emotion network outputs 8 "logits" - raw, unbounded scores, one per
 * class. Softmax turns them into probabilities that
 * 1. are all in [0, 1]
 * 2. sum to 1.0
 * 3. preserve the ordering (higher logit -> higher probability)
 *
 *   P(class_i) = exp(logit_i) / Σ exp(logit_j)
 *
 * NUMERICAL EXAMPLE:
 * Logits: [2, 0, 0, 0, 0, 0, 0, 0]
 * After exp: [7.389, 1, 1, 1, 1, 1, 1, 1]
 * Sum: 14.389
 * P(neutral) = 7.389 / 14.389 ≈ 0.5135
 *
 * @file Softmax.hpp
 * @author Multi-Language AI System
 * @version 2.0.0
 */

#ifndef SOFTMAX_HPP
#define SOFTMAX_HPP

#include <vector>

namespace SoftmaxUtils {

    /**
     * Apply softmax normalization to convert logits to probabilities.
     *
     * PRECISION:
     * Exponentials and their sum are accumulated in double and only the
     * final ratio is narrowed to float, so the float outputs sum to 1
     * within 1e-5 for a few hundred classes.
     *
     * The maximum logit is subtracted before exponentiating. This does not
     * change the result (exp(-max) cancels out) but keeps exp() finite.
     *
     * @param scores Input logits (raw neural network outputs)
     * @return Probabilities, same length as scores (empty in, empty out)
     *
     * @example
     * std::vector<float> logits = {2.0f, 0.0f, 0.0f};
     * auto probs = SoftmaxUtils::softmax(logits);
     * // probs ≈ [0.787, 0.107, 0.107]
     */
    std::vector<float> softmax(const std::vector<float>& scores);

}

#endif // SOFTMAX_HPP
