/**
 * =============================================================================
 * Ranking.hpp - Emotion Labels, Ranking and Result Formatting
 * =============================================================================
 *
 * After softmax each output index has a probability. Ranking pairs index i
 * with label i of the label table and sorts the pairs by confidence.
 *
 * LABEL TABLE:
 * The mapping from output index to label is positional. The default table
 * matches the FER+ emotion model:
 *
 *   0 neutral   1 happiness   2 surprise   3 sadness
 *   4 anger     5 disgust     6 fear       7 contempt
 *
 * A different model needs a different table (see loadLabels()), changed in
 * lockstep with the model file.
 *
 * @file Ranking.hpp
 * @author Multi-Language AI System
 * @version 2.0.0
 */

#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace Ranking {

/** Ordered class labels; position i names output index i. */
using LabelTable = std::vector<std::string>;

/** One (label, confidence) entry. */
struct Prediction {
    std::string label;
    float weight = 0.0f;   // probability in [0, 1]
};

/** The 8 FER+ emotion labels in model output order. */
const LabelTable& defaultEmotionLabels();

/**
 * Load a label table from a text file, one label per line.
 * Blank lines are skipped.
 *
 * @throws std::runtime_error if the file cannot be opened or has no labels
 */
LabelTable loadLabels(const std::string& labelsPath);

/**
 * Pair labels with probabilities and sort by descending weight.
 *
 * The sort is stable: entries with exactly equal weight keep label-table
 * order. The result is a permutation of the input pairs.
 *
 * @throws InferenceError(LabelCountMismatch) if the sizes differ
 */
std::vector<Prediction> rank(const LabelTable& labels, const std::vector<float>& probabilities);

/** First min(k, ranking.size()) entries of a ranking. */
std::vector<Prediction> topPredictions(const std::vector<Prediction>& ranking, std::size_t k);

/** "<label> / <weight * 100 with 2 decimals>%", e.g. "neutral / 51.35%". */
std::string formatPrediction(const Prediction& prediction);

} // namespace Ranking
