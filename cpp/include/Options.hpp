/**
 * =============================================================================
 * Options.hpp - Command-Line Options for the Emotion Classifier
 * =============================================================================
 *
 * USAGE:
 *   ./emotion_classify [-model <path>] [-input <path>] [-labels <path>] [-top <k>] [-h]
 *
 * Flags accept one or two leading dashes and either "-flag value" or
 * "-flag=value".
 *
 * @file Options.hpp
 * @author Multi-Language AI System
 * @version 2.0.0
 */

#pragma once

#include <string>
#include <vector>

struct Options {
    std::string modelPath = "model/model.onnx";
    std::string inputPath = "images/avatar64.png";   // "-" reads stdin
    std::string labelsPath;                          // empty: FER+ table
    int top = 2;
    bool help = false;
};

/**
 * Parse argv into Options.
 *
 * @throws std::invalid_argument on an unknown flag, a missing value or a
 *         non-positive -top
 */
Options parseOptions(int argc, const char* const argv[]);

/** Usage text for the given program name. */
std::string usage(const std::string& programName);
