/**
 * =============================================================================
 * InferenceError.hpp - Error Taxonomy for the Emotion Inference Pipeline
 * =============================================================================
 *
 * Every failure raised by the pipeline (shape validation, encoding, image
 * decoding, model execution, ranking) is reported as an InferenceError.
 * The ErrorCode tells the caller which stage failed; what() carries a
 * human-readable message.
 *
 * All errors are terminal for the current request. Nothing here is retried.
 *
 * @file InferenceError.hpp
 * @author Multi-Language AI System
 * @version 2.0.0
 */

#ifndef INFERENCE_ERROR_HPP
#define INFERENCE_ERROR_HPP

#include <cstdint>     // int64_t for tensor extents
#include <stdexcept>   // std::runtime_error base class
#include <string>

/**
 * Which stage of the pipeline failed.
 */
enum class ErrorCode {
    InvalidReceiver,         // destination tensor handle is null
    RankMismatch,            // tensor does not have exactly 4 axes
    UnsupportedBatchSize,    // batch axis is not 1
    ChannelMismatch,         // channel axis is not 1 in single-channel mode
    DimensionMismatch,       // height/width differ from the image
    UnsupportedElementType,  // tensor type is neither float32 nor float64
    EncodingFailure,         // a cell write failed mid-encode
    UnsupportedImageFormat,  // decoded image is not 8-bit grayscale
    InferenceFailure,        // model load or forward pass failed
    LabelCountMismatch       // label table and score vector differ in length
};

/**
 * Stable upper-case name for an ErrorCode (e.g. "CHANNEL_MISMATCH").
 * Never throws.
 */
const char* errorCodeName(ErrorCode code) noexcept;

/**
 * Exception type for all pipeline failures.
 *
 * Derives from std::runtime_error so generic handlers still work:
 *   catch (const std::exception& e) { std::cerr << e.what(); }
 */
class InferenceError : public std::runtime_error {
public:
    InferenceError(ErrorCode code, const std::string& message);

    ErrorCode code() const noexcept { return code_; }
    const char* codeName() const noexcept { return errorCodeName(code_); }

private:
    ErrorCode code_;
};

/**
 * DimensionMismatch carries both the requested (image) extents and the
 * actual (tensor) extents so callers can report them without parsing what().
 */
class DimensionMismatchError : public InferenceError {
public:
    DimensionMismatchError(int64_t requestedHeight, int64_t requestedWidth,
                           int64_t actualHeight, int64_t actualWidth);

    int64_t requestedHeight() const noexcept { return requestedHeight_; }
    int64_t requestedWidth() const noexcept { return requestedWidth_; }
    int64_t actualHeight() const noexcept { return actualHeight_; }
    int64_t actualWidth() const noexcept { return actualWidth_; }

private:
    int64_t requestedHeight_;
    int64_t requestedWidth_;
    int64_t actualHeight_;
    int64_t actualWidth_;
};

#endif // INFERENCE_ERROR_HPP
