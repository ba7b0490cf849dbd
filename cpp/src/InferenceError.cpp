/**
 * =============================================================================
 * InferenceError.cpp - Error Code Names and Message Formatting
 * =============================================================================
 *
 * @file InferenceError.cpp
 * @author Multi-Language AI System
 * @version 2.0.0
 */

#include "InferenceError.hpp"

#include <sstream>   // std::ostringstream for building messages

const char* errorCodeName(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::InvalidReceiver:        return "INVALID_RECEIVER";
        case ErrorCode::RankMismatch:           return "RANK_MISMATCH";
        case ErrorCode::UnsupportedBatchSize:   return "UNSUPPORTED_BATCH_SIZE";
        case ErrorCode::ChannelMismatch:        return "CHANNEL_MISMATCH";
        case ErrorCode::DimensionMismatch:      return "DIMENSION_MISMATCH";
        case ErrorCode::UnsupportedElementType: return "UNSUPPORTED_ELEMENT_TYPE";
        case ErrorCode::EncodingFailure:        return "ENCODING_FAILURE";
        case ErrorCode::UnsupportedImageFormat: return "UNSUPPORTED_IMAGE_FORMAT";
        case ErrorCode::InferenceFailure:       return "INFERENCE_FAILURE";
        case ErrorCode::LabelCountMismatch:     return "LABEL_COUNT_MISMATCH";
    }
    return "UNKNOWN";
}

InferenceError::InferenceError(ErrorCode code, const std::string& message)
    : std::runtime_error(message)
    , code_(code)
{
}

namespace {

std::string dimensionMessage(int64_t requestedHeight, int64_t requestedWidth,
                             int64_t actualHeight, int64_t actualWidth) {
    // Extents are printed as height*width, image first, tensor second
    std::ostringstream msg;
    msg << "cannot fit image into tensor; image is "
        << requestedHeight << "*" << requestedWidth
        << " but tensor is "
        << actualHeight << "*" << actualWidth;
    return msg.str();
}

} // namespace

DimensionMismatchError::DimensionMismatchError(int64_t requestedHeight, int64_t requestedWidth,
                                               int64_t actualHeight, int64_t actualWidth)
    : InferenceError(ErrorCode::DimensionMismatch,
                     dimensionMessage(requestedHeight, requestedWidth, actualHeight, actualWidth))
    , requestedHeight_(requestedHeight)
    , requestedWidth_(requestedWidth)
    , actualHeight_(actualHeight)
    , actualWidth_(actualWidth)
{
}
