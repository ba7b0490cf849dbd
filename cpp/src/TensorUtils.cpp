/**
 * =============================================================================
 * TensorUtils.cpp - BCHW Validation and Grayscale Encoding
 * =============================================================================
 *
 * @file TensorUtils.cpp
 * @author Multi-Language AI System
 * @version 2.0.0
 */

#include "TensorUtils.hpp"
#include "InferenceError.hpp"

#include <sstream>
#include <stdexcept>
#include <string>

namespace TensorUtils {

namespace {

/**
 * Write every pixel of img into dst at (0, 0, row, col) as type T.
 *
 * Each cell of the (1, 1, H, W) volume is addressed exactly once.
 * Bounds and type violations surface from Tensor::setAt() / GrayImage::at()
 * and are reported as EncodingFailure.
 */
template <typename T>
void writePixels(const ImageUtils::GrayImage& img, Tensor& dst) {
    for (int row = 0; row < img.height; ++row) {
        for (int col = 0; col < img.width; ++col) {
            try {
                dst.setAt<T>(static_cast<T>(img.at(row, col)), {0, 0, row, col});
            } catch (const std::out_of_range& e) {
                throw InferenceError(ErrorCode::EncodingFailure, e.what());
            } catch (const std::invalid_argument& e) {
                throw InferenceError(ErrorCode::EncodingFailure, e.what());
            }
        }
    }
}

} // namespace

void verifyBCHWTensor(const Tensor* dst, int64_t height, int64_t width, bool singleChannel) {
    if (dst == nullptr) {
        throw InferenceError(ErrorCode::InvalidReceiver,
                             "cannot decode image into a nil receiver");
    }

    const std::vector<int64_t>& shape = dst->shape();

    // BCHW: exactly four axes
    if (shape.size() != 4) {
        throw InferenceError(ErrorCode::RankMismatch,
                             "expected a 4 dimension tensor, but receiver has " +
                             std::to_string(shape.size()));
    }

    if (shape[0] != 1) {
        throw InferenceError(ErrorCode::UnsupportedBatchSize,
                             "only batch size of one is supported, got " +
                             std::to_string(shape[0]));
    }

    if (singleChannel && shape[1] != 1) {
        throw InferenceError(ErrorCode::ChannelMismatch,
                             "refusing to insert a gray scale image into a tensor with " +
                             std::to_string(shape[1]) + " channels");
    }

    if (shape[2] != height || shape[3] != width) {
        throw DimensionMismatchError(height, width, shape[2], shape[3]);
    }
}

void grayToBCHW(const ImageUtils::GrayImage& img, Tensor* dst) {
    verifyBCHWTensor(dst, img.height, img.width, true);

    // Exhaustive over ElementType: adding a tag without handling it here
    // triggers -Wswitch.
    switch (dst->elementType()) {
        case ElementType::Float32:
            writePixels<float>(img, *dst);
            return;
        case ElementType::Float64:
            writePixels<double>(img, *dst);
            return;
        case ElementType::UInt8:
        case ElementType::Int32:
        case ElementType::Int64:
            throw InferenceError(ErrorCode::UnsupportedElementType,
                                 std::string(elementTypeName(dst->elementType())) +
                                 " not handled; expected float32 or float64");
    }
}

std::vector<float> toScores(const Tensor& output) {
    switch (output.elementType()) {
        case ElementType::Float32:
            return output.toVector<float>();
        case ElementType::Float64: {
            std::vector<double> wide = output.toVector<double>();
            return std::vector<float>(wide.begin(), wide.end());
        }
        case ElementType::UInt8:
        case ElementType::Int32:
        case ElementType::Int64:
            break;
    }
    std::ostringstream msg;
    msg << "model output is " << elementTypeName(output.elementType())
        << ", expected floating-point scores";
    throw InferenceError(ErrorCode::InferenceFailure, msg.str());
}

} // namespace TensorUtils
