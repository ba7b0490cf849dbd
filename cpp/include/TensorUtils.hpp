/**
 * =============================================================================
 * TensorUtils.hpp - Image-to-Tensor Encoding (BCHW layout)
 * =============================================================================
 *
 * Converts a decoded grayscale image into the NCHW input tensor the emotion
 * network expects:
 *
 *   shape = [batch=1, channels=1, height=H, width=W]
 *   cell (0, 0, row, col) = intensity of pixel (row, col)
 *
 * Intensities are copied as-is (0-255), cast to the tensor's element type.
 * No normalization is applied; the FER+ network was trained on raw values.
 *
 * OWNERSHIP:
 * The destination tensor belongs to the caller. grayToBCHW() writes into it
 * in place for the duration of the call and keeps no reference afterwards.
 * It never resizes or reallocates the tensor, so the caller must allocate
 * it with the exact target shape first.
 *
 * @file TensorUtils.hpp
 * @author Multi-Language AI System
 * @version 2.0.0
 */

#ifndef TENSOR_UTILS_HPP
#define TENSOR_UTILS_HPP

#include "ImageUtils.hpp"
#include "Tensor.hpp"

#include <cstdint>
#include <vector>

namespace TensorUtils {

/**
 * Check that a destination tensor can receive an H x W grayscale image.
 *
 * Checks run in this order and the first failure is thrown:
 *   1. dst is not null                       -> InvalidReceiver
 *   2. dst has exactly 4 axes                -> RankMismatch
 *   3. batch axis == 1                       -> UnsupportedBatchSize
 *   4. channel axis == 1 (singleChannel)     -> ChannelMismatch
 *   5. axis 2 == height and axis 3 == width  -> DimensionMismatch
 *
 * @param dst           Destination tensor (may be null, reported as error)
 * @param height        Expected number of rows
 * @param width         Expected number of columns
 * @param singleChannel Refuse tensors with more than one channel
 * @throws InferenceError (DimensionMismatchError for step 5)
 */
void verifyBCHWTensor(const Tensor* dst, int64_t height, int64_t width, bool singleChannel);

/**
 * Encode a grayscale image into a (1, 1, H, W) tensor.
 *
 * @param img Source image; its width/height must match the tensor
 * @param dst Destination tensor, float32 or float64
 * @throws InferenceError from verifyBCHWTensor()
 * @throws InferenceError(UnsupportedElementType) for integer tensors,
 *         before any cell is written
 * @throws InferenceError(EncodingFailure) if a cell write fails; dst is then
 *         partially written and must be discarded
 */
void grayToBCHW(const ImageUtils::GrayImage& img, Tensor* dst);

/**
 * Flatten a model output tensor into a score vector.
 *
 * float64 outputs are narrowed to float.
 *
 * @throws InferenceError(InferenceFailure) for non floating-point outputs
 */
std::vector<float> toScores(const Tensor& output);

} // namespace TensorUtils

#endif // TENSOR_UTILS_HPP
