/**
 * =============================================================================
 * ImageUtils.hpp - Grayscale Image Loading for the Emotion Classifier
 * =============================================================================
 *
 * The emotion model consumes a single 64x64 grayscale face. This file turns
 * encoded image bytes (PNG, JPEG, BMP, ... anything OpenCV's imgcodecs can
 * read) into a GrayImage: a width, a height and one 8-bit intensity per
 * pixel.
 *
 * GRAYSCALE-ONLY POLICY:
 * Images are decoded with cv::IMREAD_UNCHANGED, so no implicit color
 * conversion takes place. If the file holds a color image, an alpha channel
 * or 16-bit samples, decoding fails with UnsupportedImageFormat instead of
 * silently converting.
 *
 * MEMORY LAYOUT:
 * Pixels are stored row-major: pixel (row, col) is pixels[row * width + col].
 *
 * @file ImageUtils.hpp
 * @author Multi-Language AI System
 * @version 2.0.0
 */

#pragma once

#include <cstdint>   // uint8_t - one grayscale intensity (0-255)
#include <string>
#include <vector>

#include <opencv2/core.hpp>

namespace ImageUtils {

/**
 * A decoded single-channel image.
 */
struct GrayImage {
    int width = 0;
    int height = 0;
    std::vector<uint8_t> pixels;   // row-major, width * height entries

    /**
     * Intensity at (row, col).
     * @throws std::out_of_range if the coordinate is outside the image or the
     *         pixel buffer is shorter than width * height
     */
    uint8_t at(int row, int col) const;
};

/**
 * Decode an in-memory encoded image.
 *
 * @param bytes Encoded file contents
 * @return The decoded grayscale image
 * @throws InferenceError(UnsupportedImageFormat) if the bytes cannot be
 *         decoded or the image is not 8-bit single channel
 */
GrayImage decodeGrayImage(const std::vector<uint8_t>& bytes);

/**
 * Read and decode an image file.
 *
 * @param imagePath Path to the image, or "-" to read from standard input
 * @throws std::runtime_error if the file cannot be read
 * @throws InferenceError(UnsupportedImageFormat) as decodeGrayImage()
 */
GrayImage loadGrayImage(const std::string& imagePath);

/**
 * Copy a CV_8UC1 matrix into a GrayImage. Non-continuous matrices (ROIs)
 * are supported.
 *
 * @throws InferenceError(UnsupportedImageFormat) for any other matrix type
 */
GrayImage fromMat(const cv::Mat& mat);

} // namespace ImageUtils
