/**
 * =============================================================================
 * ImageUtils.cpp - Grayscale Decoding via OpenCV
 * =============================================================================
 *
 * Decoding is delegated to cv::imdecode. This file only enforces the
 * 8-bit single-channel contract and copies pixels out of the cv::Mat so the
 * rest of the pipeline does not depend on OpenCV types.
 *
 * @file ImageUtils.cpp
 * @author Multi-Language AI System
 * @version 2.0.0
 */

#include "ImageUtils.hpp"
#include "InferenceError.hpp"

#include <algorithm>   // std::copy
#include <fstream>     // std::ifstream for reading image files
#include <iostream>    // std::cin when the input path is "-"
#include <iterator>    // std::istreambuf_iterator
#include <sstream>
#include <stdexcept>

#include <opencv2/imgcodecs.hpp>   // cv::imdecode

namespace ImageUtils {

uint8_t GrayImage::at(int row, int col) const {
    if (row < 0 || row >= height || col < 0 || col >= width) {
        std::ostringstream msg;
        msg << "pixel (" << row << ", " << col << ") outside "
            << height << "x" << width << " image";
        throw std::out_of_range(msg.str());
    }
    // vector::at() catches a pixel buffer shorter than width * height
    return pixels.at(static_cast<std::size_t>(row) * width + col);
}

GrayImage fromMat(const cv::Mat& mat) {
    if (mat.type() != CV_8UC1) {
        std::ostringstream msg;
        msg << "Please give a gray image as input (got " << mat.channels()
            << " channel(s), depth " << mat.depth() << ")";
        throw InferenceError(ErrorCode::UnsupportedImageFormat, msg.str());
    }

    GrayImage image;
    image.width = mat.cols;
    image.height = mat.rows;
    image.pixels.resize(static_cast<std::size_t>(mat.rows) * mat.cols);

    // Copy row by row: an ROI's rows are not adjacent in memory
    for (int row = 0; row < mat.rows; ++row) {
        const uint8_t* src = mat.ptr<uint8_t>(row);
        std::copy(src, src + mat.cols, image.pixels.begin() + static_cast<std::ptrdiff_t>(row) * mat.cols);
    }
    return image;
}

GrayImage decodeGrayImage(const std::vector<uint8_t>& bytes) {
    if (bytes.empty()) {
        throw InferenceError(ErrorCode::UnsupportedImageFormat, "cannot decode an empty image buffer");
    }

    // IMREAD_UNCHANGED keeps the stored channel count and bit depth,
    // so color or 16-bit inputs are detected rather than converted.
    cv::Mat img = cv::imdecode(bytes, cv::IMREAD_UNCHANGED);
    if (img.empty()) {
        throw InferenceError(ErrorCode::UnsupportedImageFormat, "image data could not be decoded");
    }
    return fromMat(img);
}

GrayImage loadGrayImage(const std::string& imagePath) {
    std::vector<uint8_t> bytes;

    if (imagePath == "-") {
        bytes.assign(std::istreambuf_iterator<char>(std::cin),
                     std::istreambuf_iterator<char>());
    } else {
        std::ifstream file(imagePath, std::ios::binary);
        if (!file) {
            throw std::runtime_error("Failed to load image: " + imagePath);
        }
        bytes.assign(std::istreambuf_iterator<char>(file),
                     std::istreambuf_iterator<char>());
    }

    return decodeGrayImage(bytes);
}

} // namespace ImageUtils
