#include "TensorUtils.hpp"
#include "InferenceError.hpp"
#include <gtest/gtest.h>
#include <vector>

namespace {

/**
 * H x W image whose pixel (r, c) is (r * 7 + c * 3) % 256
 */
ImageUtils::GrayImage patternImage(int height, int width) {
    ImageUtils::GrayImage img;
    img.height = height;
    img.width = width;
    img.pixels.resize(static_cast<std::size_t>(height) * width);
    for (int r = 0; r < height; ++r) {
        for (int c = 0; c < width; ++c) {
            img.pixels[static_cast<std::size_t>(r) * width + c] = static_cast<uint8_t>((r * 7 + c * 3) % 256);
        }
    }
    return img;
}

ErrorCode verifyCode(const Tensor* dst, int64_t h, int64_t w, bool singleChannel = true) {
    try {
        TensorUtils::verifyBCHWTensor(dst, h, w, singleChannel);
    } catch (const InferenceError& e) {
        return e.code();
    }
    ADD_FAILURE() << "verifyBCHWTensor did not throw";
    return ErrorCode::InferenceFailure;
}

} // namespace

// ============================================================================
// Validator
// ============================================================================

TEST(VerifyBCHWTest, AcceptsMatchingTensor) {
    Tensor t(ElementType::Float32, {1, 1, 64, 64});
    EXPECT_NO_THROW(TensorUtils::verifyBCHWTensor(&t, 64, 64, true));
}

TEST(VerifyBCHWTest, NullReceiver) {
    EXPECT_EQ(verifyCode(nullptr, 64, 64), ErrorCode::InvalidReceiver);
}

TEST(VerifyBCHWTest, RankMismatch) {
    Tensor rank2(ElementType::Float32, {64, 64});
    Tensor rank3(ElementType::Float32, {1, 64, 64});
    Tensor rank5(ElementType::Float32, {1, 1, 1, 64, 64});

    EXPECT_EQ(verifyCode(&rank2, 64, 64), ErrorCode::RankMismatch);
    EXPECT_EQ(verifyCode(&rank3, 64, 64), ErrorCode::RankMismatch);
    EXPECT_EQ(verifyCode(&rank5, 64, 64), ErrorCode::RankMismatch);
}

TEST(VerifyBCHWTest, BatchSizeMustBeOne) {
    Tensor batch2(ElementType::Float32, {2, 1, 64, 64});
    Tensor batch0(ElementType::Float32, {0, 1, 64, 64});

    EXPECT_EQ(verifyCode(&batch2, 64, 64), ErrorCode::UnsupportedBatchSize);
    EXPECT_EQ(verifyCode(&batch0, 64, 64), ErrorCode::UnsupportedBatchSize);
}

TEST(VerifyBCHWTest, TwoChannelTensorInSingleChannelMode) {
    Tensor t(ElementType::Float32, {1, 2, 64, 64});
    EXPECT_EQ(verifyCode(&t, 64, 64, true), ErrorCode::ChannelMismatch);
}

TEST(VerifyBCHWTest, MultiChannelAllowedWhenNotSingleChannel) {
    Tensor t(ElementType::Float32, {1, 3, 64, 64});
    EXPECT_NO_THROW(TensorUtils::verifyBCHWTensor(&t, 64, 64, false));
}

TEST(VerifyBCHWTest, DimensionMismatchReportsBothExtents) {
    Tensor t(ElementType::Float32, {1, 1, 64, 64});

    try {
        TensorUtils::verifyBCHWTensor(&t, 48, 32, true);
        FAIL() << "expected DimensionMismatchError";
    } catch (const DimensionMismatchError& e) {
        EXPECT_EQ(e.code(), ErrorCode::DimensionMismatch);
        EXPECT_EQ(e.requestedHeight(), 48);
        EXPECT_EQ(e.requestedWidth(), 32);
        EXPECT_EQ(e.actualHeight(), 64);
        EXPECT_EQ(e.actualWidth(), 64);
        EXPECT_NE(std::string(e.what()).find("48*32"), std::string::npos);
        EXPECT_NE(std::string(e.what()).find("64*64"), std::string::npos);
    }
}

TEST(VerifyBCHWTest, WidthOnlyMismatch) {
    Tensor t(ElementType::Float32, {1, 1, 64, 63});
    EXPECT_EQ(verifyCode(&t, 64, 64), ErrorCode::DimensionMismatch);
}

TEST(VerifyBCHWTest, FirstFailingCheckWins) {
    // Wrong batch, channel and size at once: batch is checked first
    Tensor t(ElementType::Float32, {2, 3, 10, 10});
    EXPECT_EQ(verifyCode(&t, 64, 64), ErrorCode::UnsupportedBatchSize);
}

// ============================================================================
// Encoder
// ============================================================================

TEST(GrayToBCHWTest, Float32EveryCellMatchesPixel) {
    auto img = patternImage(5, 7);
    Tensor t(ElementType::Float32, {1, 1, 5, 7});

    TensorUtils::grayToBCHW(img, &t);

    for (int r = 0; r < 5; ++r) {
        for (int c = 0; c < 7; ++c) {
            EXPECT_EQ(t.at<float>({0, 0, r, c}), static_cast<float>(img.at(r, c)))
                << "at (" << r << ", " << c << ")";
        }
    }
}

TEST(GrayToBCHWTest, Float64UsesFourAxisAddressing) {
    auto img = patternImage(6, 4);
    Tensor t(ElementType::Float64, {1, 1, 6, 4});

    TensorUtils::grayToBCHW(img, &t);

    for (int r = 0; r < 6; ++r) {
        for (int c = 0; c < 4; ++c) {
            EXPECT_EQ(t.at<double>({0, 0, r, c}), static_cast<double>(img.at(r, c)));
        }
    }
}

TEST(GrayToBCHWTest, OverwritesEveryPreallocatedCell) {
    auto img = patternImage(3, 3);
    auto t = Tensor::fromVector<float>({1, 1, 3, 3}, std::vector<float>(9, -1.0f));

    TensorUtils::grayToBCHW(img, &t);

    for (float v : t.toVector<float>()) {
        EXPECT_GE(v, 0.0f);
        EXPECT_LE(v, 255.0f);
    }
}

TEST(GrayToBCHWTest, FullIntensityRange) {
    ImageUtils::GrayImage img;
    img.height = 1;
    img.width = 3;
    img.pixels = {0, 128, 255};
    Tensor t(ElementType::Float32, {1, 1, 1, 3});

    TensorUtils::grayToBCHW(img, &t);

    EXPECT_EQ(t.at<float>({0, 0, 0, 0}), 0.0f);
    EXPECT_EQ(t.at<float>({0, 0, 0, 1}), 128.0f);
    EXPECT_EQ(t.at<float>({0, 0, 0, 2}), 255.0f);
}

TEST(GrayToBCHWTest, IntegerTensorRejectedWithoutWrites) {
    auto img = patternImage(2, 2);
    auto t = Tensor::fromVector<uint8_t>({1, 1, 2, 2}, {9, 9, 9, 9});

    try {
        TensorUtils::grayToBCHW(img, &t);
        FAIL() << "expected UnsupportedElementType";
    } catch (const InferenceError& e) {
        EXPECT_EQ(e.code(), ErrorCode::UnsupportedElementType);
    }

    for (uint8_t v : t.toVector<uint8_t>()) {
        EXPECT_EQ(v, 9);
    }
}

TEST(GrayToBCHWTest, ValidationRunsBeforeEncoding) {
    auto img = patternImage(64, 64);
    Tensor t(ElementType::Float32, {1, 2, 64, 64});

    try {
        TensorUtils::grayToBCHW(img, &t);
        FAIL() << "expected ChannelMismatch";
    } catch (const InferenceError& e) {
        EXPECT_EQ(e.code(), ErrorCode::ChannelMismatch);
    }
}

TEST(GrayToBCHWTest, NullDestination) {
    auto img = patternImage(2, 2);
    try {
        TensorUtils::grayToBCHW(img, nullptr);
        FAIL() << "expected InvalidReceiver";
    } catch (const InferenceError& e) {
        EXPECT_EQ(e.code(), ErrorCode::InvalidReceiver);
    }
}

TEST(GrayToBCHWTest, ShortPixelBufferIsEncodingFailure) {
    // Declares 4x4 but only carries 10 pixels
    ImageUtils::GrayImage img;
    img.height = 4;
    img.width = 4;
    img.pixels.assign(10, 1);
    Tensor t(ElementType::Float32, {1, 1, 4, 4});

    try {
        TensorUtils::grayToBCHW(img, &t);
        FAIL() << "expected EncodingFailure";
    } catch (const InferenceError& e) {
        EXPECT_EQ(e.code(), ErrorCode::EncodingFailure);
    }
}

// ============================================================================
// Output scores
// ============================================================================

TEST(ToScoresTest, Float32AndFloat64) {
    auto f = Tensor::fromVector<float>({1, 3}, {1.0f, 2.0f, 3.0f});
    auto d = Tensor::fromVector<double>({1, 3}, {1.0, 2.0, 3.0});

    EXPECT_EQ(TensorUtils::toScores(f), (std::vector<float>{1.0f, 2.0f, 3.0f}));
    EXPECT_EQ(TensorUtils::toScores(d), (std::vector<float>{1.0f, 2.0f, 3.0f}));
}

TEST(ToScoresTest, IntegerOutputIsInferenceFailure) {
    auto t = Tensor::fromVector<int64_t>({1, 2}, {0, 1});
    try {
        TensorUtils::toScores(t);
        FAIL() << "expected InferenceFailure";
    } catch (const InferenceError& e) {
        EXPECT_EQ(e.code(), ErrorCode::InferenceFailure);
    }
}

int main(int argc, char** argv) {
    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
