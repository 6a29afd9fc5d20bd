#include "frame_normalizer.hpp"
#include "engine_errors.hpp"
#include <gtest/gtest.h>
#include <opencv2/core.hpp>

namespace {

// Serves one fixed B,G,R,X frame, optionally after some "not ready" replies.
class ScriptedSource : public FrameSource {
public:
    ScriptedSource(int width, int height, size_t padding = 0)
        : width_(width), height_(height), stride_(static_cast<size_t>(width) * 4 + padding),
          pixels_(stride_ * height, 0xEE) {}

    void Fill(uint8_t b, uint8_t g, uint8_t r) {
        for (int y = 0; y < height_; ++y) {
            for (int x = 0; x < width_; ++x) {
                uint8_t* p = &pixels_[y * stride_ + x * 4];
                p[0] = b;
                p[1] = g;
                p[2] = r;
                p[3] = 0;
            }
        }
    }

    int Width() const override { return width_; }
    int Height() const override { return height_; }

    CaptureStatus Grab(RawFrame& frame) override {
        ++grabs;
        if (not_ready > 0) {
            --not_ready;
            return CaptureStatus::kNotReady;
        }
        frame.data = pixels_.data();
        frame.size = pixels_.size();
        frame.width = width_;
        frame.height = height_;
        frame.stride = reported_stride ? reported_stride : stride_;
        return CaptureStatus::kReady;
    }

    int not_ready = 0;
    int grabs = 0;
    size_t reported_stride = 0;

private:
    int width_;
    int height_;
    size_t stride_;
    std::vector<uint8_t> pixels_;
};

NormalizerOptions FastRetries(int max_retries = 600) {
    NormalizerOptions options;
    options.retry_interval = std::chrono::microseconds(0);
    options.max_not_ready_retries = max_retries;
    return options;
}

}

TEST(FrameNormalizerTest, CropsToBadgeRegion) {
    ScriptedSource source(320, 420);
    source.Fill(255, 255, 255);
    FrameNormalizer normalizer(source, FastRetries());

    cv::Mat image = normalizer.Capture();
    EXPECT_EQ(image.type(), CV_8UC1);
    // x from 150 to the right edge, y from 50, height 420 / 2 - 150.
    EXPECT_EQ(image.size(), cv::Size(170, 60));
}

TEST(FrameNormalizerTest, AppliesBrightnessShift) {
    ScriptedSource source(320, 420);
    source.Fill(255, 255, 255);
    FrameNormalizer normalizer(source, FastRetries());

    cv::Mat image = normalizer.Capture();
    EXPECT_EQ(cv::countNonZero(image != 205), 0);
}

TEST(FrameNormalizerTest, ReadsBlueGreenRedOrderAndSkipsRowPadding) {
    // Pure red: 0.299 * 200 = 60 after grayscale, 10 after the shift.
    // Read as blue it would be 23 and clamp to 0.
    ScriptedSource source(320, 420, 24);
    source.Fill(0, 0, 200);
    FrameNormalizer normalizer(source, FastRetries());

    cv::Mat image = normalizer.Capture();
    EXPECT_EQ(cv::countNonZero(image != 10), 0);
}

TEST(FrameNormalizerTest, WaitsForFrame) {
    ScriptedSource source(320, 420);
    source.not_ready = 3;
    FrameNormalizer normalizer(source, FastRetries());

    EXPECT_FALSE(normalizer.Capture().empty());
    EXPECT_EQ(source.grabs, 4);
}

TEST(FrameNormalizerTest, GivesUpAfterRetryBound) {
    ScriptedSource source(320, 420);
    source.not_ready = 5;
    FrameNormalizer normalizer(source, FastRetries(2));

    EXPECT_THROW(normalizer.Capture(), CaptureError);
    EXPECT_EQ(source.grabs, 3);
}

TEST(FrameNormalizerTest, RejectsShortStride) {
    ScriptedSource source(320, 420);
    source.reported_stride = 320 * 4 - 4;
    FrameNormalizer normalizer(source, FastRetries());

    EXPECT_THROW(normalizer.Capture(), LayoutError);
}

TEST(FrameNormalizerTest, RejectsDisplayTooSmallForRegion) {
    ScriptedSource source(100, 200);
    FrameNormalizer normalizer(source, FastRetries());

    EXPECT_THROW(normalizer.Capture(), CaptureError);
}

TEST(FrameUtilsTest, RegionOfInterestOnFullHd) {
    EXPECT_EQ(FrameUtils::RegionOfInterest(cv::Size(1920, 1080), 150, 50, 150), cv::Rect(150, 50, 1770, 390));
}

TEST(FrameUtilsTest, CanonicalRgbaSwapsChannelsAndSetsAlpha) {
    std::vector<uint8_t> pixels = {10, 20, 30, 0, 40, 50, 60, 7};
    RawFrame frame;
    frame.data = pixels.data();
    frame.size = pixels.size();
    frame.width = 2;
    frame.height = 1;
    frame.stride = 8;

    cv::Mat rgba = FrameUtils::ToCanonicalRgba(frame);
    ASSERT_EQ(rgba.type(), CV_8UC4);
    EXPECT_EQ(rgba.at<cv::Vec4b>(0, 0), cv::Vec4b(30, 20, 10, 255));
    EXPECT_EQ(rgba.at<cv::Vec4b>(0, 1), cv::Vec4b(60, 50, 40, 255));
}

TEST(FrameUtilsTest, TruncatedBufferIsLayoutError) {
    std::vector<uint8_t> pixels(12);
    RawFrame frame;
    frame.data = pixels.data();
    frame.size = pixels.size();
    frame.width = 2;
    frame.height = 2;
    frame.stride = 8;

    EXPECT_THROW(FrameUtils::ToCanonicalRgba(frame), LayoutError);
}
