#pragma once
#include "frame_source.hpp"
#include <chrono>
#include <opencv2/core.hpp>

struct NormalizerOptions {
    int roi_x = 150;
    int roi_y = 50;
    int roi_height_trim = 150;
    int brightness = -50;
    std::chrono::microseconds retry_interval{1000000 / 60};
    int max_not_ready_retries = 600;
};

// Stateless pixel helpers used by FrameNormalizer.
namespace FrameUtils {
    // Copies a B,G,R,X frame into a packed CV_8UC4 image in R,G,B,A order.
    cv::Mat ToCanonicalRgba(const RawFrame& frame);
    // (x, y, width, height / 2 - height_trim) clipped to the frame.
    cv::Rect RegionOfInterest(const cv::Size& frame_size, int roi_x, int roi_y, int height_trim);
    cv::Mat GrayscaleAndShift(const cv::Mat& rgba, int brightness);
}

/**
 * @class FrameNormalizer
 * @brief Pulls one frame from a capture source and turns it into the
 *        grayscale region of interest the OCR stage reads.
 */
class FrameNormalizer {
public:
    explicit FrameNormalizer(FrameSource& source, NormalizerOptions options = NormalizerOptions());

    // Blocks until a frame is available. Returns a CV_8UC1 image.
    cv::Mat Capture();

private:
    FrameSource& source_;
    NormalizerOptions options_;
};
