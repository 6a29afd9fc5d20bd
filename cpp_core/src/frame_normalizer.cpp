#include "frame_normalizer.hpp"
#include "engine_errors.hpp"
#include <iostream>
#include <thread>
#include <opencv2/imgproc.hpp>

namespace FrameUtils {

    cv::Mat ToCanonicalRgba(const RawFrame& frame) {
        if (frame.data == nullptr || frame.width <= 0 || frame.height <= 0) {
            throw LayoutError("empty frame");
        }
        const size_t row_bytes = static_cast<size_t>(frame.width) * 4;
        if (frame.stride < row_bytes) {
            throw LayoutError("row stride " + std::to_string(frame.stride) + " shorter than " +
                              std::to_string(row_bytes) + " bytes of pixels");
        }
        if (frame.size < frame.stride * static_cast<size_t>(frame.height)) {
            throw LayoutError("frame buffer holds " + std::to_string(frame.size) + " bytes, expected " +
                              std::to_string(frame.stride * static_cast<size_t>(frame.height)));
        }

        // Wraps the provider's buffer without copying; padding bytes are skipped via the step.
        cv::Mat bgra(frame.height, frame.width, CV_8UC4, const_cast<uint8_t*>(frame.data), frame.stride);
        cv::Mat rgba;
        cv::cvtColor(bgra, rgba, cv::COLOR_BGRA2RGBA);

        // The X channel carries no alpha.
        cv::Mat alpha(rgba.size(), CV_8UC1, cv::Scalar(255));
        int from_to[] = {0, 3};
        cv::mixChannels(&alpha, 1, &rgba, 1, from_to, 1);
        return rgba;
    }

    cv::Rect RegionOfInterest(const cv::Size& frame_size, int roi_x, int roi_y, int height_trim) {
        cv::Rect roi(roi_x, roi_y, frame_size.width, frame_size.height / 2 - height_trim);
        return roi & cv::Rect(0, 0, frame_size.width, frame_size.height);
    }

    cv::Mat GrayscaleAndShift(const cv::Mat& rgba, int brightness) {
        cv::Mat gray;
        cv::cvtColor(rgba, gray, cv::COLOR_RGBA2GRAY);
        cv::Mat shifted;
        gray.convertTo(shifted, CV_8U, 1.0, brightness);
        return shifted;
    }
}

FrameNormalizer::FrameNormalizer(FrameSource& source, NormalizerOptions options)
    : source_(source), options_(options) {}

cv::Mat FrameNormalizer::Capture() {
    RawFrame frame;
    int retries = 0;
    while (source_.Grab(frame) == CaptureStatus::kNotReady) {
        if (++retries > options_.max_not_ready_retries) {
            throw CaptureError("no frame after " + std::to_string(options_.max_not_ready_retries) + " retries");
        }
        std::this_thread::sleep_for(options_.retry_interval);
    }

    cv::Mat rgba = FrameUtils::ToCanonicalRgba(frame);
    cv::Rect roi = FrameUtils::RegionOfInterest(rgba.size(), options_.roi_x, options_.roi_y,
                                                  options_.roi_height_trim);
    if (roi.empty()) {
        throw CaptureError("display " + std::to_string(frame.width) + "x" + std::to_string(frame.height) +
                           " is too small for the badge region");
    }
    return FrameUtils::GrayscaleAndShift(rgba(roi), options_.brightness);
}
