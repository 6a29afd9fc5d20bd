#pragma once
#include <vector>
#include <opencv2/core.hpp>

/**
 * @struct ChwTensor
 * @brief Planar float image, channel-major, values in [0, 1].
 */
struct ChwTensor {
    int channels = 0;
    int height = 0;
    int width = 0;
    std::vector<float> data;

    const float* Plane(int c) const { return data.data() + static_cast<size_t>(c) * height * width; }
    float At(int c, int y, int x) const { return Plane(c)[static_cast<size_t>(y) * width + x]; }
};

// Converts an 8-bit 1, 3 or 4 channel image into a 3 x H x W tensor.
// Throws LayoutError for anything else.
ChwTensor ToTensor(const cv::Mat& image);
