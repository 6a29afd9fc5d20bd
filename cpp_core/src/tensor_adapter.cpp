#include "tensor_adapter.hpp"
#include "engine_errors.hpp"
#include <opencv2/imgproc.hpp>

ChwTensor ToTensor(const cv::Mat& image) {
    if (image.empty() || image.dims != 2) {
        throw LayoutError("expected a non-empty 2-D image");
    }
    if (image.depth() != CV_8U) {
        throw LayoutError("expected 8-bit pixels, got depth " + std::to_string(image.depth()));
    }

    cv::Mat rgb;
    switch (image.channels()) {
        case 1: cv::cvtColor(image, rgb, cv::COLOR_GRAY2RGB); break;
        case 3: rgb = image; break;
        case 4: cv::cvtColor(image, rgb, cv::COLOR_RGBA2RGB); break;
        default:
            throw LayoutError("unsupported channel count " + std::to_string(image.channels()));
    }

    const int h = rgb.rows;
    const int w = rgb.cols;

    // HWC -> CHW, made contiguous before the rescale.
    std::vector<cv::Mat> planes;
    cv::split(rgb, planes);
    cv::Mat planar(3 * h, w, CV_8U);
    for (int c = 0; c < 3; ++c) {
        planes[c].copyTo(planar.rowRange(c * h, (c + 1) * h));
    }

    cv::Mat scaled;
    planar.convertTo(scaled, CV_32F, 1.0 / 255.0);

    ChwTensor tensor;
    tensor.channels = 3;
    tensor.height = h;
    tensor.width = w;
    tensor.data.assign(scaled.ptr<float>(), scaled.ptr<float>() + scaled.total());
    return tensor;
}
