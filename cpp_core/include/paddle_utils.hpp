#pragma once
#include "engine_errors.hpp"
#include "ocr_engine.hpp"
#include <onnxruntime_cxx_api.h>
#include <opencv2/opencv.hpp>
#include <cstdint>
#include <vector>
#include <string>

// This namespace encapsulates stateless helper functions for PaddleOCR.
namespace PaddleUtils {
    std::pair<cv::Mat, float> ResizeKeepRatio(const cv::Mat& img, int max_side = 960);
    cv::Mat NormalizeImageNet(const cv::Mat& img);
    std::vector<WordBox> PostprocessDetection(const float* prob_map, const cv::Size& original_shape, const cv::Size& resized_shape, float scale);
    std::vector<LineBoxes> GroupTextLines(const std::vector<WordBox>& boxes);
    cv::Mat WarpQuad(const cv::Mat& image, const WordBox& quad);
    std::vector<cv::Mat> SplitWideCrop(const cv::Mat& crop, int chunk_width = 320, int overlap = 64);
    cv::Mat PreprocessRecognition(const cv::Mat& img);
    std::string DecodeRecognition(const float* preds, const std::vector<int64_t>& preds_shape, const std::vector<std::string>& charset);
    std::vector<std::string> SplitWords(const std::string& text);

    // Runs one OCR stage. ONNX Runtime and OpenCV failures come out as OcrError.
    template <typename Fn>
    auto RunStage(const std::string& stage, Fn&& fn) -> decltype(fn()) {
        try {
            return fn();
        } catch (const Ort::Exception& e) {
            throw OcrError(stage + " failed: " + e.what());
        } catch (const cv::Exception& e) {
            throw OcrError(stage + " failed: " + e.what());
        }
    }
}
