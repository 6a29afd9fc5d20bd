#pragma once
#include "ocr_engine.hpp"
#include "paddle_utils.hpp"
#include <string>
#include <vector>
#include <memory>
#include <onnxruntime_cxx_api.h>

/**
 * @class PaddleOcrEngine
 * @brief Runs the PaddleOCR detection and recognition models.
 *
 * Expects `models_dir/ocr_detection/inference.onnx`,
 * `models_dir/ocr_recognition/inference.onnx` and the recognition
 * dictionary `models_dir/ocr_recognition/dict.txt`.
 */
class PaddleOcrEngine : public OcrEngine {
public:
    PaddleOcrEngine(Ort::Env& env, Ort::SessionOptions& session_options, const std::string& models_dir);

    OcrInput PrepareInput(const ChwTensor& tensor) override;
    std::vector<WordBox> DetectWords(const OcrInput& input) override;
    std::vector<LineBoxes> FindTextLines(const OcrInput& input, const std::vector<WordBox>& words) override;
    std::vector<TextLine> RecognizeText(const OcrInput& input, const std::vector<LineBoxes>& lines) override;

private:
    void LoadCharset(const std::string& path);
    std::string RecognizeWord(const cv::Mat& image, const WordBox& box);

    std::unique_ptr<Ort::Session> det_session_;
    std::unique_ptr<Ort::Session> rec_session_;
    Ort::MemoryInfo memory_info_;

    std::vector<std::string> det_input_names_str_;
    std::vector<std::string> det_output_names_str_;
    std::vector<const char*> det_input_names_;
    std::vector<const char*> det_output_names_;

    std::vector<std::string> rec_input_names_str_;
    std::vector<std::string> rec_output_names_str_;
    std::vector<const char*> rec_input_names_;
    std::vector<const char*> rec_output_names_;

    std::vector<std::string> charset_;
};
