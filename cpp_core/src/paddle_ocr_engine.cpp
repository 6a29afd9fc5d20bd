#include "paddle_ocr_engine.hpp"
#include "engine_errors.hpp"
#include <iostream>
#include <fstream>
#include <algorithm>

PaddleOcrEngine::PaddleOcrEngine(Ort::Env& env, Ort::SessionOptions& session_options, const std::string& models_dir)
    : memory_info_(Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault)) {
    Ort::AllocatorWithDefaultOptions allocator;

    std::cout << "Loading PaddleOCR detection model..." << std::endl;
    std::string det_path = models_dir + "/ocr_detection/inference.onnx";
    det_session_ = std::make_unique<Ort::Session>(env, det_path.c_str(), session_options);

    std::cout << "Loading PaddleOCR recognition model..." << std::endl;
    std::string rec_path = models_dir + "/ocr_recognition/inference.onnx";
    rec_session_ = std::make_unique<Ort::Session>(env, rec_path.c_str(), session_options);

    det_input_names_str_.push_back(det_session_->GetInputNameAllocated(0, allocator).get());
    det_output_names_str_.push_back(det_session_->GetOutputNameAllocated(0, allocator).get());
    det_input_names_.push_back(det_input_names_str_[0].c_str());
    det_output_names_.push_back(det_output_names_str_[0].c_str());

    rec_input_names_str_.push_back(rec_session_->GetInputNameAllocated(0, allocator).get());
    rec_output_names_str_.push_back(rec_session_->GetOutputNameAllocated(0, allocator).get());
    rec_input_names_.push_back(rec_input_names_str_[0].c_str());
    rec_output_names_.push_back(rec_output_names_str_[0].c_str());

    LoadCharset(models_dir + "/ocr_recognition/dict.txt");
}

void PaddleOcrEngine::LoadCharset(const std::string& path) {
    std::ifstream file(path, std::ios::binary);  // Use binary to avoid newline translation
    if (!file.is_open()) {
        throw std::runtime_error("Could not open charset file: " + path);
    }

    charset_.clear();
    charset_.push_back("");  // CTC blank token

    std::string line;
    while (std::getline(file, line)) {
        // Remove trailing \r or \n (handles Windows and Unix)
        while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
            line.pop_back();
        }
        if (!line.empty()) {
            charset_.push_back(line);
        }
    }

    charset_.push_back(" ");  // space class appended by the PaddleOCR exporter
    std::cout << "Loaded charset with " << charset_.size() << " characters." << std::endl;
}

OcrInput PaddleOcrEngine::PrepareInput(const ChwTensor& tensor) {
    const size_t plane = static_cast<size_t>(tensor.height) * tensor.width;
    if (tensor.channels != 3 || tensor.height <= 0 || tensor.width <= 0 || tensor.data.size() != 3 * plane) {
        throw OcrError("input tensor must be 3xHxW, got " + std::to_string(tensor.channels) + "x" +
                       std::to_string(tensor.height) + "x" + std::to_string(tensor.width));
    }

    return PaddleUtils::RunStage("input preparation", [&tensor]() {
        std::vector<cv::Mat> planes;
        for (int c = 0; c < 3; ++c) {
            planes.emplace_back(tensor.height, tensor.width, CV_32F, const_cast<float*>(tensor.Plane(c)));
        }
        OcrInput input;
        cv::merge(planes, input.image);
        return input;
    });
}

std::vector<WordBox> PaddleOcrEngine::DetectWords(const OcrInput& input) {
    return PaddleUtils::RunStage("word detection", [this, &input]() {
        auto [resized, scale] = PaddleUtils::ResizeKeepRatio(input.image);
        cv::Mat blob = PaddleUtils::NormalizeImageNet(resized);

        std::vector<int64_t> det_input_dims = {1, 3, static_cast<int64_t>(resized.rows), static_cast<int64_t>(resized.cols)};
        Ort::Value input_tensor = Ort::Value::CreateTensor<float>(
            memory_info_, blob.ptr<float>(), blob.total(), det_input_dims.data(), det_input_dims.size()
        );

        auto det_outputs = det_session_->Run(
            Ort::RunOptions{nullptr}, det_input_names_.data(), &input_tensor, 1, det_output_names_.data(), 1
        );

        const float* prob_map = det_outputs[0].GetTensorData<float>();
        return PaddleUtils::PostprocessDetection(prob_map, input.image.size(), resized.size(), scale);
    });
}

std::vector<LineBoxes> PaddleOcrEngine::FindTextLines(const OcrInput& /*input*/, const std::vector<WordBox>& words) {
    return PaddleUtils::RunStage("line grouping", [&words]() {
        return PaddleUtils::GroupTextLines(words);
    });
}

std::string PaddleOcrEngine::RecognizeWord(const cv::Mat& image, const WordBox& box) {
    cv::Mat crop = PaddleUtils::WarpQuad(image, box);
    if (crop.empty()) return "";

    std::string text;
    for (const auto& chunk : PaddleUtils::SplitWideCrop(crop)) {
        cv::Mat rec_blob = PaddleUtils::PreprocessRecognition(chunk);
        if (rec_blob.empty()) continue;

        std::vector<int64_t> rec_input_dims = {1, 3, 48, 320};
        Ort::Value rec_input_tensor = Ort::Value::CreateTensor<float>(
            memory_info_, rec_blob.ptr<float>(), rec_blob.total(), rec_input_dims.data(), rec_input_dims.size()
        );

        auto rec_outputs = rec_session_->Run(
            Ort::RunOptions{nullptr}, rec_input_names_.data(), &rec_input_tensor, 1, rec_output_names_.data(), 1
        );

        const float* preds = rec_outputs[0].GetTensorData<float>();
        auto preds_shape = rec_outputs[0].GetTensorTypeAndShapeInfo().GetShape();
        if (preds_shape.size() != 3) {
            throw OcrError("unexpected recognition output rank " + std::to_string(preds_shape.size()));
        }

        std::string chunk_text = PaddleUtils::DecodeRecognition(preds, preds_shape, charset_);
        if (!chunk_text.empty()) {
            if (!text.empty()) text += " ";
            text += chunk_text;
        }
    }
    return text;
}

std::vector<TextLine> PaddleOcrEngine::RecognizeText(const OcrInput& input, const std::vector<LineBoxes>& lines) {
    return PaddleUtils::RunStage("text recognition", [this, &input, &lines]() {
        std::vector<TextLine> results;
        for (const auto& line : lines) {
            TextLine text_line;
            for (const auto& box : line) {
                for (auto& word : PaddleUtils::SplitWords(RecognizeWord(input.image, box))) {
                    text_line.words.push_back(std::move(word));
                }
            }
            results.push_back(std::move(text_line));
        }
        return results;
    });
}
