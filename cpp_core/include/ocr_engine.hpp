#pragma once
#include "tensor_adapter.hpp"
#include <string>
#include <vector>
#include <opencv2/core.hpp>

// Quadrilateral around one detected word, in input image coordinates.
using WordBox = std::vector<cv::Point>;
using LineBoxes = std::vector<WordBox>;

struct TextLine {
    std::vector<std::string> words;

    // Words joined by single spaces.
    std::string ToString() const;
};

// Model-ready form of one tensor: HWC, CV_32FC3, values in [0, 1].
struct OcrInput {
    cv::Mat image;
};

/**
 * @class OcrEngine
 * @brief Three-stage text reader. Calls must be made in order:
 *        PrepareInput, DetectWords, FindTextLines, RecognizeText.
 *
 * Every stage throws OcrError on failure.
 */
class OcrEngine {
public:
    virtual ~OcrEngine() = default;

    virtual OcrInput PrepareInput(const ChwTensor& tensor) = 0;
    virtual std::vector<WordBox> DetectWords(const OcrInput& input) = 0;
    virtual std::vector<LineBoxes> FindTextLines(const OcrInput& input, const std::vector<WordBox>& words) = 0;
    virtual std::vector<TextLine> RecognizeText(const OcrInput& input, const std::vector<LineBoxes>& lines) = 0;
};
