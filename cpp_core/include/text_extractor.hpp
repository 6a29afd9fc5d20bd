#pragma once
#include "ocr_engine.hpp"
#include <vector>

/**
 * @class TextExtractor
 * @brief Reads the text lines of one tensor through an OcrEngine.
 *
 * No caching and no retry: every call runs all stages, and an OcrError from
 * any stage reaches the caller unchanged.
 */
class TextExtractor {
public:
    explicit TextExtractor(OcrEngine& engine);

    std::vector<TextLine> ExtractLines(const ChwTensor& tensor);

private:
    OcrEngine& engine_;
};
