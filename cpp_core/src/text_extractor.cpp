#include "text_extractor.hpp"

std::string TextLine::ToString() const {
    std::string text;
    for (const auto& word : words) {
        if (!text.empty()) text += " ";
        text += word;
    }
    return text;
}

TextExtractor::TextExtractor(OcrEngine& engine) : engine_(engine) {}

std::vector<TextLine> TextExtractor::ExtractLines(const ChwTensor& tensor) {
    OcrInput input = engine_.PrepareInput(tensor);
    std::vector<WordBox> words = engine_.DetectWords(input);
    std::vector<LineBoxes> lines = engine_.FindTextLines(input, words);
    return engine_.RecognizeText(input, lines);
}
