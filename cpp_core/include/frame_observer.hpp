#pragma once
#include "frame_normalizer.hpp"
#include "text_extractor.hpp"
#include <string>
#include <vector>

// Candidate names read from a single frame.
using FrameObservation = std::vector<std::string>;

/**
 * @class FrameObserver
 * @brief Produces one observation per call from a fresh frame.
 */
class FrameObserver {
public:
    virtual ~FrameObserver() = default;
    virtual FrameObservation Observe() = 0;
};

/**
 * @class OcrFrameObserver
 * @brief capture -> normalize -> tensor -> OCR lines -> candidate filter.
 */
class OcrFrameObserver : public FrameObserver {
public:
    OcrFrameObserver(FrameNormalizer& normalizer, TextExtractor& extractor);

    FrameObservation Observe() override;

private:
    FrameNormalizer& normalizer_;
    TextExtractor& extractor_;
};
