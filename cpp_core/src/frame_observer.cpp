#include "frame_observer.hpp"
#include "candidate_filter.hpp"
#include "tensor_adapter.hpp"

OcrFrameObserver::OcrFrameObserver(FrameNormalizer& normalizer, TextExtractor& extractor)
    : normalizer_(normalizer), extractor_(extractor) {}

FrameObservation OcrFrameObserver::Observe() {
    cv::Mat image = normalizer_.Capture();
    ChwTensor tensor = ToTensor(image);
    return FilterCandidates(extractor_.ExtractLines(tensor));
}
