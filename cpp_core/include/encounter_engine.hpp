#pragma once
#include <chrono>
#include <string>
#include <memory>
#include <onnxruntime_cxx_api.h>
#include "x11_capture.hpp"
#include "paddle_ocr_engine.hpp"
#include "frame_normalizer.hpp"
#include "text_extractor.hpp"
#include "frame_observer.hpp"
#include "encounter_tracker.hpp"
#include "mode_switch.hpp"
#include "state_store.hpp"

struct EngineOptions {
    std::string models_dir = "../../models";
    std::string state_path = "state.json";
    std::string display_name;
    bool fresh_state = false;
    bool use_cuda = false;
    NormalizerOptions normalizer;
    TrackerOptions tracker;
};

/**
 * @class EncounterEngine
 * @brief Owns the capture handle, the OCR models and the detection pipeline.
 */
class EncounterEngine {
public:
    explicit EncounterEngine(const EngineOptions& options);

    // Loops until a quit is requested. Any capture, layout or persistence
    // error ends the loop by propagating.
    void Run(EncounterState& state, ModeSwitch& mode_switch);

    const StateStore& Store() const { return store_; }

private:
    EngineOptions options_;
    StateStore store_;

    Ort::Env env_;
    Ort::SessionOptions session_options_;
    std::unique_ptr<PaddleOcrEngine> ocr_engine_;

    std::unique_ptr<X11Capture> capture_;
    std::unique_ptr<FrameNormalizer> normalizer_;
    std::unique_ptr<TextExtractor> extractor_;
    std::unique_ptr<OcrFrameObserver> observer_;
    std::unique_ptr<EncounterTracker> tracker_;
};
