#include "encounter_engine.hpp"
#include <algorithm>
#include <iostream>
#include <thread>

EncounterEngine::EncounterEngine(const EngineOptions& options)
    : options_(options),
      store_(options.state_path),
      env_(ORT_LOGGING_LEVEL_WARNING, "encounter-tracker") {
    // OCR is the only heavy stage and runs on one thread at a time,
    // so it may take most of the cores.
    int num_cores = std::thread::hardware_concurrency();
    if (num_cores == 0) num_cores = 4;
    int intra_op_threads = std::max(1, num_cores / 2);

    std::cout << "Threading config: " << num_cores << " cores detected, using "
              << intra_op_threads << " intra-op threads" << std::endl;

    session_options_.SetIntraOpNumThreads(intra_op_threads);
    session_options_.SetInterOpNumThreads(1);

    if (options_.use_cuda) {
        OrtCUDAProviderOptions cuda_options{};
        session_options_.AppendExecutionProvider_CUDA(cuda_options);
    }

    ocr_engine_ = std::make_unique<PaddleOcrEngine>(env_, session_options_, options_.models_dir);

    capture_ = std::make_unique<X11Capture>(options_.display_name);
    normalizer_ = std::make_unique<FrameNormalizer>(*capture_, options_.normalizer);
    extractor_ = std::make_unique<TextExtractor>(*ocr_engine_);
    observer_ = std::make_unique<OcrFrameObserver>(*normalizer_, *extractor_);
    tracker_ = std::make_unique<EncounterTracker>(*observer_, store_, options_.tracker);
}

void EncounterEngine::Run(EncounterState& state, ModeSwitch& mode_switch) {
    std::cout << FormatStatus(state) << std::endl;

    while (!mode_switch.QuitRequested()) {
        bool changed = mode_switch.ApplyPending(state);
        changed = tracker_->RunCycle(state) || changed;

        bool status_requested = mode_switch.TakeStatusRequest();
        if (changed || status_requested) {
            std::cout << FormatStatus(state) << std::endl;
        }

        if (!IsSampling(state.mode)) {
            std::this_thread::sleep_for(options_.tracker.cycle_delay);
        }
    }

    std::cout << "Tracking stopped. State saved to " << store_.Path() << std::endl;
}
