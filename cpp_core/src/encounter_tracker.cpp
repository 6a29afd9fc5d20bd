#include "encounter_tracker.hpp"
#include "engine_errors.hpp"
#include <algorithm>
#include <iostream>
#include <thread>

bool FoldObservations(EncounterState& state, const std::vector<FrameObservation>& observations) {
    if (observations.empty()) return false;

    auto is_empty = [](const FrameObservation& o) { return o.empty(); };

    if (state.mode == Mode::Encounter) {
        if (std::all_of(observations.begin(), observations.end(), is_empty)) {
            state.mode = Mode::Walk;
            return true;
        }
        return false;
    }

    if (state.mode == Mode::Walk) {
        if (std::all_of(observations.begin(), observations.end(), is_empty)) return false;

        const FrameObservation* chosen = nullptr;
        for (const auto& o : observations) {
            if (!o.empty() && (chosen == nullptr || o.size() >= chosen->size())) {
                chosen = &o;
            }
        }

        state.encounters += static_cast<uint32_t>(chosen->size());
        state.last_encounter = *chosen;
        state.mode = Mode::Encounter;
        for (const auto& name : *chosen) {
            ++state.mon_stats[name];
        }
        return true;
    }

    return false;
}

EncounterTracker::EncounterTracker(FrameObserver& observer, const StateStore& store, TrackerOptions options)
    : observer_(observer), store_(store), options_(options) {}

std::vector<FrameObservation> EncounterTracker::SampleFrames() {
    std::vector<FrameObservation> observations;
    for (int i = 1; i < options_.detect_frames; ++i) {
        try {
            observations.push_back(observer_.Observe());
        } catch (const OcrError& e) {
            // The frame casts no vote; the rest of the cycle still counts.
            std::cerr << "[Tracker] Frame " << i << " skipped: " << e.what() << std::endl;
        }
    }
    return observations;
}

bool EncounterTracker::RunCycle(EncounterState& state) {
    bool changed = false;
    if (IsSampling(state.mode)) {
        std::vector<FrameObservation> observations = SampleFrames();
        std::this_thread::sleep_for(options_.cycle_delay);

        if (observations.empty()) {
            std::cerr << "[Tracker] No readable frame this cycle, keeping " << ModeToString(state.mode) << std::endl;
        }

        const Mode before = state.mode;
        changed = FoldObservations(state, observations);
        if (changed && before == Mode::Walk) {
            std::cout << "[Tracker] Encounter:";
            for (const auto& name : state.last_encounter) std::cout << " " << name;
            std::cout << " (total " << state.encounters << ")" << std::endl;
        }
    }

    store_.Save(state);
    return changed;
}
