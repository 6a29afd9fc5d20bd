#pragma once
#include "encounter_state.hpp"
#include "frame_observer.hpp"
#include "state_store.hpp"
#include <chrono>
#include <vector>

struct TrackerOptions {
    // Each cycle samples detect_frames - 1 frames.
    int detect_frames = 4;
    std::chrono::milliseconds cycle_delay{400};
};

/**
 * Applies one cycle's observations to the state.
 *
 * Encounter -> Walk when every observation is empty. Walk -> Encounter when
 * any is non-empty; the longest one (the later on ties) is recorded, and each
 * name in it is counted, duplicates included. An empty `observations` list
 * changes nothing. Returns true when the mode changed.
 */
bool FoldObservations(EncounterState& state, const std::vector<FrameObservation>& observations);

/**
 * @class EncounterTracker
 * @brief Debounced Walk/Encounter state machine driven by a FrameObserver.
 */
class EncounterTracker {
public:
    EncounterTracker(FrameObserver& observer, const StateStore& store, TrackerOptions options = TrackerOptions());

    // One polling cycle. Init and Pause sample nothing. The state is saved
    // at the end of every cycle. Returns true when the mode changed.
    bool RunCycle(EncounterState& state);

private:
    std::vector<FrameObservation> SampleFrames();

    FrameObserver& observer_;
    const StateStore& store_;
    TrackerOptions options_;
};
