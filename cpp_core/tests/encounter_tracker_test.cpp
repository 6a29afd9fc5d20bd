#include "encounter_tracker.hpp"
#include "engine_errors.hpp"
#include <gtest/gtest.h>
#include <deque>
#include <filesystem>

namespace {

// Replays observations in order. An observation equal to {"<ocr-error>"}
// throws OcrError, {"<capture-error>"} throws CaptureError.
class ScriptedObserver : public FrameObserver {
public:
    explicit ScriptedObserver(std::deque<FrameObservation> script = {}) : script_(std::move(script)) {}

    void Push(const std::vector<FrameObservation>& frames) {
        script_.insert(script_.end(), frames.begin(), frames.end());
    }

    FrameObservation Observe() override {
        ++calls;
        if (script_.empty()) return {};
        FrameObservation next = script_.front();
        script_.pop_front();
        if (next == FrameObservation{"<ocr-error>"}) throw OcrError("recognition failed");
        if (next == FrameObservation{"<capture-error>"}) throw CaptureError("display lost");
        return next;
    }

    int calls = 0;

private:
    std::deque<FrameObservation> script_;
};

class EncounterTrackerTest : public ::testing::Test {
protected:
    EncounterTrackerTest()
        : path_(std::filesystem::temp_directory_path() /
                (std::string("encounter_tracker_") +
                 ::testing::UnitTest::GetInstance()->current_test_info()->name() + ".json")),
          store_(path_.string()) {
        options_.detect_frames = 4;
        options_.cycle_delay = std::chrono::milliseconds(0);
    }

    void SetUp() override { std::filesystem::remove(path_); }
    void TearDown() override { std::filesystem::remove(path_); }

    EncounterState StateIn(Mode mode) {
        EncounterState state;
        state.mode = mode;
        return state;
    }

    std::filesystem::path path_;
    StateStore store_;
    TrackerOptions options_;
};

}

TEST_F(EncounterTrackerTest, EncounterEndsOnlyWhenEveryFrameIsEmpty) {
    ScriptedObserver observer({{}, {}, {}});
    EncounterTracker tracker(observer, store_, options_);
    EncounterState state = StateIn(Mode::Encounter);

    EXPECT_TRUE(tracker.RunCycle(state));
    EXPECT_EQ(state.mode, Mode::Walk);
    EXPECT_EQ(observer.calls, 3);
}

TEST_F(EncounterTrackerTest, OneNonEmptyFrameKeepsEncounter) {
    ScriptedObserver observer({{}, {"eevee"}, {}});
    EncounterTracker tracker(observer, store_, options_);
    EncounterState state = StateIn(Mode::Encounter);
    state.encounters = 1;
    state.last_encounter = {"eevee"};

    EXPECT_FALSE(tracker.RunCycle(state));
    EXPECT_EQ(state.mode, Mode::Encounter);
    EXPECT_EQ(state.encounters, 1u);
}

TEST_F(EncounterTrackerTest, WalkPicksLongestObservation) {
    ScriptedObserver observer({{}, {"eevee"}, {"eevee", "eevee"}});
    EncounterTracker tracker(observer, store_, options_);
    EncounterState state = StateIn(Mode::Walk);
    state.encounters = 3;
    state.mon_stats["eevee"] = 1;

    EXPECT_TRUE(tracker.RunCycle(state));
    EXPECT_EQ(state.mode, Mode::Encounter);
    EXPECT_EQ(state.encounters, 5u);
    EXPECT_EQ(state.mon_stats["eevee"], 3u);
    EXPECT_EQ(state.last_encounter, (std::vector<std::string>{"eevee", "eevee"}));
}

TEST_F(EncounterTrackerTest, LaterObservationWinsTies) {
    ScriptedObserver observer({{"pidgey"}, {}, {"rattata"}});
    EncounterTracker tracker(observer, store_, options_);
    EncounterState state = StateIn(Mode::Walk);

    tracker.RunCycle(state);
    EXPECT_EQ(state.last_encounter, (std::vector<std::string>{"rattata"}));
    EXPECT_EQ(state.mon_stats.count("pidgey"), 0u);
    EXPECT_EQ(state.mon_stats["rattata"], 1u);
}

TEST_F(EncounterTrackerTest, WalkStaysWalkOnEmptyFrames) {
    ScriptedObserver observer({{}, {}, {}});
    EncounterTracker tracker(observer, store_, options_);
    EncounterState state = StateIn(Mode::Walk);

    EXPECT_FALSE(tracker.RunCycle(state));
    EXPECT_EQ(state, StateIn(Mode::Walk));
}

TEST_F(EncounterTrackerTest, PauseSamplesNothingButStillSaves) {
    ScriptedObserver observer({{"eevee"}, {"eevee"}, {"eevee"}});
    EncounterTracker tracker(observer, store_, options_);
    EncounterState state = StateIn(Mode::Pause);
    state.encounters = 9;
    state.mon_stats["abra"] = 9;
    const EncounterState before = state;

    EXPECT_FALSE(tracker.RunCycle(state));
    EXPECT_EQ(observer.calls, 0);
    EXPECT_EQ(state, before);
    EXPECT_EQ(store_.Load(), before);
}

TEST_F(EncounterTrackerTest, InitSamplesNothing) {
    ScriptedObserver observer({{"eevee"}});
    EncounterTracker tracker(observer, store_, options_);
    EncounterState state;

    EXPECT_FALSE(tracker.RunCycle(state));
    EXPECT_EQ(observer.calls, 0);
    EXPECT_EQ(state.mode, Mode::Init);
    EXPECT_EQ(store_.Load(), state);
}

TEST_F(EncounterTrackerTest, SamplesOneFewerFramesThanWindow) {
    options_.detect_frames = 6;
    ScriptedObserver observer;
    EncounterTracker tracker(observer, store_, options_);
    EncounterState state = StateIn(Mode::Walk);

    tracker.RunCycle(state);
    EXPECT_EQ(observer.calls, 5);
}

TEST_F(EncounterTrackerTest, TransitionIsPersisted) {
    ScriptedObserver observer({{"zubat", "abra"}, {}, {}});
    EncounterTracker tracker(observer, store_, options_);
    EncounterState state = StateIn(Mode::Walk);

    tracker.RunCycle(state);
    EncounterState saved = store_.Load();
    EXPECT_EQ(saved, state);
    EXPECT_EQ(saved.mode, Mode::Encounter);
    EXPECT_EQ(saved.encounters, 2u);
}

TEST_F(EncounterTrackerTest, OcrFailureSkipsOnlyThatFrame) {
    ScriptedObserver observer({{"<ocr-error>"}, {"abra"}, {}});
    EncounterTracker tracker(observer, store_, options_);
    EncounterState state = StateIn(Mode::Walk);

    EXPECT_TRUE(tracker.RunCycle(state));
    EXPECT_EQ(observer.calls, 3);
    EXPECT_EQ(state.last_encounter, (std::vector<std::string>{"abra"}));
}

TEST_F(EncounterTrackerTest, CycleWithoutReadableFrameKeepsMode) {
    ScriptedObserver observer({{"<ocr-error>"}, {"<ocr-error>"}, {"<ocr-error>"}});
    EncounterTracker tracker(observer, store_, options_);
    EncounterState state = StateIn(Mode::Encounter);

    EXPECT_FALSE(tracker.RunCycle(state));
    EXPECT_EQ(state.mode, Mode::Encounter);
    EXPECT_EQ(store_.Load(), state);
}

TEST_F(EncounterTrackerTest, CaptureFailurePropagates) {
    ScriptedObserver observer({{}, {"<capture-error>"}, {}});
    EncounterTracker tracker(observer, store_, options_);
    EncounterState state = StateIn(Mode::Walk);

    EXPECT_THROW(tracker.RunCycle(state), CaptureError);
}

TEST_F(EncounterTrackerTest, EncounterCountNeverDecreases) {
    ScriptedObserver observer;
    observer.Push({{"abra"}, {}, {}});
    observer.Push({{}, {}, {}});
    observer.Push({{}, {"zubat", "zubat"}, {"zubat"}});
    observer.Push({{"zubat"}, {}, {}});
    observer.Push({{}, {}, {}});
    EncounterTracker tracker(observer, store_, options_);
    EncounterState state = StateIn(Mode::Walk);

    std::vector<Mode> modes;
    uint32_t previous = 0;
    for (int cycle = 0; cycle < 5; ++cycle) {
        tracker.RunCycle(state);
        EXPECT_GE(state.encounters, previous);
        previous = state.encounters;
        modes.push_back(state.mode);
    }

    EXPECT_EQ(modes, (std::vector<Mode>{Mode::Encounter, Mode::Walk, Mode::Encounter, Mode::Encounter, Mode::Walk}));
    EXPECT_EQ(state.encounters, 3u);
    EXPECT_EQ(state.mon_stats["abra"], 1u);
    EXPECT_EQ(state.mon_stats["zubat"], 2u);

    uint32_t total = 0;
    for (const auto& [name, count] : state.mon_stats) total += count;
    EXPECT_EQ(total, state.encounters);
}

TEST(FoldObservationsTest, NoObservationsChangesNothing) {
    EncounterState state;
    state.mode = Mode::Encounter;
    EXPECT_FALSE(FoldObservations(state, {}));
    EXPECT_EQ(state.mode, Mode::Encounter);
}

TEST(FoldObservationsTest, IgnoresIdleModes) {
    for (Mode mode : {Mode::Init, Mode::Pause}) {
        EncounterState state;
        state.mode = mode;
        EXPECT_FALSE(FoldObservations(state, {{"eevee"}}));
        EXPECT_EQ(state.encounters, 0u);
        EXPECT_EQ(state.mode, mode);
    }
}
