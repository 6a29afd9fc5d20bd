#pragma once
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>

enum class Mode {
    Init,
    Encounter,
    Walk,
    Pause,
};

// Wire name stored in the state file ("Init", "Encounter", ...).
std::string ModeToString(Mode mode);
// Throws PersistenceError for unknown names.
Mode ModeFromString(const std::string& name);
// Human-readable label for the console.
std::string ModeLabel(Mode mode);

// True for the modes in which a cycle samples the screen.
bool IsSampling(Mode mode);

/**
 * @struct EncounterState
 * @brief Durable session state, mutated only by the engine thread.
 */
struct EncounterState {
    uint32_t encounters = 0;
    std::vector<std::string> last_encounter;
    Mode mode = Mode::Init;
    std::unordered_map<std::string, uint32_t> mon_stats;

    bool operator==(const EncounterState& other) const;
    bool operator!=(const EncounterState& other) const { return !(*this == other); }
};

void to_json(nlohmann::json& j, const EncounterState& state);
void from_json(const nlohmann::json& j, EncounterState& state);

std::string FormatStatus(const EncounterState& state);
