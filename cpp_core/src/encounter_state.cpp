#include "encounter_state.hpp"
#include "engine_errors.hpp"
#include <limits>
#include <sstream>

std::string ModeToString(Mode mode) {
    switch (mode) {
        case Mode::Init: return "Init";
        case Mode::Encounter: return "Encounter";
        case Mode::Walk: return "Walk";
        case Mode::Pause: return "Pause";
    }
    return "Init";
}

Mode ModeFromString(const std::string& name) {
    if (name == "Init") return Mode::Init;
    if (name == "Encounter") return Mode::Encounter;
    if (name == "Walk") return Mode::Walk;
    if (name == "Pause") return Mode::Pause;
    throw PersistenceError("unknown mode '" + name + "'");
}

std::string ModeLabel(Mode mode) {
    if (mode == Mode::Init) {
        return "Init, Press S to start.";
    }
    return ModeToString(mode);
}

bool IsSampling(Mode mode) {
    return mode == Mode::Walk || mode == Mode::Encounter;
}

bool EncounterState::operator==(const EncounterState& other) const {
    return encounters == other.encounters &&
           last_encounter == other.last_encounter &&
           mode == other.mode &&
           mon_stats == other.mon_stats;
}

void to_json(nlohmann::json& j, const EncounterState& state) {
    j = nlohmann::json{
        {"encounters", state.encounters},
        {"last_encounter", state.last_encounter},
        {"mode", ModeToString(state.mode)},
        {"mon_stats", state.mon_stats},
    };
}

namespace {
uint32_t CountFromJson(const nlohmann::json& value, const std::string& field) {
    if (!value.is_number_unsigned()) {
        throw PersistenceError("field '" + field + "' must be a non-negative integer");
    }
    const uint64_t count = value.get<uint64_t>();
    if (count > std::numeric_limits<uint32_t>::max()) {
        throw PersistenceError("field '" + field + "' is out of range: " + std::to_string(count));
    }
    return static_cast<uint32_t>(count);
}
}

void from_json(const nlohmann::json& j, EncounterState& state) {
    state.encounters = CountFromJson(j.at("encounters"), "encounters");
    j.at("last_encounter").get_to(state.last_encounter);
    state.mode = ModeFromString(j.at("mode").get<std::string>());
    const nlohmann::json& stats = j.at("mon_stats");
    if (!stats.is_object()) {
        throw PersistenceError("field 'mon_stats' must be an object");
    }
    state.mon_stats.clear();
    for (auto it = stats.begin(); it != stats.end(); ++it) {
        state.mon_stats[it.key()] = CountFromJson(it.value(), "mon_stats." + it.key());
    }
}

std::string FormatStatus(const EncounterState& state) {
    std::ostringstream ss;
    ss << "Mode: " << ModeLabel(state.mode) << " | Encounters: " << state.encounters;
    if (!state.last_encounter.empty()) {
        ss << " | Last:";
        for (const auto& name : state.last_encounter) {
            ss << " " << name;
        }
    }
    return ss.str();
}
