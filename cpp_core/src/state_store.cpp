#include "state_store.hpp"
#include "engine_errors.hpp"
#include <fstream>
#include <utility>

StateStore::StateStore(std::string path) : path_(std::move(path)) {}

EncounterState StateStore::Load() const {
    std::ifstream file(path_);
    if (!file.is_open()) {
        throw PersistenceError("could not open state file: " + path_);
    }

    try {
        nlohmann::json j = nlohmann::json::parse(file);
        return j.get<EncounterState>();
    } catch (const nlohmann::json::exception& e) {
        throw PersistenceError("malformed state file " + path_ + ": " + e.what());
    }
}

void StateStore::Save(const EncounterState& state) const {
    std::ofstream file(path_, std::ios::trunc);
    if (!file.is_open()) {
        throw PersistenceError("could not write state file: " + path_);
    }

    file << nlohmann::json(state).dump();
    file.flush();
    if (!file) {
        throw PersistenceError("write failed for state file: " + path_);
    }
}
