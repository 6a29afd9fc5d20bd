#pragma once
#include "encounter_state.hpp"
#include <string>

/**
 * @class StateStore
 * @brief Reads and writes the session state file.
 *
 * Save() overwrites the whole file in place. There is no locking and no
 * write-then-rename, so a crash while saving can leave a truncated file.
 */
class StateStore {
public:
    explicit StateStore(std::string path);

    EncounterState Load() const;
    void Save(const EncounterState& state) const;

    const std::string& Path() const { return path_; }

private:
    std::string path_;
};
