#pragma once

#include <cstdint>
#include <map>
#include <string>

// Run-level counters handed to the save/load collaborator.
// Only aggregate numbers live here; floors are always regenerated from the
// seed, never stored.

enum class RunOutcome : uint8_t {
    InProgress = 0,
    Won,
    Lost,
};

const char* runOutcomeId(RunOutcome o);
bool parseRunOutcome(const std::string& raw, RunOutcome& out);

struct RunStats {
    std::string runSeed;
    int floorIndex = 0;
    int floorsCleared = 0;

    // All accepted turns this run, and those spent on the current floor.
    uint32_t turnCount = 0;
    uint32_t floorTurns = 0;

    int keycards = 0;
    bool objectiveCollected = false;

    uint32_t score = 0;
    RunOutcome outcome = RunOutcome::InProgress;
};

using KeyValues = std::map<std::string, std::string>;

// Points for clearing floor `floorIndex` in `floorTurns` turns.
uint32_t floorScore(int floorIndex, uint32_t floorTurns);

KeyValues statsToKeyValues(const RunStats& s);

// Missing keys keep their defaults; malformed values fail the whole load.
bool statsFromKeyValues(const KeyValues& kv, RunStats& out, std::string* err = nullptr);

// "key = value" lines, sorted by key.
std::string formatKeyValues(const KeyValues& kv);

// Inverse of formatKeyValues. Blank lines and #/; comments are skipped.
bool parseKeyValues(const std::string& text, KeyValues& out, std::string* err = nullptr);
