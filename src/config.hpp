#pragma once

#include <string>
#include <utility>
#include <vector>

#include "guard_ai.hpp"
#include "levelgen.hpp"

// Difficulty / tuning file (INI-ish: key = value).
//
// Every knob has a default; a missing file means "all defaults". The core
// never keeps a config of its own: callers pass a GameConfig by value and the
// per-floor parameters are derived from it with paramsForFloor().
struct GameConfig {
    // Floor layout
    int gridWidth = 24;
    int gridHeight = 14;
    float wallDensity = 0.18f;
    int maxAttempts = 200;

    // Run structure
    int floorsPerRun = 3;

    // Guards: base + perFloor * floorIndex, capped.
    int guardsBase = 2;
    int guardsPerFloor = 1;
    int guardsMax = 6;
    int guardMinDistance = 4;

    // Doors: chance per chokepoint ramps with floor index.
    float doorChanceBase = 0.0f;
    float doorChancePerFloor = 0.35f;
    int maxDoors = 3;
    bool keyOnEveryFloor = true;
    int keyMinDistance = 3;

    // Slow terrain appears from this floor index onward.
    int slowTerrainFromFloor = 1;
    float slowTerrainChance = 0.06f;
    int slowTerrainCost = 2;

    // Hazards: base + perFloor * floorIndex.
    int hazardsBase = 0;
    int hazardsPerFloor = 1;
    int hazardAlertRadius = 6;

    // Guard tuning
    int visionRange = 8;
    int chaseTurns = 6;
    int alertTurns = 4;
    bool weightedPursuit = false;
};

// Applies one key = value pair. Unknown keys and unparsable values leave the
// config untouched and return false with a note in `warn`. Out-of-range
// values are clamped.
bool applyConfigKey(GameConfig& cfg, const std::string& key, const std::string& value, std::string* warn = nullptr);

using ConfigPairs = std::vector<std::pair<std::string, std::string>>;

// Loads a config file. If the file is missing, defaults are used. Problems
// with individual lines are appended to `warnings` (one per line). Accepted
// pairs are appended to `applied` in file order (replays record them).
GameConfig loadConfig(const std::string& path, std::string* warnings = nullptr, ConfigPairs* applied = nullptr);

// Writes a commented default config file. Returns true on success.
bool writeDefaultConfig(const std::string& path);

// Deterministic difficulty ramp for one floor.
GenParams paramsForFloor(const GameConfig& cfg, int floorIndex);

GuardTuning guardTuningFor(const GameConfig& cfg);
