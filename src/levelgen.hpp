#pragma once

#include "common.hpp"
#include "grid.hpp"
#include "rng.hpp"

#include <cstdint>
#include <string>
#include <vector>

// Floor generation.
//
// One call carves a grid, picks start/objective/exit, validates reachability,
// places doors, guards, keycards, hazards and slow terrain, then runs the
// placement validator. Any failed check throws the whole attempt away and
// starts over from a blank grid with the next draws of the same stream.

constexpr int GEN_MIN_WIDTH = 5;
constexpr int GEN_MIN_HEIGHT = 5;

struct GenParams {
    int width = 24;
    int height = 14;

    // Chance for each interior cell to start as wall.
    float wallDensity = 0.18f;

    int guardCount = 2;

    // Always place a keycard (one is placed regardless when doors exist).
    bool placeKey = false;

    // Chance for each chokepoint to get a closed door, up to maxDoors.
    float doorChance = 0.0f;
    int maxDoors = 3;

    float slowTerrainChance = 0.0f;
    int slowTerrainCost = 2;

    int hazardCount = 0;

    // Manhattan spacing rules.
    int guardMinDistance = 4;
    int keyMinDistance = 3;

    int maxAttempts = 200;
};

// Immutable once produced; the caller builds live agents from the spawns.
struct GenResult {
    Grid grid;
    Vec2i start{-1, -1};
    Vec2i objective{-1, -1};
    Vec2i exit{-1, -1};
    std::vector<Vec2i> guardSpawns;
    std::vector<Vec2i> keySpawns;
    std::vector<Vec2i> hazards;
    int attempts = 0;
};

enum class GenFailureKind : uint8_t {
    None = 0,
    InvalidConfig,
    Exhausted,
};

inline const char* genFailureKindName(GenFailureKind k) {
    switch (k) {
        case GenFailureKind::None:          return "None";
        case GenFailureKind::InvalidConfig: return "InvalidConfig";
        case GenFailureKind::Exhausted:     return "Exhausted";
    }
    return "None";
}

struct GenFailure {
    GenFailureKind kind = GenFailureKind::None;
    std::string reason;
    int attempts = 0;
};

// Rejects degenerate parameters up front (no attempt is made).
bool validateGenParams(const GenParams& p, std::string* reason = nullptr);

// Reachability + no-softlock checks on a finished layout:
//  - start -> objective and objective -> exit (walls block, doors do not)
//  - if any door exists, some keycard exists and one is reachable from
//    start without crossing a door.
bool validateFloorLayout(const GenResult& r, std::string* reason = nullptr);

bool generateFloor(const GenParams& p, RNG& rng, GenResult& out, GenFailure* fail = nullptr);
