#pragma once

#include "common.hpp"
#include "grid.hpp"
#include "rng.hpp"

#include <cstdint>

enum class GuardState : uint8_t {
    Patrol = 0,
    // Investigating a noise (hazard) without having seen the player.
    Alert,
    Chase,
};

inline const char* guardStateName(GuardState s) {
    switch (s) {
        case GuardState::Patrol: return "PATROL";
        case GuardState::Alert:  return "ALERT";
        case GuardState::Chase:  return "CHASE";
    }
    return "PATROL";
}

struct GuardTuning {
    // Max Manhattan distance at which a guard notices the player along a
    // clear row/column. 0 = unlimited.
    int visionRange = 8;

    // Turns a guard keeps pursuing the last known position after losing sight.
    int chaseTurns = 6;

    // Turns a guard spends walking toward a noise before giving up.
    int alertTurns = 4;

    // Pursuit paths weigh slow terrain by its cost instead of counting steps.
    bool weightedPursuit = false;
};

struct Guard {
    int id = 0;
    Vec2i pos{0, 0};
    Vec2i facing{1, 0};
    GuardState state = GuardState::Patrol;

    // Chase/alert countdown. Refreshed to the maximum on every turn the
    // player is in sight.
    int turnsRemaining = 0;

    // Activations to skip before moving again (slow terrain).
    int cooldown = 0;

    Vec2i lastKnownTarget{-1, -1};

    // Patrol choices draw from this stream. It is seeded from the floor stream
    // when the roster is built, so guards never consume floor draws mid-game.
    RNG rng;
};

struct GuardStepOutcome {
    GuardState before = GuardState::Patrol;
    GuardState after = GuardState::Patrol;
    Vec2i from{0, 0};
    Vec2i to{0, 0};
    bool moved = false;
    bool onCooldown = false;
    bool sawPlayer = false;
};

// Builds a guard at `pos`. Draws its facing and its private stream seed from
// `floorRng` (two draws, in that order).
Guard makeGuard(int id, Vec2i pos, RNG& floorRng);

bool guardCanSee(const Guard& g, const Grid& grid, Vec2i target, const GuardTuning& tuning);

// One activation of the state machine: perception, then movement.
GuardStepOutcome stepGuard(Guard& g, const Grid& grid, Vec2i playerPos, const GuardTuning& tuning);

// Noise heard at `noisePos`. Patrolling/alerted guards start (or restart) an
// investigation; chasing guards are unaffected. Returns true if the guard
// changed state.
bool alertGuard(Guard& g, Vec2i noisePos, const GuardTuning& tuning);
