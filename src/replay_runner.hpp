#pragma once

#include "config.hpp"
#include "replay.hpp"
#include "simulation.hpp"

#include <cstdint>
#include <memory>
#include <string>

// Headless replay runner: regenerates the recorded floor, feeds it the
// recorded actions and (optionally) validates the state-hash checkpoints.
//
// Used by the headless tool and the regression tests to diagnose desyncs.

struct ReplayRunOptions {
    // If true and the replay contains StateHash events, validate them.
    bool verifyHashes = true;

    // Safety limit on dispatched actions (0 = unlimited).
    uint32_t maxActions = 0;
};

// Categorized failure for tooling/CI purposes. New categories are appended.
enum class ReplayFailureKind : uint8_t {
    None = 0,
    BadConfig,
    GenerationFailed,
    HashMismatch,
    SafetyLimit,
};

inline const char* replayFailureKindName(ReplayFailureKind k) {
    switch (k) {
        case ReplayFailureKind::None:             return "None";
        case ReplayFailureKind::BadConfig:        return "BadConfig";
        case ReplayFailureKind::GenerationFailed: return "GenerationFailed";
        case ReplayFailureKind::HashMismatch:     return "HashMismatch";
        case ReplayFailureKind::SafetyLimit:      return "SafetyLimit";
    }
    return "None";
}

struct ReplayRunStats {
    uint32_t actionsDispatched = 0;
    uint32_t actionsRejected = 0;
    uint32_t checkpointsVerified = 0;
    uint32_t turns = 0;
    FloorStatus finalStatus = FloorStatus::Playing;
    uint64_t finalHash = 0;

    ReplayFailureKind failure = ReplayFailureKind::None;

    // HashMismatch details.
    //  - failedTurn: the simulation turn when the verifier noticed the problem.
    //  - failedCheckpointTurn: the checkpoint turn that was expected (may be
    //    < failedTurn when a checkpoint was skipped over).
    uint32_t failedTurn = 0;
    uint32_t failedCheckpointTurn = 0;
    uint64_t expectedHash = 0;
    uint64_t gotHash = 0;
};

// Builds the config a replay was recorded with: defaults plus the @config
// overrides in file order. Unknown keys or bad values fail the replay.
bool replayConfig(const ReplayFile& replay, GameConfig& out, std::string* err = nullptr);

// Plays a replay from scratch. Returns true when every action was dispatched
// and every checkpoint matched. `outSim` (optional) receives the final floor.
bool runReplayHeadless(const ReplayFile& replay,
                       const ReplayRunOptions& opt = {},
                       ReplayRunStats* outStats = nullptr,
                       std::string* err = nullptr,
                       std::unique_ptr<Simulation>* outSim = nullptr);
