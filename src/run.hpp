#pragma once

#include "config.hpp"
#include "events.hpp"
#include "levelgen.hpp"
#include "seed.hpp"
#include "simulation.hpp"
#include "stats.hpp"

#include <memory>
#include <string>

// Generates floor `floorIndex` of a run and builds its simulation. The floor
// stream is consumed by generation and then by guard initialization, and is
// discarded afterwards. `layout` (optional) receives a copy of the generated
// snapshot for callers that want to inspect it.
std::unique_ptr<Simulation> createFloorSimulation(
    const RunSeed& seed,
    int floorIndex,
    const GameConfig& cfg,
    GenFailure* fail = nullptr,
    GenResult* layout = nullptr);

SimTuning simTuningFor(const GameConfig& cfg);

// A whole heist: consecutive floors of one run seed, with score and
// counters carried between them.
class Run {
public:
    Run(RunSeed seed, GameConfig cfg);

    // (Re)generates the current floor. Counters earned on an unfinished floor
    // are dropped. Refused once the run is over or the floor is cleared;
    // if generation fails no floor is left in play.
    bool startFloor(GenFailure* fail = nullptr);

    // Forwards one action to the current floor. Winning the last floor wins
    // the run; being caught loses it. Rejected when no floor is in play or
    // the run is over.
    StepResult step(const PlayerAction& a);

    // After a won floor: generate the next one.
    bool nextFloor(GenFailure* fail = nullptr);

    void setEventSink(EventSink* sink);

    bool hasFloor() const { return static_cast<bool>(sim_); }
    const Simulation* floor() const { return sim_.get(); }
    const GenResult& layout() const { return layout_; }

    const RunSeed& seed() const { return seed_; }
    const GameConfig& config() const { return cfg_; }
    int floorIndex() const { return floorIndex_; }
    RunOutcome outcome() const { return outcome_; }
    bool awaitingNextFloor() const;

    RunStats stats() const;

private:
    RunSeed seed_;
    GameConfig cfg_;

    int floorIndex_ = 0;
    int floorsCleared_ = 0;
    uint32_t turnsBeforeFloor_ = 0;
    uint32_t score_ = 0;
    RunOutcome outcome_ = RunOutcome::InProgress;

    GenResult layout_;
    std::unique_ptr<Simulation> sim_;
    EventSink* sink_ = nullptr;
};
