#include "run.hpp"

#include <utility>

SimTuning simTuningFor(const GameConfig& cfg) {
    SimTuning t;
    t.guards = guardTuningFor(cfg);
    t.hazardAlertRadius = cfg.hazardAlertRadius;
    return t;
}

std::unique_ptr<Simulation> createFloorSimulation(
    const RunSeed& seed,
    int floorIndex,
    const GameConfig& cfg,
    GenFailure* fail,
    GenResult* layout)
{
    RNG rng = floorRng(seed, floorIndex);

    GenResult floor;
    if (!generateFloor(paramsForFloor(cfg, floorIndex), rng, floor, fail)) return nullptr;

    if (layout) *layout = floor;
    return std::make_unique<Simulation>(Simulation::fromGenerated(std::move(floor), rng, simTuningFor(cfg)));
}

Run::Run(RunSeed seed, GameConfig cfg) : seed_(std::move(seed)), cfg_(std::move(cfg)) {}

bool Run::startFloor(GenFailure* fail) {
    if (outcome_ != RunOutcome::InProgress || awaitingNextFloor()) {
        if (fail) {
            fail->kind = GenFailureKind::None;
            fail->reason = (outcome_ != RunOutcome::InProgress) ? "run is over" : "floor already cleared";
            fail->attempts = 0;
        }
        return false;
    }

    sim_.reset();
    sim_ = createFloorSimulation(seed_, floorIndex_, cfg_, fail, &layout_);
    if (!sim_) return false;
    sim_->setEventSink(sink_);
    return true;
}

StepResult Run::step(const PlayerAction& a) {
    if (!sim_ || outcome_ != RunOutcome::InProgress || sim_->isFinished()) {
        StepResult r;
        r.ok = false;
        r.reason = sim_ ? "THE FLOOR IS OVER." : "NO FLOOR IN PLAY.";
        if (sim_) {
            r.status = sim_->status();
            r.turn = sim_->turns();
        }
        return r;
    }

    StepResult r = sim_->step(a);
    if (!r.ok) return r;

    if (r.status == FloorStatus::Lost) {
        outcome_ = RunOutcome::Lost;
    } else if (r.status == FloorStatus::Won) {
        ++floorsCleared_;
        score_ += floorScore(floorIndex_, sim_->turns());
        if (floorIndex_ + 1 >= cfg_.floorsPerRun) outcome_ = RunOutcome::Won;
    }
    return r;
}

bool Run::awaitingNextFloor() const {
    return sim_ && sim_->status() == FloorStatus::Won && outcome_ == RunOutcome::InProgress;
}

bool Run::nextFloor(GenFailure* fail) {
    if (!awaitingNextFloor()) {
        if (fail) {
            fail->kind = GenFailureKind::None;
            fail->reason = "current floor is not cleared";
            fail->attempts = 0;
        }
        return false;
    }

    turnsBeforeFloor_ += sim_->turns();
    ++floorIndex_;
    return startFloor(fail);
}

void Run::setEventSink(EventSink* sink) {
    sink_ = sink;
    if (sim_) sim_->setEventSink(sink_);
}

RunStats Run::stats() const {
    RunStats s;
    s.runSeed = seed_.text;
    s.floorIndex = floorIndex_;
    s.floorsCleared = floorsCleared_;
    s.floorTurns = sim_ ? sim_->turns() : 0;
    s.turnCount = turnsBeforeFloor_ + s.floorTurns;
    if (sim_) {
        s.keycards = sim_->player().count(PickupKind::Keycard);
        s.objectiveCollected = sim_->hasObjective();
    }
    s.score = score_;
    s.outcome = outcome_;
    return s;
}
