#include "replay_runner.hpp"

#include "run.hpp"
#include "seed.hpp"

#include <algorithm>
#include <sstream>
#include <vector>

namespace {

struct TurnHashCheckpoint {
    uint32_t turn = 0;
    uint64_t hash = 0;
};

struct TurnHashVerifyCtx {
    const std::vector<TurnHashCheckpoint>* expected = nullptr;
    size_t idx = 0;
    uint32_t verified = 0;
    bool failed = false;
    uint32_t failedTurn = 0;
    uint32_t expectedTurn = 0;
    uint64_t expectedHash = 0;
    uint64_t gotHash = 0;
};

void verifyTurnHash(TurnHashVerifyCtx& ctx, uint32_t turn, uint64_t hash) {
    if (ctx.failed || !ctx.expected) return;
    if (ctx.idx < ctx.expected->size() && (*ctx.expected)[ctx.idx].turn < turn) {
        // Skipped over an expected checkpoint.
        ctx.failed = true;
        ctx.failedTurn = turn;
        ctx.expectedTurn = (*ctx.expected)[ctx.idx].turn;
        ctx.expectedHash = (*ctx.expected)[ctx.idx].hash;
        ctx.gotHash = hash;
        return;
    }
    // Several checkpoints may name the same turn; each is checked against it.
    while (ctx.idx < ctx.expected->size() && (*ctx.expected)[ctx.idx].turn == turn) {
        const uint64_t exp = (*ctx.expected)[ctx.idx].hash;
        ctx.idx++;
        if (exp != hash) {
            ctx.failed = true;
            ctx.failedTurn = turn;
            ctx.expectedTurn = turn;
            ctx.expectedHash = exp;
            ctx.gotHash = hash;
            return;
        }
        ctx.verified++;
    }
}

std::string formatHashMismatch(const TurnHashVerifyCtx& ctx) {
    std::ostringstream ss;
    if (ctx.expectedTurn != ctx.failedTurn) {
        ss << "REPLAY DESYNC: missed checkpoint turn " << ctx.expectedTurn
           << " while at turn " << ctx.failedTurn
           << " (expected 0x" << std::hex << ctx.expectedHash
           << ", got 0x" << std::hex << ctx.gotHash << ")";
    } else {
        ss << "REPLAY DESYNC at turn " << ctx.failedTurn
           << " (expected 0x" << std::hex << ctx.expectedHash
           << ", got 0x" << std::hex << ctx.gotHash << ")";
    }
    return ss.str();
}

void fillMismatch(const TurnHashVerifyCtx& ctx, ReplayRunStats& st) {
    st.failure = ReplayFailureKind::HashMismatch;
    st.failedTurn = ctx.failedTurn;
    st.failedCheckpointTurn = ctx.expectedTurn;
    st.expectedHash = ctx.expectedHash;
    st.gotHash = ctx.gotHash;
}

void setErr(std::string* err, const std::string& msg) {
    if (err) *err = msg;
}

} // namespace

bool replayConfig(const ReplayFile& replay, GameConfig& out, std::string* err) {
    GameConfig cfg;
    for (const auto& [key, value] : replay.meta.config) {
        std::string warn;
        if (!applyConfigKey(cfg, key, value, &warn)) {
            setErr(err, "Replay config override rejected: " + warn);
            return false;
        }
    }
    out = cfg;
    return true;
}

bool runReplayHeadless(const ReplayFile& replay,
                       const ReplayRunOptions& opt,
                       ReplayRunStats* outStats,
                       std::string* err,
                       std::unique_ptr<Simulation>* outSim) {
    ReplayRunStats st;
    auto finish = [&](bool ok, std::unique_ptr<Simulation> sim) {
        if (sim) {
            st.turns = sim->turns();
            st.finalStatus = sim->status();
            st.finalHash = sim->stateHash();
        }
        if (outStats) *outStats = st;
        if (outSim) *outSim = std::move(sim);
        return ok;
    };

    GameConfig cfg;
    if (!replayConfig(replay, cfg, err)) {
        st.failure = ReplayFailureKind::BadConfig;
        return finish(false, nullptr);
    }

    GenFailure fail;
    std::unique_ptr<Simulation> sim =
        createFloorSimulation(runSeedFromText(replay.meta.seedText), replay.meta.floorIndex, cfg, &fail);
    if (!sim) {
        st.failure = ReplayFailureKind::GenerationFailed;
        setErr(err, std::string("Floor generation failed (") + genFailureKindName(fail.kind) + "): " + fail.reason);
        return finish(false, nullptr);
    }

    std::vector<TurnHashCheckpoint> checkpoints;
    for (const auto& ev : replay.events) {
        if (ev.kind == ReplayEventType::StateHash) {
            checkpoints.push_back(TurnHashCheckpoint{ev.turn, ev.hash});
        }
    }
    std::stable_sort(checkpoints.begin(), checkpoints.end(),
                     [](const TurnHashCheckpoint& a, const TurnHashCheckpoint& b) { return a.turn < b.turn; });

    TurnHashVerifyCtx verify{};
    if (opt.verifyHashes && !checkpoints.empty()) {
        verify.expected = &checkpoints;
        // The initial state (turn 0) may carry a checkpoint too.
        verifyTurnHash(verify, sim->turns(), sim->stateHash());
    }

    for (const auto& ev : replay.events) {
        if (verify.failed) break;
        if (ev.kind != ReplayEventType::Action) continue;

        if (opt.maxActions != 0 && st.actionsDispatched >= opt.maxActions) {
            st.failure = ReplayFailureKind::SafetyLimit;
            std::ostringstream ss;
            ss << "Replay runner exceeded safety limit (maxActions=" << opt.maxActions << ").";
            setErr(err, ss.str());
            return finish(false, std::move(sim));
        }

        const StepResult r = sim->step(ev.action);
        st.actionsDispatched++;
        if (!r.ok) {
            // Rejected inputs are part of the recording and change nothing.
            st.actionsRejected++;
            continue;
        }
        if (verify.expected) verifyTurnHash(verify, sim->turns(), sim->stateHash());
    }

    if (!verify.failed && verify.expected && verify.idx < checkpoints.size()) {
        // Checkpoints left past the last recorded turn.
        verify.failed = true;
        verify.failedTurn = sim->turns();
        verify.expectedTurn = checkpoints[verify.idx].turn;
        verify.expectedHash = checkpoints[verify.idx].hash;
        verify.gotHash = sim->stateHash();
    }

    st.checkpointsVerified = verify.verified;
    if (verify.failed) {
        fillMismatch(verify, st);
        setErr(err, formatHashMismatch(verify));
        return finish(false, std::move(sim));
    }
    return finish(true, std::move(sim));
}
