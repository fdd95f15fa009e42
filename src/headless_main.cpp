#include "config.hpp"
#include "replay.hpp"
#include "replay_runner.hpp"
#include "run.hpp"
#include "seed.hpp"
#include "version.hpp"

#include <cstdint>
#include <filesystem>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

namespace {

static void printUsage(const char* argv0) {
    std::cout
        << "Usage:\n"
        << "  " << argv0 << " [--seed <s>] [--floor <n>] [--actions <list>] [options]\n"
        << "  " << argv0 << " --replay <file.hrr> [options]\n"
        << "  " << argv0 << " --write-config <path>\n\n"
        << "Options:\n"
        << "  --seed <s>              Run seed (integer or any text). Default: random.\n"
        << "  --floor <n>             Play a single floor instead of a whole run.\n"
        << "  --config <path>         Difficulty config file (key = value).\n"
        << "  --set <key=value>       Override one config key (repeatable).\n"
        << "  --actions <list>        Comma/space separated actions: up,right,down,left,wait,interact\n"
        << "                          (or u,r,d,l,w,i).\n"
        << "  --record <path>         Record the floor as a replay (implies single-floor mode).\n"
        << "  --hash-every <n>        State-hash checkpoint interval in turns when recording. Default: 1.\n"
        << "  --replay <path>         Verify/play a replay headlessly.\n"
        << "  --no-verify-hashes      Do not verify StateHash checkpoints, even if present.\n"
        << "  --max-actions <n>       Safety cap for replayed actions (0 = unlimited).\n"
        << "  --map                   Print the floor after generation and at the end.\n"
        << "  --events                Print simulation events as they happen.\n"
        << "  --write-config <path>   Write a commented default config and exit.\n"
        << "  --version               Print version.\n"
        << "  --help                  Show this help.\n";
}

static bool argValue(int& i, int argc, char** argv, std::string& out) {
    if (i + 1 >= argc) return false;
    out = argv[++i];
    return true;
}

static bool parseU32(const std::string& s, uint32_t& out) {
    if (s.empty()) return false;
    uint64_t v = 0;
    for (char c : s) {
        if (c < '0' || c > '9') return false;
        v = v * 10 + static_cast<uint64_t>(c - '0');
        if (v > 0xFFFFFFFFull) return false;
    }
    out = static_cast<uint32_t>(v);
    return true;
}

static std::string hex64(uint64_t v) {
    std::ostringstream ss;
    ss << "0x" << std::hex << v;
    return ss.str();
}

static bool parseActionList(const std::string& s, std::vector<PlayerAction>& out, std::string& bad) {
    std::string tok;
    auto flush = [&]() -> bool {
        if (tok.empty()) return true;
        PlayerAction a;
        if (!parseAction(tok, a)) {
            bad = tok;
            return false;
        }
        out.push_back(a);
        tok.clear();
        return true;
    };
    for (char c : s) {
        if (c == ',' || c == ' ' || c == '\t' || c == '\n') {
            if (!flush()) return false;
        } else {
            tok.push_back(c);
        }
    }
    return flush();
}

static char tileGlyph(const Tile& t) {
    switch (tileKind(t)) {
        case TileKind::Floor:       return '.';
        case TileKind::Wall:        return '#';
        case TileKind::Door:        return std::get<DoorTile>(t).open ? '/' : '+';
        case TileKind::Exit:        return '>';
        case TileKind::Hazard:      return std::get<HazardTile>(t).armed ? '^' : '_';
        case TileKind::SlowTerrain: return '~';
        case TileKind::Pickup:
            return std::get<PickupTile>(t).item == PickupKind::Objective ? '$' : 'k';
    }
    return '?';
}

static void printMap(const Simulation& sim) {
    const Grid& g = sim.grid();
    for (int y = 0; y < g.height; ++y) {
        std::string row;
        row.reserve(static_cast<size_t>(g.width));
        for (int x = 0; x < g.width; ++x) {
            const Vec2i p{x, y};
            char c = tileGlyph(g.tile(p));
            for (const Guard& gd : sim.guards()) {
                if (gd.pos == p) c = 'G';
            }
            if (sim.player().pos == p) c = '@';
            row.push_back(c);
        }
        std::cout << "  " << row << "\n";
    }
}

static void printLayout(int floorIndex, const GenResult& r) {
    std::cout << "Floor " << floorIndex << ": " << r.grid.width << "x" << r.grid.height
              << " attempts=" << r.attempts
              << " start=" << posString(r.start)
              << " objective=" << posString(r.objective)
              << " exit=" << posString(r.exit)
              << " guards=" << r.guardSpawns.size()
              << " doors=" << r.grid.countKind(TileKind::Door)
              << " keycards=" << r.keySpawns.size()
              << " hazards=" << r.hazards.size()
              << " slow=" << r.grid.countKind(TileKind::SlowTerrain)
              << "\n";
}

static void printStep(const PlayerAction& a, const StepResult& r) {
    std::cout << "  " << actionToken(a) << ": ";
    if (!r.ok) {
        std::cout << "REJECTED (" << r.reason << ")";
    } else {
        std::cout << "turn " << r.turn << " " << floorStatusName(r.status);
        if (!r.note.empty()) std::cout << " [" << r.note << "]";
    }
    std::cout << "\n";
}

// Prints events as they arrive; TurnCompleted is implied by the step line.
class PrintSink : public EventSink {
public:
    void onEvent(const GameEvent& ev) override {
        if (ev.kind == GameEventKind::TurnCompleted) return;
        std::cout << "    * " << gameEventKindName(ev.kind) << " turn=" << ev.turn << " at " << posString(ev.pos);
        switch (ev.kind) {
            case GameEventKind::PickupCollected:
                std::cout << " " << pickupKindName(ev.pickup);
                break;
            case GameEventKind::GuardStateChanged:
                std::cout << " guard=" << ev.guardIndex << " " << guardStateName(ev.fromState)
                          << "->" << guardStateName(ev.toState);
                break;
            case GameEventKind::HazardTriggered:
                std::cout << " alerted=" << ev.alertedGuards;
                break;
            case GameEventKind::FloorLost:
                std::cout << " guard=" << ev.guardIndex;
                break;
            default:
                break;
        }
        std::cout << "\n";
    }
};

static void printWarnings(const std::vector<Message>& msgs) {
    for (const Message& m : msgs) {
        if (m.kind != MessageKind::Warning) continue;
        std::cerr << "warning: " << m.text << "\n";
    }
}

struct PlayArgs {
    RunSeed seed;
    GameConfig cfg;
    ConfigPairs overrides;
    std::vector<PlayerAction> actions;
    bool singleFloor = false;
    int floorIndex = 0;
    std::filesystem::path recordPath;
    uint32_t hashEvery = 1;
    bool showMap = false;
    bool showEvents = false;
};

static int playSingleFloor(const PlayArgs& a) {
    GenFailure fail;
    GenResult layout;
    std::unique_ptr<Simulation> sim = createFloorSimulation(a.seed, a.floorIndex, a.cfg, &fail, &layout);
    if (!sim) {
        std::cerr << "Floor generation failed (" << genFailureKindName(fail.kind) << ", attempts="
                  << fail.attempts << "): " << fail.reason << "\n";
        return 1;
    }

    PrintSink sink;
    if (a.showEvents) sim->setEventSink(&sink);

    printLayout(a.floorIndex, layout);
    if (a.showMap) printMap(*sim);

    ReplayWriter rec;
    if (!a.recordPath.empty()) {
        ReplayMeta meta;
        meta.gameVersion = HEIST_VERSION;
        meta.seedText = a.seed.text;
        meta.floorIndex = a.floorIndex;
        meta.config = a.overrides;

        std::string err;
        if (!rec.open(a.recordPath, meta, &err)) {
            std::cerr << err << "\n";
            return 1;
        }
        rec.writeStateHash(sim->turns(), sim->stateHash());
    }

    for (const PlayerAction& act : a.actions) {
        const StepResult r = sim->step(act);
        printStep(act, r);
        if (rec.isOpen()) {
            rec.writeAction(act);
            if (r.ok && a.hashEvery != 0 && (r.turn % a.hashEvery) == 0) {
                rec.writeStateHash(r.turn, sim->stateHash());
            }
        }
        if (sim->isFinished()) break;
    }
    rec.close();

    if (a.showMap) printMap(*sim);
    printWarnings(sim->messages());

    std::cout << "Status: " << floorStatusName(sim->status())
              << " turns=" << sim->turns()
              << " objective=" << (sim->hasObjective() ? "yes" : "no")
              << " hash=" << hex64(sim->stateHash()) << "\n";
    if (sim->capturedBy() >= 0) std::cout << "Captured by guard " << sim->capturedBy() << "\n";
    if (!a.recordPath.empty()) std::cout << "Replay written: " << a.recordPath.generic_string() << "\n";
    return 0;
}

static int playRun(const PlayArgs& a) {
    Run run(a.seed, a.cfg);
    PrintSink sink;
    if (a.showEvents) run.setEventSink(&sink);

    GenFailure fail;
    if (!run.startFloor(&fail)) {
        std::cerr << "Floor generation failed (" << genFailureKindName(fail.kind) << ", attempts="
                  << fail.attempts << "): " << fail.reason << "\n";
        return 1;
    }
    printLayout(run.floorIndex(), run.layout());
    if (a.showMap) printMap(*run.floor());

    for (const PlayerAction& act : a.actions) {
        const StepResult r = run.step(act);
        printStep(act, r);
        if (run.outcome() != RunOutcome::InProgress) break;

        if (run.awaitingNextFloor()) {
            if (a.showMap) printMap(*run.floor());
            printWarnings(run.floor()->messages());
            if (!run.nextFloor(&fail)) {
                std::cerr << "Floor generation failed (" << genFailureKindName(fail.kind) << ", attempts="
                          << fail.attempts << "): " << fail.reason << "\n";
                return 1;
            }
            printLayout(run.floorIndex(), run.layout());
            if (a.showMap) printMap(*run.floor());
        }
    }

    if (a.showMap) printMap(*run.floor());
    printWarnings(run.floor()->messages());

    std::cout << "Run: " << runOutcomeId(run.outcome())
              << " floor=" << run.floorIndex()
              << " hash=" << hex64(run.floor()->stateHash()) << "\n";
    std::cout << formatKeyValues(statsToKeyValues(run.stats()));
    return 0;
}

static int verifyReplay(const std::filesystem::path& path, const ReplayRunOptions& opt, bool showMap) {
    ReplayFile rf;
    std::string err;
    if (!loadReplayFile(path, rf, &err)) {
        std::cout << "Replay FAILED: " << path.generic_string() << "\n";
        std::cout << "  " << err << "\n";
        return 1;
    }

    ReplayRunStats stats;
    std::unique_ptr<Simulation> sim;
    const bool ok = runReplayHeadless(rf, opt, &stats, &err, &sim);
    if (showMap && sim) printMap(*sim);

    if (ok) {
        std::cout << "Replay OK: " << path.generic_string()
                  << " turns=" << stats.turns
                  << " actions=" << stats.actionsDispatched
                  << " rejected=" << stats.actionsRejected
                  << " checkpoints=" << stats.checkpointsVerified
                  << " status=" << floorStatusName(stats.finalStatus)
                  << " hash=" << hex64(stats.finalHash)
                  << "\n";
        return 0;
    }

    std::cout << "Replay FAILED (" << replayFailureKindName(stats.failure) << "): "
              << path.generic_string() << "\n";
    std::cout << "  " << err << "\n";
    return 1;
}

} // namespace

int main(int argc, char** argv) {
    PlayArgs play;
    std::string seedText;
    std::string configPath;
    std::filesystem::path replayPath;
    std::string writeConfigPath;
    ReplayRunOptions opt;

    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        if (a == "--help" || a == "-h") {
            printUsage(argv[0]);
            return 0;
        } else if (a == "--version") {
            std::cout << HEIST_APPNAME << " " << HEIST_VERSION << "\n";
            return 0;
        } else if (a == "--seed") {
            if (!argValue(i, argc, argv, seedText) || runSeedFromText(seedText).text.empty()) {
                std::cerr << "--seed requires a value\n";
                return 2;
            }
        } else if (a == "--floor") {
            std::string v;
            uint32_t n = 0;
            if (!argValue(i, argc, argv, v) || !parseU32(v, n) || n > 999) {
                std::cerr << "--floor requires a floor index (0..999)\n";
                return 2;
            }
            play.floorIndex = static_cast<int>(n);
            play.singleFloor = true;
        } else if (a == "--config") {
            if (!argValue(i, argc, argv, configPath)) {
                std::cerr << "--config requires a path\n";
                return 2;
            }
        } else if (a == "--set") {
            std::string v;
            if (!argValue(i, argc, argv, v) || v.find('=') == std::string::npos) {
                std::cerr << "--set requires key=value\n";
                return 2;
            }
            const size_t eq = v.find('=');
            play.overrides.emplace_back(v.substr(0, eq), v.substr(eq + 1));
        } else if (a == "--actions") {
            std::string v;
            std::string bad;
            if (!argValue(i, argc, argv, v)) {
                std::cerr << "--actions requires a list\n";
                return 2;
            }
            if (!parseActionList(v, play.actions, bad)) {
                std::cerr << "Unknown action: " << bad << "\n";
                return 2;
            }
        } else if (a == "--record") {
            std::string v;
            if (!argValue(i, argc, argv, v)) {
                std::cerr << "--record requires a path\n";
                return 2;
            }
            play.recordPath = v;
            play.singleFloor = true;
        } else if (a == "--hash-every") {
            std::string v;
            if (!argValue(i, argc, argv, v) || !parseU32(v, play.hashEvery)) {
                std::cerr << "--hash-every requires a value\n";
                return 2;
            }
        } else if (a == "--replay") {
            std::string v;
            if (!argValue(i, argc, argv, v)) {
                std::cerr << "--replay requires a path\n";
                return 2;
            }
            replayPath = v;
        } else if (a == "--no-verify-hashes") {
            opt.verifyHashes = false;
        } else if (a == "--max-actions") {
            std::string v;
            if (!argValue(i, argc, argv, v) || !parseU32(v, opt.maxActions)) {
                std::cerr << "--max-actions requires a value\n";
                return 2;
            }
        } else if (a == "--map") {
            play.showMap = true;
        } else if (a == "--events") {
            play.showEvents = true;
        } else if (a == "--write-config") {
            if (!argValue(i, argc, argv, writeConfigPath)) {
                std::cerr << "--write-config requires a path\n";
                return 2;
            }
        } else {
            std::cerr << "Unknown arg: " << a << "\n";
            printUsage(argv[0]);
            return 2;
        }
    }

    if (!writeConfigPath.empty()) {
        if (!writeDefaultConfig(writeConfigPath)) {
            std::cerr << "Failed to write config: " << writeConfigPath << "\n";
            return 1;
        }
        std::cout << "Config written: " << writeConfigPath << "\n";
        return 0;
    }

    if (!replayPath.empty()) {
        if (!seedText.empty() || !play.actions.empty() || !play.recordPath.empty()) {
            std::cerr << "--replay cannot be combined with --seed, --actions or --record\n";
            return 2;
        }
        return verifyReplay(replayPath, opt, play.showMap);
    }

    // Config file first, then command-line overrides on top. Both end up in
    // a recorded replay so it regenerates the same floor.
    ConfigPairs applied;
    if (!configPath.empty()) {
        if (!std::filesystem::exists(configPath)) {
            std::cerr << "Config not found: " << configPath << "\n";
            return 2;
        }
        std::string warns;
        play.cfg = loadConfig(configPath, &warns, &applied);
        if (!warns.empty()) std::cerr << warns;
    }
    for (const auto& [k, v] : play.overrides) {
        std::string warn;
        if (!applyConfigKey(play.cfg, k, v, &warn)) {
            std::cerr << "--set " << k << ": " << warn << "\n";
            return 2;
        }
        applied.emplace_back(k, v);
    }
    play.overrides = applied;

    play.seed = seedText.empty() ? runSeedFromInt(randomRunSeed()) : runSeedFromText(seedText);
    std::cout << HEIST_APPNAME << " " << HEIST_VERSION << " seed=" << play.seed.text << "\n";

    return play.singleFloor ? playSingleFloor(play) : playRun(play);
}
