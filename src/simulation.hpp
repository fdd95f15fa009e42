#pragma once
#include "common.hpp"
#include "events.hpp"
#include "grid.hpp"
#include "guard_ai.hpp"
#include "levelgen.hpp"
#include "rng.hpp"

#include <array>
#include <cstdint>
#include <string>
#include <vector>

enum class PlayerActionKind : uint8_t {
    Move = 0,
    Wait,
    Interact,
};

struct PlayerAction {
    PlayerActionKind kind = PlayerActionKind::Wait;
    Direction dir = Direction::Up; // Move only

    static PlayerAction move(Direction d) { return {PlayerActionKind::Move, d}; }
    static PlayerAction wait() { return {PlayerActionKind::Wait, Direction::Up}; }
    static PlayerAction interact() { return {PlayerActionKind::Interact, Direction::Up}; }
};

// Stable tokens: "up", "right", "down", "left", "wait", "interact".
const char* actionToken(const PlayerAction& a);

// Accepts the tokens above plus single letters u/r/d/l, w (wait) and i.
bool parseAction(const std::string& raw, PlayerAction& out);

enum class FloorStatus : uint8_t {
    Playing = 0,
    Won,
    Lost,
};

inline const char* floorStatusName(FloorStatus s) {
    switch (s) {
        case FloorStatus::Playing: return "PLAYING";
        case FloorStatus::Won:     return "WON";
        case FloorStatus::Lost:    return "LOST";
    }
    return "PLAYING";
}

struct Player {
    Vec2i pos{0, 0};
    std::array<int, PICKUP_KIND_COUNT> inventory{};

    int count(PickupKind k) const { return inventory[static_cast<size_t>(k)]; }
};

struct StepResult {
    // False when the input was rejected; nothing changed in that case.
    bool ok = false;
    std::string reason;

    // Human-readable remark for accepted no-op actions ("nothing to interact with").
    std::string note;

    FloorStatus status = FloorStatus::Playing;
    uint32_t turn = 0;
};

enum class MessageKind : uint8_t {
    Info = 0,
    System,
    Warning,
    Success,
};

struct Message {
    std::string text;
    MessageKind kind = MessageKind::Info;

    // Consecutive duplicates are compacted by incrementing this counter.
    int repeat = 1;
};

struct SimTuning {
    GuardTuning guards;
    // Manhattan radius within which a triggered hazard alerts guards.
    int hazardAlertRadius = 6;
};

// One floor in play: the turn scheduler.
//
// Owns the grid, the player and the guard roster (guards are addressed by
// their index in the roster). Every accepted action runs one full step:
// player action, pickups/hazards, guard phase, terminal checks.
class Simulation {
public:
    Simulation(Grid grid, Vec2i playerStart, Vec2i exit, std::vector<Guard> roster, const SimTuning& tuning);

    // Takes ownership of a generated floor. Guards are built from the spawns
    // in order, drawing from `floorRng` (the stream that generated the floor).
    static Simulation fromGenerated(GenResult floor, RNG& floorRng, const SimTuning& tuning);

    StepResult step(const PlayerAction& a);

    void setEventSink(EventSink* sink) { sink_ = sink; }

    // Scripted tile edits (tools, scenario setup). Out-of-bounds writes are
    // ignored and logged as warnings.
    bool setTile(Vec2i p, const Tile& t);

    const Grid& grid() const { return grid_; }
    const Player& player() const { return player_; }
    const std::vector<Guard>& guards() const { return guards_; }
    Vec2i exitPos() const { return exit_; }

    FloorStatus status() const { return status_; }
    bool isFinished() const { return status_ != FloorStatus::Playing; }
    uint32_t turns() const { return turn_; }
    bool hasObjective() const { return player_.count(PickupKind::Objective) > 0; }

    // Index of the guard that caught the player, -1 otherwise.
    int capturedBy() const { return capturedBy_; }

    const std::vector<Message>& messages() const { return msgs_; }

    // Deterministic checksum of everything that affects future turns.
    uint64_t stateHash() const;

private:
    StepResult reject(const std::string& why);
    void emit(GameEvent ev);
    void pushMsg(const std::string& s, MessageKind kind = MessageKind::Info);

    std::string interact();
    void resolveTile();
    void guardPhase();
    void terminalChecks();

    Grid grid_;
    Player player_;
    Vec2i exit_{-1, -1};
    std::vector<Guard> guards_;
    SimTuning tuning_;

    FloorStatus status_ = FloorStatus::Playing;
    uint32_t turn_ = 0;
    int capturedBy_ = -1;

    EventSink* sink_ = nullptr;
    std::vector<Message> msgs_;
};
