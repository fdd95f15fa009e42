#pragma once

#include "common.hpp"
#include "grid.hpp"
#include "guard_ai.hpp"

#include <cstdint>
#include <vector>

// Notifications for presentation-side collaborators (message log, audio, HUD).
// Each event carries everything a listener needs; listeners never have to
// query the simulation mid-step.

enum class GameEventKind : uint8_t {
    PickupCollected = 0,
    DoorOpened,
    HazardTriggered,
    GuardStateChanged,
    TurnCompleted,
    FloorWon,
    FloorLost,
};

inline const char* gameEventKindName(GameEventKind k) {
    switch (k) {
        case GameEventKind::PickupCollected:   return "PickupCollected";
        case GameEventKind::DoorOpened:        return "DoorOpened";
        case GameEventKind::HazardTriggered:   return "HazardTriggered";
        case GameEventKind::GuardStateChanged: return "GuardStateChanged";
        case GameEventKind::TurnCompleted:     return "TurnCompleted";
        case GameEventKind::FloorWon:          return "FloorWon";
        case GameEventKind::FloorLost:         return "FloorLost";
    }
    return "Unknown";
}

struct GameEvent {
    GameEventKind kind = GameEventKind::TurnCompleted;
    uint32_t turn = 0;
    Vec2i pos{0, 0};

    // PickupCollected
    PickupKind pickup = PickupKind::Keycard;

    // GuardStateChanged (guardIndex is the roster slot); FloorLost names the
    // capturing guard the same way.
    int guardIndex = -1;
    GuardState fromState = GuardState::Patrol;
    GuardState toState = GuardState::Patrol;

    // HazardTriggered: how many guards heard it.
    int alertedGuards = 0;
};

class EventSink {
public:
    virtual ~EventSink() = default;
    virtual void onEvent(const GameEvent& ev) = 0;
};

// Keeps every event it receives (tests, headless tooling).
class EventRecorder : public EventSink {
public:
    void onEvent(const GameEvent& ev) override { events.push_back(ev); }
    void clear() { events.clear(); }

    int count(GameEventKind k) const {
        int n = 0;
        for (const auto& e : events) {
            if (e.kind == k) ++n;
        }
        return n;
    }

    std::vector<GameEvent> events;
};
