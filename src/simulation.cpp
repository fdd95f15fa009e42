#include "simulation.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace {

const char* dirToken(Direction d) {
    switch (d) {
        case Direction::Up:    return "up";
        case Direction::Right: return "right";
        case Direction::Down:  return "down";
        case Direction::Left:  return "left";
    }
    return "up";
}

} // namespace

const char* actionToken(const PlayerAction& a) {
    switch (a.kind) {
        case PlayerActionKind::Move:     return dirToken(a.dir);
        case PlayerActionKind::Wait:     return "wait";
        case PlayerActionKind::Interact: return "interact";
    }
    return "wait";
}

bool parseAction(const std::string& raw, PlayerAction& out) {
    std::string s;
    s.reserve(raw.size());
    for (unsigned char ch : raw) {
        if (std::isspace(ch)) continue;
        s.push_back(static_cast<char>(std::tolower(ch)));
    }
    if (s.empty()) return false;

    if (s == "up" || s == "u")               { out = PlayerAction::move(Direction::Up); return true; }
    if (s == "right" || s == "r")            { out = PlayerAction::move(Direction::Right); return true; }
    if (s == "down" || s == "d")             { out = PlayerAction::move(Direction::Down); return true; }
    if (s == "left" || s == "l")             { out = PlayerAction::move(Direction::Left); return true; }
    if (s == "wait" || s == "w" || s == ".") { out = PlayerAction::wait(); return true; }
    if (s == "interact" || s == "i")         { out = PlayerAction::interact(); return true; }
    return false;
}

Simulation::Simulation(Grid grid, Vec2i playerStart, Vec2i exit, std::vector<Guard> roster, const SimTuning& tuning)
    : grid_(std::move(grid)), exit_(exit), guards_(std::move(roster)), tuning_(tuning) {
    player_.pos = playerStart;
    for (size_t i = 0; i < guards_.size(); ++i) {
        guards_[i].id = static_cast<int>(i);
    }
}

Simulation Simulation::fromGenerated(GenResult floor, RNG& floorRng, const SimTuning& tuning) {
    std::vector<Guard> roster;
    roster.reserve(floor.guardSpawns.size());
    for (size_t i = 0; i < floor.guardSpawns.size(); ++i) {
        roster.push_back(makeGuard(static_cast<int>(i), floor.guardSpawns[i], floorRng));
    }
    return Simulation(std::move(floor.grid), floor.start, floor.exit, std::move(roster), tuning);
}

bool Simulation::setTile(Vec2i p, const Tile& t) {
    std::string warn;
    if (!grid_.setTile(p, t, &warn)) {
        pushMsg(warn, MessageKind::Warning);
        return false;
    }
    return true;
}

StepResult Simulation::reject(const std::string& why) {
    pushMsg(why, MessageKind::Warning);

    StepResult r;
    r.ok = false;
    r.reason = why;
    r.status = status_;
    r.turn = turn_;
    return r;
}

void Simulation::emit(GameEvent ev) {
    if (sink_) sink_->onEvent(ev);
}

void Simulation::pushMsg(const std::string& s, MessageKind kind) {
    if (!msgs_.empty()) {
        Message& last = msgs_.back();
        if (last.text == s && last.kind == kind) {
            if (last.repeat < 9999) ++last.repeat;
            return;
        }
    }

    // Keep some scrollback
    if (msgs_.size() > 400) {
        msgs_.erase(msgs_.begin(), msgs_.begin() + 100);
    }
    msgs_.push_back({s, kind, 1});
}

StepResult Simulation::step(const PlayerAction& a) {
    if (isFinished()) return reject("THE FLOOR IS OVER.");

    std::string note;
    switch (a.kind) {
        case PlayerActionKind::Move: {
            const Vec2i dest = player_.pos + dirDelta(a.dir);
            if (!grid_.isWalkable(dest)) {
                if (grid_.isDoorClosed(dest)) return reject("THE DOOR IS CLOSED.");
                return reject("YOU CAN'T MOVE THERE.");
            }
            player_.pos = dest;
            break;
        }
        case PlayerActionKind::Wait:
            break;
        case PlayerActionKind::Interact:
            note = interact();
            break;
    }

    ++turn_;

    resolveTile();
    guardPhase();
    terminalChecks();

    GameEvent done;
    done.kind = GameEventKind::TurnCompleted;
    done.turn = turn_;
    done.pos = player_.pos;
    emit(done);

    StepResult r;
    r.ok = true;
    r.note = note;
    r.status = status_;
    r.turn = turn_;
    return r;
}

std::string Simulation::interact() {
    bool sawDoor = false;
    int opened = 0;

    for (const auto& dv : DIRS4) {
        const Vec2i p{player_.pos.x + dv[0], player_.pos.y + dv[1]};
        if (!grid_.isDoorClosed(p)) continue;
        sawDoor = true;

        // Keycards are access passes: they open doors without being used up.
        if (player_.count(PickupKind::Keycard) <= 0) continue;
        if (!grid_.openDoor(p)) continue;
        ++opened;

        GameEvent ev;
        ev.kind = GameEventKind::DoorOpened;
        ev.turn = turn_ + 1;
        ev.pos = p;
        emit(ev);
    }

    if (opened > 0) {
        pushMsg("THE DOOR SLIDES OPEN.");
        return {};
    }
    if (sawDoor) {
        pushMsg("THE DOOR IS LOCKED. YOU NEED A KEYCARD.");
        return "door locked: no keycard";
    }
    return "nothing to interact with";
}

void Simulation::resolveTile() {
    const Vec2i here = player_.pos;

    if (const auto item = grid_.takePickup(here)) {
        ++player_.inventory[static_cast<size_t>(*item)];
        pushMsg(std::string("YOU PICK UP THE ") + pickupKindName(*item) + ".", MessageKind::Success);

        GameEvent ev;
        ev.kind = GameEventKind::PickupCollected;
        ev.turn = turn_;
        ev.pos = here;
        ev.pickup = *item;
        emit(ev);
    }

    if (grid_.disarmHazard(here)) {
        int alerted = 0;
        for (size_t i = 0; i < guards_.size(); ++i) {
            Guard& g = guards_[i];
            if (manhattan(g.pos, here) > tuning_.hazardAlertRadius) continue;
            const GuardState before = g.state;
            if (!alertGuard(g, here, tuning_.guards)) continue;
            ++alerted;

            GameEvent sc;
            sc.kind = GameEventKind::GuardStateChanged;
            sc.turn = turn_;
            sc.pos = g.pos;
            sc.guardIndex = static_cast<int>(i);
            sc.fromState = before;
            sc.toState = g.state;
            emit(sc);
        }

        pushMsg("AN ALARM PANEL SHRIEKS!", MessageKind::Warning);

        GameEvent ev;
        ev.kind = GameEventKind::HazardTriggered;
        ev.turn = turn_;
        ev.pos = here;
        ev.alertedGuards = alerted;
        emit(ev);
    }
}

void Simulation::guardPhase() {
    for (size_t i = 0; i < guards_.size(); ++i) {
        Guard& g = guards_[i];
        const GuardStepOutcome o = stepGuard(g, grid_, player_.pos, tuning_.guards);

        if (o.before != o.after) {
            GameEvent ev;
            ev.kind = GameEventKind::GuardStateChanged;
            ev.turn = turn_;
            ev.pos = g.pos;
            ev.guardIndex = static_cast<int>(i);
            ev.fromState = o.before;
            ev.toState = o.after;
            emit(ev);
        }

        // Capture is immediate: the remaining guards do not act.
        if (g.pos == player_.pos) break;
    }
}

void Simulation::terminalChecks() {
    for (size_t i = 0; i < guards_.size(); ++i) {
        if (guards_[i].pos != player_.pos) continue;

        status_ = FloorStatus::Lost;
        capturedBy_ = static_cast<int>(i);
        pushMsg("A GUARD GRABS YOU. CAUGHT!", MessageKind::System);

        GameEvent ev;
        ev.kind = GameEventKind::FloorLost;
        ev.turn = turn_;
        ev.pos = player_.pos;
        ev.guardIndex = capturedBy_;
        emit(ev);
        return;
    }

    if (grid_.kindAt(player_.pos) != TileKind::Exit) return;

    if (!hasObjective()) {
        pushMsg("THE EXIT WON'T OPEN WITHOUT THE DATA SHARD.");
        return;
    }

    status_ = FloorStatus::Won;
    pushMsg("YOU SLIP OUT WITH THE DATA SHARD.", MessageKind::Success);

    GameEvent ev;
    ev.kind = GameEventKind::FloorWon;
    ev.turn = turn_;
    ev.pos = player_.pos;
    emit(ev);
}

uint64_t Simulation::stateHash() const {
    Hash64 h;
    grid_.hashInto(h);

    h.addI32(player_.pos.x);
    h.addI32(player_.pos.y);
    for (int c : player_.inventory) h.addI32(c);

    h.addU32(static_cast<uint32_t>(guards_.size()));
    for (const Guard& g : guards_) {
        h.addI32(g.pos.x);
        h.addI32(g.pos.y);
        h.addI32(g.facing.x);
        h.addI32(g.facing.y);
        h.addByte(static_cast<uint8_t>(g.state));
        h.addI32(g.turnsRemaining);
        h.addI32(g.cooldown);
        h.addI32(g.lastKnownTarget.x);
        h.addI32(g.lastKnownTarget.y);
        h.addU32(g.rng.state);
    }

    h.addU32(turn_);
    h.addByte(static_cast<uint8_t>(status_));
    return h.h;
}
