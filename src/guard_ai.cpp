#include "guard_ai.hpp"

#include "pathfinding.hpp"

#include <vector>

namespace {

void moveTo(Guard& g, const Grid& grid, Vec2i dest, GuardStepOutcome& out) {
    const Vec2i delta = dest - g.pos;
    if (delta.x != 0 || delta.y != 0) {
        g.facing = {sign(delta.x), sign(delta.y)};
    }
    g.pos = dest;
    // Entering slow terrain costs extra activations.
    g.cooldown = grid.moveCost(dest) - 1;
    if (g.cooldown < 0) g.cooldown = 0;
    out.moved = true;
}

void patrolStep(Guard& g, const Grid& grid, GuardStepOutcome& out) {
    // Momentum: keep walking the current heading while it is open.
    const Vec2i ahead = g.pos + g.facing;
    if ((g.facing.x != 0 || g.facing.y != 0) && grid.isWalkable(ahead)) {
        moveTo(g, grid, ahead, out);
        return;
    }

    std::vector<Vec2i> open;
    open.reserve(4);
    for (const auto& dv : DIRS4) {
        const Vec2i n{g.pos.x + dv[0], g.pos.y + dv[1]};
        if (grid.isWalkable(n)) open.push_back(n);
    }
    if (open.empty()) return;

    const Vec2i next = open[static_cast<size_t>(g.rng.range(0, static_cast<int>(open.size()) - 1))];
    moveTo(g, grid, next, out);
}

void pursueStep(Guard& g, const Grid& grid, const GuardTuning& tuning, GuardStepOutcome& out) {
    if (!grid.inBounds(g.lastKnownTarget)) return;

    auto passable = [&](int x, int y) { return grid.isWalkable({x, y}); };

    std::vector<Vec2i> path;
    if (tuning.weightedPursuit) {
        auto stepCost = [&](int x, int y) { return grid.moveCost({x, y}); };
        path = dijkstraPath(grid.width, grid.height, g.pos, g.lastKnownTarget, passable, stepCost);
    } else {
        path = bfsPath(grid.width, grid.height, g.pos, g.lastKnownTarget, passable);
    }

    if (path.size() >= 2) {
        moveTo(g, grid, path[1], out);
        return;
    }

    // Already standing on the noise: nothing left to investigate.
    if (path.size() == 1 && g.state == GuardState::Alert) {
        g.state = GuardState::Patrol;
        g.turnsRemaining = 0;
        g.lastKnownTarget = {-1, -1};
    }
}

} // namespace

Guard makeGuard(int id, Vec2i pos, RNG& floorRng) {
    Guard g;
    g.id = id;
    g.pos = pos;
    const auto& dv = DIRS4[floorRng.range(0, 3)];
    g.facing = {dv[0], dv[1]};
    g.rng = RNG(floorRng.nextU32());
    return g;
}

bool guardCanSee(const Guard& g, const Grid& grid, Vec2i target, const GuardTuning& tuning) {
    if (tuning.visionRange > 0 && manhattan(g.pos, target) > tuning.visionRange) return false;
    return grid.lineOfSight(g.pos, target);
}

GuardStepOutcome stepGuard(Guard& g, const Grid& grid, Vec2i playerPos, const GuardTuning& tuning) {
    GuardStepOutcome out;
    out.before = g.state;
    out.from = g.pos;
    out.to = g.pos;

    if (g.cooldown > 0) {
        --g.cooldown;
        out.onCooldown = true;
        out.after = g.state;
        return out;
    }

    if (guardCanSee(g, grid, playerPos, tuning)) {
        out.sawPlayer = true;
        g.state = GuardState::Chase;
        g.turnsRemaining = tuning.chaseTurns;
        g.lastKnownTarget = playerPos;
    }

    switch (g.state) {
        case GuardState::Patrol:
            patrolStep(g, grid, out);
            break;
        case GuardState::Alert:
        case GuardState::Chase:
            pursueStep(g, grid, tuning, out);
            break;
    }

    if (!out.sawPlayer && g.state != GuardState::Patrol) {
        --g.turnsRemaining;
        if (g.turnsRemaining <= 0) {
            g.state = GuardState::Patrol;
            g.turnsRemaining = 0;
            g.lastKnownTarget = {-1, -1};
        }
    }

    out.to = g.pos;
    out.after = g.state;
    return out;
}

bool alertGuard(Guard& g, Vec2i noisePos, const GuardTuning& tuning) {
    if (g.state == GuardState::Chase) return false;
    const bool changed = (g.state != GuardState::Alert);
    g.state = GuardState::Alert;
    g.turnsRemaining = tuning.alertTurns;
    g.lastKnownTarget = noisePos;
    return changed;
}
