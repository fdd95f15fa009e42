#include "levelgen.hpp"

#include "pathfinding.hpp"

#include <algorithm>
#include <sstream>

namespace {

void setReason(std::string* reason, const std::string& msg) {
    if (reason) *reason = msg;
}

bool inUnitRange(float v) {
    return v >= 0.0f && v <= 1.0f; // false for NaN
}

void carve(Grid& g, const GenParams& p, RNG& rng) {
    g = Grid(p.width, p.height);
    for (int y = 0; y < g.height; ++y) {
        for (int x = 0; x < g.width; ++x) {
            const bool border = (x == 0 || y == 0 || x == g.width - 1 || y == g.height - 1);
            if (border) {
                g.setTile({x, y}, WallTile{});
                continue;
            }
            if (rng.chance(p.wallDensity)) g.setTile({x, y}, WallTile{});
        }
    }
}

bool connected(const Grid& g, Vec2i a, Vec2i b, bool doorsBlock) {
    auto passable = [&](int x, int y) {
        const TileKind k = g.kindAt({x, y});
        if (k == TileKind::Wall) return false;
        if (doorsBlock && k == TileKind::Door) return false;
        return true;
    };
    return !bfsPath(g.width, g.height, a, b, passable).empty();
}

bool farFromAll(Vec2i p, const std::vector<Vec2i>& others, int minDist) {
    for (const Vec2i& o : others) {
        if (manhattan(p, o) < minDist) return false;
    }
    return true;
}

bool isOpen(const Grid& g, Vec2i p) {
    return g.inBounds(p) && g.kindAt(p) != TileKind::Wall;
}

// A floor cell squeezed between two walls with open cells on the other axis.
bool isChokepoint(const Grid& g, Vec2i p) {
    const bool wallsLR = !isOpen(g, {p.x - 1, p.y}) && !isOpen(g, {p.x + 1, p.y});
    const bool wallsUD = !isOpen(g, {p.x, p.y - 1}) && !isOpen(g, {p.x, p.y + 1});
    const bool openLR = isOpen(g, {p.x - 1, p.y}) && isOpen(g, {p.x + 1, p.y});
    const bool openUD = isOpen(g, {p.x, p.y - 1}) && isOpen(g, {p.x, p.y + 1});
    return (wallsLR && openUD) || (wallsUD && openLR);
}

bool contains(const std::vector<Vec2i>& v, Vec2i p) {
    return std::find(v.begin(), v.end(), p) != v.end();
}

void placeDoors(GenResult& r, const GenParams& p, RNG& rng) {
    if (p.doorChance <= 0.0f || p.maxDoors <= 0) return;

    std::vector<Vec2i> candidates;
    for (const Vec2i& c : r.grid.cellsOfKind(TileKind::Floor)) {
        if (c == r.start) continue;
        if (isChokepoint(r.grid, c)) candidates.push_back(c);
    }
    rng.shuffle(candidates);

    int placed = 0;
    for (const Vec2i& c : candidates) {
        if (placed >= p.maxDoors) break;
        if (!rng.chance(p.doorChance)) continue;
        r.grid.setTile(c, DoorTile{false});
        ++placed;
    }
}

bool placeGuards(GenResult& r, const GenParams& p, RNG& rng) {
    if (p.guardCount <= 0) return true;

    std::vector<Vec2i> candidates = r.grid.cellsOfKind(TileKind::Floor);
    rng.shuffle(candidates);

    const std::vector<Vec2i> anchors = {r.start, r.objective, r.exit};
    for (const Vec2i& c : candidates) {
        if (static_cast<int>(r.guardSpawns.size()) >= p.guardCount) break;
        if (!farFromAll(c, anchors, p.guardMinDistance)) continue;
        if (!farFromAll(c, r.guardSpawns, p.guardMinDistance)) continue;
        r.guardSpawns.push_back(c);
    }
    return static_cast<int>(r.guardSpawns.size()) >= p.guardCount;
}

void placeKey(GenResult& r, const GenParams& p, RNG& rng) {
    const bool wanted = p.placeKey || r.grid.countKind(TileKind::Door) > 0;
    if (!wanted) return;

    std::vector<Vec2i> candidates = r.grid.cellsOfKind(TileKind::Floor);
    rng.shuffle(candidates);

    const std::vector<Vec2i> anchors = {r.start, r.objective, r.exit};
    for (const Vec2i& c : candidates) {
        if (contains(r.guardSpawns, c)) continue;
        if (!farFromAll(c, anchors, p.keyMinDistance)) continue;
        r.grid.setTile(c, PickupTile{PickupKind::Keycard});
        r.keySpawns.push_back(c);
        return;
    }
}

void placeHazards(GenResult& r, const GenParams& p, RNG& rng) {
    if (p.hazardCount <= 0) return;

    std::vector<Vec2i> candidates = r.grid.cellsOfKind(TileKind::Floor);
    rng.shuffle(candidates);

    for (const Vec2i& c : candidates) {
        if (static_cast<int>(r.hazards.size()) >= p.hazardCount) break;
        if (manhattan(c, r.start) < 2) continue;
        if (contains(r.guardSpawns, c)) continue;
        r.grid.setTile(c, HazardTile{true});
        r.hazards.push_back(c);
    }
}

void placeSlowTerrain(GenResult& r, const GenParams& p, RNG& rng) {
    if (p.slowTerrainChance <= 0.0f) return;

    for (const Vec2i& c : r.grid.cellsOfKind(TileKind::Floor)) {
        if (c == r.start) continue;
        if (contains(r.guardSpawns, c)) continue;
        if (rng.chance(p.slowTerrainChance)) {
            r.grid.setTile(c, SlowTile{p.slowTerrainCost});
        }
    }
}

} // namespace

bool validateGenParams(const GenParams& p, std::string* reason) {
    if (p.width < GEN_MIN_WIDTH || p.height < GEN_MIN_HEIGHT) {
        std::ostringstream ss;
        ss << "grid " << p.width << "x" << p.height << " is smaller than the minimum "
           << GEN_MIN_WIDTH << "x" << GEN_MIN_HEIGHT;
        setReason(reason, ss.str());
        return false;
    }
    if (!inUnitRange(p.wallDensity)) {
        setReason(reason, "wall density must be within [0,1]");
        return false;
    }
    if (!inUnitRange(p.doorChance)) {
        setReason(reason, "door chance must be within [0,1]");
        return false;
    }
    if (!inUnitRange(p.slowTerrainChance)) {
        setReason(reason, "slow terrain chance must be within [0,1]");
        return false;
    }
    if (p.guardCount < 0 || p.hazardCount < 0 || p.maxDoors < 0) {
        setReason(reason, "guard, hazard and door counts must not be negative");
        return false;
    }
    if (p.guardMinDistance < 1) {
        setReason(reason, "guards must spawn at least one step from the start");
        return false;
    }
    if (p.keyMinDistance < 0) {
        setReason(reason, "keycard distance must not be negative");
        return false;
    }
    if (p.slowTerrainCost < 1) {
        setReason(reason, "slow terrain cost must be at least 1");
        return false;
    }
    if (p.maxAttempts < 1) {
        setReason(reason, "attempt cap must be at least 1");
        return false;
    }
    return true;
}

bool validateFloorLayout(const GenResult& r, std::string* reason) {
    const Grid& g = r.grid;
    if (!g.inBounds(r.start) || !g.inBounds(r.objective) || !g.inBounds(r.exit)) {
        setReason(reason, "start, objective or exit lies outside the grid");
        return false;
    }
    if (!connected(g, r.start, r.objective, false)) {
        setReason(reason, "objective unreachable from start");
        return false;
    }
    if (!connected(g, r.objective, r.exit, false)) {
        setReason(reason, "exit unreachable from objective");
        return false;
    }

    if (g.countKind(TileKind::Door) == 0) return true;

    const std::vector<Vec2i> keys = g.cellsOfKind(TileKind::Pickup);
    bool anyKey = false;
    for (const Vec2i& k : keys) {
        if (g.pickupAt(k) != PickupKind::Keycard) continue;
        anyKey = true;
        if (connected(g, r.start, k, true)) return true;
    }

    setReason(reason, anyKey ? "every keycard sits behind a door" : "doors placed without a keycard");
    return false;
}

bool generateFloor(const GenParams& p, RNG& rng, GenResult& out, GenFailure* fail) {
    std::string why;
    if (!validateGenParams(p, &why)) {
        if (fail) {
            fail->kind = GenFailureKind::InvalidConfig;
            fail->reason = why;
            fail->attempts = 0;
        }
        return false;
    }

    std::string lastReject = "no attempt made";
    for (int attempt = 1; attempt <= p.maxAttempts; ++attempt) {
        GenResult r;
        carve(r.grid, p, rng);

        std::vector<Vec2i> floors = r.grid.cellsOfKind(TileKind::Floor);
        if (floors.size() < 3) {
            lastReject = "fewer than three floor cells";
            continue;
        }
        rng.shuffle(floors);
        r.start = floors[0];
        r.objective = floors[1];
        r.exit = floors[2];

        if (!connected(r.grid, r.start, r.objective, false) || !connected(r.grid, r.objective, r.exit, false)) {
            lastReject = "start, objective and exit are not connected";
            continue;
        }

        r.grid.setTile(r.objective, PickupTile{PickupKind::Objective});
        r.grid.setTile(r.exit, ExitTile{});

        placeDoors(r, p, rng);

        if (!placeGuards(r, p, rng)) {
            lastReject = "not enough spaced floor cells for guards";
            continue;
        }

        placeKey(r, p, rng);
        placeHazards(r, p, rng);
        placeSlowTerrain(r, p, rng);

        if (!validateFloorLayout(r, &why)) {
            lastReject = why;
            continue;
        }

        r.attempts = attempt;
        out = std::move(r);
        return true;
    }

    if (fail) {
        std::ostringstream ss;
        ss << "no valid floor after " << p.maxAttempts << " attempts (last rejection: " << lastReject << ")";
        fail->kind = GenFailureKind::Exhausted;
        fail->reason = ss.str();
        fail->attempts = p.maxAttempts;
    }
    return false;
}
