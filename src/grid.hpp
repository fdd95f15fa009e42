#pragma once
#include "common.hpp"
#include "rng.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

enum class TileKind : uint8_t {
    Floor = 0,
    Wall,
    Door,
    Exit,
    Hazard,
    SlowTerrain,
    Pickup,
};

enum class PickupKind : uint8_t {
    Keycard = 0,
    Objective,
};

constexpr int PICKUP_KIND_COUNT = 2;

inline const char* tileKindName(TileKind k) {
    switch (k) {
        case TileKind::Floor:       return "FLOOR";
        case TileKind::Wall:        return "WALL";
        case TileKind::Door:        return "DOOR";
        case TileKind::Exit:        return "EXIT";
        case TileKind::Hazard:      return "HAZARD";
        case TileKind::SlowTerrain: return "SLOW TERRAIN";
        case TileKind::Pickup:      return "PICKUP";
    }
    return "FLOOR";
}

inline const char* pickupKindName(PickupKind k) {
    switch (k) {
        case PickupKind::Keycard:   return "KEYCARD";
        case PickupKind::Objective: return "DATA SHARD";
    }
    return "KEYCARD";
}

// Per-kind tile payloads. Only the attributes that matter for a kind live on it.
struct FloorTile {};
struct WallTile {};
struct DoorTile { bool open = false; };
struct ExitTile {};
struct HazardTile { bool armed = true; };
struct SlowTile { int cost = 2; };
struct PickupTile { PickupKind item = PickupKind::Keycard; };

// Alternative order must match TileKind.
using Tile = std::variant<FloorTile, WallTile, DoorTile, ExitTile, HazardTile, SlowTile, PickupTile>;

inline TileKind tileKind(const Tile& t) {
    return static_cast<TileKind>(t.index());
}

class Grid {
public:
    int width = 0;
    int height = 0;
    std::vector<Tile> tiles;

    Grid() = default;
    // Every cell starts as floor.
    Grid(int w, int h);

    bool inBounds(Vec2i p) const {
        return p.x >= 0 && p.y >= 0 && p.x < width && p.y < height;
    }

    // Out-of-bounds cells read as wall.
    const Tile& tile(Vec2i p) const;
    TileKind kindAt(Vec2i p) const { return tileKind(tile(p)); }

    // Returns false (and leaves the grid untouched) for out-of-bounds writes.
    // `warn` receives a description of the ignored write.
    bool setTile(Vec2i p, const Tile& t, std::string* warn = nullptr);
    void fill(const Tile& t);

    // Pure function of tile kind plus door state; never of occupancy.
    bool isWalkable(Vec2i p) const;
    bool blocksSight(Vec2i p) const;

    // Activations an agent spends to enter `p` (1 for ordinary tiles).
    // 0 when `p` is not walkable.
    int moveCost(Vec2i p) const;

    // Up/right/down/left, bounds-filtered.
    std::vector<Vec2i> neighbors4(Vec2i p) const;

    // Row/column sight only: true if a == b, or a and b share a row or a
    // column and no tile strictly between them blocks sight.
    bool lineOfSight(Vec2i a, Vec2i b) const;

    bool isDoorClosed(Vec2i p) const;
    bool isDoorOpen(Vec2i p) const;
    bool openDoor(Vec2i p);
    bool closeDoor(Vec2i p);

    bool isHazardArmed(Vec2i p) const;
    // Idempotent: returns true only on the armed -> disarmed transition.
    bool disarmHazard(Vec2i p);

    std::optional<PickupKind> pickupAt(Vec2i p) const;
    // Reverts a pickup tile to floor. Returns the removed item, if any.
    std::optional<PickupKind> takePickup(Vec2i p);

    int countKind(TileKind k) const;
    std::vector<Vec2i> cellsOfKind(TileKind k) const;

    void hashInto(Hash64& h) const;

private:
    size_t idx(Vec2i p) const { return static_cast<size_t>(p.y * width + p.x); }
};
