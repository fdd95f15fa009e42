#include "grid.hpp"

#include <algorithm>

Grid::Grid(int w, int h) : width(std::max(0, w)), height(std::max(0, h)) {
    tiles.assign(static_cast<size_t>(width * height), Tile{FloorTile{}});
}

const Tile& Grid::tile(Vec2i p) const {
    static const Tile outside{WallTile{}};
    if (!inBounds(p)) return outside;
    return tiles[idx(p)];
}

bool Grid::setTile(Vec2i p, const Tile& t, std::string* warn) {
    if (!inBounds(p)) {
        if (warn) {
            *warn = std::string("IGNORED ") + tileKindName(tileKind(t)) + " WRITE OUTSIDE GRID AT " + posString(p);
        }
        return false;
    }
    tiles[idx(p)] = t;
    return true;
}

void Grid::fill(const Tile& t) {
    std::fill(tiles.begin(), tiles.end(), t);
}

bool Grid::isWalkable(Vec2i p) const {
    if (!inBounds(p)) return false;
    const Tile& t = tiles[idx(p)];
    switch (tileKind(t)) {
        case TileKind::Wall:
            return false;
        case TileKind::Door:
            return std::get<DoorTile>(t).open;
        default:
            return true;
    }
}

bool Grid::blocksSight(Vec2i p) const {
    if (!inBounds(p)) return true;
    const Tile& t = tiles[idx(p)];
    switch (tileKind(t)) {
        case TileKind::Wall:
            return true;
        case TileKind::Door:
            return !std::get<DoorTile>(t).open;
        default:
            return false;
    }
}

int Grid::moveCost(Vec2i p) const {
    if (!isWalkable(p)) return 0;
    if (const auto* s = std::get_if<SlowTile>(&tiles[idx(p)])) {
        return std::max(1, s->cost);
    }
    return 1;
}

std::vector<Vec2i> Grid::neighbors4(Vec2i p) const {
    std::vector<Vec2i> out;
    out.reserve(4);
    for (const auto& dv : DIRS4) {
        const Vec2i n{p.x + dv[0], p.y + dv[1]};
        if (inBounds(n)) out.push_back(n);
    }
    return out;
}

bool Grid::lineOfSight(Vec2i a, Vec2i b) const {
    if (!inBounds(a) || !inBounds(b)) return false;
    if (a == b) return true;

    // Diagonal / non-aligned pairs never see each other.
    if (a.x != b.x && a.y != b.y) return false;

    const Vec2i step{sign(b.x - a.x), sign(b.y - a.y)};
    for (Vec2i p = a + step; p != b; p = p + step) {
        if (blocksSight(p)) return false;
    }
    return true;
}

bool Grid::isDoorClosed(Vec2i p) const {
    if (!inBounds(p)) return false;
    const auto* d = std::get_if<DoorTile>(&tiles[idx(p)]);
    return d && !d->open;
}

bool Grid::isDoorOpen(Vec2i p) const {
    if (!inBounds(p)) return false;
    const auto* d = std::get_if<DoorTile>(&tiles[idx(p)]);
    return d && d->open;
}

bool Grid::openDoor(Vec2i p) {
    if (!isDoorClosed(p)) return false;
    std::get<DoorTile>(tiles[idx(p)]).open = true;
    return true;
}

bool Grid::closeDoor(Vec2i p) {
    if (!isDoorOpen(p)) return false;
    std::get<DoorTile>(tiles[idx(p)]).open = false;
    return true;
}

bool Grid::isHazardArmed(Vec2i p) const {
    if (!inBounds(p)) return false;
    const auto* h = std::get_if<HazardTile>(&tiles[idx(p)]);
    return h && h->armed;
}

bool Grid::disarmHazard(Vec2i p) {
    if (!isHazardArmed(p)) return false;
    std::get<HazardTile>(tiles[idx(p)]).armed = false;
    return true;
}

std::optional<PickupKind> Grid::pickupAt(Vec2i p) const {
    if (!inBounds(p)) return std::nullopt;
    if (const auto* pk = std::get_if<PickupTile>(&tiles[idx(p)])) return pk->item;
    return std::nullopt;
}

std::optional<PickupKind> Grid::takePickup(Vec2i p) {
    const auto item = pickupAt(p);
    if (item) tiles[idx(p)] = FloorTile{};
    return item;
}

int Grid::countKind(TileKind k) const {
    int n = 0;
    for (const auto& t : tiles) {
        if (tileKind(t) == k) ++n;
    }
    return n;
}

std::vector<Vec2i> Grid::cellsOfKind(TileKind k) const {
    std::vector<Vec2i> out;
    for (int y = 0; y < height; ++y) {
        for (int x = 0; x < width; ++x) {
            if (tileKind(tiles[idx({x, y})]) == k) out.push_back({x, y});
        }
    }
    return out;
}

void Grid::hashInto(Hash64& h) const {
    h.addI32(width);
    h.addI32(height);
    for (const auto& t : tiles) {
        h.addByte(static_cast<uint8_t>(t.index()));
        switch (tileKind(t)) {
            case TileKind::Door:        h.addByte(std::get<DoorTile>(t).open ? 1 : 0); break;
            case TileKind::Hazard:      h.addByte(std::get<HazardTile>(t).armed ? 1 : 0); break;
            case TileKind::SlowTerrain: h.addI32(std::get<SlowTile>(t).cost); break;
            case TileKind::Pickup:      h.addByte(static_cast<uint8_t>(std::get<PickupTile>(t).item)); break;
            default: break;
        }
    }
}
