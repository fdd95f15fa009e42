#pragma once
#include <cstdint>
#include <cstdlib>
#include <string>

struct Vec2i {
    int x = 0;
    int y = 0;
};

inline bool operator==(const Vec2i& a, const Vec2i& b) { return a.x == b.x && a.y == b.y; }
inline bool operator!=(const Vec2i& a, const Vec2i& b) { return !(a == b); }
inline Vec2i operator+(const Vec2i& a, const Vec2i& b) { return {a.x + b.x, a.y + b.y}; }
inline Vec2i operator-(const Vec2i& a, const Vec2i& b) { return {a.x - b.x, a.y - b.y}; }

// Cardinal directions in the fixed visitation order used everywhere
// (pathfinding tie-breaks, patrol sampling, interact scans).
constexpr int DIRS4[4][2] = {{0,-1},{1,0},{0,1},{-1,0}};

enum class Direction : uint8_t {
    Up = 0,
    Right,
    Down,
    Left,
};

inline Vec2i dirDelta(Direction d) {
    const auto& dv = DIRS4[static_cast<int>(d)];
    return {dv[0], dv[1]};
}

inline int manhattan(const Vec2i& a, const Vec2i& b) {
    return std::abs(a.x - b.x) + std::abs(a.y - b.y);
}

inline int sign(int v) {
    return (v > 0) - (v < 0);
}

inline std::string posString(const Vec2i& p) {
    return "(" + std::to_string(p.x) + "," + std::to_string(p.y) + ")";
}
