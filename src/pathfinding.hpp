#pragma once

#include "common.hpp"

#include <functional>
#include <vector>

// 4-way grid search helpers.
//
// The callbacks are intentionally minimal so the same search serves guard
// pursuit (walkable tiles), level validation (walls only, or walls + doors)
// and the cost-weighted variant used for slow terrain.
//
// Conventions:
//   - passable(x,y) returns true if the tile can be entered.
//   - stepCost(x,y) is the cost to ENTER tile (x,y). Return <=0 to treat the
//     tile as blocked.
//   - Neighbors are expanded in DIRS4 order (up, right, down, left); that
//     order is the only tie-break between equal-length paths.

using PassableFn = std::function<bool(int x, int y)>;
using StepCostFn = std::function<int(int x, int y)>;

// Breadth-first shortest path. Returns {start, ..., goal}; {start} when
// start == goal. Empty if either endpoint is out of bounds or not passable,
// or no path exists.
std::vector<Vec2i> bfsPath(
    int width,
    int height,
    Vec2i start,
    Vec2i goal,
    const PassableFn& passable);

// Same contract as bfsPath, minimizing the summed stepCost instead of the
// number of steps.
std::vector<Vec2i> dijkstraPath(
    int width,
    int height,
    Vec2i start,
    Vec2i goal,
    const PassableFn& passable,
    const StepCostFn& stepCost);
