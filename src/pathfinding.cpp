#include "pathfinding.hpp"

#include <algorithm>
#include <cstdint>
#include <deque>
#include <limits>
#include <queue>

namespace {

inline bool inBounds(int w, int h, int x, int y) {
    return x >= 0 && y >= 0 && x < w && y < h;
}

inline int idxOf(int w, int x, int y) {
    return y * w + x;
}

using Node = std::pair<int, int>; // (cost, idx)

bool endpointsOk(int width, int height, Vec2i start, Vec2i goal, const PassableFn& passable) {
    if (width <= 0 || height <= 0) return false;
    if (!inBounds(width, height, start.x, start.y)) return false;
    if (!inBounds(width, height, goal.x, goal.y)) return false;
    if (!passable(start.x, start.y)) return false;
    if (!passable(goal.x, goal.y)) return false;
    return true;
}

std::vector<Vec2i> reconstruct(int width, const std::vector<int>& prev, int startI, int goalI) {
    std::vector<Vec2i> path;
    int cur = goalI;
    while (cur != -1) {
        path.push_back({cur % width, cur / width});
        if (cur == startI) break;
        cur = prev[static_cast<size_t>(cur)];
    }
    if (path.empty() || idxOf(width, path.back().x, path.back().y) != startI) return {};
    std::reverse(path.begin(), path.end());
    return path;
}

} // namespace

std::vector<Vec2i> bfsPath(
    int width,
    int height,
    Vec2i start,
    Vec2i goal,
    const PassableFn& passable)
{
    if (!endpointsOk(width, height, start, goal, passable)) return {};
    if (start == goal) return {start};

    const int startI = idxOf(width, start.x, start.y);
    const int goalI = idxOf(width, goal.x, goal.y);

    std::vector<int> prev(static_cast<size_t>(width * height), -1);
    std::vector<uint8_t> seen(static_cast<size_t>(width * height), 0);
    seen[static_cast<size_t>(startI)] = 1;

    std::deque<int> q;
    q.push_back(startI);

    bool found = false;
    while (!q.empty() && !found) {
        const int i = q.front();
        q.pop_front();

        const int x = i % width;
        const int y = i / width;

        for (const auto& dv : DIRS4) {
            const int nx = x + dv[0];
            const int ny = y + dv[1];
            if (!inBounds(width, height, nx, ny)) continue;
            const int ni = idxOf(width, nx, ny);
            if (seen[static_cast<size_t>(ni)]) continue;
            if (!passable(nx, ny)) continue;

            seen[static_cast<size_t>(ni)] = 1;
            prev[static_cast<size_t>(ni)] = i;
            if (ni == goalI) {
                found = true;
                break;
            }
            q.push_back(ni);
        }
    }

    if (!found) return {};
    return reconstruct(width, prev, startI, goalI);
}

std::vector<Vec2i> dijkstraPath(
    int width,
    int height,
    Vec2i start,
    Vec2i goal,
    const PassableFn& passable,
    const StepCostFn& stepCost)
{
    if (!endpointsOk(width, height, start, goal, passable)) return {};
    if (start == goal) return {start};

    const int startI = idxOf(width, start.x, start.y);
    const int goalI = idxOf(width, goal.x, goal.y);

    const int INF = std::numeric_limits<int>::max() / 4;
    std::vector<int> dist(static_cast<size_t>(width * height), INF);
    std::vector<int> prev(static_cast<size_t>(width * height), -1);

    std::priority_queue<Node, std::vector<Node>, std::greater<Node>> pq;

    dist[static_cast<size_t>(startI)] = 0;
    pq.push({0, startI});

    while (!pq.empty()) {
        const Node cur = pq.top();
        pq.pop();

        const int costHere = cur.first;
        const int i = cur.second;
        if (i == goalI) break;
        if (costHere != dist[static_cast<size_t>(i)]) continue;

        const int x = i % width;
        const int y = i / width;

        for (const auto& dv : DIRS4) {
            const int nx = x + dv[0];
            const int ny = y + dv[1];
            if (!inBounds(width, height, nx, ny)) continue;
            if (!passable(nx, ny)) continue;

            const int step = stepCost(nx, ny);
            if (step <= 0) continue;

            const int ni = idxOf(width, nx, ny);
            const int ncost = costHere + step;
            if (ncost < dist[static_cast<size_t>(ni)]) {
                dist[static_cast<size_t>(ni)] = ncost;
                prev[static_cast<size_t>(ni)] = i;
                pq.push({ncost, ni});
            }
        }
    }

    if (dist[static_cast<size_t>(goalI)] == INF) return {};
    return reconstruct(width, prev, startI, goalI);
}
