#include "sim/PathSearch.h"
#include <algorithm>
#include <deque>
#include <unordered_map>

namespace pacduo::sim {

PathResult findPath(const GridModel& grid, GridCell start, GridCell goal, int maxIterations,
                    Traversal traversal) {
    PathResult result;
    if (cellDistance(start, goal) < kArrivalDistance) {
        result.reachedGoal = true;
        return result;
    }

    std::deque<GridCell> frontier;
    std::unordered_map<GridCell, GridCell, GridCellHash> cameFrom;
    frontier.push_back(start);
    cameFrom.emplace(start, start);

    while (!frontier.empty() && result.iterations < maxIterations) {
        GridCell cell = frontier.front();
        frontier.pop_front();
        ++result.iterations;

        if (cellDistance(cell, goal) < kArrivalDistance) {
            for (GridCell at = cell; !(at == start); at = cameFrom[at]) {
                result.path.push_back(at);
            }
            std::reverse(result.path.begin(), result.path.end());
            result.reachedGoal = true;
            return result;
        }

        for (const GridCell& next : grid.walkableNeighbors(cell, traversal)) {
            if (cameFrom.emplace(next, cell).second) {
                frontier.push_back(next);
            }
        }
    }
    return result;
}

std::optional<GridCell> greedyStepToward(const GridModel& grid, GridCell from, GridCell goal,
                                         Traversal traversal) {
    std::optional<GridCell> best;
    float bestDistance = 0.0f;
    for (const GridCell& next : grid.walkableNeighbors(from, traversal)) {
        float d = cellDistance(next, goal);
        if (!best || d < bestDistance) {
            best = next;
            bestDistance = d;
        }
    }
    return best;
}

std::optional<GridCell> fleeStepFrom(const GridModel& grid, GridCell from, GridCell threat,
                                     Traversal traversal) {
    std::optional<GridCell> best;
    float bestDistance = 0.0f;
    for (const GridCell& next : grid.walkableNeighbors(from, traversal)) {
        float d = cellDistance(next, threat);
        if (!best || d > bestDistance) {
            best = next;
            bestDistance = d;
        }
    }
    return best;
}

} // namespace pacduo::sim
