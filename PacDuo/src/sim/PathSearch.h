#pragma once
#include "pacduo/grid_cell.h"
#include "sim/GridModel.h"
#include <optional>
#include <vector>

namespace pacduo::sim {

// A cell closer than this to the goal counts as arrived (adjacent or diagonal).
inline constexpr float kArrivalDistance = 1.5f;

struct PathResult {
    std::vector<GridCell> path{};  // excludes start; consecutive cells are adjacent
    bool reachedGoal{false};
    int iterations{0};
};

// Breadth-first search from start toward goal, expanding at most maxIterations
// cells. Starting within kArrivalDistance yields an empty path with
// reachedGoal set. Budget exhaustion yields an empty path with reachedGoal false.
PathResult findPath(const GridModel& grid, GridCell start, GridCell goal, int maxIterations,
                    Traversal traversal = Traversal::Pursuer);

// Walkable neighbor closest to goal (first in Up/Down/Left/Right order on ties).
std::optional<GridCell> greedyStepToward(const GridModel& grid, GridCell from, GridCell goal,
                                         Traversal traversal = Traversal::Pursuer);

// Walkable neighbor farthest from threat (first in Up/Down/Left/Right order on ties).
std::optional<GridCell> fleeStepFrom(const GridModel& grid, GridCell from, GridCell threat,
                                     Traversal traversal = Traversal::Pursuer);

} // namespace pacduo::sim
