#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "sim/GridModel.h"
#include "sim/MazeLayout.h"
#include "sim_test_helpers.h"

using namespace pacduo;
using namespace pacduo::sim;

TEST_CASE("toGrid inverts toWorld for every cell", "[grid]") {
    for (float cellSize : {1.0f, 0.5f, 32.0f}) {
        GridModel grid = MazeLayout::builtIn().toGrid(cellSize);
        for (int y = 0; y < grid.height(); ++y) {
            for (int x = 0; x < grid.width(); ++x) {
                REQUIRE(grid.toGrid(grid.toWorld({x, y})) == GridCell{x, y});
            }
        }
    }
}

TEST_CASE("Grid center maps near the world origin", "[grid]") {
    GridModel grid = testing::openGrid(5, 3);
    Vector2 center = grid.toWorld({2, 1});
    REQUIRE(center.x == Catch::Approx(0.0f));
    REQUIRE(center.y == Catch::Approx(0.0f));
    // +y is up
    REQUIRE(grid.toWorld({2, 2}).y > center.y);
}

TEST_CASE("Out of bounds cells are never walkable", "[grid]") {
    GridModel grid = testing::openGrid(4, 4);
    for (GridCell c : {GridCell{-1, 0}, GridCell{0, -1}, GridCell{4, 0}, GridCell{0, 4}, GridCell{100, -100}}) {
        REQUIRE_FALSE(grid.isWalkable(c));
        REQUIRE_FALSE(grid.isWalkable(c, Traversal::Player));
    }
    REQUIRE(grid.isWalkable({0, 0}));
    REQUIRE(grid.isWalkable({3, 3}));
}

TEST_CASE("Neighbors follow up, down, left, right order", "[grid]") {
    GridModel grid = testing::openGrid(3, 3);
    auto n = grid.walkableNeighbors({1, 1});
    REQUIRE(n == std::vector<GridCell>{{1, 2}, {1, 0}, {0, 1}, {2, 1}});

    auto corner = grid.walkableNeighbors({0, 0});
    REQUIRE(corner == std::vector<GridCell>{{0, 1}, {1, 0}});
}

TEST_CASE("Gates are open to pursuers only", "[grid]") {
    GridModel grid = testing::gridFromRows({
        "#.#",
        "#-#",
        "#.#",
    });
    const GridCell gate{1, 1};
    REQUIRE(grid.isGate(gate));
    REQUIRE(grid.isWalkable(gate));
    REQUIRE_FALSE(grid.isWalkable(gate, Traversal::Player));
    REQUIRE(grid.walkableNeighbors({1, 0}, Traversal::Pursuer).size() == 1);
    REQUIRE(grid.walkableNeighbors({1, 0}, Traversal::Player).empty());
    REQUIRE(grid.walkableCount(Traversal::Pursuer) == 3);
    REQUIRE(grid.walkableCount(Traversal::Player) == 2);
}

TEST_CASE("Boolean walkability tables build a grid", "[grid]") {
    GridModel grid = GridModel::fromWalkability({
        {true, false, true},
        {true, true},
    });
    REQUIRE(grid.width() == 3);
    REQUIRE(grid.height() == 2);
    REQUIRE(grid.isWalkable({0, 0}));
    REQUIRE_FALSE(grid.isWalkable({1, 0}));
    REQUIRE(grid.isWalkable({1, 1}));
    // Short rows are padded with walls
    REQUIRE_FALSE(grid.isWalkable({2, 1}));
}

TEST_CASE("Mismatched cell tables are padded, not trusted", "[grid]") {
    GridModel grid(3, 3, {CellKind::Open, CellKind::Open});
    REQUIRE(grid.isWalkable({1, 0}));
    REQUIRE_FALSE(grid.isWalkable({2, 2}));
    REQUIRE(grid.walkableCount() == 2);
}
