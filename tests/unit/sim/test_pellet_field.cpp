#include <catch2/catch_test_macros.hpp>
#include "sim/PelletField.h"
#include "sim_test_helpers.h"
#include <algorithm>
#include <cstdlib>
#include <set>
#include <utility>

using namespace pacduo;
using namespace pacduo::sim;

TEST_CASE("Built-in maze gets 122 regular pellets per player and 8 power pellets", "[pellets]") {
    GridModel grid = MazeLayout::builtIn().toGrid(1.0f);
    RaylibRandomSource rng(7);
    PelletField field(grid, PelletSettings{}, rng);

    REQUIRE(field.candidateCells().size() == 274);

    field.spawnPellets();
    REQUIRE(field.countLive(PelletKind::Regular) == 244);
    REQUIRE(field.countLive(PelletKind::Power) == 8);

    std::set<std::pair<int, int>> regularCells;
    for (const Pellet& p : field.pellets()) {
        REQUIRE(grid.isWalkable(p.cell, Traversal::Player));
        if (p.kind == PelletKind::Power) continue;
        REQUIRE(p.cell.x >= 2);
        REQUIRE(p.cell.x <= 29);
        REQUIRE_FALSE((std::abs(p.cell.x - 16) <= 4 && std::abs(p.cell.y - 16) <= 4));
        REQUIRE(regularCells.insert({p.cell.x, p.cell.y}).second);
    }

    for (GridCell corner : PelletSettings{}.powerCorners) {
        int owners = 0;
        for (const Pellet& p : field.pellets()) {
            if (p.cell == corner) {
                REQUIRE(p.kind == PelletKind::Power);
                ++owners;
            }
        }
        REQUIRE(owners == 2);
    }
}

TEST_CASE("Each player only collects their own pellets", "[pellets]") {
    GridModel grid = testing::openGrid(3, 3);
    testing::ScriptedRandom rng;
    PelletSettings settings;
    settings.regularPerPlayer = 1;
    settings.minSpawnX = 0;
    settings.maxSpawnX = 2;
    settings.powerCorners = {{2, 2}};
    PelletField field(grid, settings, rng);
    field.spawnPellets();

    const GridCell corner{2, 2};
    auto mine = field.collectAt(corner, PlayerSlot::One);
    REQUIRE(mine.has_value());
    REQUIRE(mine->owner == PlayerSlot::One);
    REQUIRE(mine->kind == PelletKind::Power);
    REQUIRE_FALSE(field.collectAt(corner, PlayerSlot::One).has_value());

    REQUIRE(field.collectAt(corner, PlayerSlot::Two).has_value());
    REQUIRE_FALSE(field.collectAt(corner, PlayerSlot::Two).has_value());

    REQUIRE(field.countLive(PelletKind::Regular) == 2);
    field.clearPellets();
    REQUIRE(field.pellets().empty());
}

TEST_CASE("A blocked power corner falls back to the nearest open cell", "[pellets]") {
    GridModel grid = testing::gridFromRows({
        "...",
        "...",
        "#..",
    });
    testing::ScriptedRandom rng;
    PelletSettings settings;
    settings.regularPerPlayer = 0;
    settings.powerCorners = {{0, 0}};
    PelletField field(grid, settings, rng);

    REQUIRE(field.nearestWalkable({0, 0}, 5) == GridCell{1, 0});
    field.spawnPellets();
    REQUIRE(field.countLive(PelletKind::Power) == 2);
    for (const Pellet& p : field.pellets()) {
        REQUIRE(p.cell == GridCell{1, 0});
    }
}

TEST_CASE("A corner with nothing open nearby is skipped", "[pellets]") {
    GridModel grid = testing::gridFromRows({
        "#####",
        "#####",
        "#####",
        "####.",
    });
    testing::ScriptedRandom rng;
    PelletSettings settings;
    settings.regularPerPlayer = 0;
    settings.powerCorners = {{0, 3}};
    settings.cornerSearchRadius = 2;
    PelletField field(grid, settings, rng);

    field.spawnPellets();
    REQUIRE(field.countLive(PelletKind::Power) == 0);
}

TEST_CASE("Too few cells places what fits", "[pellets]") {
    GridModel grid = testing::openGrid(3, 3);
    testing::ScriptedRandom rng;
    PelletSettings settings;
    settings.regularPerPlayer = 10;
    settings.minSpawnX = 0;
    settings.maxSpawnX = 2;
    settings.powerCorners.clear();
    PelletField field(grid, settings, rng);

    field.spawnPellets();
    REQUIRE(field.countLive(PelletKind::Regular) == 9);
    REQUIRE(field.countLive(PelletKind::Power) == 0);
}

TEST_CASE("Pellets avoid gates and the exclusion square", "[pellets]") {
    GridModel grid = testing::gridFromRows({
        ".....",
        "..-..",
        ".....",
    });
    testing::ScriptedRandom rng;
    PelletSettings settings;
    settings.minSpawnX = 0;
    settings.maxSpawnX = 4;
    settings.exclusionCenter = {0, 0};
    settings.exclusionRadius = 1;
    PelletField field(grid, settings, rng);

    auto cells = field.candidateCells();
    REQUIRE(cells.size() == 10);
    REQUIRE(std::find(cells.begin(), cells.end(), GridCell{2, 1}) == cells.end());
    REQUIRE(std::find(cells.begin(), cells.end(), GridCell{1, 1}) == cells.end());
    REQUIRE(std::find(cells.begin(), cells.end(), GridCell{2, 0}) != cells.end());
}
