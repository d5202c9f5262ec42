#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "services/configuration/ConfigurationManager.h"
#include "services/configuration/paths.h"
#include "services/persistence/HighScoreStore.h"
#include "sim/GameSettings.h"
#include "sim/MatchWorld.h"
#include "sim/MazeLayout.h"
#include <filesystem>
#include <fstream>
#include <cstdlib>

using namespace pacduo;
using namespace pacduo::sim;

static void set_env(const char* k, const char* v) {
#if defined(_WIN32)
    _putenv_s(k, v);
#else
    if (v == nullptr || v[0] == '\0') {
        unsetenv(k);
    } else {
        setenv(k, v, 1);
    }
#endif
}

// Small two-loop maze plus a config pointing at it.
static std::filesystem::path prepare_config_dir(const char* sub) {
    namespace fs = std::filesystem;
    auto base = fs::temp_directory_path() / fs::path(sub);
    std::error_code ec;
    fs::remove_all(base, ec);
    fs::create_directories(base, ec);
    set_env("PACDUO_CONFIG_DIR", base.string().c_str());

    auto mazePath = base / "loop.txt";
    {
        std::ofstream maze(mazePath);
        maze << "#########\n"
                "#.......#\n"
                "#.#####.#\n"
                "#.......#\n"
                "#########\n";
    }

    std::string mazeJson = mazePath.generic_string();
    std::ofstream cfg(base / "config.json");
    cfg << R"({
  "version": 1,
  "maze": { "path": ")" << mazeJson << R"(" },
  "spawn": { "player1": "1,1", "player2": "7,1", "pursuers": ["7,3"] },
  "pursuer": { "home_min_x": 50, "home_max_x": 50, "home_min_y": 50, "home_max_y": 50, "home_exit": "4,3" },
  "match": { "starting_lives": 2, "random_seed": 7 },
  "pellets": {
    "regular_per_player": 2, "min_spawn_x": 1, "max_spawn_x": 7,
    "exclusion_radius": -1, "power_corners": ["1,3"], "corner_search_radius": 1
  },
  "tunnels": { "pairs": [] },
  "persistence": { "high_score_file": "scores.json" }
})";
    return base;
}

TEST_CASE("Configuration file drives world construction", "[integration][config][world]") {
    auto base = prepare_config_dir("pacduo_config_to_world");
    REQUIRE(ConfigurationManager::load());

    GameSettings settings = GameSettings::fromConfiguration();
    REQUIRE(settings.playerSpawns[1] == GridCell{7, 1});
    REQUIRE(settings.pursuerSpawns.size() == 1);
    REQUIRE(settings.tunnels.pairs.empty());
    REQUIRE(settings.match.startingLives == 2);
    REQUIRE(settings.randomSeed == 7u);
    // Keys absent from the file keep their defaults
    REQUIRE(settings.match.swapCooldown == Catch::Approx(10.0f));

    GridModel grid = loadMazeOrBuiltIn(settings.mazePath).toGrid(settings.cellSize);
    REQUIRE(grid.width() == 9);
    REQUIRE(grid.height() == 5);

    persistence::JsonScoreStore store(paths::dataFilePath(settings.highScoreFile));
    REQUIRE(std::filesystem::path(store.path()).parent_path() == base);

    MatchWorld world(grid, settings, store);
    world.start();
    REQUIRE(world.pursuerCount() == 1);
    REQUIRE(world.state().lives == 2);
    REQUIRE(world.state().totalPellets == 6);
    REQUIRE(world.pellets().countLive(PelletKind::Power) == 2);

    world.orchestrator().onPelletCollected(PlayerSlot::One, PelletKind::Regular);
    REQUIRE(std::filesystem::exists(base / "scores.json"));

    persistence::JsonScoreStore reread(store.path());
    REQUIRE(reread.readHighScore() == 10);

    MatchWorld next(grid, settings, reread);
    next.start();
    REQUIRE(next.state().highScore == 10);

    for (int i = 0; i < 120; ++i) next.step(1.0f / 60.0f, PlayerInputs{});
    REQUIRE(grid.isWalkable(next.pursuer(0).motion().currentCell()));
}

TEST_CASE("Environment overrides reach the match rules", "[integration][config]") {
    prepare_config_dir("pacduo_config_to_world_env");
    set_env("PACDUO_MATCH__STARTING_LIVES", "4");
    set_env("PACDUO_MATCH__SWAP_COOLDOWN", "2.5");
    REQUIRE(ConfigurationManager::load());

    GameSettings settings = GameSettings::fromConfiguration();
    REQUIRE(settings.match.startingLives == 4);
    REQUIRE(settings.match.maxLives == 5);
    REQUIRE(settings.match.swapCooldown == Catch::Approx(2.5f));

    GridModel grid = loadMazeOrBuiltIn(settings.mazePath).toGrid(settings.cellSize);
    persistence::MemoryScoreStore store;
    MatchWorld world(grid, settings, store);
    world.start();
    REQUIRE(world.state().lives == 4);
}

TEST_CASE("An unreadable maze path falls back to the built-in maze", "[integration][config]") {
    auto base = prepare_config_dir("pacduo_config_to_world_fallback");
    std::filesystem::remove(base / "loop.txt");
    REQUIRE(ConfigurationManager::load());

    GameSettings settings = GameSettings::fromConfiguration();
    GridModel grid = loadMazeOrBuiltIn(settings.mazePath).toGrid(settings.cellSize);
    REQUIRE(grid.width() == 32);
    REQUIRE(grid.height() == 31);
}
