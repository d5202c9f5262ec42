#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "sim_test_helpers.h"

using namespace pacduo;
using namespace pacduo::sim;
using pacduo::testing::MatchFixture;

TEST_CASE("Starting a match spawns the first level", "[match]") {
    MatchFixture f;
    f.match.startMatch();

    const MatchState& s = f.match.state();
    REQUIRE(s.currentLevel == 1);
    REQUIRE(s.lives == 3);
    REQUIRE(s.totalPellets == 5);
    REQUIRE(s.pelletsCollected == 0);
    REQUIRE(f.spawner.spawnCalls == 1);
    REQUIRE(f.match.gameplayActive());
    REQUIRE(f.sink.events.front().type == MatchEventType::LevelStarted);
    REQUIRE(f.sink.events.front().value == 5);
}

TEST_CASE("Pellets score by kind", "[match]") {
    MatchFixture f;
    f.spawner.regularPerSpawn = 3;
    f.spawner.powerPerSpawn = 1;
    f.match.startMatch();

    f.match.onPelletCollected(PlayerSlot::One, PelletKind::Regular);
    f.match.onPelletCollected(PlayerSlot::Two, PelletKind::Power);
    REQUIRE(f.match.state().score(PlayerSlot::One) == 10);
    REQUIRE(f.match.state().score(PlayerSlot::Two) == 50);
    REQUIRE(f.match.state().combinedScore() == 60);
    REQUIRE(f.sink.count(MatchEventType::PelletCollected) == 1);
    REQUIRE(f.sink.count(MatchEventType::PowerPelletCollected) == 1);

    f.match.onPursuerEaten(PlayerSlot::Two, 0);
    REQUIRE(f.match.state().score(PlayerSlot::Two) == 250);
}

TEST_CASE("The power-up ends exactly once after its duration", "[match]") {
    MatchFixture f;
    f.spawner.powerPerSpawn = 1;
    f.match.startMatch();

    f.match.onPelletCollected(PlayerSlot::One, PelletKind::Power);
    REQUIRE(f.match.state().powerUpActive);
    REQUIRE(f.pursuer.scared());
    REQUIRE(f.sink.count(MatchEventType::PowerUpStarted) == 1);

    for (int i = 0; i < 99; ++i) f.match.tickTimers(0.1f);
    REQUIRE(f.match.state().powerUpActive);
    REQUIRE(f.sink.count(MatchEventType::PowerUpEnded) == 0);

    f.match.tickTimers(0.1f);
    f.match.tickTimers(0.1f);
    REQUIRE_FALSE(f.match.state().powerUpActive);
    REQUIRE_FALSE(f.pursuer.scared());
    REQUIRE(f.sink.count(MatchEventType::PowerUpEnded) == 1);

    f.match.tickTimers(0.1f);
    REQUIRE(f.sink.count(MatchEventType::PowerUpEnded) == 1);
}

TEST_CASE("A second power pellet restarts the power-up clock", "[match]") {
    MatchFixture f;
    f.spawner.powerPerSpawn = 2;
    f.match.startMatch();

    f.match.onPelletCollected(PlayerSlot::One, PelletKind::Power);
    f.match.tickTimers(6.0f);
    f.match.onPelletCollected(PlayerSlot::Two, PelletKind::Power);
    REQUIRE(f.match.state().powerUpRemaining == Catch::Approx(10.0f));
    f.match.tickTimers(6.0f);
    REQUIRE(f.match.state().powerUpActive);
}

TEST_CASE("Collecting the last pellet completes the level once", "[match]") {
    MatchFixture f;
    f.match.startMatch();

    f.collect(PlayerSlot::One, 4);
    REQUIRE(f.sink.count(MatchEventType::LevelComplete) == 0);
    f.collect(PlayerSlot::Two, 1);
    REQUIRE(f.sink.count(MatchEventType::LevelComplete) == 1);
    REQUIRE(f.match.state().transitioningLevel);
    REQUIRE_FALSE(f.match.gameplayActive());

    // Collections while the level is transitioning are ignored
    f.collect(PlayerSlot::Two, 1);
    REQUIRE(f.match.state().pelletsCollected == 5);
    REQUIRE(f.match.state().combinedScore() == 50);
    REQUIRE(f.sink.count(MatchEventType::LevelComplete) == 1);
}

TEST_CASE("The next level adds a life, speeds pursuers up and resets positions", "[match]") {
    MatchFixture f;
    f.spawner.powerPerSpawn = 1;
    f.match.startMatch();
    f.playerOne.teleport({4, 4});

    f.match.onPelletCollected(PlayerSlot::One, PelletKind::Power);
    f.collect(PlayerSlot::One, 5);
    REQUIRE(f.match.state().transitioningLevel);

    f.match.tickTimers(1.0f);
    REQUIRE(f.match.state().currentLevel == 1);
    f.match.tickTimers(1.0f);

    const MatchState& s = f.match.state();
    REQUIRE(s.currentLevel == 2);
    REQUIRE(s.lives == 4);
    REQUIRE_FALSE(s.transitioningLevel);
    REQUIRE_FALSE(s.powerUpActive);
    REQUIRE(s.pelletsCollected == 0);
    REQUIRE(s.totalPellets == 6);
    REQUIRE(f.spawner.spawnCalls == 2);
    REQUIRE(f.pursuer.chaseSpeed() == Catch::Approx(3.4f));
    REQUIRE_FALSE(f.pursuer.scared());
    REQUIRE(f.playerOne.currentCell() == GridCell{1, 1});
    REQUIRE(f.sink.events.back().type == MatchEventType::LevelStarted);
    REQUIRE(f.sink.events.back().level == 2);
}

TEST_CASE("Bonus lives stop at the cap", "[match]") {
    MatchRules rules;
    rules.startingLives = 5;
    rules.maxLives = 5;
    MatchFixture f{rules};
    f.spawner.regularPerSpawn = 1;
    f.match.startMatch();

    f.collect(PlayerSlot::One, 1);
    f.match.tickTimers(2.0f);
    REQUIRE(f.match.state().currentLevel == 2);
    REQUIRE(f.match.state().lives == 5);
}

TEST_CASE("Pursuer speed grows linearly with the level", "[match]") {
    MatchFixture f;
    REQUIRE(f.match.pursuerSpeedForLevel(1) == Catch::Approx(3.0f));
    REQUIRE(f.match.pursuerSpeedForLevel(3) == Catch::Approx(3.8f));
}

TEST_CASE("A level without pellets moves straight on", "[match]") {
    MatchFixture f;
    f.spawner.regularPerSpawn = 0;
    f.match.startMatch();

    REQUIRE(f.match.state().totalPellets == 0);
    REQUIRE(f.match.state().transitioningLevel);
    REQUIRE(f.sink.count(MatchEventType::LevelComplete) == 1);

    f.match.onPelletCollected(PlayerSlot::One, PelletKind::Regular);
    REQUIRE(f.match.state().combinedScore() == 0);

    f.spawner.regularPerSpawn = 2;
    f.match.tickTimers(2.0f);
    REQUIRE(f.match.state().currentLevel == 2);
    REQUIRE(f.match.state().totalPellets == 2);
    REQUIRE(f.match.gameplayActive());
}

TEST_CASE("The high score follows the combined score", "[match]") {
    MatchFixture f;
    f.store.writeHighScore(30);
    f.spawner.regularPerSpawn = 10;
    f.match.startMatch();
    REQUIRE(f.match.state().highScore == 30);

    f.collect(PlayerSlot::One, 2);
    f.collect(PlayerSlot::Two, 1);
    REQUIRE(f.store.writes() == 1);
    REQUIRE(f.sink.count(MatchEventType::HighScoreChanged) == 0);

    f.collect(PlayerSlot::Two, 1);
    REQUIRE(f.match.state().highScore == 40);
    REQUIRE(f.store.value() == 40);
    REQUIRE(f.sink.count(MatchEventType::HighScoreChanged) == 1);
}

TEST_CASE("Unsubscribed sinks hear nothing", "[match]") {
    MatchFixture f;
    testing::RecordingSink second;
    const auto id = f.match.subscribe(&second);
    REQUIRE(id != 0);
    REQUIRE(f.match.subscribe(nullptr) == 0);

    f.match.startMatch();
    const std::size_t seen = second.events.size();
    REQUIRE(seen > 0);

    f.match.unsubscribe(id);
    f.collect(PlayerSlot::One, 1);
    REQUIRE(second.events.size() == seen);
    REQUIRE(f.sink.count(MatchEventType::PelletCollected) == 1);
}
