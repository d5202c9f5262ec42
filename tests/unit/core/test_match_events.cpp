#include <catch2/catch_test_macros.hpp>
#include "pacduo/match_events.h"
#include <string>

using namespace pacduo;

TEST_CASE("Match event names", "[core]") {
    REQUIRE(std::string(to_string(MatchEventType::LevelStarted)) == "LevelStarted");
    REQUIRE(std::string(to_string(MatchEventType::SwapExecuted)) == "SwapExecuted");
    REQUIRE(std::string(to_string(MatchEventType::GameOver)) == "GameOver");
    REQUIRE(std::string(to_string(MatchEventType::MatchRestarted)) == "MatchRestarted");
}
