#include <catch2/catch_test_macros.hpp>
#include "services/configuration/ConfigurationManager.h"
#include "services/input/KeyBindings.h"

using namespace pacduo::input;
using pacduo::ConfigurationManager;

TEST_CASE("Key names parse to raylib codes", "[input]") {
    REQUIRE(parseKeyName("W") == KEY_W);
    REQUIRE(parseKeyName(" w ") == KEY_W);
    REQUIRE(parseKeyName("Up") == KEY_UP);
    REQUIRE(parseKeyName("arrowLeft") == KEY_LEFT);
    REQUIRE(parseKeyName("Slash") == KEY_SLASH);
    REQUIRE(parseKeyName("/") == KEY_SLASH);
    REQUIRE(parseKeyName("7") == KEY_SEVEN);
    REQUIRE(parseKeyName("F5") == KEY_F5);
    REQUIRE(parseKeyName("Numpad8") == KEY_KP_8);
    REQUIRE_FALSE(parseKeyName("").has_value());
    REQUIRE_FALSE(parseKeyName("F13").has_value());
    REQUIRE_FALSE(parseKeyName("hyperspace").has_value());
}

TEST_CASE("Display names are canonical", "[input]") {
    REQUIRE(keyDisplayName(KEY_W) == "W");
    REQUIRE(keyDisplayName(KEY_UP) == "Up");
    REQUIRE(keyDisplayName(KEY_SLASH) == "/");
    REQUIRE(keyDisplayName(KEY_F12) == "F12");
}

TEST_CASE("Bindings come from configuration with per-action fallback", "[input]") {
    ConfigurationManager::loadOrDefault();
    KeyBindings p1 = KeyBindings::fromConfiguration(1);
    REQUIRE(p1.up == KEY_W);
    REQUIRE(p1.swap == KEY_E);
    KeyBindings p2 = KeyBindings::fromConfiguration(2);
    REQUIRE(p2.left == KEY_LEFT);
    REQUIRE(p2.swap == KEY_SLASH);

    ConfigurationManager::set("input.player1.up", std::string("I"));
    ConfigurationManager::set("input.player1.swap", std::string("warp"));
    p1 = KeyBindings::fromConfiguration(1);
    REQUIRE(p1.up == KEY_I);
    REQUIRE(p1.swap == KEY_E);
}
