#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "raylib.h"

namespace pacduo::input {

// Symbolic actions for one player slot, as raylib key codes.
struct KeyBindings {
    int up{KEY_W};
    int down{KEY_S};
    int left{KEY_A};
    int right{KEY_D};
    int swap{KEY_E};

    static KeyBindings defaultsForPlayer(int playerNumber);

    // Reads input.player<N>.{up,down,left,right,swap}; unknown names keep the
    // default for that action and log a warning.
    static KeyBindings fromConfiguration(int playerNumber);
};

// "W", "up", "Slash", "/", "F5", "Numpad8"... -> raylib key code.
std::optional<int> parseKeyName(std::string_view text);

// Canonical display token for HUD help lines ("W", "Up", "/").
std::string keyDisplayName(int keyCode);

} // namespace pacduo::input
