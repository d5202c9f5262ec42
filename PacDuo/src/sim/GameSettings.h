#pragma once
#include "pacduo/grid_cell.h"
#include "sim/MatchOrchestrator.h"
#include "sim/PelletField.h"
#include "sim/PursuerBehavior.h"
#include "sim/WrapTunnels.h"
#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace pacduo::sim {

struct TunnelSettings {
    std::vector<TunnelPair> pairs{TunnelPair{{0, 16}, {31, 16}}};
    float cooldown{0.5f};
};

// Typed view of the configuration document. Defaults match the built-in maze.
struct GameSettings {
    float cellSize{1.0f};
    std::string mazePath{};
    float playerSpeed{5.0f};
    std::array<GridCell, 2> playerSpawns{GridCell{15, 7}, GridCell{16, 7}};
    std::vector<GridCell> pursuerSpawns{{14, 16}, {15, 16}, {16, 16}, {17, 16}};
    PursuerTuning pursuer{};
    MatchRules match{};
    PelletSettings pellets{};
    TunnelSettings tunnels{};
    std::uint32_t randomSeed{0};
    std::string highScoreFile{"highscore.json"};

    // Reads ConfigurationManager. Missing keys keep defaults; out-of-range
    // values are clamped with a warning.
    static GameSettings fromConfiguration();
};

// "x,y" -> cell
bool parseCell(std::string_view text, GridCell& out);
// "x,y:x,y" -> tunnel pair
bool parseTunnelPair(std::string_view text, TunnelPair& out);

} // namespace pacduo::sim
