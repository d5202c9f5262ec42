#include "sim/GameSettings.h"
#include "services/configuration/ConfigurationManager.h"
#include "services/logger/LogManager.h"
#include <algorithm>
#include <charconv>

namespace pacduo::sim {

namespace {

using logging::LogManager;

std::string_view trim(std::string_view text) {
    auto begin = text.find_first_not_of(" \t");
    if (begin == std::string_view::npos) return {};
    auto end = text.find_last_not_of(" \t");
    return text.substr(begin, end - begin + 1);
}

bool parseInt(std::string_view text, int& out) {
    text = trim(text);
    if (text.empty()) return false;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
    return ec == std::errc() && ptr == text.data() + text.size();
}

float readFloat(const char* key, float fallback, float lo, float hi) {
    double value = ConfigurationManager::getDouble(key, fallback);
    if (value < lo || value > hi) {
        double clamped = std::clamp(value, static_cast<double>(lo), static_cast<double>(hi));
        LogManager::warn("Config: {} = {} out of range [{}, {}], using {}", key, value, lo, hi, clamped);
        value = clamped;
    }
    return static_cast<float>(value);
}

int readInt(const char* key, int fallback, int lo, int hi) {
    int64_t value = ConfigurationManager::getInt(key, fallback);
    if (value < lo || value > hi) {
        int64_t clamped = std::clamp<int64_t>(value, lo, hi);
        LogManager::warn("Config: {} = {} out of range [{}, {}], using {}", key, value, lo, hi, clamped);
        value = clamped;
    }
    return static_cast<int>(value);
}

GridCell readCell(const char* key, GridCell fallback) {
    std::string text = ConfigurationManager::getString(key, "");
    if (text.empty()) return fallback;
    GridCell cell;
    if (!parseCell(text, cell)) {
        LogManager::warn("Config: {} = '{}' is not an \"x,y\" cell, using ({},{})", key, text, fallback.x, fallback.y);
        return fallback;
    }
    return cell;
}

std::vector<GridCell> readCellList(const char* key, const std::vector<GridCell>& fallback) {
    auto entries = ConfigurationManager::getStringList(key, {});
    if (entries.empty()) return fallback;
    std::vector<GridCell> cells;
    for (const auto& entry : entries) {
        GridCell cell;
        if (parseCell(entry, cell)) {
            cells.push_back(cell);
        } else {
            LogManager::warn("Config: {} entry '{}' skipped", key, entry);
        }
    }
    return cells.empty() ? fallback : cells;
}

} // namespace

bool parseCell(std::string_view text, GridCell& out) {
    auto comma = text.find(',');
    if (comma == std::string_view::npos) return false;
    GridCell cell;
    if (!parseInt(text.substr(0, comma), cell.x) || !parseInt(text.substr(comma + 1), cell.y)) return false;
    out = cell;
    return true;
}

bool parseTunnelPair(std::string_view text, TunnelPair& out) {
    auto colon = text.find(':');
    if (colon == std::string_view::npos) return false;
    TunnelPair pair;
    if (!parseCell(text.substr(0, colon), pair.a) || !parseCell(text.substr(colon + 1), pair.b)) return false;
    out = pair;
    return true;
}

GameSettings GameSettings::fromConfiguration() {
    GameSettings s;

    s.cellSize = readFloat("grid.cell_size", s.cellSize, 0.01f, 1000.0f);
    s.mazePath = ConfigurationManager::getString("maze.path", s.mazePath);
    s.playerSpeed = readFloat("player.move_speed", s.playerSpeed, 0.1f, 60.0f);
    s.playerSpawns[0] = readCell("spawn.player1", s.playerSpawns[0]);
    s.playerSpawns[1] = readCell("spawn.player2", s.playerSpawns[1]);
    s.pursuerSpawns = readCellList("spawn.pursuers", s.pursuerSpawns);

    PursuerTuning& p = s.pursuer;
    p.baseSpeed = readFloat("pursuer.base_speed", p.baseSpeed, 0.1f, 60.0f);
    p.scaredSpeed = readFloat("pursuer.scared_speed", p.scaredSpeed, 0.1f, 60.0f);
    p.recomputeInterval = readFloat("pursuer.path_recalculate_interval", p.recomputeInterval, 0.0f, 60.0f);
    p.maxSearchIterations = readInt("pursuer.max_search_iterations", p.maxSearchIterations, 1, 1000000);
    p.randomDecisionInterval = readFloat("pursuer.random_decision_interval", p.randomDecisionInterval, 0.0f, 3600.0f);
    p.randomDecisionChance = readFloat("pursuer.random_decision_chance", p.randomDecisionChance, 0.0f, 1.0f);
    p.respawnDelay = readFloat("pursuer.respawn_delay", p.respawnDelay, 0.0f, 3600.0f);
    p.home.minX = readInt("pursuer.home_min_x", p.home.minX, 0, 100000);
    p.home.maxX = readInt("pursuer.home_max_x", p.home.maxX, p.home.minX, 100000);
    p.home.minY = readInt("pursuer.home_min_y", p.home.minY, 0, 100000);
    p.home.maxY = readInt("pursuer.home_max_y", p.home.maxY, p.home.minY, 100000);
    p.homeExit = readCell("pursuer.home_exit", p.homeExit);

    MatchRules& m = s.match;
    m.startingLives = readInt("match.starting_lives", m.startingLives, 0, 99);
    m.maxLives = readInt("match.max_lives", m.maxLives, m.startingLives, 99);
    m.powerUpDuration = readFloat("match.power_up_duration", m.powerUpDuration, 0.0f, 3600.0f);
    m.swapWindowDuration = readFloat("match.swap_window_duration", m.swapWindowDuration, 0.0f, 3600.0f);
    m.swapCooldown = readFloat("match.swap_cooldown", m.swapCooldown, 0.0f, 3600.0f);
    m.levelTransitionDelay = readFloat("match.level_transition_delay", m.levelTransitionDelay, 0.0f, 3600.0f);
    m.speedIncreasePerLevel = readFloat("match.speed_increase_per_level", m.speedIncreasePerLevel, 0.0f, 60.0f);
    m.pursuerEatenPoints = readInt("match.pursuer_eaten_points", m.pursuerEatenPoints, 0, 1000000);
    m.pursuerBaseSpeed = p.baseSpeed;
    m.regularPoints = readInt("pellets.regular_points", m.regularPoints, 0, 1000000);
    m.powerPoints = readInt("pellets.power_points", m.powerPoints, 0, 1000000);

    PelletSettings& pel = s.pellets;
    pel.regularPerPlayer = readInt("pellets.regular_per_player", pel.regularPerPlayer, 0, 100000);
    pel.minSpawnX = readInt("pellets.min_spawn_x", pel.minSpawnX, 0, 100000);
    pel.maxSpawnX = readInt("pellets.max_spawn_x", pel.maxSpawnX, pel.minSpawnX, 100000);
    pel.exclusionCenter = readCell("pellets.exclusion_center", pel.exclusionCenter);
    pel.exclusionRadius = readInt("pellets.exclusion_radius", pel.exclusionRadius, -1, 100000);
    pel.powerCorners = readCellList("pellets.power_corners", pel.powerCorners);
    pel.cornerSearchRadius = readInt("pellets.corner_search_radius", pel.cornerSearchRadius, 0, 100);

    // An explicit empty list disables tunnels; a missing key keeps the default pair
    const std::vector<std::string> unset{"?"};
    auto tunnelEntries = ConfigurationManager::getStringList("tunnels.pairs", unset);
    if (tunnelEntries != unset) {
        s.tunnels.pairs.clear();
        for (const auto& entry : tunnelEntries) {
            TunnelPair pair;
            if (parseTunnelPair(entry, pair)) {
                s.tunnels.pairs.push_back(pair);
            } else {
                LogManager::warn("Config: tunnels.pairs entry '{}' skipped", entry);
            }
        }
    }
    s.tunnels.cooldown = readFloat("tunnels.cooldown", s.tunnels.cooldown, 0.0f, 60.0f);

    s.randomSeed = static_cast<std::uint32_t>(readInt("match.random_seed", 0, 0, 2147483647));
    s.highScoreFile = ConfigurationManager::getString("persistence.high_score_file", s.highScoreFile);
    return s;
}

} // namespace pacduo::sim
