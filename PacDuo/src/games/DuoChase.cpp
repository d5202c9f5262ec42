#include "games/DuoChase.h"
#include "services/configuration/paths.h"
#include "services/logger/LogManager.h"
#include "sim/MazeLayout.h"
#include <algorithm>
#include <cmath>
#include <string>

namespace pacduo::games {

namespace {

using logging::LogManager;

constexpr float kHudHeight = 56.0f;
constexpr float kMessageStripHeight = 36.0f;
constexpr std::size_t kMessageLines = 2;

constexpr std::array<Color, 2> kPlayerColors = {
    Color{255, 221, 0, 255},
    Color{80, 200, 255, 255}
};
constexpr std::array<Color, 4> kPursuerColors = {
    Color{255, 0, 0, 255},
    Color{255, 105, 180, 255},
    Color{0, 255, 255, 255},
    Color{255, 165, 0, 255}
};
constexpr Color kScaredColor{40, 60, 230, 255};
constexpr Color kWallColor{33, 33, 222, 255};
constexpr Color kGateColor{255, 184, 222, 255};

} // namespace

void DuoChase::init(int width, int height) {
    settings_ = sim::GameSettings::fromConfiguration();
    grid_ = std::make_unique<sim::GridModel>(sim::loadMazeOrBuiltIn(settings_.mazePath).toGrid(settings_.cellSize));
    scoreStore_ = std::make_unique<persistence::JsonScoreStore>(paths::dataFilePath(settings_.highScoreFile));
    world_ = std::make_unique<sim::MatchWorld>(*grid_, settings_, *scoreStore_);
    subscription_ = world_->orchestrator().subscribe(this);
    reloadBindings();

    layout(width, height);
    world_->start();
    LogManager::info("DuoChase ready: {}x{} maze, {} pursuers", grid_->width(), grid_->height(), world_->pursuerCount());
}

void DuoChase::unload() {
    if (world_ && subscription_ != 0) {
        world_->orchestrator().unsubscribe(subscription_);
    }
    subscription_ = 0;
    world_.reset();
    scoreStore_.reset();
    grid_.reset();
    banner_.clear();
    bannerTimer_ = 0.0f;
}

void DuoChase::reloadBindings() {
    bindings_ = {input::KeyBindings::fromConfiguration(1), input::KeyBindings::fromConfiguration(2)};
    LogManager::debug("DuoChase: key bindings loaded");
}

void DuoChase::onResize(int width, int height) {
    layout(width, height);
}

void DuoChase::layout(int width, int height) {
    width_ = width;
    height_ = height;
    if (!grid_ || grid_->width() == 0 || grid_->height() == 0) return;

    const float available = std::max(1.0f, static_cast<float>(height_) - kHudHeight - kMessageStripHeight);
    tileSize_ = std::clamp(std::min(static_cast<float>(width_) / grid_->width(), available / grid_->height()), 6.0f, 48.0f);
    offset_ = { (width_ - grid_->width() * tileSize_) * 0.5f,
                kHudHeight + std::max(0.0f, (available - grid_->height() * tileSize_) * 0.5f) };
}

void DuoChase::update(float dt, int width, int height, bool acceptInput) {
    if (!world_) return;
    if (width != width_ || height != height_) {
        layout(width, height);
    }
    if (bannerTimer_ > 0.0f) {
        bannerTimer_ = std::max(0.0f, bannerTimer_ - dt);
    }

    if (world_->state().gameOver) {
        if (acceptInput && IsKeyPressed(KEY_ENTER)) {
            world_->restart();
        }
        return;
    }

    sim::PlayerInputs inputs{};
    if (acceptInput) {
        inputs = readInputs();
    }
    world_->step(dt, inputs);
}

sim::PlayerInputs DuoChase::readInputs() const {
    sim::PlayerInputs inputs{};
    for (std::size_t i = 0; i < bindings_.size(); ++i) {
        const input::KeyBindings& keys = bindings_[i];
        GridCell direction = dir::None;
        if (IsKeyDown(keys.up)) direction = dir::Up;
        else if (IsKeyDown(keys.down)) direction = dir::Down;
        else if (IsKeyDown(keys.left)) direction = dir::Left;
        else if (IsKeyDown(keys.right)) direction = dir::Right;
        inputs[i].direction = direction;
        inputs[i].swapRequested = IsKeyPressed(keys.swap);
    }
    return inputs;
}

void DuoChase::onMatchEvent(const MatchEvent& event) {
    switch (event.type) {
        case MatchEventType::LevelStarted:
            showBanner("LEVEL " + std::to_string(event.level), RAYWHITE, 1.5f);
            break;
        case MatchEventType::LevelComplete:
            showBanner("LEVEL " + std::to_string(event.level) + " CLEAR", GREEN, 2.0f);
            break;
        case MatchEventType::PowerUpStarted:
            showBanner("POWER UP!", kScaredColor, 1.0f);
            break;
        case MatchEventType::SwapWindowOpened:
            showBanner("P" + std::to_string(event.player) + " WANTS TO SWAP", ORANGE, 1.5f);
            break;
        case MatchEventType::SwapExecuted:
            showBanner(event.value == static_cast<int>(sim::SwapMode::LastOneStanding) ? "TAG IN!" : "SWAP!", ORANGE, 1.0f);
            break;
        case MatchEventType::PlayerEliminated:
            showBanner("P" + std::to_string(event.player) + " IS OUT", RED, 2.0f);
            break;
        case MatchEventType::GameOver:
            showBanner("GAME OVER - ENTER TO RESTART", RED, 3600.0f);
            break;
        case MatchEventType::MatchRestarted:
            showBanner("NEW MATCH", RAYWHITE, 1.5f);
            break;
        default:
            break;
    }
}

void DuoChase::showBanner(std::string text, Color color, float seconds) {
    banner_ = std::move(text);
    bannerColor_ = color;
    bannerTimer_ = seconds;
}

Vector2 DuoChase::cellToScreen(GridCell cell) const {
    // Grid row 0 is the bottom row; screen y grows downward
    return { offset_.x + (cell.x + 0.5f) * tileSize_,
             offset_.y + (grid_->height() - 1 - cell.y + 0.5f) * tileSize_ };
}

Vector2 DuoChase::worldToScreen(Vector2 world) const {
    const Vector2 origin = grid_->toWorld({0, 0});
    const float gx = (world.x - origin.x) / grid_->cellSize();
    const float gy = (world.y - origin.y) / grid_->cellSize();
    return { offset_.x + (gx + 0.5f) * tileSize_,
             offset_.y + (grid_->height() - 1 - gy + 0.5f) * tileSize_ };
}

void DuoChase::render(int width, int height) {
    ClearBackground(BLACK);
    if (!world_) return;
    drawMaze();
    drawPellets();
    drawPursuers();
    drawPlayers();
    drawHud(width, height);
}

void DuoChase::drawMaze() const {
    for (int y = 0; y < grid_->height(); ++y) {
        for (int x = 0; x < grid_->width(); ++x) {
            const sim::CellKind kind = grid_->kind({x, y});
            if (kind == sim::CellKind::Open) continue;
            Vector2 c = cellToScreen({x, y});
            if (kind == sim::CellKind::Gate) {
                DrawRectangleV({c.x - tileSize_ * 0.5f, c.y - tileSize_ * 0.1f}, {tileSize_, tileSize_ * 0.2f}, kGateColor);
            } else {
                DrawRectangleV({c.x - tileSize_ * 0.5f, c.y - tileSize_ * 0.5f}, {tileSize_, tileSize_}, kWallColor);
            }
        }
    }
}

void DuoChase::drawPellets() const {
    for (const sim::Pellet& pellet : world_->pellets().pellets()) {
        Vector2 c = cellToScreen(pellet.cell);
        const Color color = kPlayerColors[sim::slotIndex(pellet.owner)];
        // Offset the two owners so shared cells stay readable
        c.x += (pellet.owner == sim::PlayerSlot::One ? -0.15f : 0.15f) * tileSize_;
        const float radius = pellet.kind == sim::PelletKind::Power ? tileSize_ * 0.28f : tileSize_ * 0.09f;
        DrawCircleV(c, radius, color);
    }
}

void DuoChase::drawPlayers() const {
    const float t = static_cast<float>(GetTime());
    for (sim::PlayerSlot slot : sim::kPlayerSlots) {
        const sim::EntityMotion& body = world_->player(slot);
        if (!body.alive()) continue;
        Vector2 c = worldToScreen(body.position());
        float mouth = 20.0f + 25.0f * std::fabs(std::sin(t * 10.0f));
        GridCell d = body.currentDirection();
        float facing = 0.0f;
        if (d == dir::Left) facing = 180.0f;
        else if (d == dir::Up) facing = 270.0f;
        else if (d == dir::Down) facing = 90.0f;
        DrawCircleSector(c, tileSize_ * 0.45f, facing + mouth, facing + 360.0f - mouth, 24, kPlayerColors[sim::slotIndex(slot)]);
    }
}

void DuoChase::drawPursuers() const {
    for (std::size_t i = 0; i < world_->pursuerCount(); ++i) {
        const sim::PursuerBehavior& pursuer = world_->pursuer(i);
        Vector2 c = worldToScreen(pursuer.motion().position());
        Color color = kPursuerColors[i % kPursuerColors.size()];
        if (pursuer.scared()) color = kScaredColor;
        if (pursuer.respawning()) color = Fade(color, 0.35f);
        const float r = tileSize_ * 0.45f;
        DrawCircleV({c.x, c.y - r * 0.2f}, r, color);
        DrawRectangleV({c.x - r, c.y - r * 0.2f}, {2.0f * r, r}, color);
        DrawCircleV({c.x - r * 0.35f, c.y - r * 0.35f}, r * 0.22f, RAYWHITE);
        DrawCircleV({c.x + r * 0.35f, c.y - r * 0.35f}, r * 0.22f, RAYWHITE);
    }
}

void DuoChase::drawHud(int width, int height) const {
    const sim::MatchState& s = world_->state();
    const int line = 20;
    DrawText(TextFormat("P1 %06d", s.score(sim::PlayerSlot::One)), 12, 8, line, kPlayerColors[0]);
    DrawText(TextFormat("P2 %06d", s.score(sim::PlayerSlot::Two)), 12, 8 + line + 4, line, kPlayerColors[1]);
    const char* hi = TextFormat("HIGH %06d", s.highScore);
    DrawText(hi, (width - MeasureText(hi, line)) / 2, 8, line, RAYWHITE);
    const char* level = TextFormat("LEVEL %d   LIVES %d", s.currentLevel, s.lives);
    DrawText(level, (width - MeasureText(level, line)) / 2, 8 + line + 4, line, LIGHTGRAY);

    const char* timers = nullptr;
    if (s.swapWindowActive) {
        timers = TextFormat("SWAP %.1fs", s.swapWindowRemaining);
    } else if (s.swapOnCooldown) {
        timers = TextFormat("SWAP IN %.1fs", s.swapCooldownRemaining);
    } else {
        timers = "SWAP READY";
    }
    DrawText(timers, width - MeasureText(timers, line) - 12, 8, line, ORANGE);
    if (s.powerUpActive) {
        const char* power = TextFormat("POWER %.1fs", s.powerUpRemaining);
        DrawText(power, width - MeasureText(power, line) - 12, 8 + line + 4, line, kScaredColor);
    }

    drawMessages(height);

    if (bannerTimer_ > 0.0f && !banner_.empty()) {
        const int size = 32;
        const int w = MeasureText(banner_.c_str(), size);
        DrawRectangle((width - w) / 2 - 12, height / 2 - size, w + 24, size * 2, Fade(BLACK, 0.7f));
        DrawText(banner_.c_str(), (width - w) / 2, height / 2 - size / 2, size, bannerColor_);
    }
}

// Recent warnings and errors from the log ring buffer (config reload, maze and score file problems).
void DuoChase::drawMessages(int height) const {
    const auto lines = logging::read_recent_lines(logging::Level::warn, kMessageLines);
    const int size = 14;
    int y = height - static_cast<int>(kMessageStripHeight) + 2;
    for (const auto& line : lines) {
        const Color color = line.level >= logging::Level::err ? RED : ORANGE;
        const char* text = TextFormat("%s %s", logging::level_to_label(line.level), line.text.c_str());
        DrawText(text, 12, y, size, color);
        y += size + 2;
    }
}

} // namespace pacduo::games
