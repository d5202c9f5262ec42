#pragma once
#include "games/Game.h"
#include "pacduo/match_events.h"
#include "services/input/KeyBindings.h"
#include "services/persistence/HighScoreStore.h"
#include "sim/GameSettings.h"
#include "sim/GridModel.h"
#include "sim/MatchWorld.h"
#include <raylib.h>
#include <array>
#include <cstdint>
#include <memory>
#include <string>

namespace pacduo::games {

// Two-player raylib front end around sim::MatchWorld.
class DuoChase final : public Game, public MatchEventSink {
public:
    DuoChase() = default;
    ~DuoChase() override = default;

    const char* id() const override { return "duo-chase"; }
    const char* name() const override { return "PacDuo"; }

    void init(int width, int height) override;
    void update(float dt, int width, int height, bool acceptInput) override;
    void render(int width, int height) override;
    void unload() override;
    void onResize(int width, int height) override;

    void onMatchEvent(const MatchEvent& event) override;

    // Re-reads both players' key bindings from the current configuration.
    void reloadBindings();

private:
    void layout(int width, int height);
    sim::PlayerInputs readInputs() const;
    void showBanner(std::string text, Color color, float seconds);

    void drawMaze() const;
    void drawPellets() const;
    void drawPlayers() const;
    void drawPursuers() const;
    void drawHud(int width, int height) const;
    void drawMessages(int height) const;

    Vector2 cellToScreen(GridCell cell) const;
    Vector2 worldToScreen(Vector2 world) const;

    std::unique_ptr<sim::GridModel> grid_{};
    std::unique_ptr<persistence::JsonScoreStore> scoreStore_{};
    std::unique_ptr<sim::MatchWorld> world_{};
    sim::GameSettings settings_{};
    std::array<input::KeyBindings, 2> bindings_{};
    std::uint32_t subscription_{0};

    int width_{0};
    int height_{0};
    float tileSize_{18.0f};
    Vector2 offset_{};

    std::string banner_{};
    Color bannerColor_{RAYWHITE};
    float bannerTimer_{0.0f};
};

} // namespace pacduo::games
