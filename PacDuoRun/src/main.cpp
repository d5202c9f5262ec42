#include "raylib.h"
#include "games/DuoChase.h"
#include "services/configuration/ConfigurationManager.h"
#include "services/logger/LogManager.h"
#include <algorithm>

int main(void)
{
    using pacduo::ConfigurationManager;
    using pacduo::logging::LogManager;

    LogManager::init({"PacDuo", pacduo::logging::Level::info, "[%H:%M:%S] [%^%l%$] %v"});
    if (!ConfigurationManager::load()) {
        LogManager::warn("Configuration file missing or invalid; using defaults");
    }
    LogManager::reconfigure({"PacDuo",
                             pacduo::logging::level_from_string(ConfigurationManager::getString("logging.level", "info")),
                             ConfigurationManager::getString("logging.pattern", "[%H:%M:%S] [%^%l%$] %v")});

    int width = std::max(320, static_cast<int>(ConfigurationManager::getInt("window.width", 960)));
    int height = std::max(240, static_cast<int>(ConfigurationManager::getInt("window.height", 900)));
    int fps = std::clamp(static_cast<int>(ConfigurationManager::getInt("window.target_fps", 60)), 15, 240);

    SetConfigFlags(FLAG_WINDOW_RESIZABLE | FLAG_VSYNC_HINT);
    InitWindow(width, height, "PacDuo");
    SetTargetFPS(fps);
    LogManager::info("Window initialized: {}x{} @ {} fps", GetScreenWidth(), GetScreenHeight(), fps);

    pacduo::games::DuoChase game{};
    game.init(GetScreenWidth(), GetScreenHeight());

    ConfigurationManager::pushReloadHook({
        .name = "DuoChase::reloadBindings",
        .callback = [&game]() { game.reloadBindings(); }
    });

    while (!WindowShouldClose())
    {
        const int w = GetScreenWidth();
        const int h = GetScreenHeight();
        if (IsWindowResized()) {
            game.onResize(w, h);
        }
        if (IsKeyPressed(KEY_F5) && !ConfigurationManager::load()) {
            LogManager::warn("Configuration reload failed; defaults restored");
        }
        // Clamp long frames (window drags) so one tick never spans several cells
        float dt = std::min(GetFrameTime(), 0.1f);
        game.update(dt, w, h, IsWindowFocused());

        BeginDrawing();
        game.render(w, h);
        EndDrawing();
    }

    game.unload();
    CloseWindow();
    LogManager::shutdown();
    return 0;
}
