#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "services/configuration/ConfigurationManager.h"
#include <filesystem>
#include <cstdlib>

using pacduo::ConfigurationManager;

static void set_env(const char* k, const char* v) {
#if defined(_WIN32)
    _putenv_s(k, v);
#else
    setenv(k, v, 1);
#endif
}

static std::filesystem::path prepare_clean_config_dir(const char* sub) {
    namespace fs = std::filesystem;
    auto base = fs::temp_directory_path() / fs::path(sub);
    std::error_code ec;
    fs::remove_all(base, ec);
    fs::create_directories(base, ec);
    set_env("PACDUO_CONFIG_DIR", base.string().c_str());
    return base;
}

TEST_CASE("save and reload roundtrip", "[config]") {
    prepare_clean_config_dir("pacduo_configdir_roundtrip");

    ConfigurationManager::loadOrDefault();
    ConfigurationManager::set("match.starting_lives", static_cast<int64_t>(4));
    ConfigurationManager::set("player.move_speed", 6.5);
    ConfigurationManager::set("input.player1.swap", std::string("Q"));
    ConfigurationManager::set("pellets.power_corners", std::vector<std::string>{"4,4", "5,5"});

    REQUIRE(ConfigurationManager::save());

    ConfigurationManager::loadOrDefault();
    REQUIRE(ConfigurationManager::getInt("match.starting_lives", 0) == 3);

    REQUIRE(ConfigurationManager::load());
    REQUIRE(ConfigurationManager::getInt("match.starting_lives", 0) == 4);
    REQUIRE(ConfigurationManager::getDouble("player.move_speed", 0.0) == Catch::Approx(6.5));
    REQUIRE(ConfigurationManager::getString("input.player1.swap", "") == std::string("Q"));
    REQUIRE(ConfigurationManager::getStringList("pellets.power_corners", {}) == std::vector<std::string>{"4,4", "5,5"});
}

TEST_CASE("save notifies subscribers until they unsubscribe", "[config]") {
    prepare_clean_config_dir("pacduo_configdir_notify");
    ConfigurationManager::loadOrDefault();

    int calls = 0;
    int id = ConfigurationManager::subscribeOnChange([&calls] { ++calls; });
    REQUIRE(ConfigurationManager::save());
    REQUIRE(calls == 1);

    ConfigurationManager::unsubscribe(id);
    REQUIRE(ConfigurationManager::save());
    REQUIRE(calls == 1);
}

TEST_CASE("exportCompact reflects the live document", "[config]") {
    ConfigurationManager::loadOrDefault();
    ConfigurationManager::set("maze.path", std::string("mazes/custom.txt"));
    auto text = ConfigurationManager::exportCompact();
    REQUIRE(text.find("mazes/custom.txt") != std::string::npos);
    REQUIRE(text.find('\n') == std::string::npos);
}

namespace {
int g_reloadHookCalls = 0;
}

TEST_CASE("reload hooks run after a successful load and are registered once per name", "[config]") {
    prepare_clean_config_dir("pacduo_configdir_reload_hook");
    ConfigurationManager::loadOrDefault();
    REQUIRE(ConfigurationManager::save());

    g_reloadHookCalls = 0;
    ConfigurationManager::OnConfigReloadedHook hook{"test::reload_counter", [] { ++g_reloadHookCalls; }};
    ConfigurationManager::pushReloadHook(hook);
    ConfigurationManager::pushReloadHook(hook);

    REQUIRE(ConfigurationManager::load());
    REQUIRE(g_reloadHookCalls == 1);

    ConfigurationManager::loadOrDefault();
    REQUIRE(g_reloadHookCalls == 1);
}
