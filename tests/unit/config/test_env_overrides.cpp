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

TEST_CASE("env overrides apply", "[config]") {
    auto base = std::filesystem::temp_directory_path() / "pacduo_configdir_env";
    std::error_code ec;
    std::filesystem::remove_all(base, ec);
    std::filesystem::create_directories(base);
    set_env("PACDUO_CONFIG_DIR", base.string().c_str());

    set_env("PACDUO_MATCH__STARTING_LIVES", "5");
    set_env("PACDUO_PURSUER__RANDOM_DECISION_CHANCE", "0.25");
    set_env("PACDUO_LOGGING__LEVEL", "debug");
    set_env("PACDUO_FEATURE__ENABLED", "true");

    // No file on disk: load() falls back to defaults and re-applies env
    REQUIRE_FALSE(ConfigurationManager::load());

    REQUIRE(ConfigurationManager::getInt("match.starting_lives", 0) == 5);
    REQUIRE(ConfigurationManager::getDouble("pursuer.random_decision_chance", 0.0) == Catch::Approx(0.25));
    REQUIRE(ConfigurationManager::getString("logging.level", "") == std::string("debug"));
    REQUIRE(ConfigurationManager::getBool("feature.enabled", false) == true);
}

TEST_CASE("env variables without a section separator are ignored", "[config]") {
    set_env("PACDUO_STARTING_LIVES", "9");
    ConfigurationManager::loadOrDefault();
    REQUIRE(ConfigurationManager::getInt("starting_lives", -1) == -1);
    REQUIRE(ConfigurationManager::getInt("match.starting_lives", 0) == 3);
}
