#include <catch2/catch_test_macros.hpp>
#include "services/configuration/ConfigurationManager.h"
#include <cstdlib>
#include <filesystem>

static void set_env(const char* k, const char* v) {
#if defined(_WIN32)
    _putenv_s(k, v);
#else
    setenv(k, v, 1);
#endif
}

TEST_CASE("env overrides apply", "[config]") {
    auto base = std::filesystem::temp_directory_path() / "fitz_configdir_env";
    std::error_code ec;
    std::filesystem::remove_all(base, ec);
    std::filesystem::create_directories(base);
    set_env("FITZ_CONFIG_DIR", base.string().c_str());

    set_env("FITZ_SIM__TICK_HZ", "20");
    set_env("FITZ_GAME__STARTING_LIVES", "4");
    set_env("FITZ_LOG__LEVEL", "debug");
    set_env("FITZ_FEATURE__ENABLED", "true");
    set_env("FITZ_SIM__SPEED", "1.5");

    // No file yet: load() falls back to defaults, which still take overrides.
    fitz::ConfigurationManager::load();

    REQUIRE(fitz::ConfigurationManager::getInt("sim.tick_hz", 0) == 20);
    REQUIRE(fitz::ConfigurationManager::getInt("game.starting_lives", 0) == 4);
    REQUIRE(fitz::ConfigurationManager::getString("log.level", "") == std::string("debug"));
    REQUIRE(fitz::ConfigurationManager::getBool("feature.enabled", false) == true);
    REQUIRE(fitz::ConfigurationManager::getDouble("sim.speed", 0.0) == 1.5);
    // Control variables without "__" are not config keys.
    REQUIRE(fitz::ConfigurationManager::getString("config_dir", "") == std::string(""));
}

TEST_CASE("env overrides win over the file", "[config]") {
    auto base = std::filesystem::temp_directory_path() / "fitz_configdir_env_file";
    std::error_code ec;
    std::filesystem::remove_all(base, ec);
    std::filesystem::create_directories(base);
    set_env("FITZ_CONFIG_DIR", base.string().c_str());

    fitz::ConfigurationManager::loadOrDefault();
    fitz::ConfigurationManager::set("sim.tick_hz", static_cast<int64_t>(15));
    REQUIRE(fitz::ConfigurationManager::save());

    set_env("FITZ_SIM__TICK_HZ", "25");
    REQUIRE(fitz::ConfigurationManager::load());
    REQUIRE(fitz::ConfigurationManager::getInt("sim.tick_hz", 0) == 25);
}
