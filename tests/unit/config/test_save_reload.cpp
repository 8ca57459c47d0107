#include <catch2/catch_test_macros.hpp>
#include "services/configuration/ConfigurationManager.h"
#include "pm2d_test_helpers.h"
#include <filesystem>

TEST_CASE("saved values survive a reload", "[config]") {
    pm2d::testing::ConfigDirScope scope("config_save");
    pm2d::ConfigurationManager::loadOrDefault();

    pm2d::ConfigurationManager::set("stage.cols", int64_t{19});
    pm2d::ConfigurationManager::set("window.fullscreen", true);
    pm2d::ConfigurationManager::set("stage::path", std::string("maps/tiny.json"));
    REQUIRE(pm2d::ConfigurationManager::save());
    REQUIRE(std::filesystem::exists(scope.configFile()));

    pm2d::ConfigurationManager::loadOrDefault();
    REQUIRE(pm2d::ConfigurationManager::getInt("stage.cols", 0) == 28);

    REQUIRE(pm2d::ConfigurationManager::load());
    REQUIRE(pm2d::ConfigurationManager::getInt("stage.cols", 0) == 19);
    REQUIRE(pm2d::ConfigurationManager::getBool("window.fullscreen", false));
    REQUIRE(pm2d::ConfigurationManager::getString("stage.path", "") == std::string("maps/tiny.json"));
}

TEST_CASE("defaults written on first run load back unchanged", "[config]") {
    pm2d::testing::ConfigDirScope scope("config_first_run");
    REQUIRE_FALSE(pm2d::ConfigurationManager::load());
    REQUIRE(pm2d::ConfigurationManager::save());

    REQUIRE(pm2d::ConfigurationManager::load());
    REQUIRE(pm2d::ConfigurationManager::getInt("version", 0) == 1);
    REQUIRE(pm2d::ConfigurationManager::getInt("stage.rows", 0) == 31);
    REQUIRE(pm2d::ConfigurationManager::getString("window.title", "") == std::string("Pac-Man"));

    // A current-version file is not migrated, so no backup appears.
    auto bak = scope.configFile();
    bak += ".bak";
    REQUIRE_FALSE(std::filesystem::exists(bak));
}
