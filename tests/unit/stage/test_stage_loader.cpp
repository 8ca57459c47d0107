#include <catch2/catch_test_macros.hpp>

#include "stage/StageLoader.h"
#include "pm2d_test_helpers.h"

#include <nlohmann/json.hpp>

#include <fstream>

using nlohmann::json;
using pm2d::StageStatus;

TEST_CASE("Stage rows may be strings or arrays of characters", "[stage][loader]") {
    json asStrings = {{"grid", {"BBB", "BpB", "BBB"}}};
    json asArrays = {{"grid", {{"B", "B", "B"}, {"B", "p", "B"}, {"B", "B", "B"}}}};

    auto a = pm2d::parseSymbolGrid(asStrings);
    auto b = pm2d::parseSymbolGrid(asArrays);
    REQUIRE(a.ok());
    REQUIRE(b.ok());
    REQUIRE(a.symbols == b.symbols);
    REQUIRE(a.symbols.cols() == 3);
    REQUIRE(a.symbols.rows() == 3);
    REQUIRE(a.symbols.symbolAt(1, 1) == 'p');
}

TEST_CASE("Symbol lookups count rows from the bottom", "[stage][loader]") {
    auto load = pm2d::parseSymbolGrid(json{{"grid", {"AB", "CD"}}});
    REQUIRE(load.ok());
    REQUIRE(load.symbols.symbolAt(0, 0) == 'C');
    REQUIRE(load.symbols.symbolAt(1, 1) == 'B');
    REQUIRE(load.symbols.symbolAt(5, 0) == ' ');
    REQUIRE(load.symbols.symbolAt(0, -1) == ' ');
}

TEST_CASE("Malformed stage documents are rejected", "[stage][loader]") {
    REQUIRE(pm2d::parseSymbolGrid(json::array({"BBB"})).status == StageStatus::BadFormat);
    REQUIRE(pm2d::parseSymbolGrid(json{{"rows", {"BBB"}}}).status == StageStatus::BadFormat);
    REQUIRE(pm2d::parseSymbolGrid(json{{"grid", json::array()}}).status == StageStatus::BadFormat);
    REQUIRE(pm2d::parseSymbolGrid(json{{"grid", {"BBB", 7}}}).status == StageStatus::BadFormat);

    auto ragged = pm2d::parseSymbolGrid(json{{"grid", {"BBB", "BB"}}});
    REQUIRE(ragged.status == StageStatus::BadFormat);
    REQUIRE_FALSE(ragged.message.empty());
}

TEST_CASE("Missing or unparsable stage files report FileUnreadable", "[stage][loader]") {
    auto dir = pm2d::testing::prepare_temp_dir("stage_loader");

    auto missing = pm2d::loadSymbolGrid((dir / "nope.json").string());
    REQUIRE(missing.status == StageStatus::FileUnreadable);

    auto broken = dir / "broken.json";
    {
        std::ofstream out(broken);
        out << "{ \"grid\": [ \"BBB\", ";
    }
    REQUIRE(pm2d::loadSymbolGrid(broken.string()).status == StageStatus::FileUnreadable);

    auto good = dir / "good.json";
    {
        std::ofstream out(good);
        out << R"({"grid": ["BBB", "BpB", "BBB"]})";
    }
    auto loaded = pm2d::loadSymbolGrid(good.string());
    REQUIRE(loaded.ok());
    REQUIRE(loaded.symbols.topDownRows().front() == "BBB");

    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
}
