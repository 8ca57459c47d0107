#pragma once
#include "core/Direction.h"
#include "core/GameSettings.h"
#include "stage/Grid.h"
#include "stage/StageStatus.h"
#include "stage/SymbolGrid.h"
#include <optional>
#include <string>
#include <vector>

namespace pm2d {

struct GhostSpawnPoint {
    GhostType type{GhostType::Blinky};
    Tile tile{};
    Vector2 offset{};
};

struct StageOptions {
    int cols{28};
    int rows{31};
    float cellSize{24.0f};
    Vector2 origin{0.0f, 48.0f};
    // Ghost spawns are not read from the map; the classic board places them here.
    std::vector<GhostSpawnPoint> ghostSpawns{classicGhostSpawns()};

    static std::vector<GhostSpawnPoint> classicGhostSpawns();
    static StageOptions fromSettings(const GameSettings& settings);
};

struct GhostSpawn {
    GhostType type{GhostType::Blinky};
    Tile tile{};
    Vector2 position{};
};

// A compiled board plus everything needed to rebuild it from scratch.
struct Stage {
    Grid grid;
    Tile playerTile{};
    Vector2 playerSpawn{};
    std::vector<GhostSpawn> ghostSpawns{};
    SymbolGrid source{};
    StageOptions options{};
};

struct StageResult {
    StageStatus status{StageStatus::Ok};
    std::string message{};
    std::optional<Stage> stage{};

    bool ok() const { return status == StageStatus::Ok && stage.has_value(); }
};

class StageCompiler {
public:
    explicit StageCompiler(StageOptions options) : options_(std::move(options)) {}

    const StageOptions& options() const { return options_; }

    // Never throws on bad input: every malformed map is reported through the result.
    StageResult compile(const SymbolGrid& symbols) const;

private:
    StageOptions options_;
};

} // namespace pm2d
