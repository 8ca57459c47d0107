#include "stage/StageCompiler.h"
#include "stage/Adjacency.h"
#include "stage/Barrier.h"
#include "stage/TextureSelector.h"
#include "services/logger/LogManager.h"
#include <utility>

namespace pm2d {
namespace {

StageResult fail(StageStatus status, std::string message) {
    logging::LogManager::error("Stage compile failed ({}): {}", to_string(status), message);
    StageResult r;
    r.status = status;
    r.message = std::move(message);
    return r;
}

std::optional<BarrierKind> barrierKindFor(char symbol) {
    switch (symbol) {
        case 'B': return BarrierKind::Border;
        case 'S': return BarrierKind::Structure;
        case 'I': return BarrierKind::Interior;
        case 'D': return BarrierKind::Door;
        default: return std::nullopt;
    }
}

// Half a cell toward an adjacent 'm'; right, left, up, down in that order.
Vector2 playerSpawnOffset(const SymbolGrid& symbols, int col, int row, float cellSize) {
    const float half = cellSize * 0.5f;
    if (symbols.symbolAt(col + 1, row) == 'm') return Vector2{half, 0.0f};
    if (symbols.symbolAt(col - 1, row) == 'm') return Vector2{-half, 0.0f};
    if (symbols.symbolAt(col, row + 1) == 'm') return Vector2{0.0f, half};
    if (symbols.symbolAt(col, row - 1) == 'm') return Vector2{0.0f, -half};
    return Vector2{0.0f, 0.0f};
}

} // namespace

std::vector<GhostSpawnPoint> StageOptions::classicGhostSpawns() {
    return {
        {GhostType::Blinky, Tile{13, 19}, Vector2{12.0f, 0.0f}},
        {GhostType::Inky,   Tile{9, 16},  Vector2{0.0f, 0.0f}},
        {GhostType::Pinky,  Tile{13, 13}, Vector2{12.0f, 0.0f}},
        {GhostType::Clyde,  Tile{18, 16}, Vector2{0.0f, 0.0f}},
    };
}

StageOptions StageOptions::fromSettings(const GameSettings& settings) {
    StageOptions o;
    o.cols = settings.cols;
    o.rows = settings.rows;
    o.cellSize = settings.cellSize;
    o.origin = settings.origin;
    return o;
}

StageResult StageCompiler::compile(const SymbolGrid& symbols) const {
    const int cols = options_.cols;
    const int rows = options_.rows;
    if (symbols.cols() != cols || symbols.rows() != rows) {
        return fail(StageStatus::DimensionMismatch,
                    fmt::format("stage is {}x{}, board expects {}x{}", symbols.cols(), symbols.rows(), cols, rows));
    }

    Grid grid(cols, rows, options_.cellSize, options_.origin);
    BarrierPoints barriers;
    std::optional<Tile> playerTile;
    Vector2 playerSpawn{};
    int ignored = 0;

    for (int col = 0; col < cols; ++col) {
        for (int row = 0; row < rows; ++row) {
            const char symbol = symbols.symbolAt(col, row);
            if (auto kind = barrierKindFor(symbol)) {
                barriers.emplace(Tile{col, row}, *kind);
                continue;
            }
            switch (symbol) {
                case 'F':
                    grid.set(col, row, DotCell{DotKind::Regular});
                    break;
                case 'U':
                    grid.set(col, row, DotCell{DotKind::PowerUp});
                    break;
                case 'p': {
                    if (playerTile) {
                        return fail(StageStatus::DuplicatePlayerSpawn,
                                    fmt::format("second player spawn at ({},{}), first at ({},{})",
                                                col, row, playerTile->col, playerTile->row));
                    }
                    playerTile = Tile{col, row};
                    Vector2 base = grid.cellPixelPosition(col, row);
                    Vector2 offset = playerSpawnOffset(symbols, col, row, options_.cellSize);
                    playerSpawn = Vector2{base.x + offset.x, base.y + offset.y};
                    grid.set(col, row, PlayerCell{playerSpawn});
                    break;
                }
                case 'm':
                case ' ':
                    break;
                default:
                    ++ignored;
                    break;
            }
        }
    }

    if (!playerTile) {
        return fail(StageStatus::MissingPlayerSpawn, "stage has no player spawn ('p')");
    }
    if (ignored > 0) {
        logging::LogManager::debug("Stage compile ignored {} unrecognised symbol(s)", ignored);
    }

    std::vector<GhostSpawn> ghostSpawns;
    ghostSpawns.reserve(options_.ghostSpawns.size());
    for (const auto& sp : options_.ghostSpawns) {
        if (!grid.contains(sp.tile)) {
            return fail(StageStatus::GhostSpawnOutOfBounds,
                        fmt::format("{} spawn ({},{}) is outside the board", to_string(sp.type), sp.tile.col, sp.tile.row));
        }
        if (barriers.count(sp.tile) != 0) {
            return fail(StageStatus::GhostSpawnBlocked,
                        fmt::format("{} spawn ({},{}) is inside a barrier", to_string(sp.type), sp.tile.col, sp.tile.row));
        }
        Vector2 base = grid.cellPixelPosition(sp.tile);
        Vector2 pos{base.x + sp.offset.x, base.y + sp.offset.y};
        grid.set(sp.tile, GhostCell{sp.type, pos});
        ghostSpawns.push_back(GhostSpawn{sp.type, sp.tile, pos});
    }

    int materialised = 0;
    for (const auto& [tile, kind] : barriers) {
        TextureTag tag = selectTexture(computeAdjacency(tile, barriers, cols, rows), kind);
        if (tag == TextureTag::Default) continue;
        auto barrier = makeBarrier(kind, tag);
        if (!barrier) {
            return fail(StageStatus::InvalidBarrierTexture,
                        fmt::format("{} barrier at ({},{}) cannot use texture {}", to_string(kind), tile.col, tile.row, to_string(tag)));
        }
        grid.set(tile, *barrier);
        ++materialised;
    }

    logging::LogManager::info("Stage compiled: {} barriers ({} hidden), {} dots, {} ghosts",
                              materialised, static_cast<int>(barriers.size()) - materialised, grid.dotCount(),
                              ghostSpawns.size());

    StageResult result;
    result.stage = Stage{std::move(grid), *playerTile, playerSpawn, std::move(ghostSpawns), symbols, options_};
    return result;
}

} // namespace pm2d
