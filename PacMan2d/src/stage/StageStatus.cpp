#include "stage/StageStatus.h"

namespace pm2d {

const char* to_string(StageStatus status) noexcept {
    switch (status) {
        case StageStatus::Ok: return "OK";
        case StageStatus::FileUnreadable: return "FILE_UNREADABLE";
        case StageStatus::BadFormat: return "BAD_FORMAT";
        case StageStatus::DimensionMismatch: return "DIMENSION_MISMATCH";
        case StageStatus::MissingPlayerSpawn: return "MISSING_PLAYER_SPAWN";
        case StageStatus::DuplicatePlayerSpawn: return "DUPLICATE_PLAYER_SPAWN";
        case StageStatus::GhostSpawnOutOfBounds: return "GHOST_SPAWN_OUT_OF_BOUNDS";
        case StageStatus::GhostSpawnBlocked: return "GHOST_SPAWN_BLOCKED";
        case StageStatus::InvalidBarrierTexture: return "INVALID_BARRIER_TEXTURE";
        default: return "UNKNOWN_STAGE_STATUS";
    }
}

} // namespace pm2d
