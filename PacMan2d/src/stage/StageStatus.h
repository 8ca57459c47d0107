#pragma once
#include <cstdint>

namespace pm2d {

// Outcome of loading or compiling a stage. Every non-Ok value is a fatal
// configuration error: the stage must not be played.
enum class StageStatus : std::uint32_t {
    Ok = 0,
    FileUnreadable = 1,
    BadFormat = 2,
    DimensionMismatch = 3,
    MissingPlayerSpawn = 4,
    DuplicatePlayerSpawn = 5,
    GhostSpawnOutOfBounds = 6,
    GhostSpawnBlocked = 7,
    InvalidBarrierTexture = 8,
};

// Returns a stable null-terminated string literal for the status.
const char* to_string(StageStatus status) noexcept;

} // namespace pm2d
