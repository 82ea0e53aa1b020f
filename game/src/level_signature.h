#pragma once

#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

#include "level_gen.h"

namespace tilerun::world {

// FNV-1a over the tile rows, one byte per tile and a separator per row.
uint64_t HashTileRows(const TileGrid &grid);
std::string HashToHex(uint64_t hash);

// Deterministic summary of a generated level: same (world, level, seed) gives
// the same JSON.
nlohmann::json LevelSignature(const GeneratedLevel &level);

}  // namespace tilerun::world
