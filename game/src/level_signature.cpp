#include "level_signature.h"

#include <iomanip>
#include <sstream>

namespace tilerun::world {
namespace {
constexpr uint64_t kFnvOffsetBasis = 1469598103934665603ull;
constexpr uint64_t kFnvPrime = 1099511628211ull;
constexpr uint8_t kRowSeparator = 0xff;

uint64_t HashByte(uint64_t hash, uint8_t value) {
  const uint64_t mixed = hash ^ static_cast<uint64_t>(value);
  return mixed * kFnvPrime;
}
}  // namespace

uint64_t HashTileRows(const TileGrid &grid) {
  uint64_t hash = kFnvOffsetBasis;
  for (int ty = 0; ty < grid.height(); ++ty) {
    for (int tx = 0; tx < grid.width(); ++tx) {
      hash = HashByte(hash, static_cast<uint8_t>(grid.tile_at(tx, ty)));
    }
    hash = HashByte(hash, kRowSeparator);
  }
  return hash;
}

std::string HashToHex(uint64_t hash) {
  std::ostringstream out;
  out << std::hex << std::setw(16) << std::setfill('0') << hash;
  return out.str();
}

nlohmann::json LevelSignature(const GeneratedLevel &level) {
  nlohmann::json spawn_rows = nlohmann::json::array();
  for (const auto &spawn : level.spawns) {
    spawn_rows.push_back({actors::EntityKindName(spawn.kind), static_cast<int>(spawn.x),
                          static_cast<int>(spawn.y), spawn.dir});
  }
  nlohmann::json out = {
      {"seed", level.seed},
      {"world", level.world},
      {"level", level.level},
      {"theme", LevelThemeName(level.theme)},
      {"width", level.grid.width()},
      {"height", level.grid.height()},
      {"tileHash", HashToHex(HashTileRows(level.grid))},
      {"flagPoleX", level.flag_pole_x},
      {"axeX", level.axe_x},
      {"gapCount", level.gap_columns.size()},
      {"spawnCount", level.spawns.size()},
      {"spawnRows", spawn_rows},
  };
  return out;
}

}  // namespace tilerun::world
