#pragma once

#include <cstdint>
#include <vector>

#include "entities.h"
#include "sim/sim.h"
#include "tile_grid.h"

namespace tilerun::world {

enum class LevelTheme : uint8_t {
  Overworld = 0,
  Underground,
  Castle,
  Underwater,
};

const char *LevelThemeName(LevelTheme theme);

// Throws std::logic_error for world < 1 or level outside 1-4.
LevelTheme ClassifyLevel(int world, int level);

constexpr int kMaxWorld = 8;
constexpr int kLevelsPerWorld = 4;
constexpr int kPlayerStartColumn = 3;
// Columns at each end kept free of gaps, platforms and pipes.
constexpr int kSpawnSafeColumns = 6;
constexpr int kTailSafeColumns = 16;
constexpr int kFlagTopRow = 2;

struct GeneratedLevel {
  uint32_t seed = 0;
  int world = 1;
  int level = 1;
  LevelTheme theme = LevelTheme::Overworld;
  TileGrid grid{1, sim::kLevelHeightTiles};
  int flag_pole_x = -1;
  int axe_x = -1;
  int axe_y = -1;
  int bridge_row = -1;
  int bridge_begin = -1;
  int bridge_end = -1;
  // Sorted column indices with no floor at the bottom of an overworld level.
  std::vector<int> gap_columns;
  // Sorted by x.
  std::vector<actors::EntitySpawn> spawns;

  bool has_flag() const { return flag_pole_x >= 0; }
  bool has_axe() const { return axe_x >= 0; }
  double width_px() const { return sim::TileEdge(grid.width()); }
  double start_x() const { return sim::TileEdge(kPlayerStartColumn); }
  // Feet position of a freshly spawned player.
  double start_floor_y() const { return sim::TileEdge(sim::kLevelHeightTiles - 2); }
};

GeneratedLevel GenerateLevel(int world, int level, uint32_t seed);

// Throws std::logic_error when the grid breaks the fixed-height contract.
void ValidateLevel(const GeneratedLevel &level);

// Places a 2-wide pipe whose top-left tile is (x, y); rejects placements that
// would leave the grid. Returns whether the pipe was placed.
bool AddPipe(TileGrid &grid, int x, int y, int height);

}  // namespace tilerun::world
