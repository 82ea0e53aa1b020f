#include "level_gen.h"

#include <algorithm>
#include <stdexcept>
#include <string>

#include "rng.h"

namespace tilerun::world {
namespace {
constexpr int kHeight = sim::kLevelHeightTiles;
constexpr int kBaseWidth = 200;
constexpr int kWidthPerWorld = 20;
constexpr int kWidthJitter = 50;
constexpr int kBridgeLength = 20;
// Floating platforms keep this many free rows above the floor so a Big player fits underneath.
constexpr int kLowestPlatformRow = kHeight - 5;

using actors::EntityKind;
using actors::EntitySpawn;

int FeatureLimit(const TileGrid &grid) {
  return grid.width() - kTailSafeColumns;
}

void SetIfAir(TileGrid &grid, int x, int y, TileKind kind) {
  if (grid.tile_at(x, y) == TileKind::Air) {
    grid.set_tile(x, y, kind);
  }
}

// First solid row at or below `from_row`, or the grid height when the column is open.
int FirstSolidRow(const TileGrid &grid, int x, int from_row) {
  for (int y = from_row; y < grid.height(); ++y) {
    if (grid.solid(x, y)) {
      return y;
    }
  }
  return grid.height();
}

void PlaceFlagPole(GeneratedLevel &out, int x) {
  TileGrid &grid = out.grid;
  const int floor_row = FirstSolidRow(grid, x, kFlagTopRow + 1);
  const int base_row = std::min(floor_row, kHeight) - 1;
  grid.set_tile(x, kFlagTopRow, TileKind::FlagTop);
  for (int y = kFlagTopRow + 1; y < base_row; ++y) {
    grid.set_tile(x, y, TileKind::FlagPole);
  }
  grid.set_tile(x, base_row, TileKind::Hard);
  out.flag_pole_x = x;
}

void PlaceBlockRow(TileGrid &grid, XorShift32 &rng, int x, int y, int length, double question_chance) {
  const int limit = FeatureLimit(grid);
  for (int i = 0; i < length && x + i < limit; ++i) {
    const bool question = rng.Chance(question_chance);
    grid.set_tile(x + i, y, question ? TileKind::Question : TileKind::Brick);
  }
}

void DecorateOverworld(TileGrid &grid, XorShift32 &rng) {
  const int surface = kHeight - 3;
  for (int x = 4; x < grid.width(); x += 9 + rng.NextInt(0, 6)) {
    const int row = 1 + rng.NextInt(0, 2);
    const int width = 2 + rng.NextInt(0, 1);
    for (int i = 0; i < width; ++i) {
      SetIfAir(grid, x + i, row, TileKind::Cloud);
    }
  }
  for (int x = 1; x < grid.width(); x += 24 + rng.NextInt(0, 12)) {
    for (int i = 0; i < 3; ++i) {
      if (grid.solid(x + i, surface + 1)) {
        SetIfAir(grid, x + i, surface, TileKind::Hill);
      }
    }
    if (grid.tile_at(x + 1, surface) == TileKind::Hill) {
      SetIfAir(grid, x + 1, surface - 1, TileKind::Hill);
    }
  }
  for (int x = 11; x < grid.width(); x += 16 + rng.NextInt(0, 10)) {
    const int width = 1 + rng.NextInt(0, 2);
    for (int i = 0; i < width; ++i) {
      if (grid.solid(x + i, surface + 1)) {
        SetIfAir(grid, x + i, surface, TileKind::Bush);
      }
    }
  }
}

void BuildOverworld(GeneratedLevel &out, XorShift32 &rng) {
  TileGrid &grid = out.grid;
  const int width = grid.width();
  const int limit = FeatureLimit(grid);
  grid.FillRect(0, kHeight - 2, width, kHeight, TileKind::Ground);

  const int num_gaps = 3 + out.world + rng.NextInt(0, 3);
  for (int i = 0; i < num_gaps; ++i) {
    const int gap_x = 30 + i * (width / (num_gaps + 1)) + rng.NextInt(-10, 10);
    const int gap_w = 2 + rng.NextInt(0, 2 + out.world / 2);
    for (int x = std::max(gap_x, kSpawnSafeColumns); x < gap_x + gap_w && x < limit; ++x) {
      grid.set_tile(x, kHeight - 2, TileKind::Air);
      grid.set_tile(x, kHeight - 1, TileKind::Air);
      out.gap_columns.push_back(x);
    }
  }

  for (int i = 0; i < width / 15; ++i) {
    const int x = 10 + i * 15 + rng.NextInt(0, 8);
    const int y = kLowestPlatformRow - rng.NextInt(0, 3);
    switch (rng.NextInt(0, 3)) {
      case 0:
        PlaceBlockRow(grid, rng, x, y, 1 + rng.NextInt(0, 4), 0.33);
        break;
      case 1:
        PlaceBlockRow(grid, rng, x, y, 3 + rng.NextInt(0, 5), 0.0);
        break;
      case 2: {
        const int stair_height = 2 + rng.NextInt(0, 4);
        for (int step = 0; step < stair_height; ++step) {
          for (int col = 0; col <= step && x + col < limit; ++col) {
            grid.set_tile(x + col, kHeight - 3 - step, TileKind::Hard);
          }
        }
        break;
      }
      default:
        break;
    }
  }

  for (int i = 0; i < width / 30; ++i) {
    const int x = 20 + i * 30 + rng.NextInt(0, 15);
    const int height = 2 + rng.NextInt(0, 3);
    if (x + 1 < limit) {
      AddPipe(grid, x, kHeight - 2 - height, height);
    }
  }

  PlaceFlagPole(out, width - 10);

  grid.FillRect(width - 6, kHeight - 6, width - 1, kHeight - 2, TileKind::Castle);
  grid.set_tile(width - 4, kHeight - 3, TileKind::Air);
  grid.set_tile(width - 4, kHeight - 4, TileKind::Air);

  DecorateOverworld(grid, rng);
}

void BuildUnderground(GeneratedLevel &out, XorShift32 &rng) {
  TileGrid &grid = out.grid;
  const int width = grid.width();
  grid.FillRect(0, 0, width, 2, TileKind::Brick);
  grid.FillRect(0, kHeight - 2, width, kHeight, TileKind::Hard);

  for (int i = 0; i < width / 20; ++i) {
    const int x = 15 + i * 20 + rng.NextInt(0, 10);
    const int y = 4 + rng.NextInt(0, kLowestPlatformRow - 4);
    PlaceBlockRow(grid, rng, x, y, 3 + rng.NextInt(0, 6), 0.25);
  }

  AddPipe(grid, width - 15, kHeight - 6, 4);
  PlaceFlagPole(out, width - 8);
}

void BuildCastle(GeneratedLevel &out, XorShift32 &rng) {
  TileGrid &grid = out.grid;
  const int width = grid.width();
  for (int x = 0; x < width; ++x) {
    if (x % 20 < 15 || x > width - 30) {
      grid.set_tile(x, kHeight - 1, TileKind::Hard);
      grid.set_tile(x, kHeight - 2, TileKind::Hard);
    } else {
      grid.set_tile(x, kHeight - 1, TileKind::Lava);
    }
  }
  grid.FillRect(0, 0, width, 2, TileKind::Hard);

  out.bridge_row = kHeight - 4;
  out.bridge_begin = width - kBridgeLength - 5;
  out.bridge_end = width - 5;

  for (int i = 0; i < width / 25; ++i) {
    const int x = 10 + i * 25;
    const int y = 5 + rng.NextInt(0, kLowestPlatformRow - 5);
    const int length = 4 + rng.NextInt(0, 4);
    for (int col = 0; col < length && x + col < out.bridge_begin - 2; ++col) {
      grid.set_tile(x + col, y, TileKind::Brick);
    }
  }

  grid.FillRow(out.bridge_row, out.bridge_begin, out.bridge_end, TileKind::Bridge);
  grid.FillRect(out.bridge_begin, out.bridge_row + 1, out.bridge_end, kHeight, TileKind::Lava);

  out.axe_x = width - 6;
  out.axe_y = kHeight - 5;
  grid.set_tile(out.axe_x, out.axe_y, TileKind::Axe);
  grid.FillRect(width - 5, kHeight - 2, width, kHeight, TileKind::Hard);
}

void BuildUnderwater(GeneratedLevel &out, XorShift32 &rng) {
  TileGrid &grid = out.grid;
  const int width = grid.width();
  std::vector<int> floor_top(static_cast<size_t>(width), kHeight - 2);
  for (int x = 0; x < width; ++x) {
    int raised = 0;
    if (rng.Chance(0.3)) {
      raised = rng.NextInt(0, 1);
    }
    if (x < kSpawnSafeColumns) {
      raised = 0;
    }
    floor_top[static_cast<size_t>(x)] = kHeight - 2 - raised;
    grid.FillRect(x, kHeight - 2 - raised, x + 1, kHeight, TileKind::Ground);
  }

  for (int i = 0; i < width / 10; ++i) {
    const int x = 5 + i * 10 + rng.NextInt(0, 5);
    const int height = 1 + rng.NextInt(0, 3);
    if (x >= width) {
      continue;
    }
    const int top = floor_top[static_cast<size_t>(x)];
    for (int y = top - 1; y >= std::max(top - height, 2); --y) {
      SetIfAir(grid, x, y, TileKind::Coral);
    }
  }

  const int limit = FeatureLimit(grid);
  for (int i = 0; i < width / 20; ++i) {
    const int x = 15 + i * 20 + rng.NextInt(0, 10);
    const int y = 4 + rng.NextInt(0, kLowestPlatformRow - 4);
    const int length = 3 + rng.NextInt(0, 4);
    for (int col = 0; col < length && x + col < limit; ++col) {
      grid.set_tile(x + col, y, TileKind::Hard);
    }
  }

  AddPipe(grid, width - 12, kHeight - 6, 4);
  PlaceFlagPole(out, width - 6);

  for (int y = 0; y < kHeight; ++y) {
    for (int x = 0; x < width; ++x) {
      SetIfAir(grid, x, y, TileKind::Water);
    }
  }
}

// Lifts a spawn until its 32 px box no longer overlaps solid tiles.
double SettleSpawnY(const TileGrid &grid, double x, int row) {
  const int left = sim::TileCoord(x);
  const int right = sim::TileCoord(x + sim::kTileSize - 1);
  while (row > 0 && (grid.solid(left, row) || grid.solid(right, row))) {
    --row;
  }
  return sim::TileEdge(row);
}

void PopulateEnemies(GeneratedLevel &out, XorShift32 &rng) {
  const TileGrid &grid = out.grid;
  const int width = grid.width();
  const int count = 5 + out.world * 2 + out.level;
  const int spacing = width * sim::kTileSize / count;
  const double min_x = 200.0;
  const double max_x = sim::TileEdge(width - 15);

  for (int i = 0; i < count; ++i) {
    const double x = 100.0 + static_cast<double>(i * spacing);
    if (x < min_x || x > max_x) {
      continue;
    }
    EntitySpawn spawn;
    spawn.kind = rng.Chance(0.67) ? EntityKind::Goomba : EntityKind::Koopa;
    spawn.dir = rng.Chance(0.5) ? -1 : 1;
    spawn.x = x;
    spawn.y = SettleSpawnY(grid, x, kHeight - 3);
    out.spawns.push_back(spawn);
  }

  if (out.theme == LevelTheme::Castle) {
    EntitySpawn boss;
    boss.kind = EntityKind::Bowser;
    boss.dir = -1;
    boss.x = sim::TileEdge(width - 20);
    boss.y = sim::TileEdge(kHeight - 6);
    out.spawns.push_back(boss);
  }
  std::stable_sort(out.spawns.begin(), out.spawns.end(),
                   [](const EntitySpawn &a, const EntitySpawn &b) { return a.x < b.x; });
}

}  // namespace

const char *LevelThemeName(LevelTheme theme) {
  switch (theme) {
    case LevelTheme::Overworld:
      return "overworld";
    case LevelTheme::Underground:
      return "underground";
    case LevelTheme::Castle:
      return "castle";
    case LevelTheme::Underwater:
      return "underwater";
  }
  return "overworld";
}

LevelTheme ClassifyLevel(int world, int level) {
  if (world < 1) {
    throw std::logic_error("world index must be >= 1, got " + std::to_string(world));
  }
  if (level < 1 || level > kLevelsPerWorld) {
    throw std::logic_error("level index must be in 1-4, got " + std::to_string(level));
  }
  if (level == 4) {
    return LevelTheme::Castle;
  }
  if (level == 2 && (world == 1 || world == 4)) {
    return LevelTheme::Underground;
  }
  if (level == 2 && (world == 2 || world == 7)) {
    return LevelTheme::Underwater;
  }
  return LevelTheme::Overworld;
}

bool AddPipe(TileGrid &grid, int x, int y, int height) {
  if (x < 0 || x + 1 >= grid.width() || y < 0 || height < 1 || y + height >= grid.height()) {
    return false;
  }
  grid.set_tile(x, y, TileKind::PipeTopLeft);
  grid.set_tile(x + 1, y, TileKind::PipeTopRight);
  for (int row = y + 1; row < y + height; ++row) {
    grid.set_tile(x, row, TileKind::PipeBottomLeft);
    grid.set_tile(x + 1, row, TileKind::PipeBottomRight);
  }
  return true;
}

GeneratedLevel GenerateLevel(int world, int level, uint32_t seed) {
  GeneratedLevel out;
  out.seed = seed;
  out.world = world;
  out.level = level;
  out.theme = ClassifyLevel(world, level);

  XorShift32 rng(seed);
  const int width = kBaseWidth + (world - 1) * kWidthPerWorld + rng.NextInt(0, kWidthJitter);
  out.grid = TileGrid(width, kHeight);

  switch (out.theme) {
    case LevelTheme::Overworld:
      BuildOverworld(out, rng);
      break;
    case LevelTheme::Underground:
      BuildUnderground(out, rng);
      break;
    case LevelTheme::Castle:
      BuildCastle(out, rng);
      break;
    case LevelTheme::Underwater:
      BuildUnderwater(out, rng);
      break;
  }

  std::sort(out.gap_columns.begin(), out.gap_columns.end());
  out.gap_columns.erase(std::unique(out.gap_columns.begin(), out.gap_columns.end()),
                        out.gap_columns.end());

  PopulateEnemies(out, rng);
  ValidateLevel(out);
  return out;
}

void ValidateLevel(const GeneratedLevel &level) {
  const TileGrid &grid = level.grid;
  if (grid.height() != sim::kLevelHeightTiles) {
    throw std::logic_error("level height " + std::to_string(grid.height()) + " != viewport height " +
                           std::to_string(sim::kLevelHeightTiles));
  }
  for (int y = 0; y < grid.height(); ++y) {
    if (static_cast<int>(grid.row(y).size()) != grid.width()) {
      throw std::logic_error("level row " + std::to_string(y) + " has width " +
                             std::to_string(grid.row(y).size()));
    }
  }
}

}  // namespace tilerun::world
