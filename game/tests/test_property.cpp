#include <doctest/doctest.h>

#include <rapidcheck.h>

#include <cmath>
#include <vector>

#include "level_gen.h"
#include "rng.h"
#include "scoreboard.h"
#include "sim/sim.h"
#include "tile_grid.h"

TEST_CASE("Off-grid tiles are never solid") {
  CHECK(rc::check("off-grid reads are Air", []() {
    const tilerun::world::TileGrid grid(8, 12, tilerun::world::TileKind::Ground);
    const int tx = *rc::gen::inRange(-1000, 1000);
    const int ty = *rc::gen::inRange(-1000, 1000);
    RC_PRE(tx < 0 || tx >= 8 || ty < 0 || ty >= 12);
    RC_ASSERT(grid.tile_at(tx, ty) == tilerun::world::TileKind::Air);
    RC_ASSERT(!grid.solid(tx, ty));
  }));
}

TEST_CASE("Generated levels keep the fixed-height contract") {
  CHECK(rc::check("any seed and level yields a valid grid", []() {
    const uint32_t seed = *rc::gen::arbitrary<uint32_t>();
    const int world = *rc::gen::inRange(1, tilerun::world::kMaxWorld + 1);
    const int level = *rc::gen::inRange(1, tilerun::world::kLevelsPerWorld + 1);

    const auto generated = tilerun::world::GenerateLevel(world, level, seed);
    RC_ASSERT(generated.grid.height() == tilerun::sim::kLevelHeightTiles);
    tilerun::world::ValidateLevel(generated);

    double last_x = -1.0;
    for (const auto &spawn : generated.spawns) {
      RC_ASSERT(spawn.x >= last_x);
      RC_ASSERT(spawn.x < generated.width_px());
      last_x = spawn.x;
    }
    RC_ASSERT(generated.has_flag() != generated.has_axe());
  }));
}

TEST_CASE("Coin counter wraps into extra lives") {
  CHECK(rc::check("coins stay below a hundred", []() {
    const int collected = *rc::gen::inRange(0, 1000);
    tilerun::game::Scoreboard board;
    int granted = 0;
    for (int i = 0; i < collected; ++i) {
      if (board.CollectCoin()) {
        ++granted;
      }
    }
    RC_ASSERT(board.coins == collected % tilerun::game::kCoinsPerLife);
    RC_ASSERT(granted == collected / tilerun::game::kCoinsPerLife);
    RC_ASSERT(board.lives == tilerun::game::kStartingLives + granted);
    RC_ASSERT(board.score == collected * tilerun::game::kCoinScore);
  }));
}

TEST_CASE("Horizontal speed never exceeds the run cap") {
  CHECK(rc::check("StepHorizontal stays bounded", []() {
    const auto inputs = *rc::gen::container<std::vector<int>>(rc::gen::inRange(0, 8));
    double vel_x = 0.0;
    const auto &config = tilerun::sim::kDefaultSimConfig;
    for (const int bits : inputs) {
      tilerun::sim::StepHorizontal(vel_x, (bits & 1) != 0, (bits & 2) != 0, (bits & 4) != 0, config);
      RC_ASSERT(std::abs(vel_x) <= config.run_speed + 1e-9);
    }
  }));
}

TEST_CASE("XorShift32 ranges are inclusive and bounded") {
  CHECK(rc::check("NextInt stays in [lo, hi]", []() {
    tilerun::XorShift32 rng(*rc::gen::arbitrary<uint32_t>());
    const int lo = *rc::gen::inRange(-100, 100);
    const int hi = lo + *rc::gen::inRange(0, 50);
    for (int i = 0; i < 32; ++i) {
      const int value = rng.NextInt(lo, hi);
      RC_ASSERT(value >= lo);
      RC_ASSERT(value <= hi);
      const double unit = rng.NextUnit();
      RC_ASSERT(unit >= 0.0);
      RC_ASSERT(unit < 1.0);
    }
    RC_ASSERT(rng.state() != 0u);
  }));
}
