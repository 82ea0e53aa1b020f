#pragma once

#include <cstdint>

#include "input.h"
#include "sim/sim.h"
#include "tile_grid.h"

namespace tilerun::game {

enum class PowerTier : uint8_t {
  Small = 0,
  Big,
  Fire,
};

const char *PowerTierName(PowerTier tier);

constexpr double kPlayerWidth = 28.0;
constexpr double kSmallHeight = 32.0;
constexpr double kBigHeight = 64.0;
constexpr int kInvincibilityTicks = 120;
constexpr int kStarTicks = 600;
constexpr int kDeathTicks = 180;
constexpr int kAnimTicksPerFrame = 8;
constexpr int kAnimFrames = 3;
constexpr double kFallDeathMargin = 50.0;

struct Player {
  double x = 0.0;
  double y = 0.0;
  double vel_x = 0.0;
  double vel_y = 0.0;
  bool facing_right = true;
  PowerTier power = PowerTier::Small;
  bool on_ground = false;
  // Jump input as of the previous tick; a jump needs a fresh press.
  bool jump_held = false;
  bool crouching = false;
  int invincibility = 0;
  int star_timer = 0;
  int anim_timer = 0;
  int anim_frame = 0;
  bool dead = false;
  int death_timer = 0;

  double width() const { return kPlayerWidth; }
  double height() const { return power == PowerTier::Small ? kSmallHeight : kBigHeight; }
  double bottom() const { return y + height(); }
  sim::Aabb Bounds() const { return {x, y, width(), height()}; }
};

struct PlayerStepResult {
  bool block_hit = false;
  int hit_tx = 0;
  int hit_ty = 0;
  bool fell_out = false;
};

enum class DamageOutcome : uint8_t {
  Ignored = 0,
  Shrunk,
  Killed,
};

// Places the player standing on `floor_y` at `start_x`. Power tier is kept.
void SpawnPlayer(Player &player, double start_x, double floor_y);

// One controller tick: timers, walk/run, edge-triggered jump, gravity, then
// separate X and Y passes against the grid. `camera_x` is the left wall.
PlayerStepResult StepPlayer(Player &player,
                            const PlayerInput &input,
                            const world::TileGrid &grid,
                            bool underwater,
                            double camera_x,
                            const sim::SimConfig &config);

void ResolveHorizontal(Player &player, const world::TileGrid &grid);
// Returns true and fills the tile coordinate when the head bumped a solid tile.
bool ResolveVertical(Player &player, const world::TileGrid &grid, int &hit_tx, int &hit_ty);

// Applies a power-up tier change keeping the feet where they are.
void SetPowerTier(Player &player, PowerTier tier);
DamageOutcome DamagePlayer(Player &player, const sim::SimConfig &config);
// Returns false if the player was already dead.
bool KillPlayer(Player &player, const sim::SimConfig &config);
// Advances the death hop; returns true once the death countdown has elapsed.
bool StepDeath(Player &player, const sim::SimConfig &config);

bool OverlapsTileKind(const Player &player, const world::TileGrid &grid, world::TileKind kind);

}  // namespace tilerun::game
