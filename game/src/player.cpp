#include "player.h"

#include <algorithm>

namespace tilerun::game {
namespace {
constexpr double kWallGap = 1.0;
constexpr double kFootInset = 2.0;

void TickTimers(Player &player) {
  if (player.invincibility > 0) {
    player.invincibility -= 1;
  }
  if (player.star_timer > 0) {
    player.star_timer -= 1;
  }
  player.anim_timer += 1;
  if (player.anim_timer >= kAnimTicksPerFrame) {
    player.anim_timer = 0;
    player.anim_frame = (player.anim_frame + 1) % kAnimFrames;
  }
}

}  // namespace

const char *PowerTierName(PowerTier tier) {
  switch (tier) {
    case PowerTier::Small:
      return "small";
    case PowerTier::Big:
      return "big";
    case PowerTier::Fire:
      return "fire";
  }
  return "small";
}

void SpawnPlayer(Player &player, double start_x, double floor_y) {
  player.x = start_x;
  player.y = floor_y - player.height();
  player.vel_x = 0.0;
  player.vel_y = 0.0;
  player.facing_right = true;
  player.on_ground = false;
  player.crouching = false;
  player.invincibility = 0;
  player.star_timer = 0;
  player.dead = false;
  player.death_timer = 0;
}

PlayerStepResult StepPlayer(Player &player,
                            const PlayerInput &input,
                            const world::TileGrid &grid,
                            bool underwater,
                            double camera_x,
                            const sim::SimConfig &config) {
  PlayerStepResult result;
  TickTimers(player);

  player.crouching = input.crouch && player.on_ground && player.power != PowerTier::Small;
  const bool left = input.left && !player.crouching;
  const bool right = input.right && !player.crouching;
  const int dir = sim::StepHorizontal(player.vel_x, left, right, input.run, config);
  if (dir != 0) {
    player.facing_right = dir > 0;
  }

  const bool jump_pressed = input.jump && !player.jump_held;
  player.jump_held = input.jump;
  if (jump_pressed && player.on_ground) {
    player.vel_y = -config.jump_velocity;
    player.on_ground = false;
  }
  player.vel_y = sim::ApplyJumpCut(player.vel_y, input.jump, config);
  player.vel_y = sim::ApplyPlayerGravity(player.vel_y, underwater, config);

  player.x += player.vel_x;
  ResolveHorizontal(player, grid);
  const double right_limit = sim::TileEdge(grid.width()) - player.width();
  player.x = std::min(player.x, right_limit);
  player.x = std::max(player.x, 0.0);
  if (camera_x > 0.0 && player.x < camera_x) {
    player.x = camera_x;
  }

  player.y += player.vel_y;
  result.block_hit = ResolveVertical(player, grid, result.hit_tx, result.hit_ty);

  result.fell_out = player.y > sim::LevelBottom() + kFallDeathMargin;
  return result;
}

void ResolveHorizontal(Player &player, const world::TileGrid &grid) {
  const int top_row = sim::TileCoord(player.y);
  const int bottom_row = sim::TileCoord(player.y + player.height() - 1.0);
  if (player.vel_x > 0.0) {
    const int tile_x = sim::TileCoord(player.x + player.width());
    for (int ty = top_row; ty <= bottom_row; ++ty) {
      if (grid.solid(tile_x, ty)) {
        player.x = sim::TileEdge(tile_x) - player.width() - kWallGap;
        player.vel_x = 0.0;
        return;
      }
    }
  } else if (player.vel_x < 0.0) {
    const int tile_x = sim::TileCoord(player.x);
    for (int ty = top_row; ty <= bottom_row; ++ty) {
      if (grid.solid(tile_x, ty)) {
        player.x = sim::TileEdge(tile_x + 1) + kWallGap;
        player.vel_x = 0.0;
        return;
      }
    }
  }
}

bool ResolveVertical(Player &player, const world::TileGrid &grid, int &hit_tx, int &hit_ty) {
  player.on_ground = false;
  const int first_col = sim::TileCoord(player.x + kFootInset);
  const int last_col = sim::TileCoord(player.x + player.width() - kFootInset);

  if (player.vel_y > 0.0) {
    const int tile_y = sim::TileCoord(player.bottom());
    for (int tx = first_col; tx <= last_col; ++tx) {
      if (grid.solid(tx, tile_y)) {
        player.y = sim::TileEdge(tile_y) - player.height();
        player.vel_y = 0.0;
        player.on_ground = true;
        return false;
      }
    }
    return false;
  }

  if (player.vel_y < 0.0) {
    const int tile_y = sim::TileCoord(player.y);
    // The column under the player's center wins when both are solid.
    const int center_col = sim::TileCoord(player.x + player.width() / 2.0);
    int bumped = -1;
    if (grid.solid(center_col, tile_y)) {
      bumped = center_col;
    } else {
      for (int tx = first_col; tx <= last_col; ++tx) {
        if (grid.solid(tx, tile_y)) {
          bumped = tx;
          break;
        }
      }
    }
    if (bumped >= 0) {
      player.y = sim::TileEdge(tile_y + 1);
      player.vel_y = 0.0;
      hit_tx = bumped;
      hit_ty = tile_y;
      return true;
    }
  }
  return false;
}

void SetPowerTier(Player &player, PowerTier tier) {
  const double feet = player.bottom();
  player.power = tier;
  player.y = feet - player.height();
}

DamageOutcome DamagePlayer(Player &player, const sim::SimConfig &config) {
  if (player.dead || player.invincibility > 0 || player.star_timer > 0) {
    return DamageOutcome::Ignored;
  }
  if (player.power == PowerTier::Small) {
    KillPlayer(player, config);
    return DamageOutcome::Killed;
  }
  SetPowerTier(player, PowerTier::Small);
  player.invincibility = kInvincibilityTicks;
  return DamageOutcome::Shrunk;
}

bool KillPlayer(Player &player, const sim::SimConfig &config) {
  if (player.dead) {
    return false;
  }
  player.dead = true;
  player.vel_x = 0.0;
  player.vel_y = -config.death_hop;
  player.death_timer = 0;
  player.crouching = false;
  return true;
}

bool StepDeath(Player &player, const sim::SimConfig &config) {
  player.death_timer += 1;
  player.vel_y += config.gravity * config.death_gravity_scale;
  player.y += player.vel_y;
  return player.death_timer > kDeathTicks;
}

bool OverlapsTileKind(const Player &player, const world::TileGrid &grid, world::TileKind kind) {
  const int x0 = sim::TileCoord(player.x);
  const int x1 = sim::TileCoord(player.x + player.width() - 1.0);
  const int y0 = sim::TileCoord(player.y);
  const int y1 = sim::TileCoord(player.y + player.height() - 1.0);
  for (int ty = y0; ty <= y1; ++ty) {
    for (int tx = x0; tx <= x1; ++tx) {
      if (grid.tile_at(tx, ty) == kind) {
        return true;
      }
    }
  }
  return false;
}

}  // namespace tilerun::game
