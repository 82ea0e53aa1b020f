#include "autopilot.h"

#include <cmath>
#include <cstddef>

#include "sim/sim.h"

namespace tilerun::game {
namespace {
constexpr int kJumpHoldTicks = 20;
constexpr int kStuckTicks = 30;
constexpr int kFireInterval = 20;
constexpr double kWallLookahead = 8.0;
constexpr double kGapLookahead = 20.0;
constexpr double kEnemyJumpReach = 72.0;
constexpr double kEnemyFireReach = 260.0;

size_t ButtonIndex(Button button) {
  return static_cast<size_t>(button);
}

bool WallAhead(const world::TileGrid &grid, const PlayerView &player) {
  const int column = sim::TileCoord(player.x + player.width + kWallLookahead);
  const int top = sim::TileCoord(player.y);
  const int bottom = sim::TileCoord(player.y + player.height - 1.0);
  for (int row = top; row <= bottom; ++row) {
    if (grid.solid(column, row)) {
      return true;
    }
  }
  return false;
}

bool GapAhead(const world::TileGrid &grid, const PlayerView &player) {
  const int column = sim::TileCoord(player.x + player.width + kGapLookahead);
  const int below = sim::TileCoord(player.y + player.height + 1.0);
  for (int row = below; row < grid.height(); ++row) {
    if (grid.solid(column, row)) {
      return false;
    }
  }
  return true;
}

}  // namespace

std::vector<InputEvent> Autopilot::Decide(const FrameSnapshot &snapshot) {
  std::vector<InputEvent> out;
  switch (snapshot.state) {
    case MetaState::Title:
      if (held_[ButtonIndex(Button::Confirm)]) {
        Set(Button::Confirm, false, out);
      } else {
        ReleaseAll(out);
        Set(Button::Confirm, true, out);
      }
      return out;
    case MetaState::Playing:
      break;
    case MetaState::WorldIntro:
    case MetaState::Paused:
    case MetaState::LevelComplete:
    case MetaState::Victory:
    case MetaState::GameOver:
      ReleaseAll(out);
      last_x_ = -1.0;
      stuck_ticks_ = 0;
      return out;
  }

  const PlayerView &player = snapshot.player;
  if (!player.alive) {
    ReleaseAll(out);
    return out;
  }

  Set(Button::Confirm, false, out);
  Set(Button::Right, true, out);
  Set(Button::RunFire, true, out);

  if (std::abs(player.x - last_x_) < 0.5) {
    stuck_ticks_ += 1;
  } else {
    stuck_ticks_ = 0;
  }
  last_x_ = player.x;

  if (held_[ButtonIndex(Button::Jump)]) {
    jump_ticks_ += 1;
    if (jump_ticks_ >= kJumpHoldTicks || (player.on_ground && jump_ticks_ > 2)) {
      Set(Button::Jump, false, out);
    }
  } else if (player.on_ground && WantsJump(snapshot)) {
    Set(Button::Jump, true, out);
    jump_ticks_ = 0;
    stuck_ticks_ = 0;
  }

  if (fire_cooldown_ > 0) {
    fire_cooldown_ -= 1;
  } else if (player.power == PowerTier::Fire && EnemyAhead(snapshot, kEnemyFireReach)) {
    // A fresh press throws; run stays held across the re-press.
    Set(Button::RunFire, false, out);
    Set(Button::RunFire, true, out);
    fire_cooldown_ = kFireInterval;
  }
  return out;
}

void Autopilot::Set(Button button, bool down, std::vector<InputEvent> &out) {
  bool &held = held_[ButtonIndex(button)];
  if (held == down) {
    return;
  }
  held = down;
  out.push_back({button, down});
}

void Autopilot::ReleaseAll(std::vector<InputEvent> &out) {
  for (size_t i = 0; i < held_.size(); ++i) {
    Set(static_cast<Button>(i), false, out);
  }
  jump_ticks_ = 0;
}

bool Autopilot::WantsJump(const FrameSnapshot &snapshot) const {
  if (stuck_ticks_ >= kStuckTicks || EnemyAhead(snapshot, kEnemyJumpReach)) {
    return true;
  }
  if (snapshot.grid == nullptr) {
    return false;
  }
  return WallAhead(*snapshot.grid, snapshot.player) || GapAhead(*snapshot.grid, snapshot.player);
}

bool Autopilot::EnemyAhead(const FrameSnapshot &snapshot, double reach) const {
  const PlayerView &player = snapshot.player;
  const double front = player.x + player.width;
  for (const auto &entity : snapshot.entities) {
    if (!actors::IsHostile(entity.kind) || entity.stomped) {
      continue;
    }
    const double distance = entity.x - front;
    const bool level = entity.y < player.y + player.height && entity.y + entity.height > player.y;
    if (distance >= 0.0 && distance <= reach && level) {
      return true;
    }
  }
  return false;
}

}  // namespace tilerun::game
