#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "effects.h"
#include "entities.h"
#include "level_gen.h"
#include "player.h"
#include "tile_grid.h"

namespace tilerun::game {

enum class MetaState : uint8_t {
  Title = 0,
  WorldIntro,
  Playing,
  Paused,
  LevelComplete,
  Victory,
  GameOver,
};

const char *MetaStateName(MetaState state);

struct EntityView {
  actors::EntityKind kind = actors::EntityKind::Goomba;
  double x = 0.0;
  double y = 0.0;
  double width = 0.0;
  double height = 0.0;
  bool facing_right = false;
  bool stomped = false;
  bool in_shell = false;
  bool emerging = false;
  int anim_tick = 0;
};

struct PlayerView {
  double x = 0.0;
  double y = 0.0;
  double width = 0.0;
  double height = 0.0;
  double vel_x = 0.0;
  double vel_y = 0.0;
  bool facing_right = true;
  PowerTier power = PowerTier::Small;
  bool on_ground = false;
  bool crouching = false;
  bool invincible = false;
  bool star = false;
  int anim_frame = 0;
  bool alive = true;
  int death_ticks = 0;
};

struct HudView {
  int score = 0;
  int coins = 0;
  int lives = 0;
  int time_remaining = 0;
  int world = 1;
  int level = 1;
  std::string label;
};

// Read-only view of one frame for the presentation layer. `grid` is borrowed
// from the session and stays valid until the next tick.
struct FrameSnapshot {
  uint64_t tick = 0;
  MetaState state = MetaState::Title;
  world::LevelTheme theme = world::LevelTheme::Overworld;
  bool underground = false;
  bool underwater = false;
  bool castle = false;
  double camera_x = 0.0;
  const world::TileGrid *grid = nullptr;
  int flag_pole_x = -1;
  double flag_y = 0.0;
  int intro_ticks = 0;
  std::vector<EntityView> entities;
  std::vector<actors::Particle> particles;
  std::vector<actors::FloatingText> texts;
  PlayerView player;
  HudView hud;
};

std::string WorldLevelLabel(int world, int level);

nlohmann::json HudToJson(const HudView &hud);
nlohmann::json SnapshotToJson(const FrameSnapshot &snapshot, bool include_tiles);

}  // namespace tilerun::game
