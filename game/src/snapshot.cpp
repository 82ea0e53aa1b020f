#include "snapshot.h"

#include <string>
#include <utility>

namespace tilerun::game {
namespace {
using nlohmann::json;

json PlayerToJson(const PlayerView &player) {
  return json{{"x", player.x},
              {"y", player.y},
              {"w", player.width},
              {"h", player.height},
              {"velX", player.vel_x},
              {"velY", player.vel_y},
              {"facingRight", player.facing_right},
              {"power", PowerTierName(player.power)},
              {"onGround", player.on_ground},
              {"crouching", player.crouching},
              {"invincible", player.invincible},
              {"star", player.star},
              {"frame", player.anim_frame},
              {"alive", player.alive},
              {"deathTicks", player.death_ticks}};
}

json EntityToJson(const EntityView &entity) {
  json out{{"kind", actors::EntityKindName(entity.kind)},
           {"x", entity.x},
           {"y", entity.y},
           {"w", entity.width},
           {"h", entity.height},
           {"facingRight", entity.facing_right},
           {"anim", entity.anim_tick}};
  if (entity.stomped) {
    out["stomped"] = true;
  }
  if (entity.in_shell) {
    out["shell"] = true;
  }
  if (entity.emerging) {
    out["emerging"] = true;
  }
  return out;
}

json TilesToJson(const world::TileGrid &grid) {
  json rows = json::array();
  for (int y = 0; y < grid.height(); ++y) {
    json row = json::array();
    for (const auto kind : grid.row(y)) {
      row.push_back(static_cast<int>(kind));
    }
    rows.push_back(std::move(row));
  }
  return rows;
}
}  // namespace

const char *MetaStateName(MetaState state) {
  switch (state) {
    case MetaState::Title:
      return "title";
    case MetaState::WorldIntro:
      return "world_intro";
    case MetaState::Playing:
      return "playing";
    case MetaState::Paused:
      return "paused";
    case MetaState::LevelComplete:
      return "level_complete";
    case MetaState::Victory:
      return "victory";
    case MetaState::GameOver:
      return "game_over";
  }
  return "title";
}

std::string WorldLevelLabel(int world, int level) {
  return std::to_string(world) + "-" + std::to_string(level);
}

json HudToJson(const HudView &hud) {
  return json{{"score", hud.score},
              {"coins", hud.coins},
              {"lives", hud.lives},
              {"time", hud.time_remaining},
              {"world", hud.label}};
}

json SnapshotToJson(const FrameSnapshot &snapshot, bool include_tiles) {
  json out;
  out["tick"] = snapshot.tick;
  out["state"] = MetaStateName(snapshot.state);
  out["theme"] = world::LevelThemeName(snapshot.theme);
  out["cameraX"] = snapshot.camera_x;
  out["flagPoleX"] = snapshot.flag_pole_x;
  out["flagY"] = snapshot.flag_y;
  out["player"] = PlayerToJson(snapshot.player);
  out["hud"] = HudToJson(snapshot.hud);

  json entities = json::array();
  for (const auto &entity : snapshot.entities) {
    entities.push_back(EntityToJson(entity));
  }
  out["entities"] = std::move(entities);
  out["particles"] = snapshot.particles.size();
  out["texts"] = snapshot.texts.size();

  if (include_tiles && snapshot.grid != nullptr) {
    out["width"] = snapshot.grid->width();
    out["tiles"] = TilesToJson(*snapshot.grid);
  }
  return out;
}

}  // namespace tilerun::game
