#include "entities.h"

#include <algorithm>
#include <cmath>
#include <utility>

namespace tilerun::actors {
namespace {
constexpr double kFireballSize = 12.0;
constexpr double kCoinWidth = 12.0;
constexpr double kLandingTolerance = 0.01;

void ResolveWalls(Entity &entity, const world::TileGrid &grid) {
  if (entity.vel_x == 0.0) {
    return;
  }
  const bool moving_right = entity.vel_x > 0.0;
  const int check_x = sim::TileCoord(moving_right ? entity.x + entity.width : entity.x);
  const int check_y = sim::TileCoord(entity.y + entity.height / 2.0);
  if (!grid.solid(check_x, check_y)) {
    return;
  }
  if (entity.kind == EntityKind::Fireball) {
    entity.dead = true;
    return;
  }
  entity.x = moving_right ? sim::TileEdge(check_x) - entity.width : sim::TileEdge(check_x + 1);
  entity.vel_x = -entity.vel_x;
}

// Lands on (or bumps against) the tile under the entity's center column using
// the position the entity is about to move to.
void ResolveVertical(Entity &entity, const world::TileGrid &grid) {
  const int column = sim::TileCoord(entity.x + entity.width / 2.0);
  entity.on_ground = false;
  if (entity.vel_y >= 0.0) {
    const double bottom = entity.y + entity.height;
    const int row = sim::TileCoord(bottom + entity.vel_y);
    if (grid.solid(column, row) && sim::TileEdge(row) >= bottom - kLandingTolerance) {
      entity.y = sim::TileEdge(row) - entity.height;
      entity.vel_y = 0.0;
      entity.on_ground = true;
    }
    return;
  }
  const int row = sim::TileCoord(entity.y + entity.vel_y);
  if (grid.solid(column, row) && sim::TileEdge(row + 1) <= entity.y + kLandingTolerance) {
    entity.y = sim::TileEdge(row + 1);
    entity.vel_y = 0.0;
  }
}

void ProbeLedge(Entity &entity, const world::TileGrid &grid) {
  if (!IsPatrolling(entity.kind) || entity.in_shell || !entity.on_ground || entity.vel_x == 0.0) {
    return;
  }
  const int ahead_x = entity.vel_x > 0.0 ? sim::TileCoord(entity.x + entity.width + kLedgeProbe)
                                         : sim::TileCoord(entity.x - kLedgeProbe);
  const int below_y = sim::TileCoord(entity.y + entity.height + kLedgeProbe);
  if (!grid.solid(ahead_x, below_y)) {
    entity.vel_x = -entity.vel_x;
  }
}

}  // namespace

const char *EntityKindName(EntityKind kind) {
  switch (kind) {
    case EntityKind::Goomba:
      return "goomba";
    case EntityKind::Koopa:
      return "koopa";
    case EntityKind::Bowser:
      return "bowser";
    case EntityKind::Mushroom:
      return "mushroom";
    case EntityKind::FireFlower:
      return "fireflower";
    case EntityKind::Star:
      return "star";
    case EntityKind::Coin:
      return "coin";
    case EntityKind::Fireball:
      return "fireball";
  }
  return "goomba";
}

bool IsHostile(EntityKind kind) {
  switch (kind) {
    case EntityKind::Goomba:
    case EntityKind::Koopa:
    case EntityKind::Bowser:
      return true;
    case EntityKind::Mushroom:
    case EntityKind::FireFlower:
    case EntityKind::Star:
    case EntityKind::Coin:
    case EntityKind::Fireball:
      return false;
  }
  return false;
}

bool IsPowerUp(EntityKind kind) {
  return kind == EntityKind::Mushroom || kind == EntityKind::FireFlower || kind == EntityKind::Star;
}

bool IsPatrolling(EntityKind kind) {
  return IsHostile(kind);
}

Entity MakeEntity(EntityKind kind, double x, double y) {
  Entity entity;
  entity.kind = kind;
  entity.x = x;
  entity.y = y;
  switch (kind) {
    case EntityKind::Goomba:
    case EntityKind::Koopa:
      entity.vel_x = -1.0;
      break;
    case EntityKind::Bowser:
      entity.width = sim::kTileSize * 2.0;
      entity.height = sim::kTileSize * 2.0;
      entity.vel_x = -1.0;
      entity.hit_points = kBossHitPoints;
      break;
    case EntityKind::Mushroom:
    case EntityKind::FireFlower:
    case EntityKind::Star:
      entity.vel_x = 2.0;
      break;
    case EntityKind::Coin:
      break;
    case EntityKind::Fireball:
      entity.width = kFireballSize;
      entity.height = kFireballSize;
      break;
  }
  return entity;
}

Entity MakeCoinPop(double block_x, double block_y) {
  Entity coin = MakeEntity(EntityKind::Coin, block_x + sim::kTileSize / 2.0 - kCoinWidth / 2.0,
                           block_y - sim::kTileSize);
  coin.width = kCoinWidth;
  coin.vel_y = -kCoinPopVelocity;
  coin.active = false;
  return coin;
}

Entity MakeEmergingPowerUp(EntityKind kind, double block_x, double block_top_y) {
  Entity power_up = MakeEntity(kind, block_x, block_top_y);
  power_up.emerging = true;
  power_up.emerge_target_y = block_top_y - power_up.height;
  return power_up;
}

Entity MakeFireball(double x, double y, bool facing_right, const sim::SimConfig &config) {
  Entity fireball = MakeEntity(EntityKind::Fireball, x, y);
  fireball.vel_x = facing_right ? config.fireball_speed : -config.fireball_speed;
  return fireball;
}

bool StepEntity(Entity &entity, const world::TileGrid &grid, const sim::SimConfig &config) {
  entity.anim_tick += 1;
  if (entity.contact_grace > 0) {
    entity.contact_grace -= 1;
  }

  if (entity.stomped) {
    entity.stomp_timer -= 1;
    if (entity.stomp_timer <= 0) {
      entity.dead = true;
    }
    return false;
  }

  if (entity.emerging) {
    entity.y -= kEmergeRate;
    if (entity.y <= entity.emerge_target_y) {
      entity.y = entity.emerge_target_y;
      entity.emerging = false;
    }
    return false;
  }

  if (entity.kind == EntityKind::Coin) {
    if (entity.vel_y < 0.0) {
      entity.y += entity.vel_y;
      entity.vel_y += kCoinPopGravity;
      if (entity.vel_y >= 0.0) {
        entity.dead = true;
        return true;
      }
    }
    return false;
  }

  entity.vel_y = sim::ApplyGravity(entity.vel_y, config.entity_gravity, config.entity_max_fall);

  entity.x += entity.vel_x;
  ResolveWalls(entity, grid);
  if (entity.dead) {
    return false;
  }

  ResolveVertical(entity, grid);
  if (entity.on_ground) {
    if (entity.kind == EntityKind::Star) {
      entity.vel_y = -kStarBounceVelocity;
    } else if (entity.kind == EntityKind::Fireball) {
      entity.vel_y = -kFireballBounceVelocity;
    }
  }
  entity.y += entity.vel_y;

  ProbeLedge(entity, grid);
  return false;
}

bool TouchesLava(const Entity &entity, const world::TileGrid &grid) {
  const int x0 = sim::TileCoord(entity.x);
  const int x1 = sim::TileCoord(entity.x + entity.width - 1.0);
  const int y0 = sim::TileCoord(entity.y);
  const int y1 = sim::TileCoord(entity.y + entity.height - 1.0);
  for (int ty = y0; ty <= y1; ++ty) {
    for (int tx = x0; tx <= x1; ++tx) {
      if (grid.tile_at(tx, ty) == world::TileKind::Lava) {
        return true;
      }
    }
  }
  return false;
}

void EntitySimulation::Reset(std::vector<EntitySpawn> spawns) {
  pending_ = std::move(spawns);
  std::stable_sort(pending_.begin(), pending_.end(),
                   [](const EntitySpawn &a, const EntitySpawn &b) { return a.x < b.x; });
  next_pending_ = 0;
  entities_.clear();
}

void EntitySimulation::Clear() {
  Reset({});
}

void EntitySimulation::Add(const Entity &entity) {
  entities_.push_back(entity);
}

int EntitySimulation::ActivateSpawns(double camera_x) {
  const double reach = camera_x + sim::kViewportWidth + kActivationMargin;
  int activated = 0;
  while (next_pending_ < pending_.size() && pending_[next_pending_].x <= reach) {
    const EntitySpawn &spawn = pending_[next_pending_++];
    if (spawn.x < camera_x - kCullMargin) {
      continue;
    }
    Entity entity = MakeEntity(spawn.kind, spawn.x, spawn.y);
    entity.vel_x = std::abs(entity.vel_x) * (spawn.dir < 0 ? -1.0 : 1.0);
    entities_.push_back(entity);
    ++activated;
  }
  return activated;
}

StepReport EntitySimulation::Step(const world::TileGrid &grid, double camera_x, const sim::SimConfig &config) {
  StepReport report;
  const double left = camera_x - kCullMargin;
  const double right = camera_x + sim::kViewportWidth + kCullMargin;
  for (auto &entity : entities_) {
    if (entity.dead) {
      continue;
    }
    if (StepEntity(entity, grid, config)) {
      report.coins_collected += 1;
    }
    if (TouchesLava(entity, grid) || entity.y > sim::LevelBottom() || entity.x < left || entity.x > right) {
      entity.dead = true;
    }
  }
  report.removed = Sweep();
  return report;
}

int EntitySimulation::Sweep() {
  const size_t before = entities_.size();
  entities_.erase(std::remove_if(entities_.begin(), entities_.end(),
                                 [](const Entity &entity) { return entity.dead; }),
                  entities_.end());
  return static_cast<int>(before - entities_.size());
}

int EntitySimulation::CountKind(EntityKind kind) const {
  return static_cast<int>(std::count_if(entities_.begin(), entities_.end(),
                                        [kind](const Entity &entity) { return entity.kind == kind; }));
}

size_t EntitySimulation::pending_spawns() const {
  return pending_.size() - next_pending_;
}

std::vector<Entity> &EntitySimulation::entities() {
  return entities_;
}

const std::vector<Entity> &EntitySimulation::entities() const {
  return entities_;
}

}  // namespace tilerun::actors
