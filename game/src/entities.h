#pragma once

#include <cstdint>
#include <vector>

#include "sim/sim.h"
#include "tile_grid.h"

namespace tilerun::actors {

enum class EntityKind : uint8_t {
  Goomba = 0,
  Koopa,
  Bowser,
  Mushroom,
  FireFlower,
  Star,
  Coin,
  Fireball,
};

const char *EntityKindName(EntityKind kind);
bool IsHostile(EntityKind kind);
bool IsPowerUp(EntityKind kind);
// Enemies that probe for ledges and turn around instead of walking off.
bool IsPatrolling(EntityKind kind);

constexpr int kStompTicks = 30;
constexpr int kContactGraceTicks = 12;
constexpr int kBossHitPoints = 5;
constexpr int kMaxFireballs = 2;
constexpr double kCullMargin = 100.0;
// Spawns appear inside the cull band so a fresh entity cannot be culled on its first step.
constexpr double kActivationMargin = kCullMargin / 2.0;
constexpr double kLedgeProbe = 4.0;
constexpr double kStarBounceVelocity = 5.0;
constexpr double kFireballBounceVelocity = 4.0;
constexpr double kCoinPopVelocity = 10.0;
constexpr double kCoinPopGravity = 0.5;
constexpr double kEmergeRate = 1.0;

struct Entity {
  EntityKind kind = EntityKind::Goomba;
  double x = 0.0;
  double y = 0.0;
  double vel_x = 0.0;
  double vel_y = 0.0;
  double width = sim::kTileSize;
  double height = sim::kTileSize;
  bool active = true;
  bool dead = false;
  bool stomped = false;
  int stomp_timer = 0;
  bool in_shell = false;
  bool emerging = false;
  double emerge_target_y = 0.0;
  bool on_ground = false;
  int hit_points = 1;
  int contact_grace = 0;
  int anim_tick = 0;

  sim::Aabb Bounds() const { return {x, y, width, height}; }
};

Entity MakeEntity(EntityKind kind, double x, double y);
// A question-block coin that pops upward and is credited when it peaks.
Entity MakeCoinPop(double block_x, double block_y);
// A power-up that rises out of the block whose top edge is at block_top_y.
Entity MakeEmergingPowerUp(EntityKind kind, double block_x, double block_top_y);
Entity MakeFireball(double x, double y, bool facing_right, const sim::SimConfig &config);

struct EntitySpawn {
  EntityKind kind = EntityKind::Goomba;
  double x = 0.0;
  double y = 0.0;
  int dir = -1;
};

struct StepReport {
  int coins_collected = 0;
  int removed = 0;
};

// Owns every dynamic actor of the loaded level. Generator spawns are held back
// until the camera approaches them.
class EntitySimulation {
public:
  EntitySimulation() = default;

  void Reset(std::vector<EntitySpawn> spawns);
  void Clear();

  void Add(const Entity &entity);
  int ActivateSpawns(double camera_x);

  // Advances every entity one tick, then sweeps the dead and the off-screen.
  StepReport Step(const world::TileGrid &grid, double camera_x, const sim::SimConfig &config);
  // Drops entities marked dead; returns how many were removed.
  int Sweep();

  int CountKind(EntityKind kind) const;
  size_t pending_spawns() const;

  std::vector<Entity> &entities();
  const std::vector<Entity> &entities() const;

private:
  std::vector<EntitySpawn> pending_;
  size_t next_pending_ = 0;
  std::vector<Entity> entities_;
};

// Single-entity integrator; returns true when a popped coin reached its peak.
bool StepEntity(Entity &entity, const world::TileGrid &grid, const sim::SimConfig &config);
bool TouchesLava(const Entity &entity, const world::TileGrid &grid);

}  // namespace tilerun::actors
