#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "effects.h"
#include "entities.h"
#include "game_events.h"
#include "player.h"
#include "rng.h"
#include "scoreboard.h"
#include "sim/sim.h"
#include "tile_grid.h"

namespace tilerun::game {

constexpr double kPowerUpChance = 0.25;
constexpr double kStompDepth = 10.0;
constexpr int kKillBurstParticles = 6;
constexpr double kOneUpTextOffset = 30.0;

// Everything a contact may touch during one tick. Borrowed from the session.
struct ContactContext {
  world::TileGrid &grid;
  actors::EntitySimulation &entities;
  actors::Effects &effects;
  Scoreboard &scoreboard;
  XorShift32 &rng;
  std::vector<GameEvent> &events;
  const sim::SimConfig &config;
  int tick = 0;
};

enum class BlockHitOutcome : uint8_t {
  None = 0,
  Coin,
  PowerUp,
  BrickBroken,
  Bumped,
};

const char *BlockHitOutcomeName(BlockHitOutcome outcome);

void Emit(ContactContext &ctx, GameEventKind kind, double x, double y, int value = 0, std::string detail = {});

// Question blocks turn Used and release a coin (or, rarely and only while
// Small, a mushroom); bricks break when the player is above Small.
BlockHitOutcome HitBlock(ContactContext &ctx, const Player &player, int tx, int ty);

void CollectCoin(ContactContext &ctx, double x, double y);
void ApplyPowerUp(ContactContext &ctx, Player &player, actors::Entity &entity);

bool IsStomp(const Player &player, const actors::Entity &entity);
void StompEnemy(ContactContext &ctx, Player &player, actors::Entity &entity);
void KillEnemy(ContactContext &ctx, actors::Entity &entity, const char *cause);

// Player against every active entity. Skipped entirely while the player is
// dead or blinking after damage.
void ResolvePlayerContacts(ContactContext &ctx, Player &player);

// Fireballs and moving shells against hostiles. Returns the number of kills.
int ResolveProjectileContacts(ContactContext &ctx);

bool ShootFireball(ContactContext &ctx, const Player &player);

}  // namespace tilerun::game
