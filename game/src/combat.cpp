#include "combat.h"

#include <cmath>
#include <utility>

namespace tilerun::game {
namespace {
using actors::Entity;
using actors::EntityKind;

constexpr double kFireballMuzzleAhead = 32.0;
constexpr double kFireballMuzzleBehind = -8.0;
constexpr double kFireballMuzzleHeight = 16.0;

bool IsMovingShell(const Entity &entity, const sim::SimConfig &config) {
  return entity.kind == EntityKind::Koopa && entity.in_shell && std::abs(entity.vel_x) > config.walk_speed;
}

void HurtPlayer(ContactContext &ctx, Player &player) {
  switch (DamagePlayer(player, ctx.config)) {
    case DamageOutcome::Ignored:
      break;
    case DamageOutcome::Shrunk:
      Emit(ctx, GameEventKind::PlayerDamaged, player.x, player.y, 0, PowerTierName(player.power));
      break;
    case DamageOutcome::Killed:
      Emit(ctx, GameEventKind::PlayerDied, player.x, player.y, 0, "enemy");
      break;
  }
}

}  // namespace

const char *BlockHitOutcomeName(BlockHitOutcome outcome) {
  switch (outcome) {
    case BlockHitOutcome::None:
      return "none";
    case BlockHitOutcome::Coin:
      return "coin";
    case BlockHitOutcome::PowerUp:
      return "powerup";
    case BlockHitOutcome::BrickBroken:
      return "brick";
    case BlockHitOutcome::Bumped:
      return "bumped";
  }
  return "none";
}

void Emit(ContactContext &ctx, GameEventKind kind, double x, double y, int value, std::string detail) {
  GameEvent event;
  event.kind = kind;
  event.tick = ctx.tick;
  event.x = x;
  event.y = y;
  event.value = value;
  event.detail = std::move(detail);
  ctx.events.push_back(std::move(event));
}

BlockHitOutcome HitBlock(ContactContext &ctx, const Player &player, int tx, int ty) {
  const double block_x = sim::TileEdge(tx);
  const double block_y = sim::TileEdge(ty);
  switch (ctx.grid.tile_at(tx, ty)) {
    case world::TileKind::Question: {
      ctx.grid.set_tile(tx, ty, world::TileKind::Used);
      ctx.scoreboard.AddScore(kQuestionBlockScore);
      BlockHitOutcome outcome = BlockHitOutcome::Coin;
      if (player.power == PowerTier::Small && ctx.rng.Chance(kPowerUpChance)) {
        ctx.entities.Add(actors::MakeEmergingPowerUp(EntityKind::Mushroom, block_x, block_y));
        outcome = BlockHitOutcome::PowerUp;
      } else {
        ctx.entities.Add(actors::MakeCoinPop(block_x, block_y));
      }
      Emit(ctx, GameEventKind::BlockHit, block_x, block_y, kQuestionBlockScore, BlockHitOutcomeName(outcome));
      return outcome;
    }
    case world::TileKind::Brick:
      if (player.power == PowerTier::Small) {
        return BlockHitOutcome::Bumped;
      }
      ctx.grid.set_tile(tx, ty, world::TileKind::Air);
      ctx.effects.BrickDebris(block_x, block_y);
      ctx.scoreboard.AddScore(kBrickScore);
      Emit(ctx, GameEventKind::BrickBroken, block_x, block_y, kBrickScore);
      return BlockHitOutcome::BrickBroken;
    default:
      return BlockHitOutcome::None;
  }
}

void CollectCoin(ContactContext &ctx, double x, double y) {
  const bool one_up = ctx.scoreboard.CollectCoin();
  Emit(ctx, GameEventKind::Coin, x, y, ctx.scoreboard.coins);
  if (one_up) {
    ctx.effects.AddText(x, y - kOneUpTextOffset, "1UP!");
    Emit(ctx, GameEventKind::OneUp, x, y, ctx.scoreboard.lives);
  }
}

void ApplyPowerUp(ContactContext &ctx, Player &player, Entity &entity) {
  switch (entity.kind) {
    case EntityKind::Mushroom:
      if (player.power == PowerTier::Small) {
        SetPowerTier(player, PowerTier::Big);
      }
      break;
    case EntityKind::FireFlower:
      SetPowerTier(player, PowerTier::Fire);
      break;
    case EntityKind::Star:
      player.star_timer = kStarTicks;
      break;
    default:
      return;
  }
  entity.dead = true;
  ctx.scoreboard.AddScore(kPowerUpScore);
  ctx.effects.AddScore(entity.x, entity.y, kPowerUpScore);
  Emit(ctx, GameEventKind::PowerUp, entity.x, entity.y, kPowerUpScore, actors::EntityKindName(entity.kind));
}

bool IsStomp(const Player &player, const Entity &entity) {
  return player.vel_y > 0.0 && player.bottom() - kStompDepth < entity.y + entity.height / 2.0;
}

void StompEnemy(ContactContext &ctx, Player &player, Entity &entity) {
  player.vel_y = -ctx.config.stomp_bounce;
  entity.contact_grace = actors::kContactGraceTicks;
  switch (entity.kind) {
    case EntityKind::Goomba:
      entity.stomped = true;
      entity.stomp_timer = actors::kStompTicks;
      entity.active = false;
      entity.vel_x = 0.0;
      Emit(ctx, GameEventKind::Stomp, entity.x, entity.y, kStompScore, "goomba");
      break;
    case EntityKind::Koopa:
      if (entity.in_shell) {
        entity.vel_x = player.facing_right ? ctx.config.shell_kick_speed : -ctx.config.shell_kick_speed;
        Emit(ctx, GameEventKind::ShellKick, entity.x, entity.y, kStompScore);
      } else {
        entity.in_shell = true;
        entity.vel_x = 0.0;
        Emit(ctx, GameEventKind::Stomp, entity.x, entity.y, kStompScore, "koopa");
      }
      break;
    default:
      return;
  }
  ctx.scoreboard.AddScore(kStompScore);
  ctx.effects.AddScore(entity.x, entity.y, kStompScore);
}

void KillEnemy(ContactContext &ctx, Entity &entity, const char *cause) {
  entity.dead = true;
  ctx.scoreboard.AddScore(kKillScore);
  ctx.effects.AddScore(entity.x, entity.y, kKillScore);
  ctx.effects.Burst(entity.x, entity.y, entity.width, entity.height, kKillBurstParticles, ctx.rng);
  Emit(ctx, GameEventKind::EnemyKilled, entity.x, entity.y, kKillScore,
       std::string(actors::EntityKindName(entity.kind)) + ":" + cause);
}

void ResolvePlayerContacts(ContactContext &ctx, Player &player) {
  if (player.dead || player.invincibility > 0) {
    return;
  }
  for (auto &entity : ctx.entities.entities()) {
    if (player.dead) {
      return;
    }
    if (entity.dead || !entity.active || entity.kind == EntityKind::Fireball) {
      continue;
    }
    if (!sim::Overlaps(player.Bounds(), entity.Bounds())) {
      continue;
    }
    if (actors::IsPowerUp(entity.kind)) {
      ApplyPowerUp(ctx, player, entity);
      continue;
    }
    if (entity.kind == EntityKind::Coin) {
      entity.dead = true;
      CollectCoin(ctx, player.x, player.y);
      continue;
    }
    if (entity.contact_grace > 0) {
      continue;
    }
    if (player.star_timer > 0) {
      KillEnemy(ctx, entity, "star");
      continue;
    }
    if (IsStomp(player, entity)) {
      StompEnemy(ctx, player, entity);
    } else {
      HurtPlayer(ctx, player);
      if (player.invincibility > 0) {
        return;
      }
    }
  }
}

int ResolveProjectileContacts(ContactContext &ctx) {
  auto &list = ctx.entities.entities();
  int kills = 0;
  for (size_t i = 0; i < list.size(); ++i) {
    Entity &projectile = list[i];
    const bool fireball = projectile.kind == EntityKind::Fireball;
    const bool shell = IsMovingShell(projectile, ctx.config);
    if (projectile.dead || (!fireball && !shell)) {
      continue;
    }
    for (size_t j = 0; j < list.size(); ++j) {
      Entity &target = list[j];
      if (j == i || target.dead || !target.active || target.stomped || !actors::IsHostile(target.kind)) {
        continue;
      }
      if (shell && target.kind == EntityKind::Bowser) {
        continue;
      }
      if (!sim::Overlaps(projectile.Bounds(), target.Bounds())) {
        continue;
      }
      if (shell) {
        KillEnemy(ctx, target, "shell");
        ++kills;
        continue;
      }
      projectile.dead = true;
      target.hit_points -= 1;
      if (target.hit_points <= 0) {
        KillEnemy(ctx, target, "fireball");
        ++kills;
      }
      break;
    }
  }
  return kills;
}

bool ShootFireball(ContactContext &ctx, const Player &player) {
  if (player.dead || player.power != PowerTier::Fire) {
    return false;
  }
  if (ctx.entities.CountKind(EntityKind::Fireball) >= actors::kMaxFireballs) {
    return false;
  }
  const double x = player.x + (player.facing_right ? kFireballMuzzleAhead : kFireballMuzzleBehind);
  const double y = player.y + kFireballMuzzleHeight;
  ctx.entities.Add(actors::MakeFireball(x, y, player.facing_right, ctx.config));
  Emit(ctx, GameEventKind::Fireball, x, y);
  return true;
}

}  // namespace tilerun::game
