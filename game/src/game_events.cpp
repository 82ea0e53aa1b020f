#include "game_events.h"

namespace tilerun::game {

const char *GameEventName(GameEventKind kind) {
  switch (kind) {
    case GameEventKind::LevelLoaded:
      return "level_loaded";
    case GameEventKind::StateChanged:
      return "state_changed";
    case GameEventKind::BlockHit:
      return "block_hit";
    case GameEventKind::BrickBroken:
      return "brick_broken";
    case GameEventKind::Coin:
      return "coin";
    case GameEventKind::OneUp:
      return "one_up";
    case GameEventKind::PowerUp:
      return "powerup";
    case GameEventKind::Stomp:
      return "stomp";
    case GameEventKind::ShellKick:
      return "shell_kick";
    case GameEventKind::EnemyKilled:
      return "enemy_killed";
    case GameEventKind::PlayerDamaged:
      return "player_damaged";
    case GameEventKind::PlayerDied:
      return "player_died";
    case GameEventKind::LifeLost:
      return "life_lost";
    case GameEventKind::Flag:
      return "flag";
    case GameEventKind::Axe:
      return "axe";
    case GameEventKind::LevelComplete:
      return "level_complete";
    case GameEventKind::GameOver:
      return "game_over";
    case GameEventKind::Victory:
      return "victory";
    case GameEventKind::Fireball:
      return "fireball";
  }
  return "unknown";
}

}  // namespace tilerun::game
