#pragma once

#include <cstdint>
#include <string>

namespace tilerun::game {

enum class GameEventKind : uint8_t {
  LevelLoaded = 0,
  StateChanged,
  BlockHit,
  BrickBroken,
  Coin,
  OneUp,
  PowerUp,
  Stomp,
  ShellKick,
  EnemyKilled,
  PlayerDamaged,
  PlayerDied,
  LifeLost,
  Flag,
  Axe,
  LevelComplete,
  GameOver,
  Victory,
  Fireball,
};

const char *GameEventName(GameEventKind kind);

struct GameEvent {
  GameEventKind kind = GameEventKind::StateChanged;
  int tick = 0;
  double x = 0.0;
  double y = 0.0;
  int value = 0;
  std::string detail;
};

}  // namespace tilerun::game
