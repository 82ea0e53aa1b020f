#pragma once

namespace tilerun::game {

constexpr int kStartingLives = 3;
constexpr int kCoinsPerLife = 100;
constexpr int kLevelTimeSeconds = 400;
constexpr int kTimeBonusPerSecond = 50;
constexpr int kCoinScore = 200;
constexpr int kQuestionBlockScore = 100;
constexpr int kBrickScore = 50;
constexpr int kStompScore = 100;
constexpr int kKillScore = 200;
constexpr int kPowerUpScore = 1000;
constexpr int kMinFlagScore = 100;

// HUD counters. Score and lives never go negative.
struct Scoreboard {
  int score = 0;
  int coins = 0;
  int lives = kStartingLives;
  int time_remaining = kLevelTimeSeconds;

  void AddScore(int points);
  // Returns true when the coin completed a hundred and granted a life.
  bool CollectCoin();
  // Returns true when no lives remain.
  bool LoseLife();
  // Ticks the level clock down by one second; returns true on the tick it reaches zero.
  bool TickSecond();
  // Converts the remaining time into score and returns the bonus.
  int AwardTimeBonus();
  void ResetTimer();
  void Reset();
};

}  // namespace tilerun::game
