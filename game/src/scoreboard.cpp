#include "scoreboard.h"

namespace tilerun::game {

void Scoreboard::AddScore(int points) {
  if (points > 0) {
    score += points;
  }
}

bool Scoreboard::CollectCoin() {
  AddScore(kCoinScore);
  coins += 1;
  if (coins >= kCoinsPerLife) {
    coins = 0;
    lives += 1;
    return true;
  }
  return false;
}

bool Scoreboard::LoseLife() {
  if (lives > 0) {
    lives -= 1;
  }
  return lives == 0;
}

bool Scoreboard::TickSecond() {
  if (time_remaining <= 0) {
    return false;
  }
  time_remaining -= 1;
  return time_remaining == 0;
}

int Scoreboard::AwardTimeBonus() {
  const int bonus = time_remaining * kTimeBonusPerSecond;
  AddScore(bonus);
  return bonus;
}

void Scoreboard::ResetTimer() {
  time_remaining = kLevelTimeSeconds;
}

void Scoreboard::Reset() {
  *this = Scoreboard{};
}

}  // namespace tilerun::game
