#include <doctest/doctest.h>

#include "scoreboard.h"

TEST_CASE("Scoreboard starts with three lives and a full clock") {
  tilerun::game::Scoreboard board;
  CHECK(board.score == 0);
  CHECK(board.coins == 0);
  CHECK(board.lives == tilerun::game::kStartingLives);
  CHECK(board.time_remaining == tilerun::game::kLevelTimeSeconds);
}

TEST_CASE("Scoreboard ignores non-positive score") {
  tilerun::game::Scoreboard board;
  board.AddScore(500);
  board.AddScore(-200);
  board.AddScore(0);
  CHECK(board.score == 500);
}

TEST_CASE("Scoreboard grants a life every hundred coins") {
  tilerun::game::Scoreboard board;
  for (int i = 0; i < 99; ++i) {
    CHECK_FALSE(board.CollectCoin());
  }
  CHECK(board.coins == 99);
  CHECK(board.score == 99 * tilerun::game::kCoinScore);

  CHECK(board.CollectCoin());
  CHECK(board.coins == 0);
  CHECK(board.lives == tilerun::game::kStartingLives + 1);
}

TEST_CASE("Scoreboard lives bottom out at zero") {
  tilerun::game::Scoreboard board;
  CHECK_FALSE(board.LoseLife());
  CHECK_FALSE(board.LoseLife());
  CHECK(board.LoseLife());
  CHECK(board.lives == 0);
  CHECK(board.LoseLife());
  CHECK(board.lives == 0);
}

TEST_CASE("Scoreboard timer reports zero exactly once") {
  tilerun::game::Scoreboard board;
  board.time_remaining = 2;
  CHECK_FALSE(board.TickSecond());
  CHECK(board.TickSecond());
  CHECK(board.time_remaining == 0);
  CHECK_FALSE(board.TickSecond());
  CHECK(board.time_remaining == 0);

  board.ResetTimer();
  CHECK(board.time_remaining == tilerun::game::kLevelTimeSeconds);
}

TEST_CASE("Scoreboard time bonus converts seconds into score") {
  tilerun::game::Scoreboard board;
  board.score = 1000;
  board.time_remaining = 120;
  CHECK(board.AwardTimeBonus() == 120 * tilerun::game::kTimeBonusPerSecond);
  CHECK(board.score == 1000 + 6000);
}

TEST_CASE("Scoreboard reset restores a new game") {
  tilerun::game::Scoreboard board;
  board.score = 12345;
  board.coins = 42;
  board.lives = 1;
  board.time_remaining = 7;
  board.Reset();
  CHECK(board.score == 0);
  CHECK(board.coins == 0);
  CHECK(board.lives == tilerun::game::kStartingLives);
  CHECK(board.time_remaining == tilerun::game::kLevelTimeSeconds);
}
