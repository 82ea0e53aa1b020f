#pragma once

#include <chrono>

namespace tilerun::game {

// Wall-clock source for the level countdown.
class GameClock {
public:
  virtual ~GameClock() = default;
  virtual double NowSeconds() const = 0;
};

class SteadyGameClock : public GameClock {
public:
  SteadyGameClock() : origin_(std::chrono::steady_clock::now()) {}

  double NowSeconds() const override {
    const auto elapsed = std::chrono::steady_clock::now() - origin_;
    return std::chrono::duration<double>(elapsed).count();
  }

private:
  std::chrono::steady_clock::time_point origin_;
};

// Deterministic clock for tests and the headless runner.
class ManualClock : public GameClock {
public:
  double NowSeconds() const override { return now_; }

  void Advance(double seconds) { now_ += seconds; }
  void Set(double seconds) { now_ = seconds; }

private:
  double now_ = 0.0;
};

}  // namespace tilerun::game
