#pragma once

#include <chrono>
#include <cstdint>

// Schedules fixed-rate ticks against an anchor time. Tick n is due at
// anchor + n * tick_duration, so rounding never accumulates. A caller that
// falls behind gets at most `max_catch_up` ticks per Advance (0 means no cap);
// the rest are skipped and counted in dropped_ticks().
class TickAccumulator {
public:
  using Clock = std::chrono::steady_clock;

  explicit TickAccumulator(int tick_rate, int max_catch_up = 0);

  // Returns how many ticks to run now. The first call only sets the anchor.
  int Advance(Clock::time_point now);
  void Reset();

  int tick_rate() const;
  Clock::duration tick_duration() const;
  Clock::time_point next_tick_time() const;
  bool initialized() const;
  uint64_t scheduled_ticks() const;
  uint64_t dropped_ticks() const;

private:
  int tick_rate_ = 1;
  int max_catch_up_ = 0;
  Clock::duration tick_duration_{};
  Clock::time_point anchor_{};
  uint64_t scheduled_ticks_ = 0;
  uint64_t dropped_ticks_ = 0;
  bool anchored_ = false;
};
