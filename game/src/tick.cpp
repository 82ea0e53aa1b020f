#include "tick.h"

#include <algorithm>

TickAccumulator::TickAccumulator(int tick_rate, int max_catch_up)
    : tick_rate_(std::max(tick_rate, 1)), max_catch_up_(std::max(max_catch_up, 0)) {
  tick_duration_ = std::chrono::duration_cast<Clock::duration>(std::chrono::duration<double>(1.0 / tick_rate_));
  tick_duration_ = std::max(tick_duration_, Clock::duration{1});
}

int TickAccumulator::Advance(Clock::time_point now) {
  if (!anchored_) {
    anchored_ = true;
    anchor_ = now;
    scheduled_ticks_ = 0;
    return 0;
  }
  if (now < anchor_) {
    return 0;
  }
  const auto elapsed_ticks = static_cast<uint64_t>((now - anchor_) / tick_duration_);
  if (elapsed_ticks <= scheduled_ticks_) {
    return 0;
  }
  const uint64_t due = elapsed_ticks - scheduled_ticks_;
  scheduled_ticks_ = elapsed_ticks;
  if (max_catch_up_ > 0 && due > static_cast<uint64_t>(max_catch_up_)) {
    dropped_ticks_ += due - static_cast<uint64_t>(max_catch_up_);
    return max_catch_up_;
  }
  return static_cast<int>(due);
}

void TickAccumulator::Reset() {
  anchored_ = false;
  anchor_ = Clock::time_point{};
  scheduled_ticks_ = 0;
}

int TickAccumulator::tick_rate() const {
  return tick_rate_;
}

TickAccumulator::Clock::duration TickAccumulator::tick_duration() const {
  return tick_duration_;
}

TickAccumulator::Clock::time_point TickAccumulator::next_tick_time() const {
  return anchor_ + tick_duration_ * static_cast<Clock::rep>(scheduled_ticks_ + 1);
}

bool TickAccumulator::initialized() const {
  return anchored_;
}

uint64_t TickAccumulator::scheduled_ticks() const {
  return scheduled_ticks_;
}

uint64_t TickAccumulator::dropped_ticks() const {
  return dropped_ticks_;
}
