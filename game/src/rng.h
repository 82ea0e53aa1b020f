#pragma once

#include <cstdint>

namespace tilerun {

class XorShift32 {
public:
  explicit XorShift32(uint32_t seed) : state_(seed == 0 ? 1u : seed) {}

  uint32_t Next() {
    uint32_t x = state_;
    x ^= x << 13;
    x ^= x >> 17;
    x ^= x << 5;
    state_ = x == 0 ? 1u : x;
    return state_;
  }

  // Uniform in [0, 1).
  double NextUnit() {
    return static_cast<double>(Next()) / 4294967296.0;
  }

  // Uniform integer in [lo, hi]; returns lo when the range is empty.
  int NextInt(int lo, int hi) {
    if (hi <= lo) {
      return lo;
    }
    const uint32_t span = static_cast<uint32_t>(hi - lo) + 1u;
    return lo + static_cast<int>(Next() % span);
  }

  double NextRange(double lo, double hi) {
    return lo + (hi - lo) * NextUnit();
  }

  bool Chance(double probability) {
    return NextUnit() < probability;
  }

  uint32_t state() const { return state_; }

private:
  uint32_t state_ = 1u;
};

}  // namespace tilerun
