#include "level_gen.h"
#include "session.h"

#include <cstddef>
#include <cstdint>

namespace {
uint32_t ReadU32(const uint8_t *data, size_t size, size_t offset) {
  uint32_t value = 0;
  for (size_t i = 0; i < 4 && offset + i < size; ++i) {
    value |= static_cast<uint32_t>(data[offset + i]) << (8 * i);
  }
  return value;
}
}

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
  if (size < 6) {
    return 0;
  }
  const int world = 1 + data[0] % tilerun::world::kMaxWorld;
  const int level = 1 + data[1] % tilerun::world::kLevelsPerWorld;
  const uint32_t seed = ReadU32(data, size, 2);

  const auto generated = tilerun::world::GenerateLevel(world, level, seed);
  tilerun::world::ValidateLevel(generated);

  // Remaining bytes drive a short session on the same level.
  tilerun::game::ManualClock clock;
  tilerun::game::SessionOptions options;
  options.seed = seed | 1u;
  options.start_world = world;
  options.start_level = level;
  tilerun::game::GameSession session(options, clock);
  session.StartLevel(world, level);
  for (size_t i = 6; i < size; ++i) {
    const uint8_t byte = data[i];
    session.PushInput({static_cast<tilerun::game::Button>(byte % 5), (byte & 0x80) == 0});
    for (int step = 0; step < 1 + ((byte >> 3) & 0x7); ++step) {
      clock.Advance(1.0 / 60.0);
      session.Tick();
    }
    session.DrainEvents();
  }
  return 0;
}
