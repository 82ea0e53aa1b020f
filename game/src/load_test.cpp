#include <chrono>
#include <iostream>
#include <iterator>
#include <memory>
#include <random>
#include <string>
#include <vector>

#include "clock.h"
#include "session.h"
#include "sim/sim.h"

namespace {
int ParseInt(const char *value, int fallback) {
  if (!value) {
    return fallback;
  }
  try {
    return std::stoi(value);
  } catch (const std::exception &) {
    return fallback;
  }
}

constexpr tilerun::game::Button kPlayButtons[] = {
    tilerun::game::Button::Left,    tilerun::game::Button::Right,
    tilerun::game::Button::Jump,    tilerun::game::Button::RunFire,
    tilerun::game::Button::Crouch,
};
}

int main(int argc, char **argv) {
  int sessions = 32;
  int ticks = 600;
  unsigned int seed = 1337;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--sessions" && i + 1 < argc) {
      sessions = ParseInt(argv[++i], sessions);
    } else if (arg == "--ticks" && i + 1 < argc) {
      ticks = ParseInt(argv[++i], ticks);
    } else if (arg == "--seed" && i + 1 < argc) {
      seed = static_cast<unsigned int>(ParseInt(argv[++i], static_cast<int>(seed)));
    }
  }

  if (sessions <= 0 || ticks <= 0) {
    std::cerr << "Invalid sessions/ticks\n";
    return 1;
  }

  std::mt19937 rng(seed);
  std::uniform_int_distribution<int> world_dist(1, 8);
  std::uniform_int_distribution<int> level_dist(1, 4);
  std::uniform_int_distribution<size_t> button_dist(0, std::size(kPlayButtons) - 1);
  std::bernoulli_distribution toggle(0.1);

  tilerun::game::ManualClock clock;
  std::vector<std::unique_ptr<tilerun::game::GameSession>> games;
  games.reserve(static_cast<size_t>(sessions));
  for (int i = 0; i < sessions; ++i) {
    tilerun::game::SessionOptions options;
    options.seed = static_cast<uint32_t>(rng()) | 1u;
    options.start_world = world_dist(rng);
    options.start_level = level_dist(rng);
    games.push_back(std::make_unique<tilerun::game::GameSession>(options, clock));
    games.back()->StartLevel(options.start_world, options.start_level);
  }

  size_t event_count = 0;
  const double dt = 1.0 / tilerun::sim::kTickRate;
  auto start = std::chrono::steady_clock::now();
  for (int tick = 0; tick < ticks; ++tick) {
    clock.Advance(dt);
    for (auto &game : games) {
      if (toggle(rng)) {
        game->PushInput({kPlayButtons[button_dist(rng)], toggle(rng) || toggle(rng)});
      }
      game->Tick();
      event_count += game->DrainEvents().size();
    }
  }
  auto end = std::chrono::steady_clock::now();
  const auto elapsed = std::chrono::duration_cast<std::chrono::duration<double>>(end - start);
  const double total_ticks = static_cast<double>(sessions) * static_cast<double>(ticks);
  const double ticks_per_sec = elapsed.count() > 0 ? total_ticks / elapsed.count() : 0.0;

  std::cout << "load_test sessions=" << sessions << " ticks=" << ticks
            << " seconds=" << elapsed.count() << " events=" << event_count
            << " ticks_per_sec=" << ticks_per_sec << "\n";
  return 0;
}
