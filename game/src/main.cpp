#include "autopilot.h"
#include "clock.h"
#include "config.h"
#include "event_log.h"
#include "level_gen.h"
#include "level_signature.h"
#include "session.h"
#include "sim_config.h"
#include "tick.h"
#include "usage.h"

#include <chrono>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>

namespace {
using tilerun::game::GameSession;
using tilerun::game::MetaState;

constexpr int kMaxCatchUpTicks = 5;

tilerun::sim::SimConfig LoadRunnerSimConfig(const RuntimeConfig &config) {
  std::filesystem::path path = config.sim_config_path;
  if (path.empty()) {
    path = tilerun::sim::ResolveSimConfigPath();
  }
  if (path.empty()) {
    std::cerr << "[warn] sim_config: not_found, using defaults\n";
    return tilerun::sim::kDefaultSimConfig;
  }
  std::string error;
  auto sim_config = tilerun::sim::LoadSimConfig(path, error);
  if (!error.empty()) {
    std::cerr << "[warn] " << error << "\n";
    return tilerun::sim::kDefaultSimConfig;
  }
  if (!tilerun::sim::ValidateSimConfig(sim_config, error)) {
    std::cerr << "[warn] " << error << ", using defaults\n";
    return tilerun::sim::kDefaultSimConfig;
  }
  return sim_config;
}

int DumpLevelSignature(const RuntimeConfig &config) {
  const auto level = tilerun::world::GenerateLevel(config.world, config.level, config.seed);
  tilerun::world::ValidateLevel(level);
  std::cout << tilerun::world::LevelSignature(level).dump() << "\n";
  return 0;
}

void LogEvents(GameSession &session) {
  for (const auto &event : session.DrainEvents()) {
    std::cout << BuildEventLine(NowUtcTimestamp(), event) << "\n";
  }
}

void LogHud(const GameSession &session) {
  const auto snapshot = session.Snapshot();
  auto fields = tilerun::game::HudToJson(snapshot.hud);
  fields["tick"] = snapshot.tick;
  fields["state"] = tilerun::game::MetaStateName(snapshot.state);
  fields["x"] = static_cast<int>(snapshot.player.x);
  fields["cameraX"] = static_cast<int>(snapshot.camera_x);
  std::cout << BuildEventLine(NowUtcTimestamp(), "hud", fields) << "\n";
}

bool Finished(const GameSession &session) {
  return session.state() == MetaState::GameOver || session.state() == MetaState::Victory;
}

// Runs one tick: autopilot input, step, log. Returns false once the game has
// ended and no tick limit keeps it going.
bool RunTick(GameSession &session, tilerun::game::Autopilot *autopilot, const RuntimeConfig &config) {
  if (autopilot != nullptr) {
    for (const auto &event : autopilot->Decide(session.Snapshot())) {
      session.PushInput(event);
    }
  }
  session.Tick();
  LogEvents(session);
  if (config.log_every > 0 && session.tick_count() % static_cast<uint64_t>(config.log_every) == 0) {
    LogHud(session);
  }
  return !(config.ticks == 0 && Finished(session));
}

int RunHeadless(const RuntimeConfig &config, const tilerun::sim::SimConfig &sim_config) {
  tilerun::game::SessionOptions options;
  options.seed = config.seed;
  options.start_world = config.world;
  options.start_level = config.level;
  options.sim_config = sim_config;

  tilerun::game::ManualClock manual_clock;
  tilerun::game::SteadyGameClock steady_clock;
  const tilerun::game::GameClock &clock =
      config.realtime ? static_cast<const tilerun::game::GameClock &>(steady_clock) : manual_clock;

  GameSession session(options, clock);
  tilerun::game::Autopilot autopilot;
  tilerun::game::Autopilot *pilot = config.autoplay ? &autopilot : nullptr;
  if (!config.autoplay) {
    session.StartLevel(config.world, config.level);
  }
  LogEvents(session);

  const auto limit = static_cast<uint64_t>(config.ticks);
  auto done = [&]() { return config.ticks > 0 && session.tick_count() >= limit; };

  if (!config.realtime) {
    const double dt = 1.0 / tilerun::sim::kTickRate;
    while (!done()) {
      manual_clock.Advance(dt);
      if (!RunTick(session, pilot, config)) {
        break;
      }
    }
  } else {
    TickAccumulator accumulator(tilerun::sim::kTickRate, kMaxCatchUpTicks);
    auto last_report = TickAccumulator::Clock::now();
    uint64_t ticks_since_report = 0;
    bool running = true;
    while (running && !done()) {
      const auto now = TickAccumulator::Clock::now();
      const int due = accumulator.Advance(now);
      for (int i = 0; i < due && running && !done(); ++i) {
        running = RunTick(session, pilot, config);
        ++ticks_since_report;
      }
      if (now - last_report >= std::chrono::seconds(1)) {
        const double seconds = std::chrono::duration<double>(now - last_report).count();
        std::cerr << "[tick] rate=" << (static_cast<double>(ticks_since_report) / seconds)
                  << " ticks=" << session.tick_count() << " dropped=" << accumulator.dropped_ticks()
                  << "\n";
        last_report = now;
        ticks_since_report = 0;
      }
      std::this_thread::sleep_until(accumulator.next_tick_time());
    }
  }

  const auto &board = session.scoreboard();
  nlohmann::json summary = {
      {"ticks", session.tick_count()},
      {"state", tilerun::game::MetaStateName(session.state())},
      {"world", session.world_index()},
      {"level", session.level_index()},
      {"score", board.score},
      {"coins", board.coins},
      {"lives", board.lives},
      {"seed", session.seed()},
  };
  std::cout << BuildEventLine(NowUtcTimestamp(), "summary", summary) << "\n";
  return 0;
}
}

int main(int argc, char **argv) {
  auto parse = ParseArgs(argc, argv);
  auto config_errors = ValidateConfig(parse.config);
  parse.errors.insert(parse.errors.end(), config_errors.begin(), config_errors.end());

  if (parse.config.show_help || !parse.errors.empty()) {
    for (const auto &error : parse.errors) {
      std::cerr << error << "\n";
    }
    std::cout << UsageText(argv[0]);
    return parse.errors.empty() ? 0 : 1;
  }

  try {
    if (parse.config.dump_level) {
      return DumpLevelSignature(parse.config);
    }
    const auto sim_config = LoadRunnerSimConfig(parse.config);
    return RunHeadless(parse.config, sim_config);
  } catch (const std::logic_error &error) {
    std::cerr << "[fatal] " << error.what() << "\n";
    return 2;
  }
}
