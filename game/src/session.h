#pragma once

#include <cstdint>
#include <deque>
#include <string>
#include <vector>

#include "clock.h"
#include "combat.h"
#include "effects.h"
#include "entities.h"
#include "game_events.h"
#include "input.h"
#include "level_gen.h"
#include "player.h"
#include "rng.h"
#include "scoreboard.h"
#include "sim/sim.h"
#include "snapshot.h"

namespace tilerun::game {

constexpr int kWorldIntroTicks = 180;
constexpr int kLevelCompleteHoldTicks = 60;
constexpr int kBridgeCollapseInterval = 4;
constexpr int kFireworkInterval = 20;
constexpr double kFlagSlideSpeed = 3.0;
constexpr double kFlagSlideDistance = sim::kViewportHeight - sim::kTileSize * 3.0;
constexpr double kFlagTriggerTiles = 1.5;
constexpr double kExitWalkSpeed = 2.0;
constexpr double kExitDropSpeed = 4.0;
constexpr double kExitMargin = 50.0;
constexpr double kCameraLead = sim::kViewportWidth / 3.0;
constexpr double kCameraSmoothing = 0.1;

// Sub-phase of a level while the meta-state is Playing or LevelComplete.
enum class LevelPhase : uint8_t {
  Running = 0,
  FlagSlide,
  BridgeCollapse,
  CompleteHold,
  ExitWalk,
};

const char *LevelPhaseName(LevelPhase phase);

struct SessionOptions {
  // 0 draws a seed from std::random_device.
  uint32_t seed = 0;
  int start_world = 1;
  int start_level = 1;
  sim::SimConfig sim_config = sim::kDefaultSimConfig;
};

// Owns the whole game: meta-state, scoreboard, player, the loaded level and
// its actors. Driven by one caller: PushInput between ticks, Tick once per
// frame, then Snapshot and DrainEvents for presentation.
class GameSession {
public:
  // `clock` must outlive the session.
  GameSession(const SessionOptions &options, const GameClock &clock);

  void PushInput(const InputEvent &event);
  void Tick();

  FrameSnapshot Snapshot() const;
  std::vector<GameEvent> DrainEvents();

  // Skips the title and intro and starts playing the given level.
  void StartLevel(int world, int level);

  MetaState state() const;
  LevelPhase phase() const;
  uint64_t tick_count() const;
  int world_index() const;
  int level_index() const;
  uint32_t seed() const;
  double camera_x() const;
  double flag_y() const;
  bool underwater() const;

  const Scoreboard &scoreboard() const;
  const Player &player() const;
  const world::GeneratedLevel &level() const;
  const actors::EntitySimulation &entities() const;
  const actors::Effects &effects() const;

  Scoreboard &mutable_scoreboard();
  Player &mutable_player();
  world::GeneratedLevel &mutable_level();
  actors::EntitySimulation &mutable_entities();

private:
  void ApplyInput(const InputEvent &event);
  void SetHeld(Button button, bool pressed);
  void SetState(MetaState next);
  void ResetGame();
  void StartGame();
  void LoadLevel(int world, int level, uint32_t seed);
  void LoseLife();
  void AdvanceLevel();

  void TickPlaying();
  void TickCountdown();
  void TickRunning(ContactContext &ctx);
  void TickEntities(ContactContext &ctx, bool contacts);
  void TickFlagSlide();
  void TickBridgeCollapse();
  void TickLevelComplete(ContactContext &ctx);
  void TickVictory();
  void CheckGoals();
  void TriggerFlag();
  void TriggerAxe();
  void UpdateCamera();
  void StepExitWalk();
  void Record(GameEventKind kind, double x, double y, int value = 0, std::string detail = {});
  ContactContext Contacts();

  SessionOptions options_;
  const GameClock &clock_;
  XorShift32 rng_;
  MetaState state_ = MetaState::Title;
  LevelPhase phase_ = LevelPhase::Running;
  uint64_t tick_count_ = 0;
  int world_ = 1;
  int level_index_ = 1;

  Scoreboard scoreboard_;
  Player player_;
  world::GeneratedLevel level_;
  actors::EntitySimulation entities_;
  actors::Effects effects_;
  std::vector<GameEvent> events_;

  std::deque<InputEvent> pending_inputs_;
  PlayerInput held_;
  bool fire_requested_ = false;

  double camera_x_ = 0.0;
  double last_second_ = 0.0;
  double pause_started_ = 0.0;
  int intro_ticks_ = 0;
  int phase_ticks_ = 0;
  int victory_ticks_ = 0;
  double flag_y_ = 0.0;
  double flag_base_y_ = 0.0;
  int bridge_cursor_ = -1;
};

}  // namespace tilerun::game
