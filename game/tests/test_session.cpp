#include <doctest/doctest.h>

#include <algorithm>
#include <stdexcept>
#include <vector>

#include "level_signature.h"
#include "session.h"

using tilerun::actors::EntityKind;
using tilerun::game::Button;
using tilerun::game::GameEvent;
using tilerun::game::GameEventKind;
using tilerun::game::GameSession;
using tilerun::game::LevelPhase;
using tilerun::game::ManualClock;
using tilerun::game::MetaState;
using tilerun::game::PowerTier;
using tilerun::world::TileKind;

namespace {
const auto &kConfig = tilerun::sim::kDefaultSimConfig;

tilerun::game::SessionOptions Options(uint32_t seed = 1234u) {
  tilerun::game::SessionOptions options;
  options.seed = seed;
  return options;
}

void Run(GameSession &session, ManualClock &clock, int ticks) {
  for (int i = 0; i < ticks; ++i) {
    clock.Advance(1.0 / 60.0);
    session.Tick();
  }
}

void Press(GameSession &session, Button button) {
  session.PushInput({button, true});
  session.PushInput({button, false});
}

int CountEvents(const std::vector<GameEvent> &events, GameEventKind kind) {
  return static_cast<int>(std::count_if(events.begin(), events.end(),
                                        [kind](const GameEvent &event) { return event.kind == kind; }));
}

// Runs until `state` is reached or `limit` ticks pass, collecting events.
bool RunUntil(GameSession &session, ManualClock &clock, MetaState state, int limit,
              std::vector<GameEvent> &events) {
  for (int i = 0; i < limit && session.state() != state; ++i) {
    Run(session, clock, 1);
    auto drained = session.DrainEvents();
    events.insert(events.end(), drained.begin(), drained.end());
  }
  return session.state() == state;
}

// Puts the player on the castle axe so the next tick starts the bridge collapse.
void StandOnAxe(GameSession &session) {
  const auto &level = session.level();
  REQUIRE(level.has_axe());
  session.mutable_entities().Clear();
  auto &player = session.mutable_player();
  player.x = tilerun::sim::TileEdge(level.axe_x);
  player.y = tilerun::sim::TileEdge(level.axe_y);
  player.vel_x = 0.0;
  player.vel_y = 0.0;
}
}

TEST_CASE("Title starts the game through the timed world intro") {
  ManualClock clock;
  GameSession session(Options(), clock);
  CHECK(session.state() == MetaState::Title);
  Run(session, clock, 5);
  CHECK(session.state() == MetaState::Title);

  Press(session, Button::Confirm);
  Run(session, clock, 1);
  CHECK(session.state() == MetaState::WorldIntro);
  CHECK(session.world_index() == 1);
  CHECK(session.level_index() == 1);
  const auto events = session.DrainEvents();
  CHECK(CountEvents(events, GameEventKind::StateChanged) == 1);
  CHECK(CountEvents(events, GameEventKind::LevelLoaded) == 1);
  CHECK(session.DrainEvents().empty());

  Run(session, clock, tilerun::game::kWorldIntroTicks - 1);
  CHECK(session.state() == MetaState::WorldIntro);
  Run(session, clock, 1);
  CHECK(session.state() == MetaState::Playing);
}

TEST_CASE("Button presses outside play are ignored") {
  ManualClock clock;
  GameSession session(Options(), clock);
  Press(session, Button::Confirm);
  Run(session, clock, 1);
  session.PushInput({Button::Right, true});
  session.PushInput({Button::RunFire, true});
  Run(session, clock, tilerun::game::kWorldIntroTicks + 30);
  REQUIRE(session.state() == MetaState::Playing);
  CHECK(session.player().vel_x == 0.0);
  CHECK(session.player().x == doctest::Approx(session.level().start_x()));

  session.PushInput({Button::Right, true});
  Run(session, clock, 10);
  CHECK(session.player().x > session.level().start_x());
}

TEST_CASE("Same seed gives the same levels") {
  ManualClock clock;
  GameSession a(Options(77u), clock);
  GameSession b(Options(77u), clock);
  CHECK(a.seed() == b.seed());
  a.StartLevel(3, 3);
  b.StartLevel(3, 3);
  CHECK(tilerun::world::LevelSignature(a.level()) == tilerun::world::LevelSignature(b.level()));
}

TEST_CASE("A zero seed draws a random non-zero seed") {
  ManualClock clock;
  GameSession session(Options(0u), clock);
  CHECK(session.seed() != 0u);
}

TEST_CASE("Invalid starting levels fail loudly") {
  ManualClock clock;
  auto options = Options();
  options.start_world = 0;
  CHECK_THROWS_AS(GameSession(options, clock), std::logic_error);
  options.start_world = 9;
  CHECK_THROWS_AS(GameSession(options, clock), std::logic_error);
  options.start_world = 1;
  options.start_level = 5;
  CHECK_THROWS_AS(GameSession(options, clock), std::logic_error);
}

TEST_CASE("Pause freezes play and the level clock") {
  ManualClock clock;
  GameSession session(Options(), clock);
  session.StartLevel(1, 1);
  session.mutable_entities().Clear();

  clock.Set(1.0);
  session.Tick();
  CHECK(session.scoreboard().time_remaining == tilerun::game::kLevelTimeSeconds - 1);

  clock.Set(1.5);
  session.PushInput({Button::Pause, true});
  session.Tick();
  CHECK(session.state() == MetaState::Paused);
  const double paused_x = session.player().x;

  session.PushInput({Button::Pause, false});
  session.PushInput({Button::Right, true});
  clock.Set(20.0);
  session.Tick();
  CHECK(session.player().x == paused_x);

  session.PushInput({Button::Pause, true});
  session.Tick();
  CHECK(session.state() == MetaState::Playing);
  CHECK(session.scoreboard().time_remaining == tilerun::game::kLevelTimeSeconds - 1);

  clock.Set(20.6);
  session.Tick();
  CHECK(session.scoreboard().time_remaining == tilerun::game::kLevelTimeSeconds - 2);
}

TEST_CASE("Back returns to the title screen") {
  ManualClock clock;
  GameSession session(Options(), clock);
  session.StartLevel(1, 1);
  session.PushInput({Button::Back, true});
  session.Tick();
  CHECK(session.state() == MetaState::Title);
}

TEST_CASE("Running out of time kills the player exactly once") {
  ManualClock clock;
  GameSession session(Options(), clock);
  session.StartLevel(1, 1);
  session.mutable_entities().Clear();
  session.mutable_scoreboard().time_remaining = 1;
  const uint32_t level_seed = session.level().seed;

  clock.Advance(1.0);
  session.Tick();
  CHECK(session.player().dead);
  CHECK(session.scoreboard().time_remaining == 0);

  std::vector<GameEvent> events = session.DrainEvents();
  for (int i = 0; i < tilerun::game::kDeathTicks; ++i) {
    clock.Advance(1.0);
    session.Tick();
    auto drained = session.DrainEvents();
    events.insert(events.end(), drained.begin(), drained.end());
  }
  CHECK(session.player().dead);
  CHECK(session.scoreboard().lives == tilerun::game::kStartingLives);
  CHECK(CountEvents(events, GameEventKind::PlayerDied) == 1);

  session.Tick();
  CHECK_FALSE(session.player().dead);
  CHECK(session.scoreboard().lives == tilerun::game::kStartingLives - 1);
  CHECK(session.scoreboard().time_remaining == tilerun::game::kLevelTimeSeconds);
  CHECK(session.level().seed == level_seed);
  CHECK(session.state() == MetaState::Playing);
}

TEST_CASE("A Small player touching an enemy dies and loses a life after the countdown") {
  ManualClock clock;
  GameSession session(Options(), clock);
  session.StartLevel(1, 1);
  session.mutable_entities().Clear();
  session.mutable_entities().Add(tilerun::actors::MakeEntity(EntityKind::Goomba, 115.0, 288.0));

  Run(session, clock, 1);
  CHECK(session.player().dead);
  CHECK(session.player().power == PowerTier::Small);
  CHECK(session.scoreboard().lives == tilerun::game::kStartingLives);

  Run(session, clock, tilerun::game::kDeathTicks);
  CHECK(session.scoreboard().lives == tilerun::game::kStartingLives);
  Run(session, clock, 1);
  CHECK(session.scoreboard().lives == tilerun::game::kStartingLives - 1);
  CHECK_FALSE(session.player().dead);
  CHECK(session.player().x == doctest::Approx(session.level().start_x()));
}

TEST_CASE("A Big player touching an enemy shrinks without losing a life") {
  ManualClock clock;
  GameSession session(Options(), clock);
  session.StartLevel(1, 1);
  session.mutable_entities().Clear();
  tilerun::game::SetPowerTier(session.mutable_player(), PowerTier::Big);
  session.mutable_entities().Add(tilerun::actors::MakeEntity(EntityKind::Goomba, 115.0, 288.0));

  Run(session, clock, 1);
  CHECK_FALSE(session.player().dead);
  CHECK(session.player().power == PowerTier::Small);
  CHECK(session.player().invincibility == tilerun::game::kInvincibilityTicks);
  CHECK(session.scoreboard().lives == tilerun::game::kStartingLives);

  Run(session, clock, 10);
  CHECK_FALSE(session.player().dead);
  CHECK(session.scoreboard().lives == tilerun::game::kStartingLives);
  CHECK(session.Snapshot().player.invincible);
}

TEST_CASE("Power tier carries over a lost life") {
  ManualClock clock;
  GameSession session(Options(), clock);
  session.StartLevel(1, 1);
  tilerun::game::SetPowerTier(session.mutable_player(), PowerTier::Fire);
  REQUIRE(tilerun::game::KillPlayer(session.mutable_player(), kConfig));
  Run(session, clock, tilerun::game::kDeathTicks + 1);
  CHECK(session.scoreboard().lives == tilerun::game::kStartingLives - 1);
  CHECK(session.player().power == PowerTier::Fire);
  CHECK(session.player().bottom() == doctest::Approx(session.level().start_floor_y()));
}

TEST_CASE("Losing the last life ends the game and confirm resets the session") {
  ManualClock clock;
  GameSession session(Options(), clock);
  session.StartLevel(1, 1);
  session.mutable_scoreboard().lives = 1;
  session.mutable_scoreboard().score = 1234;
  tilerun::game::SetPowerTier(session.mutable_player(), PowerTier::Big);
  REQUIRE(tilerun::game::KillPlayer(session.mutable_player(), kConfig));

  Run(session, clock, tilerun::game::kDeathTicks + 1);
  CHECK(session.state() == MetaState::GameOver);
  CHECK(session.scoreboard().lives == 0);
  CHECK(CountEvents(session.DrainEvents(), GameEventKind::GameOver) == 1);

  Run(session, clock, 30);
  CHECK(session.state() == MetaState::GameOver);
  Press(session, Button::Confirm);
  Run(session, clock, 1);
  CHECK(session.state() == MetaState::Title);
  CHECK(session.scoreboard().score == 0);
  CHECK(session.scoreboard().lives == tilerun::game::kStartingLives);
  CHECK(session.player().power == PowerTier::Small);
  CHECK(session.world_index() == 1);
  CHECK(session.level_index() == 1);
}

TEST_CASE("Reaching the flag pole slides, walks off and advances the level") {
  ManualClock clock;
  GameSession session(Options(), clock);
  session.StartLevel(1, 1);
  session.mutable_entities().Clear();
  const int flag = session.level().flag_pole_x;
  REQUIRE(flag > 0);
  auto &player = session.mutable_player();
  player.x = tilerun::sim::TileEdge(flag - 1);
  player.y = 288.0;

  Run(session, clock, 1);
  CHECK(session.phase() == LevelPhase::FlagSlide);
  CHECK(session.player().x == doctest::Approx(tilerun::sim::TileEdge(flag) - 16.0));
  CHECK(session.scoreboard().score == 300);

  const int slide_ticks = static_cast<int>(tilerun::game::kFlagSlideDistance / tilerun::game::kFlagSlideSpeed);
  Run(session, clock, slide_ticks - 1);
  CHECK(session.state() == MetaState::Playing);
  Run(session, clock, 1);
  CHECK(session.state() == MetaState::LevelComplete);
  CHECK(session.flag_y() == doctest::Approx(tilerun::game::kFlagSlideDistance));
  CHECK(session.player().bottom() <= tilerun::sim::TileEdge(10));

  std::vector<GameEvent> events;
  REQUIRE(RunUntil(session, clock, MetaState::WorldIntro, 3000, events));
  CHECK(session.world_index() == 1);
  CHECK(session.level_index() == 2);
  CHECK(session.scoreboard().score ==
        300 + tilerun::game::kLevelTimeSeconds * tilerun::game::kTimeBonusPerSecond);
  CHECK(session.scoreboard().time_remaining == tilerun::game::kLevelTimeSeconds);
}

TEST_CASE("Touching the axe collapses the bridge and completes the castle") {
  ManualClock clock;
  GameSession session(Options(), clock);
  session.StartLevel(1, 4);
  StandOnAxe(session);
  const auto level = session.level();

  Run(session, clock, 1);
  REQUIRE(session.phase() == LevelPhase::BridgeCollapse);
  CHECK(session.level().grid.tile_at(level.axe_x, level.axe_y) == TileKind::Air);
  CHECK(CountEvents(session.DrainEvents(), GameEventKind::Axe) == 1);

  const int bridge_tiles = level.bridge_end - level.bridge_begin;
  Run(session, clock, bridge_tiles * tilerun::game::kBridgeCollapseInterval - 1);
  CHECK(session.state() == MetaState::Playing);
  CHECK(session.level().grid.tile_at(level.bridge_begin, level.bridge_row) == TileKind::Bridge);
  CHECK(session.level().grid.tile_at(level.bridge_end - 1, level.bridge_row) == TileKind::Air);
  Run(session, clock, 1);
  CHECK(session.state() == MetaState::LevelComplete);
  for (int x = level.bridge_begin; x < level.bridge_end; ++x) {
    CHECK(session.level().grid.tile_at(x, level.bridge_row) == TileKind::Air);
  }

  std::vector<GameEvent> events;
  REQUIRE(RunUntil(session, clock, MetaState::WorldIntro, 3000, events));
  CHECK(session.world_index() == 2);
  CHECK(session.level_index() == 1);
}

TEST_CASE("Clearing the last castle wins the game") {
  ManualClock clock;
  GameSession session(Options(), clock);
  session.StartLevel(8, 4);
  StandOnAxe(session);

  std::vector<GameEvent> events;
  REQUIRE(RunUntil(session, clock, MetaState::Victory, 3000, events));
  CHECK(CountEvents(events, GameEventKind::Victory) == 1);

  Run(session, clock, tilerun::game::kFireworkInterval);
  CHECK_FALSE(session.effects().particles().empty());

  Press(session, Button::Confirm);
  Run(session, clock, 1);
  CHECK(session.state() == MetaState::Title);
  CHECK(session.scoreboard().score == 0);
}

TEST_CASE("The camera follows the player and never scrolls back") {
  ManualClock clock;
  GameSession session(Options(), clock);
  session.StartLevel(1, 1);
  session.mutable_entities().Clear();
  session.PushInput({Button::Right, true});
  session.PushInput({Button::RunFire, true});

  double last_camera = session.camera_x();
  for (int i = 0; i < 120; ++i) {
    Run(session, clock, 1);
    CHECK(session.camera_x() >= last_camera);
    last_camera = session.camera_x();
  }
  CHECK(last_camera > 0.0);

  session.PushInput({Button::Right, false});
  session.PushInput({Button::Left, true});
  for (int i = 0; i < 60; ++i) {
    Run(session, clock, 1);
    CHECK(session.camera_x() >= last_camera);
    CHECK(session.player().x >= session.camera_x() - 0.001);
    last_camera = session.camera_x();
  }
}

TEST_CASE("Snapshots expose the frame for presentation") {
  ManualClock clock;
  GameSession session(Options(), clock);
  session.StartLevel(1, 2);
  Run(session, clock, 1);

  const auto snapshot = session.Snapshot();
  CHECK(snapshot.state == MetaState::Playing);
  CHECK(snapshot.underground);
  CHECK_FALSE(snapshot.underwater);
  CHECK_FALSE(snapshot.castle);
  REQUIRE(snapshot.grid != nullptr);
  CHECK(snapshot.grid->height() == tilerun::sim::kLevelHeightTiles);
  CHECK(snapshot.hud.label == "1-2");
  CHECK(snapshot.hud.lives == tilerun::game::kStartingLives);
  CHECK(snapshot.hud.time_remaining == tilerun::game::kLevelTimeSeconds);
  CHECK(snapshot.player.alive);
  CHECK(snapshot.player.height == doctest::Approx(tilerun::game::kSmallHeight));
  CHECK(snapshot.entities.size() == session.entities().entities().size());
}

TEST_CASE("World 1-1 run: generated floor, spawn offset, then the closed-form sprint") {
  ManualClock clock;
  GameSession session(Options(2024u), clock);
  session.StartLevel(1, 1);
  session.mutable_entities().Clear();
  REQUIRE(session.state() == MetaState::Playing);

  const auto &level = session.level();
  CHECK(level.theme == tilerun::world::LevelTheme::Overworld);
  CHECK(level.grid.height() == tilerun::sim::kLevelHeightTiles);
  for (int x = 0; x < level.grid.width(); ++x) {
    const bool gap = std::find(level.gap_columns.begin(), level.gap_columns.end(), x) != level.gap_columns.end();
    CHECK(level.grid.solid(x, tilerun::sim::kLevelHeightTiles - 1) == !gap);
    CHECK(level.grid.solid(x, tilerun::sim::kLevelHeightTiles - 2) == !gap);
  }

  const auto &player = session.player();
  CHECK(player.x == doctest::Approx(96.0));
  CHECK(player.y == doctest::Approx(288.0));
  CHECK(player.power == PowerTier::Small);

  session.PushInput({Button::Right, true});
  session.PushInput({Button::RunFire, true});
  double expected_x = 96.0;
  double expected_vel = 0.0;
  for (int tick = 0; tick < 20; ++tick) {
    Run(session, clock, 1);
    expected_vel = std::min(expected_vel + kConfig.run_accel, kConfig.run_speed);
    expected_x += expected_vel;
    CHECK(player.x == doctest::Approx(expected_x));
  }
  CHECK(expected_x == doctest::Approx(174.0));
  CHECK(player.vel_x == doctest::Approx(kConfig.run_speed));
  CHECK(player.y == doctest::Approx(288.0));
  CHECK(player.on_ground);
  CHECK(session.scoreboard().time_remaining == tilerun::game::kLevelTimeSeconds);
}
