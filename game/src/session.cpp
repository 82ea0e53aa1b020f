#include "session.h"

#include <algorithm>
#include <cstdlib>
#include <random>
#include <stdexcept>
#include <utility>

namespace tilerun::game {
namespace {

uint32_t ResolveSeed(uint32_t seed) {
  if (seed != 0) {
    return seed;
  }
  std::random_device device;
  return device();
}

void ValidateStart(const SessionOptions &options) {
  world::ClassifyLevel(options.start_world, options.start_level);
  if (options.start_world > world::kMaxWorld) {
    throw std::logic_error("start world must be in 1-8, got " + std::to_string(options.start_world));
  }
}

}  // namespace

const char *LevelPhaseName(LevelPhase phase) {
  switch (phase) {
    case LevelPhase::Running:
      return "running";
    case LevelPhase::FlagSlide:
      return "flag_slide";
    case LevelPhase::BridgeCollapse:
      return "bridge_collapse";
    case LevelPhase::CompleteHold:
      return "complete_hold";
    case LevelPhase::ExitWalk:
      return "exit_walk";
  }
  return "running";
}

GameSession::GameSession(const SessionOptions &options, const GameClock &clock)
    : options_(options), clock_(clock), rng_(ResolveSeed(options.seed)) {
  ValidateStart(options_);
  options_.seed = rng_.state();
  ResetGame();
}

void GameSession::PushInput(const InputEvent &event) {
  pending_inputs_.push_back(event);
}

void GameSession::Tick() {
  ++tick_count_;
  while (!pending_inputs_.empty()) {
    const InputEvent event = pending_inputs_.front();
    pending_inputs_.pop_front();
    ApplyInput(event);
  }

  ContactContext ctx = Contacts();
  switch (state_) {
    case MetaState::Title:
    case MetaState::Paused:
    case MetaState::GameOver:
      break;
    case MetaState::WorldIntro:
      intro_ticks_ += 1;
      if (intro_ticks_ > kWorldIntroTicks) {
        SetState(MetaState::Playing);
      }
      break;
    case MetaState::Playing:
      TickPlaying();
      break;
    case MetaState::LevelComplete:
      TickLevelComplete(ctx);
      break;
    case MetaState::Victory:
      TickVictory();
      break;
  }
  fire_requested_ = false;
}

void GameSession::ApplyInput(const InputEvent &event) {
  switch (state_) {
    case MetaState::Title:
      if (event.pressed && event.button == Button::Confirm) {
        StartGame();
      } else if (!event.pressed) {
        SetHeld(event.button, false);
      }
      return;
    case MetaState::GameOver:
    case MetaState::Victory:
      if (event.pressed && event.button == Button::Confirm) {
        ResetGame();
        SetState(MetaState::Title);
      } else if (!event.pressed) {
        SetHeld(event.button, false);
      }
      return;
    case MetaState::Playing:
      if (event.pressed && event.button == Button::Pause) {
        pause_started_ = clock_.NowSeconds();
        SetState(MetaState::Paused);
        return;
      }
      if (event.pressed && event.button == Button::Back) {
        held_ = PlayerInput{};
        SetState(MetaState::Title);
        return;
      }
      SetHeld(event.button, event.pressed);
      if (event.pressed && event.button == Button::RunFire) {
        fire_requested_ = true;
      }
      return;
    case MetaState::Paused:
      if (event.pressed && event.button == Button::Pause) {
        // The paused interval does not count toward the level clock.
        last_second_ += clock_.NowSeconds() - pause_started_;
        SetState(MetaState::Playing);
      } else if (event.pressed && event.button == Button::Back) {
        held_ = PlayerInput{};
        SetState(MetaState::Title);
      } else if (!event.pressed) {
        SetHeld(event.button, false);
      }
      return;
    case MetaState::WorldIntro:
    case MetaState::LevelComplete:
      if (!event.pressed) {
        SetHeld(event.button, false);
      }
      return;
  }
}

void GameSession::SetHeld(Button button, bool pressed) {
  switch (button) {
    case Button::Left:
      held_.left = pressed;
      break;
    case Button::Right:
      held_.right = pressed;
      break;
    case Button::Jump:
      held_.jump = pressed;
      break;
    case Button::RunFire:
      held_.run = pressed;
      break;
    case Button::Crouch:
      held_.crouch = pressed;
      break;
    case Button::Pause:
    case Button::Back:
    case Button::Confirm:
      break;
  }
}

void GameSession::SetState(MetaState next) {
  if (next == state_) {
    return;
  }
  const MetaState previous = state_;
  state_ = next;
  if (next == MetaState::WorldIntro) {
    intro_ticks_ = 0;
  }
  Record(GameEventKind::StateChanged, player_.x, player_.y, static_cast<int>(next),
         std::string(MetaStateName(previous)) + "->" + MetaStateName(next));
}

void GameSession::ResetGame() {
  scoreboard_.Reset();
  player_ = Player{};
  world_ = options_.start_world;
  level_index_ = options_.start_level;
  held_ = PlayerInput{};
  fire_requested_ = false;
  camera_x_ = 0.0;
  phase_ = LevelPhase::Running;
  phase_ticks_ = 0;
  victory_ticks_ = 0;
  flag_y_ = 0.0;
  entities_.Clear();
  effects_.Clear();
}

void GameSession::StartGame() {
  ResetGame();
  SetState(MetaState::WorldIntro);
  LoadLevel(world_, level_index_, rng_.Next());
}

void GameSession::StartLevel(int world, int level) {
  LoadLevel(world, level, rng_.Next());
  SetState(MetaState::Playing);
}

void GameSession::LoadLevel(int world, int level, uint32_t seed) {
  level_ = world::GenerateLevel(world, level, seed);
  world_ = world;
  level_index_ = level;

  SpawnPlayer(player_, level_.start_x(), level_.start_floor_y());
  camera_x_ = 0.0;
  entities_.Reset(level_.spawns);
  entities_.ActivateSpawns(camera_x_);
  effects_.Clear();
  scoreboard_.ResetTimer();
  last_second_ = clock_.NowSeconds();
  phase_ = LevelPhase::Running;
  phase_ticks_ = 0;
  flag_y_ = 0.0;
  flag_base_y_ = 0.0;
  bridge_cursor_ = -1;
  fire_requested_ = false;

  Record(GameEventKind::LevelLoaded, player_.x, player_.y, level_.grid.width(),
         WorldLevelLabel(world_, level_index_) + " " + world::LevelThemeName(level_.theme));
}

void GameSession::LoseLife() {
  const bool out_of_lives = scoreboard_.LoseLife();
  Record(GameEventKind::LifeLost, player_.x, player_.y, scoreboard_.lives);
  if (out_of_lives) {
    SetState(MetaState::GameOver);
    Record(GameEventKind::GameOver, player_.x, player_.y, scoreboard_.score);
    return;
  }
  // Same layout again; power tier carries over.
  LoadLevel(world_, level_index_, level_.seed);
}

void GameSession::AdvanceLevel() {
  scoreboard_.AwardTimeBonus();
  int next_world = world_;
  int next_level = level_index_ + 1;
  if (next_level > world::kLevelsPerWorld) {
    next_level = 1;
    next_world += 1;
    if (next_world > world::kMaxWorld) {
      victory_ticks_ = 0;
      SetState(MetaState::Victory);
      Record(GameEventKind::Victory, player_.x, player_.y, scoreboard_.score);
      return;
    }
  }
  SetState(MetaState::WorldIntro);
  LoadLevel(next_world, next_level, rng_.Next());
}

void GameSession::TickPlaying() {
  ContactContext ctx = Contacts();
  if (player_.dead) {
    if (StepDeath(player_, options_.sim_config)) {
      LoseLife();
    }
    return;
  }

  switch (phase_) {
    case LevelPhase::Running:
      TickCountdown();
      if (!player_.dead) {
        TickRunning(ctx);
      }
      break;
    case LevelPhase::FlagSlide:
      TickFlagSlide();
      TickEntities(ctx, false);
      effects_.Step();
      UpdateCamera();
      break;
    case LevelPhase::BridgeCollapse:
      TickBridgeCollapse();
      TickEntities(ctx, false);
      effects_.Step();
      break;
    case LevelPhase::CompleteHold:
    case LevelPhase::ExitWalk:
      break;
  }
}

void GameSession::TickCountdown() {
  const double now = clock_.NowSeconds();
  if (now - last_second_ < 1.0) {
    return;
  }
  last_second_ = now;
  if (scoreboard_.TickSecond() && KillPlayer(player_, options_.sim_config)) {
    Record(GameEventKind::PlayerDied, player_.x, player_.y, 0, "time");
  }
}

void GameSession::TickRunning(ContactContext &ctx) {
  const PlayerStepResult step =
      StepPlayer(player_, held_, level_.grid, underwater(), camera_x_, options_.sim_config);
  if (step.block_hit) {
    HitBlock(ctx, player_, step.hit_tx, step.hit_ty);
  }
  if (fire_requested_) {
    ShootFireball(ctx, player_);
  }
  if (step.fell_out) {
    if (KillPlayer(player_, options_.sim_config)) {
      Record(GameEventKind::PlayerDied, player_.x, player_.y, 0, "fall");
    }
  } else if (OverlapsTileKind(player_, level_.grid, world::TileKind::Lava)) {
    if (KillPlayer(player_, options_.sim_config)) {
      Record(GameEventKind::PlayerDied, player_.x, player_.y, 0, "lava");
    }
  }

  TickEntities(ctx, true);
  effects_.Step();
  UpdateCamera();
  if (!player_.dead) {
    CheckGoals();
  }
}

void GameSession::TickEntities(ContactContext &ctx, bool contacts) {
  entities_.ActivateSpawns(camera_x_);
  const actors::StepReport report = entities_.Step(level_.grid, camera_x_, options_.sim_config);
  for (int i = 0; i < report.coins_collected; ++i) {
    CollectCoin(ctx, player_.x, player_.y);
  }
  if (contacts) {
    ResolvePlayerContacts(ctx, player_);
  }
  ResolveProjectileContacts(ctx);
  entities_.Sweep();
}

void GameSession::CheckGoals() {
  if (level_.has_flag()) {
    const int tile_x = sim::TileCoord(player_.x);
    if (std::abs(tile_x - level_.flag_pole_x) < kFlagTriggerTiles) {
      TriggerFlag();
    }
    return;
  }
  if (level_.has_axe() && OverlapsTileKind(player_, level_.grid, world::TileKind::Axe)) {
    TriggerAxe();
  }
}

void GameSession::TriggerFlag() {
  phase_ = LevelPhase::FlagSlide;
  phase_ticks_ = 0;
  flag_y_ = 0.0;
  player_.vel_x = 0.0;
  player_.vel_y = 0.0;
  player_.crouching = false;
  player_.x = sim::TileEdge(level_.flag_pole_x) - sim::kTileSize / 2.0;

  flag_base_y_ = sim::LevelBottom();
  for (int row = world::kFlagTopRow + 1; row < level_.grid.height(); ++row) {
    if (level_.grid.solid(level_.flag_pole_x, row)) {
      flag_base_y_ = sim::TileEdge(row);
      break;
    }
  }

  const int rows_above = static_cast<int>((sim::LevelBottom() - player_.y) / sim::kTileSize);
  const int points = std::max(kMinFlagScore, rows_above * 100);
  scoreboard_.AddScore(points);
  effects_.AddScore(player_.x, player_.y, points);
  Record(GameEventKind::Flag, player_.x, player_.y, points);
}

void GameSession::TriggerAxe() {
  level_.grid.set_tile(level_.axe_x, level_.axe_y, world::TileKind::Air);
  phase_ = LevelPhase::BridgeCollapse;
  phase_ticks_ = 0;
  bridge_cursor_ = level_.bridge_end - 1;
  player_.vel_x = 0.0;
  player_.vel_y = 0.0;
  player_.crouching = false;
  Record(GameEventKind::Axe, player_.x, player_.y, level_.bridge_end - level_.bridge_begin);
}

void GameSession::TickFlagSlide() {
  flag_y_ += kFlagSlideSpeed;
  player_.y = std::min(player_.y + kFlagSlideSpeed, flag_base_y_ - player_.height());
  if (flag_y_ >= kFlagSlideDistance) {
    phase_ = LevelPhase::CompleteHold;
    phase_ticks_ = 0;
    SetState(MetaState::LevelComplete);
    Record(GameEventKind::LevelComplete, player_.x, player_.y, scoreboard_.score, "flag");
  }
}

void GameSession::TickBridgeCollapse() {
  phase_ticks_ += 1;
  if (phase_ticks_ % kBridgeCollapseInterval == 0 && bridge_cursor_ >= level_.bridge_begin) {
    level_.grid.set_tile(bridge_cursor_, level_.bridge_row, world::TileKind::Air);
    bridge_cursor_ -= 1;
  }
  if (bridge_cursor_ < level_.bridge_begin) {
    phase_ = LevelPhase::CompleteHold;
    phase_ticks_ = 0;
    SetState(MetaState::LevelComplete);
    Record(GameEventKind::LevelComplete, player_.x, player_.y, scoreboard_.score, "axe");
  }
}

void GameSession::TickLevelComplete(ContactContext &ctx) {
  if (phase_ == LevelPhase::CompleteHold) {
    phase_ticks_ += 1;
    if (phase_ticks_ > kLevelCompleteHoldTicks) {
      phase_ = LevelPhase::ExitWalk;
    }
  } else if (phase_ == LevelPhase::ExitWalk) {
    StepExitWalk();
    if (player_.x > camera_x_ + sim::kViewportWidth + kExitMargin) {
      AdvanceLevel();
      return;
    }
  }
  TickEntities(ctx, false);
  effects_.Step();
  UpdateCamera();
}

// Scripted walk to the right edge; ignores walls and drops onto the floor below.
void GameSession::StepExitWalk() {
  player_.x += kExitWalkSpeed;
  player_.facing_right = true;
  player_.anim_timer += 1;
  if (player_.anim_timer >= kAnimTicksPerFrame) {
    player_.anim_timer = 0;
    player_.anim_frame = (player_.anim_frame + 1) % kAnimFrames;
  }

  const int column = sim::TileCoord(player_.x + player_.width() / 2.0);
  double floor = level_.start_floor_y();
  for (int row = sim::TileCoord(player_.bottom()); row < level_.grid.height(); ++row) {
    if (level_.grid.solid(column, row)) {
      floor = sim::TileEdge(row);
      break;
    }
  }
  player_.y = std::min(player_.y + kExitDropSpeed, floor - player_.height());
}

void GameSession::TickVictory() {
  victory_ticks_ += 1;
  if (victory_ticks_ % kFireworkInterval == 0) {
    effects_.Fireworks(camera_x_, rng_);
  }
  effects_.Step();
}

void GameSession::UpdateCamera() {
  const double max_camera = std::max(0.0, level_.width_px() - sim::kViewportWidth);
  const double target = std::clamp(player_.x - kCameraLead, 0.0, max_camera);
  const double next = camera_x_ + (target - camera_x_) * kCameraSmoothing;
  camera_x_ = std::max(camera_x_, next);
}

void GameSession::Record(GameEventKind kind, double x, double y, int value, std::string detail) {
  GameEvent event;
  event.kind = kind;
  event.tick = static_cast<int>(tick_count_);
  event.x = x;
  event.y = y;
  event.value = value;
  event.detail = std::move(detail);
  events_.push_back(std::move(event));
}

ContactContext GameSession::Contacts() {
  return ContactContext{level_.grid,
                        entities_,
                        effects_,
                        scoreboard_,
                        rng_,
                        events_,
                        options_.sim_config,
                        static_cast<int>(tick_count_)};
}

FrameSnapshot GameSession::Snapshot() const {
  FrameSnapshot out;
  out.tick = tick_count_;
  out.state = state_;
  out.theme = level_.theme;
  out.underground = level_.theme == world::LevelTheme::Underground;
  out.underwater = level_.theme == world::LevelTheme::Underwater;
  out.castle = level_.theme == world::LevelTheme::Castle;
  out.camera_x = camera_x_;
  out.grid = &level_.grid;
  out.flag_pole_x = level_.flag_pole_x;
  out.flag_y = flag_y_;
  out.intro_ticks = intro_ticks_;

  out.entities.reserve(entities_.entities().size());
  for (const auto &entity : entities_.entities()) {
    EntityView view;
    view.kind = entity.kind;
    view.x = entity.x;
    view.y = entity.y;
    view.width = entity.width;
    view.height = entity.height;
    view.facing_right = entity.vel_x > 0.0;
    view.stomped = entity.stomped;
    view.in_shell = entity.in_shell;
    view.emerging = entity.emerging;
    view.anim_tick = entity.anim_tick;
    out.entities.push_back(view);
  }
  out.particles = effects_.particles();
  out.texts = effects_.texts();

  PlayerView &player = out.player;
  player.x = player_.x;
  player.y = player_.y;
  player.width = player_.width();
  player.height = player_.height();
  player.vel_x = player_.vel_x;
  player.vel_y = player_.vel_y;
  player.facing_right = player_.facing_right;
  player.power = player_.power;
  player.on_ground = player_.on_ground;
  player.crouching = player_.crouching;
  player.invincible = player_.invincibility > 0;
  player.star = player_.star_timer > 0;
  player.anim_frame = player_.anim_frame;
  player.alive = !player_.dead;
  player.death_ticks = player_.death_timer;

  out.hud.score = scoreboard_.score;
  out.hud.coins = scoreboard_.coins;
  out.hud.lives = scoreboard_.lives;
  out.hud.time_remaining = scoreboard_.time_remaining;
  out.hud.world = world_;
  out.hud.level = level_index_;
  out.hud.label = WorldLevelLabel(world_, level_index_);
  return out;
}

std::vector<GameEvent> GameSession::DrainEvents() {
  std::vector<GameEvent> out;
  out.swap(events_);
  return out;
}

MetaState GameSession::state() const {
  return state_;
}

LevelPhase GameSession::phase() const {
  return phase_;
}

uint64_t GameSession::tick_count() const {
  return tick_count_;
}

int GameSession::world_index() const {
  return world_;
}

int GameSession::level_index() const {
  return level_index_;
}

uint32_t GameSession::seed() const {
  return options_.seed;
}

double GameSession::camera_x() const {
  return camera_x_;
}

double GameSession::flag_y() const {
  return flag_y_;
}

bool GameSession::underwater() const {
  return level_.theme == world::LevelTheme::Underwater;
}

const Scoreboard &GameSession::scoreboard() const {
  return scoreboard_;
}

const Player &GameSession::player() const {
  return player_;
}

const world::GeneratedLevel &GameSession::level() const {
  return level_;
}

const actors::EntitySimulation &GameSession::entities() const {
  return entities_;
}

const actors::Effects &GameSession::effects() const {
  return effects_;
}

Scoreboard &GameSession::mutable_scoreboard() {
  return scoreboard_;
}

Player &GameSession::mutable_player() {
  return player_;
}

world::GeneratedLevel &GameSession::mutable_level() {
  return level_;
}

actors::EntitySimulation &GameSession::mutable_entities() {
  return entities_;
}

}  // namespace tilerun::game
