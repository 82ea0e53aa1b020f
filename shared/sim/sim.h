#pragma once

#include <algorithm>
#include <cmath>
#include <iterator>

namespace tilerun::sim {

constexpr int kTileSize = 32;
constexpr int kLevelHeightTiles = 12;
constexpr int kViewportWidth = 600;
constexpr int kViewportHeight = kLevelHeightTiles * kTileSize;
constexpr int kTickRate = 60;

// All speeds are pixels per tick, accelerations pixels per tick squared.
// Velocities are stored as magnitudes; screen y grows downward.
struct SimConfig {
  double gravity;
  double max_fall_speed;
  double walk_speed;
  double run_speed;
  double walk_accel;
  double run_accel;
  double friction;
  double jump_velocity;
  double jump_cut_velocity;
  double stomp_bounce;
  double death_hop;
  double death_gravity_scale;
  double underwater_gravity_scale;
  double underwater_max_fall;
  double entity_gravity;
  double entity_max_fall;
  double shell_kick_speed;
  double fireball_speed;
};

inline constexpr SimConfig kDefaultSimConfig{
    0.5,
    12.0,
    4.0,
    6.0,
    0.2,
    0.4,
    0.15,
    10.0,
    3.0,
    6.0,
    8.0,
    0.5,
    0.3,
    2.0,
    0.3,
    8.0,
    8.0,
    8.0};
// Keep defaults in sync with shared/sim/config.json.

struct Aabb {
  double x = 0.0;
  double y = 0.0;
  double w = 0.0;
  double h = 0.0;
};

inline bool Overlaps(const Aabb &a, const Aabb &b) {
  return a.x < b.x + b.w && a.x + a.w > b.x && a.y < b.y + b.h && a.y + a.h > b.y;
}

inline int TileCoord(double pixel) {
  return static_cast<int>(std::floor(pixel / static_cast<double>(kTileSize)));
}

inline double TileEdge(int tile) {
  return static_cast<double>(tile) * static_cast<double>(kTileSize);
}

inline double LevelBottom() {
  return static_cast<double>(kViewportHeight);
}

// Accelerates toward the walk or run cap while exactly one direction is held,
// otherwise decelerates to rest. Returns -1/+1 for the held direction, 0 if none.
inline int StepHorizontal(double &vel_x, bool left, bool right, bool run, const SimConfig &config) {
  const double accel = run ? config.run_accel : config.walk_accel;
  const double max_speed = run ? config.run_speed : config.walk_speed;

  if (left && !right) {
    vel_x -= accel;
    if (vel_x < -max_speed) {
      vel_x = -max_speed;
    }
    return -1;
  }
  if (right && !left) {
    vel_x += accel;
    if (vel_x > max_speed) {
      vel_x = max_speed;
    }
    return 1;
  }

  if (vel_x > 0.0) {
    vel_x = std::max(0.0, vel_x - config.friction);
  } else if (vel_x < 0.0) {
    vel_x = std::min(0.0, vel_x + config.friction);
  }
  return 0;
}

inline double ApplyGravity(double vel_y, double gravity, double max_fall) {
  vel_y += gravity;
  if (vel_y > max_fall) {
    vel_y = max_fall;
  }
  return vel_y;
}

inline double ApplyPlayerGravity(double vel_y, bool underwater, const SimConfig &config) {
  if (underwater) {
    return ApplyGravity(vel_y, config.gravity * config.underwater_gravity_scale, config.underwater_max_fall);
  }
  return ApplyGravity(vel_y, config.gravity, config.max_fall_speed);
}

// Releasing jump while still rising faster than the cut velocity clamps the ascent.
inline double ApplyJumpCut(double vel_y, bool jump_held, const SimConfig &config) {
  if (!jump_held && vel_y < -config.jump_cut_velocity) {
    return -config.jump_cut_velocity;
  }
  return vel_y;
}

inline bool IsFiniteConfig(const SimConfig &config) {
  const double values[] = {config.gravity,          config.max_fall_speed,
                           config.walk_speed,       config.run_speed,
                           config.walk_accel,       config.run_accel,
                           config.friction,         config.jump_velocity,
                           config.jump_cut_velocity, config.stomp_bounce,
                           config.death_hop,        config.death_gravity_scale,
                           config.underwater_gravity_scale, config.underwater_max_fall,
                           config.entity_gravity,   config.entity_max_fall,
                           config.shell_kick_speed, config.fireball_speed};
  return std::all_of(std::begin(values), std::end(values), [](double value) {
    return std::isfinite(value) && value > 0.0;
  });
}

}  // namespace tilerun::sim
