#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "rng.h"

namespace tilerun::actors {

constexpr int kParticleLife = 60;
constexpr int kFloatingTextLife = 60;
constexpr double kParticleGravity = 0.3;
constexpr double kFloatingTextRise = 1.0;

struct Rgb {
  uint8_t r = 255;
  uint8_t g = 255;
  uint8_t b = 255;
};

constexpr Rgb kWhite{255, 255, 255};
constexpr Rgb kBrickRed{200, 76, 12};

struct Particle {
  double x = 0.0;
  double y = 0.0;
  double vel_x = 0.0;
  double vel_y = 0.0;
  int life = kParticleLife;
  Rgb color{};
};

struct FloatingText {
  double x = 0.0;
  double y = 0.0;
  int life = kFloatingTextLife;
  std::string text;
};

// Fire-and-forget visual feedback. Nothing outside this class keeps a
// reference to a particle or text after it is created.
class Effects {
public:
  void AddParticle(double x, double y, double vel_x, double vel_y, Rgb color);
  void AddText(double x, double y, std::string text);
  void AddScore(double x, double y, int points);

  // Four tile quarters flung outward from the brick whose top-left is (x, y).
  void BrickDebris(double x, double y);
  // `count` white sparks scattered over the box, as when a star kills an enemy.
  void Burst(double x, double y, double width, double height, int count, XorShift32 &rng);
  // Five random colored sparks in the upper half of the view starting at `view_x`.
  void Fireworks(double view_x, XorShift32 &rng);

  void Step();
  void Clear();

  const std::vector<Particle> &particles() const;
  const std::vector<FloatingText> &texts() const;

private:
  std::vector<Particle> particles_;
  std::vector<FloatingText> texts_;
};

}  // namespace tilerun::actors
