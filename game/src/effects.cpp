#include "effects.h"

#include <algorithm>
#include <string>
#include <utility>

#include "sim/sim.h"

namespace tilerun::actors {

void Effects::AddParticle(double x, double y, double vel_x, double vel_y, Rgb color) {
  Particle particle;
  particle.x = x;
  particle.y = y;
  particle.vel_x = vel_x;
  particle.vel_y = vel_y;
  particle.color = color;
  particles_.push_back(particle);
}

void Effects::AddText(double x, double y, std::string text) {
  FloatingText entry;
  entry.x = x;
  entry.y = y;
  entry.text = std::move(text);
  texts_.push_back(std::move(entry));
}

void Effects::AddScore(double x, double y, int points) {
  AddText(x, y, "+" + std::to_string(points));
}

void Effects::BrickDebris(double x, double y) {
  const double half = sim::kTileSize / 2.0;
  for (int i = 0; i < 4; ++i) {
    const double px = x + (i % 2) * half;
    const double py = y + (i / 2) * half;
    const double vel_x = i % 2 == 0 ? -3.0 : 3.0;
    const double vel_y = i < 2 ? -8.0 : -5.0;
    AddParticle(px, py, vel_x, vel_y, kBrickRed);
  }
}

void Effects::Burst(double x, double y, double width, double height, int count, XorShift32 &rng) {
  for (int i = 0; i < count; ++i) {
    const double px = x + rng.NextInt(0, static_cast<int>(width));
    const double py = y + rng.NextInt(0, static_cast<int>(height));
    AddParticle(px, py, rng.NextRange(-3.0, 3.0), rng.NextRange(-8.0, -2.0), kWhite);
  }
}

void Effects::Fireworks(double view_x, XorShift32 &rng) {
  for (int i = 0; i < 5; ++i) {
    const double px = view_x + rng.NextInt(0, sim::kViewportWidth);
    const double py = rng.NextInt(0, sim::kViewportHeight / 2);
    Rgb color;
    color.r = static_cast<uint8_t>(rng.NextInt(100, 255));
    color.g = static_cast<uint8_t>(rng.NextInt(100, 255));
    color.b = static_cast<uint8_t>(rng.NextInt(100, 255));
    AddParticle(px, py, rng.NextRange(-2.0, 2.0), rng.NextRange(-4.0, 0.0), color);
  }
}

void Effects::Step() {
  for (auto &particle : particles_) {
    particle.x += particle.vel_x;
    particle.y += particle.vel_y;
    particle.vel_y += kParticleGravity;
    particle.life -= 1;
  }
  for (auto &entry : texts_) {
    entry.y -= kFloatingTextRise;
    entry.life -= 1;
  }
  particles_.erase(std::remove_if(particles_.begin(), particles_.end(),
                                  [](const Particle &particle) { return particle.life <= 0; }),
                   particles_.end());
  texts_.erase(std::remove_if(texts_.begin(), texts_.end(),
                              [](const FloatingText &entry) { return entry.life <= 0; }),
               texts_.end());
}

void Effects::Clear() {
  particles_.clear();
  texts_.clear();
}

const std::vector<Particle> &Effects::particles() const {
  return particles_;
}

const std::vector<FloatingText> &Effects::texts() const {
  return texts_;
}

}  // namespace tilerun::actors
