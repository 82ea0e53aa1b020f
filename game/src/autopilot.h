#pragma once

#include <array>
#include <vector>

#include "input.h"
#include "snapshot.h"

namespace tilerun::game {

// Scripted player for the headless runner: confirms the title screen, then
// holds right + run and jumps at walls, gaps and oncoming enemies. Emits only
// the button transitions needed to reach the wanted held state.
class Autopilot {
public:
  std::vector<InputEvent> Decide(const FrameSnapshot &snapshot);

private:
  void Set(Button button, bool down, std::vector<InputEvent> &out);
  void ReleaseAll(std::vector<InputEvent> &out);
  bool WantsJump(const FrameSnapshot &snapshot) const;
  bool EnemyAhead(const FrameSnapshot &snapshot, double reach) const;

  std::array<bool, 8> held_{};
  int jump_ticks_ = 0;
  int fire_cooldown_ = 0;
  int stuck_ticks_ = 0;
  double last_x_ = -1.0;
};

}  // namespace tilerun::game
