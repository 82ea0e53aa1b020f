#pragma once

#include <cstdint>

namespace tilerun::game {

enum class Button : uint8_t {
  Left = 0,
  Right,
  Jump,
  RunFire,
  Crouch,
  Pause,
  Back,
  Confirm,
};

struct InputEvent {
  Button button = Button::Confirm;
  bool pressed = true;
};

// Level-triggered button state as seen by the player controller.
struct PlayerInput {
  bool left = false;
  bool right = false;
  bool jump = false;
  bool run = false;
  bool crouch = false;
};

}  // namespace tilerun::game
