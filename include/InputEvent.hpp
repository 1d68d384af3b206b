#pragma once

#include "GridMath.hpp"

namespace FlowPairs {

enum class InputEventType { QUIT, KEY_DOWN, MOUSE_BUTTON_DOWN };

// Keys the scenes react to; everything else maps to UNKNOWN
enum class Key { UNKNOWN, RETURN, KP_ENTER, ESCAPE, Q, NUM_3, NUM_4, NUM_5 };

enum class MouseButton { LEFT, MIDDLE, RIGHT, OTHER };

/**
 * InputEvent - Backend-neutral input event drained once per tick
 */
struct InputEvent {
  InputEventType type = InputEventType::QUIT;
  Key key = Key::UNKNOWN;
  MouseButton button = MouseButton::OTHER;
  Point position; // Cursor position at button press

  static InputEvent Quit() { return InputEvent(); }

  static InputEvent KeyDown(Key k) {
    InputEvent event;
    event.type = InputEventType::KEY_DOWN;
    event.key = k;
    return event;
  }

  static InputEvent MouseDown(MouseButton b, const Point &pos) {
    InputEvent event;
    event.type = InputEventType::MOUSE_BUTTON_DOWN;
    event.button = b;
    event.position = pos;
    return event;
  }
};

} // namespace FlowPairs
