#include "SdlInput.hpp"

namespace FlowPairs {

bool TranslateEvent(const SDL_Event &event, InputEvent &out) {
  switch (event.type) {
  case SDL_QUIT:
    out = InputEvent::Quit();
    return true;

  case SDL_KEYDOWN:
    if (event.key.repeat) {
      return false;
    }
    out = InputEvent::KeyDown(TranslateKey(event.key.keysym.sym));
    return true;

  case SDL_MOUSEBUTTONDOWN:
    out = InputEvent::MouseDown(TranslateButton(event.button.button),
                                Point(event.button.x, event.button.y));
    return true;
  }
  return false;
}

Key TranslateKey(SDL_Keycode sym) {
  switch (sym) {
  case SDLK_RETURN:
    return Key::RETURN;
  case SDLK_KP_ENTER:
    return Key::KP_ENTER;
  case SDLK_ESCAPE:
    return Key::ESCAPE;
  case SDLK_q:
    return Key::Q;
  case SDLK_3:
    return Key::NUM_3;
  case SDLK_4:
    return Key::NUM_4;
  case SDLK_5:
    return Key::NUM_5;
  default:
    return Key::UNKNOWN;
  }
}

MouseButton TranslateButton(Uint8 button) {
  switch (button) {
  case SDL_BUTTON_LEFT:
    return MouseButton::LEFT;
  case SDL_BUTTON_MIDDLE:
    return MouseButton::MIDDLE;
  case SDL_BUTTON_RIGHT:
    return MouseButton::RIGHT;
  default:
    return MouseButton::OTHER;
  }
}

} // namespace FlowPairs
