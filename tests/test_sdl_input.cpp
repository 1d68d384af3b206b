#include <gtest/gtest.h>
#include "SceneMachine.hpp"
#include "SdlInput.hpp"
#include <random>
#include <vector>

using namespace FlowPairs;

namespace {

SDL_Event MakeKeyDown(SDL_Keycode sym, Uint8 repeat) {
  SDL_Event event;
  SDL_zero(event);
  event.type = SDL_KEYDOWN;
  event.key.keysym.sym = sym;
  event.key.repeat = repeat;
  return event;
}

} // namespace

TEST(SdlInputTest, KeyDownTranslates) {
  InputEvent out;
  ASSERT_TRUE(TranslateEvent(MakeKeyDown(SDLK_ESCAPE, 0), out));
  EXPECT_EQ(out.type, InputEventType::KEY_DOWN);
  EXPECT_EQ(out.key, Key::ESCAPE);

  ASSERT_TRUE(TranslateEvent(MakeKeyDown(SDLK_4, 0), out));
  EXPECT_EQ(out.key, Key::NUM_4);

  ASSERT_TRUE(TranslateEvent(MakeKeyDown(SDLK_a, 0), out));
  EXPECT_EQ(out.key, Key::UNKNOWN);
}

TEST(SdlInputTest, AutoRepeatKeyDownIsDropped) {
  InputEvent out;
  EXPECT_FALSE(TranslateEvent(MakeKeyDown(SDLK_ESCAPE, 1), out));
  EXPECT_FALSE(TranslateEvent(MakeKeyDown(SDLK_RETURN, 1), out));
}

TEST(SdlInputTest, QuitAndMouseButtonTranslate) {
  SDL_Event quit;
  SDL_zero(quit);
  quit.type = SDL_QUIT;

  SDL_Event click;
  SDL_zero(click);
  click.type = SDL_MOUSEBUTTONDOWN;
  click.button.button = SDL_BUTTON_LEFT;
  click.button.x = 360;
  click.button.y = 310;

  InputEvent out;
  ASSERT_TRUE(TranslateEvent(quit, out));
  EXPECT_EQ(out.type, InputEventType::QUIT);

  ASSERT_TRUE(TranslateEvent(click, out));
  EXPECT_EQ(out.type, InputEventType::MOUSE_BUTTON_DOWN);
  EXPECT_EQ(out.button, MouseButton::LEFT);
  EXPECT_EQ(out.position.x, 360);
  EXPECT_EQ(out.position.y, 310);
}

TEST(SdlInputTest, IgnoresUnhandledEventTypes) {
  SDL_Event motion;
  SDL_zero(motion);
  motion.type = SDL_MOUSEMOTION;

  SDL_Event keyUp = MakeKeyDown(SDLK_ESCAPE, 0);
  keyUp.type = SDL_KEYUP;

  InputEvent out;
  EXPECT_FALSE(TranslateEvent(motion, out));
  EXPECT_FALSE(TranslateEvent(keyUp, out));
}

// Holding ESC in Run: first press returns to Menu, repeats must not quit
TEST(SdlInputTest, HeldEscapeFromRunStaysInMenu) {
  std::mt19937 rng(7);
  SceneMachine machine(rng);

  AppState state;
  FrameInput start;
  start.events.push_back(InputEvent::KeyDown(Key::RETURN));
  state = machine.Tick(state, start).state;
  ASSERT_EQ(state.scene, Scene::RUN);

  std::vector<SDL_Event> held = {MakeKeyDown(SDLK_ESCAPE, 0),
                                 MakeKeyDown(SDLK_ESCAPE, 1),
                                 MakeKeyDown(SDLK_ESCAPE, 1)};
  for (const SDL_Event &sdlEvent : held) {
    FrameInput input;
    InputEvent translated;
    if (TranslateEvent(sdlEvent, translated)) {
      input.events.push_back(translated);
    }
    state = machine.Tick(state, input).state;
  }

  EXPECT_TRUE(state.running);
  EXPECT_EQ(state.scene, Scene::MENU);
}
