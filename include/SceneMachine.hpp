#pragma once

#include "AppState.hpp"
#include "DrawCommand.hpp"
#include "EndpointGenerator.hpp"
#include "InputEvent.hpp"
#include <random>
#include <vector>

namespace FlowPairs {

/**
 * FrameInput - What the input surface reported for one tick
 */
struct FrameInput {
  Point cursor; // Pointer position, for hover highlighting
  std::vector<InputEvent> events;
};

/**
 * FrameResult - Next state plus the draw commands of this tick
 * Commands reflect the state *before* this tick's events were applied.
 */
struct FrameResult {
  AppState state;
  std::vector<DrawCommand> commands;
};

/**
 * SceneMachine - Menu -> Config -> Run scene dispatch
 *
 * Tick Lifecycle:
 * 1. Hover: hit-test the cursor against the scene's buttons
 * 2. Draw: Clear -> Text -> Controls (-> Grid + Endpoints) -> Present
 * 3. Events: apply every queued event to a copy of the state
 *
 * Transitions:
 *   MENU   --Run-->     RUN     (regenerates endpoints)
 *   MENU   --Config-->  CONFIG
 *   MENU   --Quit/Q-->  running = false
 *   CONFIG --3/4/5-->   CONFIG  (numPairs updated)
 *   CONFIG --ESC-->     MENU
 *   RUN    --ESC-->     MENU    (endpoints kept)
 *   any    --QUIT-->    running = false
 */
class SceneMachine {
public:
  // Menu control order
  static constexpr int MENU_RUN = 0;
  static constexpr int MENU_CONFIG = 1;
  static constexpr int MENU_QUIT = 2;

  // Theme
  struct Colors {
    static constexpr Color BACKGROUND = {0, 0, 0, 255};
    static constexpr Color TEXT = {255, 255, 255, 255};
    static constexpr Color TEXT_DIM = {180, 180, 180, 255};
    static constexpr Color BUTTON = {32, 32, 32, 255};
    static constexpr Color BUTTON_HOVER = {64, 64, 64, 255};
    static constexpr Color BUTTON_BORDER = {96, 96, 96, 255};
    static constexpr Color SELECTED_BORDER = {200, 200, 200, 255};
    static constexpr Color GRID_LINE = {255, 255, 255, 255};
  };

  explicit SceneMachine(std::mt19937 &rng,
                        int trials = EndpointGenerator::DEFAULT_TRIALS);

  // Prevent copying (generator holds a reference to the shared engine)
  SceneMachine(const SceneMachine &) = delete;
  SceneMachine &operator=(const SceneMachine &) = delete;

  /**
   * Run one tick of the current scene
   * An out-of-range scene value resets to MENU and draws nothing.
   */
  FrameResult Tick(const AppState &state, const FrameInput &input);

private:
  FrameResult TickMenu(const AppState &state, const FrameInput &input);
  FrameResult TickConfig(const AppState &state, const FrameInput &input);
  FrameResult TickRun(const AppState &state, const FrameInput &input);

  // MENU -> RUN: fresh endpoints for the current pair count
  void StartRun(AppState &state);

  void DrawGridAndEndpoints(DrawList &draw, const EndpointList &endpoints,
                            int n) const;

  EndpointGenerator generator_;
};

} // namespace FlowPairs
