#pragma once

#include "AppState.hpp"
#include "EngineConfig.hpp"
#include "Renderer.hpp"
#include "SceneMachine.hpp"
#ifdef _WIN32
#include <SDL.h>
#else
#include <SDL2/SDL.h>
#endif
#include <random>

namespace FlowPairs {

/**
 * GameEngine - SDL lifecycle and fixed-rate frame loop
 *
 * Frame Loop Lifecycle:
 * 1. Input Poll: cursor position + drained SDL events
 * 2. Tick: SceneMachine produces the next AppState and draw commands
 * 3. Render: Renderer executes the commands (ends with Present)
 * 4. Throttle: sleep out the rest of the 1/tickRate frame budget
 */
class GameEngine {
public:
  explicit GameEngine(EngineConfig config = EngineConfig());
  ~GameEngine();

  // Prevent copying
  GameEngine(const GameEngine &) = delete;
  GameEngine &operator=(const GameEngine &) = delete;

  /**
   * Initialize the rendering surface
   * @throws std::runtime_error on SDL initialization failure
   */
  void Init();

  /**
   * Main loop: runs until AppState::running becomes false
   */
  void Run();

  /**
   * Clean shutdown of SDL resources
   */
  void Cleanup();

  const AppState &GetState() const { return state; }

private:
  /**
   * Sleep until frameStart + 1000/tickRate ms (SDL_GetTicks clock)
   */
  void ThrottleFrame(Uint32 frameStart) const;

  EngineConfig config;
  Renderer renderer;
  std::mt19937 rng; // Shared random source, seeded once at startup
  SceneMachine machine;
  AppState state;
  bool initialized = false;
};

} // namespace FlowPairs
