#include "GameEngine.hpp"
#include <iostream>
#include <utility>

namespace FlowPairs {

GameEngine::GameEngine(EngineConfig config_)
    : config(std::move(config_)), rng(std::random_device{}()),
      machine(rng, config.generatorTrials) {}

GameEngine::~GameEngine() { Cleanup(); }

void GameEngine::Init() {
  renderer.Init(config);
  initialized = true;
  state = AppState();

  std::cout << "[GameEngine] Initialized successfully (" << config.tickRate
            << " fps, " << AppState::GRID_SIZE << "x" << AppState::GRID_SIZE
            << " grid)" << std::endl;
}

void GameEngine::Run() {
  while (state.running) {
    Uint32 frameStart = SDL_GetTicks();

    FrameInput input;
    input.cursor = renderer.CursorPosition();
    input.events = renderer.PollEvents();

    FrameResult frame = machine.Tick(state, input);
    state = std::move(frame.state);
    renderer.Execute(frame.commands);

    ThrottleFrame(frameStart);
  }

  std::cout << "[GameEngine] Main loop finished" << std::endl;
}

void GameEngine::ThrottleFrame(Uint32 frameStart) const {
  if (config.tickRate <= 0)
    return;

  Uint32 frameBudget = 1000u / static_cast<Uint32>(config.tickRate);
  Uint32 elapsed = SDL_GetTicks() - frameStart;
  if (elapsed < frameBudget) {
    SDL_Delay(frameBudget - elapsed);
  }
}

void GameEngine::Cleanup() {
  if (!initialized)
    return;
  renderer.Cleanup();
  initialized = false;
  std::cout << "[GameEngine] Cleanup complete" << std::endl;
}

} // namespace FlowPairs
