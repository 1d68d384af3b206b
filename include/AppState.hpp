#pragma once

#include "GridData.hpp"

namespace FlowPairs {

/**
 * Scene - Mutually exclusive UI modes
 * Termination is tracked by AppState::running, not by a scene value.
 */
enum class Scene { MENU, CONFIG, RUN };

const char *SceneName(Scene scene);

/**
 * AppState - Everything a tick reads and produces
 *
 * Invariants:
 *   numPairs ∈ PAIR_CHOICES
 *   scene == RUN  =>  endpoints.size() == numPairs, all cells distinct
 */
struct AppState {
  static constexpr int GRID_SIZE = 5;
  static constexpr int DEFAULT_PAIRS = 3;
  static constexpr int PAIR_CHOICE_COUNT = 3;
  static constexpr int PAIR_CHOICES[PAIR_CHOICE_COUNT] = {3, 4, 5};

  bool running = true;
  Scene scene = Scene::MENU;
  int numPairs = DEFAULT_PAIRS;
  EndpointList endpoints; // Empty until the first Run

  static bool IsValidPairCount(int count) {
    for (int choice : PAIR_CHOICES) {
      if (choice == count)
        return true;
    }
    return false;
  }
};

} // namespace FlowPairs
