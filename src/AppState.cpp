#include "AppState.hpp"

namespace FlowPairs {

const char *SceneName(Scene scene) {
  switch (scene) {
  case Scene::MENU:
    return "menu";
  case Scene::CONFIG:
    return "config";
  case Scene::RUN:
    return "run";
  }
  return "unknown";
}

} // namespace FlowPairs
