#pragma once

#include "EndpointGenerator.hpp"
#include <string>

namespace FlowPairs {

/**
 * EngineConfig - Startup settings for GameEngine
 * Defaults reproduce the prototype; there is no config file or CLI.
 */
struct EngineConfig {
  std::string windowTitle = "Flow (prototype)";
  int tickRate = 60; // Frames per second cap

  // Empty = search the platform font list
  std::string fontPath;
  int fontSize = 24;
  int bigFontSize = 40; // Rendered bold

  int generatorTrials = EndpointGenerator::DEFAULT_TRIALS;
};

} // namespace FlowPairs
