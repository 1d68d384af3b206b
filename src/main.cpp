#include "../include/GameEngine.hpp"
#include <iostream>
#include <stdexcept>

int main(int argc, char* argv[]) {
  (void)argc;
  (void)argv;
  std::cout << "=== Flow (prototype) ===" << std::endl;
  std::cout << "Connect-the-colors puzzle board generator" << std::endl;
  std::cout << "-----------------------------------" << std::endl;
  std::cout << "Controls:" << std::endl;
  std::cout << "  - Menu: Enter/Click to select, Q or ESC to quit" << std::endl;
  std::cout << "  - Config: 3/4/5 or click to choose pairs" << std::endl;
  std::cout << "  - ESC: Back to menu" << std::endl;
  std::cout << "-----------------------------------" << std::endl;
  std::cout << std::endl;

  try {
    FlowPairs::GameEngine engine;

    // Initialize SDL and create window
    engine.Init();

    // Run main loop until Quit
    engine.Run();

    engine.Cleanup();

  } catch (const std::exception &e) {
    std::cerr << "[FATAL ERROR] " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
