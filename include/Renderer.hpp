#pragma once

#include "DrawCommand.hpp"
#include "EngineConfig.hpp"
#include "InputEvent.hpp"
#ifdef _WIN32
#include <SDL.h>
#include <SDL_ttf.h>
#else
#include <SDL2/SDL.h>
#include <SDL2/SDL_ttf.h>
#endif
#include <string>
#include <vector>

namespace FlowPairs {

/**
 * Renderer - SDL window, renderer and fonts behind a DrawCommand interface
 *
 * Owns every SDL/TTF handle; nothing rendering-related lives in globals.
 */
class Renderer {
public:
  Renderer() = default;
  ~Renderer();

  // Prevent copying
  Renderer(const Renderer &) = delete;
  Renderer &operator=(const Renderer &) = delete;

  /**
   * Initialize SDL video + TTF, create the window and load both fonts
   * @throws std::runtime_error on any SDL/TTF failure or if no font loads
   */
  void Init(const EngineConfig &config);

  /**
   * Execute one frame's commands in order
   */
  void Execute(const std::vector<DrawCommand> &commands);

  /**
   * Drain the SDL event queue into backend-neutral events
   */
  std::vector<InputEvent> PollEvents();

  /**
   * Current pointer position in frame coordinates
   */
  Point CursorPosition() const;

  /**
   * Release fonts, renderer, window and shut SDL down
   */
  void Cleanup();

private:
  TTF_Font *LoadFont(const std::string &preferredPath, int size);

  void SetColor(Color color);
  void FillRoundedRect(const Rect &rect, int radius);
  void StrokeRoundedRect(const Rect &rect, int radius, int width);
  void DrawThickLine(const Point &from, const Point &to, int width);
  void DrawFilledCircle(int cx, int cy, int radius);
  void RenderTextCentered(const std::string &text, const Point &center,
                          Color color, FontSize size);

  SDL_Window *window = nullptr;
  SDL_Renderer *renderer = nullptr;
  TTF_Font *font = nullptr;
  TTF_Font *fontBig = nullptr;
  bool sdlInitialized = false;
  bool ttfInitialized = false;
};

} // namespace FlowPairs
