#include "Renderer.hpp"
#include "Layout.hpp"
#include "SdlInput.hpp"
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <iostream>
#include <stdexcept>

namespace FlowPairs {

Renderer::~Renderer() { Cleanup(); }

void Renderer::Init(const EngineConfig &config) {
  if (SDL_Init(SDL_INIT_VIDEO) < 0) {
    throw std::runtime_error(std::string("SDL_Init failed: ") + SDL_GetError());
  }
  sdlInitialized = true;

  window = SDL_CreateWindow(config.windowTitle.c_str(), SDL_WINDOWPOS_CENTERED,
                            SDL_WINDOWPOS_CENTERED, Layout::SCREEN_WIDTH,
                            Layout::SCREEN_HEIGHT, SDL_WINDOW_SHOWN);

  if (!window) {
    throw std::runtime_error(std::string("SDL_CreateWindow failed: ") +
                             SDL_GetError());
  }

  renderer = SDL_CreateRenderer(
      window, -1, SDL_RENDERER_ACCELERATED | SDL_RENDERER_PRESENTVSYNC);

  if (!renderer) {
    throw std::runtime_error(std::string("SDL_CreateRenderer failed: ") +
                             SDL_GetError());
  }

  SDL_SetRenderDrawBlendMode(renderer, SDL_BLENDMODE_BLEND);

  if (TTF_Init() == -1) {
    throw std::runtime_error(std::string("TTF_Init failed: ") +
                             TTF_GetError());
  }
  ttfInitialized = true;

  font = LoadFont(config.fontPath, config.fontSize);
  fontBig = LoadFont(config.fontPath, config.bigFontSize);
  if (!font || !fontBig) {
    throw std::runtime_error("Could not load any font");
  }
  TTF_SetFontStyle(fontBig, TTF_STYLE_BOLD);

  std::cout << "[Renderer] Initialized " << Layout::SCREEN_WIDTH << "x"
            << Layout::SCREEN_HEIGHT << " window" << std::endl;
}

TTF_Font *Renderer::LoadFont(const std::string &preferredPath, int size) {
  // Sans-serif fonts, closest to Arial first
  std::vector<std::string> fontPaths = {
      preferredPath,
      // Windows Fonts
      "c:/windows/fonts/arial.ttf",
      "c:/windows/fonts/segoeui.ttf",
      // macOS Fonts
      "/Library/Fonts/Arial.ttf",
      "/System/Library/Fonts/Supplemental/Arial.ttf",
      "/System/Library/Fonts/Helvetica.ttc",
      // Liberation fonts (metric-compatible with Arial)
      "/usr/share/fonts/truetype/liberation/LiberationSans-Regular.ttf",
      "/usr/share/fonts/liberation/LiberationSans-Regular.ttf",
      "/usr/share/fonts/truetype/liberation2/LiberationSans-Regular.ttf",
      // DejaVu fonts
      "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf",
      "/usr/share/fonts/dejavu-sans-fonts/DejaVuSans.ttf",
      "/usr/share/fonts/TTF/DejaVuSans.ttf",
      // Noto fonts
      "/usr/share/fonts/truetype/noto/NotoSans-Regular.ttf",
      "/usr/share/fonts/noto/NotoSans-Regular.ttf",
      "/usr/share/fonts/google-noto/NotoSans-Regular.ttf",
      // Free fonts
      "/usr/share/fonts/truetype/freefont/FreeSans.ttf",
      "/usr/share/fonts/freefont/FreeSans.ttf"};

  for (const auto &path : fontPaths) {
    if (path.empty())
      continue;
    TTF_Font *loaded = TTF_OpenFont(path.c_str(), size);
    if (loaded) {
      std::cout << "[Renderer] Loaded font: " << path << " (" << size
                << "pt)" << std::endl;
      return loaded;
    }
  }

  std::cerr << "[Renderer] Could not load a " << size << "pt font"
            << std::endl;
  return nullptr;
}

void Renderer::Cleanup() {
  if (fontBig) {
    TTF_CloseFont(fontBig);
    fontBig = nullptr;
  }
  if (font) {
    TTF_CloseFont(font);
    font = nullptr;
  }
  if (ttfInitialized) {
    TTF_Quit();
    ttfInitialized = false;
  }
  if (renderer) {
    SDL_DestroyRenderer(renderer);
    renderer = nullptr;
  }
  if (window) {
    SDL_DestroyWindow(window);
    window = nullptr;
  }
  if (sdlInitialized) {
    SDL_Quit();
    sdlInitialized = false;
    std::cout << "[Renderer] Cleanup complete" << std::endl;
  }
}

void Renderer::Execute(const std::vector<DrawCommand> &commands) {
  for (const DrawCommand &cmd : commands) {
    switch (cmd.op) {
    case DrawOp::CLEAR:
      SetColor(cmd.color);
      SDL_RenderClear(renderer);
      break;
    case DrawOp::FILL_RECT:
      SetColor(cmd.color);
      FillRoundedRect(cmd.rect, cmd.radius);
      break;
    case DrawOp::STROKE_RECT:
      SetColor(cmd.color);
      StrokeRoundedRect(cmd.rect, cmd.radius, cmd.width);
      break;
    case DrawOp::LINE:
      SetColor(cmd.color);
      DrawThickLine(cmd.from, cmd.to, cmd.width);
      break;
    case DrawOp::FILL_CIRCLE:
      SetColor(cmd.color);
      DrawFilledCircle(cmd.center.x, cmd.center.y, cmd.radius);
      break;
    case DrawOp::TEXT:
      RenderTextCentered(cmd.text, cmd.center, cmd.color, cmd.font);
      break;
    case DrawOp::PRESENT:
      SDL_RenderPresent(renderer);
      break;
    }
  }
}

void Renderer::SetColor(Color color) {
  SDL_SetRenderDrawColor(renderer, color.r, color.g, color.b, color.a);
}

void Renderer::FillRoundedRect(const Rect &rect, int radius) {
  int r = std::min(radius, std::min(rect.w, rect.h) / 2);
  if (r <= 0) {
    SDL_Rect dst = {rect.x, rect.y, rect.w, rect.h};
    SDL_RenderFillRect(renderer, &dst);
    return;
  }

  int top = rect.y + r;               // Corner centers (rows)
  int bottom = rect.y + rect.h - 1 - r;
  for (int y = rect.y; y < rect.y + rect.h; ++y) {
    int dy = 0;
    if (y < top) {
      dy = top - y;
    } else if (y > bottom) {
      dy = y - bottom;
    }
    int inset = r - static_cast<int>(std::sqrt(r * r - dy * dy));
    SDL_RenderDrawLine(renderer, rect.x + inset, y,
                       rect.x + rect.w - 1 - inset, y);
  }
}

void Renderer::StrokeRoundedRect(const Rect &rect, int radius, int width) {
  for (int t = 0; t < width; ++t) {
    int x = rect.x + t;
    int y = rect.y + t;
    int w = rect.w - 2 * t;
    int h = rect.h - 2 * t;
    if (w <= 0 || h <= 0)
      break;
    int r = std::min(std::max(0, radius - t), std::min(w, h) / 2);

    int left = x + r;
    int right = x + w - 1 - r;
    int top = y + r;
    int bottom = y + h - 1 - r;

    SDL_RenderDrawLine(renderer, left, y, right, y);
    SDL_RenderDrawLine(renderer, left, y + h - 1, right, y + h - 1);
    SDL_RenderDrawLine(renderer, x, top, x, bottom);
    SDL_RenderDrawLine(renderer, x + w - 1, top, x + w - 1, bottom);

    // Midpoint circle, one quadrant per corner
    int px = r, py = 0;
    int radiusError = 1 - px;
    while (px >= py) {
      SDL_RenderDrawPoint(renderer, left - px, top - py);
      SDL_RenderDrawPoint(renderer, left - py, top - px);
      SDL_RenderDrawPoint(renderer, right + px, top - py);
      SDL_RenderDrawPoint(renderer, right + py, top - px);
      SDL_RenderDrawPoint(renderer, left - px, bottom + py);
      SDL_RenderDrawPoint(renderer, left - py, bottom + px);
      SDL_RenderDrawPoint(renderer, right + px, bottom + py);
      SDL_RenderDrawPoint(renderer, right + py, bottom + px);

      ++py;
      if (radiusError < 0) {
        radiusError += 2 * py + 1;
      } else {
        --px;
        radiusError += 2 * (py - px + 1);
      }
    }
  }
}

void Renderer::DrawThickLine(const Point &from, const Point &to, int width) {
  bool mostlyHorizontal = std::abs(to.x - from.x) >= std::abs(to.y - from.y);
  int start = -(width - 1) / 2;
  for (int offset = start; offset < start + width; ++offset) {
    if (mostlyHorizontal) {
      SDL_RenderDrawLine(renderer, from.x, from.y + offset, to.x,
                         to.y + offset);
    } else {
      SDL_RenderDrawLine(renderer, from.x + offset, from.y, to.x + offset,
                         to.y);
    }
  }
}

void Renderer::DrawFilledCircle(int cx, int cy, int radius) {
  for (int y = -radius; y <= radius; ++y) {
    int halfWidth = static_cast<int>(std::sqrt(radius * radius - y * y));
    SDL_RenderDrawLine(renderer, cx - halfWidth, cy + y, cx + halfWidth,
                       cy + y);
  }
}

void Renderer::RenderTextCentered(const std::string &text,
                                  const Point &center, Color color,
                                  FontSize size) {
  TTF_Font *active = size == FontSize::BIG ? fontBig : font;
  if (!active || !renderer || text.empty())
    return;

  SDL_Color sdlColor = {color.r, color.g, color.b, color.a};
  SDL_Surface *surface = TTF_RenderUTF8_Blended(active, text.c_str(), sdlColor);
  if (surface) {
    SDL_Texture *texture = SDL_CreateTextureFromSurface(renderer, surface);
    if (texture) {
      SDL_Rect dst = {center.x - surface->w / 2, center.y - surface->h / 2,
                      surface->w, surface->h};
      SDL_RenderCopy(renderer, texture, nullptr, &dst);
      SDL_DestroyTexture(texture);
    }
    SDL_FreeSurface(surface);
  }
}

std::vector<InputEvent> Renderer::PollEvents() {
  std::vector<InputEvent> events;
  SDL_Event event;
  while (SDL_PollEvent(&event)) {
    InputEvent translated;
    if (TranslateEvent(event, translated)) {
      events.push_back(translated);
    }
  }
  return events;
}

Point Renderer::CursorPosition() const {
  int mx = 0, my = 0;
  SDL_GetMouseState(&mx, &my);
  return Point(mx, my);
}

} // namespace FlowPairs
