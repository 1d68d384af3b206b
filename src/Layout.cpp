#include "Layout.hpp"

namespace FlowPairs {

std::vector<Rect> Layout::MenuButtons() {
  std::vector<Rect> rects;
  int x = (SCREEN_WIDTH - MENU_BUTTON_WIDTH) / 2;
  for (int i = 0; i < 3; ++i) {
    rects.emplace_back(x,
                       MENU_START_Y + i * (MENU_BUTTON_HEIGHT +
                                           MENU_BUTTON_SPACING),
                       MENU_BUTTON_WIDTH, MENU_BUTTON_HEIGHT);
  }
  return rects;
}

std::vector<Rect> Layout::ConfigButtons() {
  std::vector<Rect> rects;
  int totalWidth = 3 * CONFIG_BUTTON_WIDTH + 2 * CONFIG_BUTTON_SPACING;
  int x0 = (SCREEN_WIDTH - totalWidth) / 2;
  for (int i = 0; i < 3; ++i) {
    rects.emplace_back(x0 + i * (CONFIG_BUTTON_WIDTH + CONFIG_BUTTON_SPACING),
                       CONFIG_START_Y, CONFIG_BUTTON_WIDTH,
                       CONFIG_BUTTON_HEIGHT);
  }
  return rects;
}

GridGeometry Layout::Grid(int n) {
  GridGeometry geometry;
  geometry.n = n;
  int available = SCREEN_WIDTH - 2 * GRID_MARGIN;
  geometry.cellSize = available / n;
  geometry.gridWidth = geometry.cellSize * n;
  geometry.x0 = (SCREEN_WIDTH - geometry.gridWidth) / 2;
  geometry.y0 = (SCREEN_HEIGHT - geometry.gridWidth) / 2;
  return geometry;
}

} // namespace FlowPairs
