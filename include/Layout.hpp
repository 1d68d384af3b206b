#pragma once

#include "GridData.hpp"
#include "GridMath.hpp"
#include <vector>

namespace FlowPairs {

/**
 * GridGeometry - Pixel placement of the N x N board inside the frame
 */
struct GridGeometry {
  int x0 = 0;        // Left edge of the board
  int y0 = 0;        // Top edge of the board
  int cellSize = 0;  // Side of one cell in pixels
  int gridWidth = 0; // cellSize * N
  int n = 0;

  Point CellCenter(const Cell &cell) const {
    return Point(x0 + cell.col * cellSize + cellSize / 2,
                 y0 + cell.row * cellSize + cellSize / 2);
  }

  // Endpoint marker radius: 32% of a cell, truncated
  int MarkerRadius() const { return static_cast<int>(cellSize * 0.32f); }
};

/**
 * Layout - Fixed screen geometry shared by the scenes and the renderer
 *
 * All coordinates are in the 720x720 logical frame.
 */
class Layout {
public:
  static constexpr int SCREEN_WIDTH = 720;
  static constexpr int SCREEN_HEIGHT = 720;

  // Menu: three stacked buttons [Run, Config, Quit]
  static constexpr int MENU_BUTTON_WIDTH = 260;
  static constexpr int MENU_BUTTON_HEIGHT = 60;
  static constexpr int MENU_BUTTON_SPACING = 20;
  static constexpr int MENU_START_Y = 280;

  // Config: three buttons in a row [3, 4, 5]
  static constexpr int CONFIG_BUTTON_WIDTH = 90;
  static constexpr int CONFIG_BUTTON_HEIGHT = 60;
  static constexpr int CONFIG_BUTTON_SPACING = 20;
  static constexpr int CONFIG_START_Y = 320;

  static constexpr int GRID_MARGIN = 60;
  static constexpr int BUTTON_RADIUS = 10;

  static std::vector<Rect> MenuButtons();
  static std::vector<Rect> ConfigButtons();

  /**
   * Board geometry for an n x n grid, centered in the frame
   */
  static GridGeometry Grid(int n);
};

} // namespace FlowPairs
