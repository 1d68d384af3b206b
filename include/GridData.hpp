#pragma once

#include <cstdint>
#include <vector>

namespace FlowPairs {

/**
 * Color - RGBA color, backend-neutral (converted to SDL_Color at draw time)
 */
struct Color {
  std::uint8_t r = 0;
  std::uint8_t g = 0;
  std::uint8_t b = 0;
  std::uint8_t a = 255;

  bool operator==(const Color &other) const {
    return r == other.r && g == other.g && b == other.b && a == other.a;
  }
  bool operator!=(const Color &other) const { return !(*this == other); }
};

/**
 * Cell - (row, column) coordinate on the N x N board, 0-indexed
 */
struct Cell {
  int row = 0;
  int col = 0;

  Cell() = default;
  Cell(int row_, int col_) : row(row_), col(col_) {}

  bool operator==(const Cell &other) const {
    return row == other.row && col == other.col;
  }
  bool operator!=(const Cell &other) const { return !(*this == other); }

  // Row-major ordering, used for duplicate detection in sets
  bool operator<(const Cell &other) const {
    return row != other.row ? row < other.row : col < other.col;
  }
};

/**
 * EndpointPair - Two distinct cells sharing one palette color
 * The color is implied by the pair's index in the generated sequence.
 */
struct EndpointPair {
  Cell first;
  Cell second;

  EndpointPair() = default;
  EndpointPair(Cell a, Cell b) : first(a), second(b) {}

  bool operator==(const EndpointPair &other) const {
    return first == other.first && second == other.second;
  }
};

using EndpointList = std::vector<EndpointPair>;

/**
 * Palette - Fixed pair colors, indexed by pair index modulo size
 * Five pairs never repeat a color.
 */
struct Palette {
  static constexpr int SIZE = 7;
  static constexpr Color COLORS[SIZE] = {
      {244, 67, 54, 255},  // Red
      {76, 175, 80, 255},  // Green
      {33, 150, 243, 255}, // Blue
      {255, 193, 7, 255},  // Amber
      {156, 39, 176, 255}, // Purple
      {255, 87, 34, 255},  // Deep orange (spare)
      {0, 188, 212, 255},  // Cyan (spare)
  };

  static Color ForPair(int pairIndex) { return COLORS[pairIndex % SIZE]; }
};

} // namespace FlowPairs
