#pragma once

#include "GridData.hpp"
#include <cstdlib>
#include <vector>

namespace FlowPairs {

/**
 * Point - Integer pixel coordinate in the 720x720 logical frame
 */
struct Point {
  int x = 0;
  int y = 0;

  Point() = default;
  Point(int x_, int y_) : x(x_), y(y_) {}
};

/**
 * Rect - Axis-aligned pixel rectangle (x, y = top-left corner)
 */
struct Rect {
  int x = 0;
  int y = 0;
  int w = 0;
  int h = 0;

  Rect() = default;
  Rect(int x_, int y_, int w_, int h_) : x(x_), y(y_), w(w_), h(h_) {}

  Point center() const { return Point(x + w / 2, y + h / 2); }

  // Half-open on the right/bottom edge, same rule as SDL_PointInRect
  bool contains(const Point &p) const {
    return p.x >= x && p.x < x + w && p.y >= y && p.y < y + h;
  }

  bool operator==(const Rect &other) const {
    return x == other.x && y == other.y && w == other.w && h == other.h;
  }
};

/**
 * ManhattanDistance - |r1 - r2| + |c1 - c2|
 */
inline int ManhattanDistance(const Cell &a, const Cell &b) {
  return std::abs(a.row - b.row) + std::abs(a.col - b.col);
}

/**
 * PairingScore - Spread score of a pairing
 *
 * score = Σ ManhattanDistance(pair.first, pair.second)
 * Larger scores place the two endpoints of each color further apart.
 */
inline int PairingScore(const EndpointList &pairs) {
  int score = 0;
  for (const EndpointPair &pair : pairs) {
    score += ManhattanDistance(pair.first, pair.second);
  }
  return score;
}

/**
 * HitTest - Index of the first rect containing the point, or -1
 */
int HitTest(const std::vector<Rect> &rects, const Point &point);

/**
 * AllCellsDistinct - True if no cell appears twice across all pairs
 * (including both cells of the same pair)
 */
bool AllCellsDistinct(const EndpointList &pairs);

} // namespace FlowPairs
