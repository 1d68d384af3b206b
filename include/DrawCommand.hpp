#pragma once

#include "GridData.hpp"
#include "GridMath.hpp"
#include <string>
#include <utility>
#include <vector>

namespace FlowPairs {

enum class DrawOp {
  CLEAR,       // Fill the whole frame with `color`
  FILL_RECT,   // Filled rect, rounded by `radius` (0 = square corners)
  STROKE_RECT, // Outlined rect, `width` px thick, rounded by `radius`
  LINE,        // `from` -> `to`, `width` px thick
  FILL_CIRCLE, // Disc at `center` with `radius`
  TEXT,        // `text` centered on `center`
  PRESENT      // Flip the frame buffer
};

enum class FontSize {
  REGULAR, // 24pt
  BIG      // 40pt bold
};

/**
 * DrawCommand - One backend-neutral drawing primitive
 * Only the fields relevant to `op` are meaningful.
 */
struct DrawCommand {
  DrawOp op = DrawOp::CLEAR;
  Color color;
  Rect rect;
  Point from;
  Point to;
  Point center;
  int radius = 0;
  int width = 1;
  std::string text;
  FontSize font = FontSize::REGULAR;
};

/**
 * DrawList - Builder for the command list of one frame
 */
class DrawList {
public:
  void Clear(Color color);
  void FillRect(const Rect &rect, Color color, int radius = 0);
  void StrokeRect(const Rect &rect, Color color, int width, int radius = 0);
  void Line(const Point &from, const Point &to, Color color, int width = 1);
  void FillCircle(const Point &center, int radius, Color color);
  void Text(const std::string &text, const Point &center, Color color,
            FontSize font = FontSize::REGULAR);
  void Present();

  const std::vector<DrawCommand> &Commands() const { return commands_; }
  std::vector<DrawCommand> Take() { return std::move(commands_); }

private:
  std::vector<DrawCommand> commands_;
};

} // namespace FlowPairs
