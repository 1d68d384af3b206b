#include "DrawCommand.hpp"

namespace FlowPairs {

void DrawList::Clear(Color color) {
  DrawCommand cmd;
  cmd.op = DrawOp::CLEAR;
  cmd.color = color;
  commands_.push_back(cmd);
}

void DrawList::FillRect(const Rect &rect, Color color, int radius) {
  DrawCommand cmd;
  cmd.op = DrawOp::FILL_RECT;
  cmd.rect = rect;
  cmd.color = color;
  cmd.radius = radius;
  commands_.push_back(cmd);
}

void DrawList::StrokeRect(const Rect &rect, Color color, int width,
                          int radius) {
  DrawCommand cmd;
  cmd.op = DrawOp::STROKE_RECT;
  cmd.rect = rect;
  cmd.color = color;
  cmd.width = width;
  cmd.radius = radius;
  commands_.push_back(cmd);
}

void DrawList::Line(const Point &from, const Point &to, Color color,
                    int width) {
  DrawCommand cmd;
  cmd.op = DrawOp::LINE;
  cmd.from = from;
  cmd.to = to;
  cmd.color = color;
  cmd.width = width;
  commands_.push_back(cmd);
}

void DrawList::FillCircle(const Point &center, int radius, Color color) {
  DrawCommand cmd;
  cmd.op = DrawOp::FILL_CIRCLE;
  cmd.center = center;
  cmd.radius = radius;
  cmd.color = color;
  commands_.push_back(cmd);
}

void DrawList::Text(const std::string &text, const Point &center, Color color,
                    FontSize font) {
  DrawCommand cmd;
  cmd.op = DrawOp::TEXT;
  cmd.text = text;
  cmd.center = center;
  cmd.color = color;
  cmd.font = font;
  commands_.push_back(std::move(cmd));
}

void DrawList::Present() {
  DrawCommand cmd;
  cmd.op = DrawOp::PRESENT;
  commands_.push_back(cmd);
}

} // namespace FlowPairs
