#include "SceneMachine.hpp"
#include "Layout.hpp"
#include <iostream>
#include <string>
#include <utility>

namespace FlowPairs {

namespace {

const char *const MENU_LABELS[3] = {"Run", "Config", "Quit"};

void DrawTextCenter(DrawList &draw, const std::string &text, int y,
                    Color color = SceneMachine::Colors::TEXT,
                    bool big = false) {
  draw.Text(text, Point(Layout::SCREEN_WIDTH / 2, y), color,
            big ? FontSize::BIG : FontSize::REGULAR);
}

void DrawButton(DrawList &draw, const Rect &rect, const std::string &label,
                bool hover) {
  draw.FillRect(rect,
                hover ? SceneMachine::Colors::BUTTON_HOVER
                      : SceneMachine::Colors::BUTTON,
                Layout::BUTTON_RADIUS);
  draw.StrokeRect(rect, SceneMachine::Colors::BUTTON_BORDER, 2,
                  Layout::BUTTON_RADIUS);
  draw.Text(label, rect.center(), SceneMachine::Colors::TEXT);
}

bool IsLeftClick(const InputEvent &event) {
  return event.type == InputEventType::MOUSE_BUTTON_DOWN &&
         event.button == MouseButton::LEFT;
}

} // namespace

SceneMachine::SceneMachine(std::mt19937 &rng, int trials)
    : generator_(rng, trials) {}

FrameResult SceneMachine::Tick(const AppState &state,
                               const FrameInput &input) {
  FrameResult result;

  switch (state.scene) {
  case Scene::MENU:
    result = TickMenu(state, input);
    break;
  case Scene::CONFIG:
    result = TickConfig(state, input);
    break;
  case Scene::RUN:
    result = TickRun(state, input);
    break;
  default:
    // Corrupted scene value: recover without drawing this frame
    std::cerr << "[Scene] Unknown scene " << static_cast<int>(state.scene)
              << ", returning to menu" << std::endl;
    result.state = state;
    result.state.scene = Scene::MENU;
    return result;
  }

  if (result.state.scene != state.scene) {
    std::cout << "[Scene] " << SceneName(state.scene) << " -> "
              << SceneName(result.state.scene) << std::endl;
  }
  if (state.running && !result.state.running) {
    std::cout << "[Scene] Quit requested from " << SceneName(state.scene)
              << std::endl;
  }

  return result;
}

void SceneMachine::StartRun(AppState &state) {
  GenerationResult generated =
      generator_.Generate(state.numPairs, AppState::GRID_SIZE);
  state.endpoints = std::move(generated.pairs);
  state.scene = Scene::RUN;
}

FrameResult SceneMachine::TickMenu(const AppState &state,
                                   const FrameInput &input) {
  FrameResult result;
  result.state = state;
  AppState &next = result.state;

  DrawList draw;
  draw.Clear(Colors::BACKGROUND);
  DrawTextCenter(draw, "Flow (prototype)", 130, Colors::TEXT, true);
  DrawTextCenter(draw, "Enter/Click to select", 180);
  DrawTextCenter(draw,
                 "Pairs: " + std::to_string(state.numPairs) +
                     " (change in Config)",
                 215, Colors::TEXT_DIM);

  std::vector<Rect> rects = Layout::MenuButtons();
  int hoverIndex = HitTest(rects, input.cursor);
  for (size_t i = 0; i < rects.size(); ++i) {
    DrawButton(draw, rects[i], MENU_LABELS[i],
               static_cast<int>(i) == hoverIndex);
  }
  draw.Present();
  result.commands = draw.Take();

  // Last selection in the queue wins; applied after draining
  int selection = -1;
  for (const InputEvent &event : input.events) {
    switch (event.type) {
    case InputEventType::QUIT:
      next.running = false;
      break;

    case InputEventType::KEY_DOWN:
      switch (event.key) {
      case Key::RETURN:
      case Key::KP_ENTER:
        // Hovered control, else the top one
        selection = hoverIndex == -1 ? MENU_RUN : hoverIndex;
        break;
      case Key::Q:
      case Key::ESCAPE:
        next.running = false;
        break;
      default:
        break;
      }
      break;

    case InputEventType::MOUSE_BUTTON_DOWN:
      if (IsLeftClick(event)) {
        int clicked = HitTest(rects, event.position);
        if (clicked != -1) {
          selection = clicked;
        }
      }
      break;
    }
  }

  switch (selection) {
  case MENU_RUN:
    StartRun(next);
    break;
  case MENU_CONFIG:
    next.scene = Scene::CONFIG;
    break;
  case MENU_QUIT:
    next.running = false;
    break;
  default:
    break;
  }

  return result;
}

FrameResult SceneMachine::TickConfig(const AppState &state,
                                     const FrameInput &input) {
  FrameResult result;
  result.state = state;
  AppState &next = result.state;

  DrawList draw;
  draw.Clear(Colors::BACKGROUND);
  DrawTextCenter(draw, "Config", 120, Colors::TEXT, true);
  DrawTextCenter(draw,
                 "Choose number of color pairs for " +
                     std::to_string(AppState::GRID_SIZE) + "x" +
                     std::to_string(AppState::GRID_SIZE) + ":",
                 170);
  DrawTextCenter(draw, "[3]  [4]  [5]", 215);
  DrawTextCenter(draw, "Press 3/4/5, or click buttons. ESC to return.", 255,
                 Colors::TEXT_DIM);

  std::vector<Rect> rects = Layout::ConfigButtons();
  int hoverIndex = HitTest(rects, input.cursor);
  for (int i = 0; i < AppState::PAIR_CHOICE_COUNT; ++i) {
    int value = AppState::PAIR_CHOICES[i];
    DrawButton(draw, rects[i], std::to_string(value) + " pairs",
               i == hoverIndex);
    if (value == state.numPairs) {
      draw.StrokeRect(rects[i], Colors::SELECTED_BORDER, 3,
                      Layout::BUTTON_RADIUS);
    }
  }
  draw.Present();
  result.commands = draw.Take();

  for (const InputEvent &event : input.events) {
    switch (event.type) {
    case InputEventType::QUIT:
      next.running = false;
      break;

    case InputEventType::KEY_DOWN:
      switch (event.key) {
      case Key::ESCAPE:
        next.scene = Scene::MENU;
        break;
      case Key::NUM_3:
        next.numPairs = 3;
        break;
      case Key::NUM_4:
        next.numPairs = 4;
        break;
      case Key::NUM_5:
        next.numPairs = 5;
        break;
      default:
        break;
      }
      break;

    case InputEventType::MOUSE_BUTTON_DOWN:
      if (IsLeftClick(event)) {
        int clicked = HitTest(rects, event.position);
        if (clicked != -1) {
          next.numPairs = AppState::PAIR_CHOICES[clicked];
        }
      }
      break;
    }
  }

  if (next.numPairs != state.numPairs) {
    std::cout << "[Config] Pairs set to " << next.numPairs << std::endl;
  }

  return result;
}

void SceneMachine::DrawGridAndEndpoints(DrawList &draw,
                                        const EndpointList &endpoints,
                                        int n) const {
  GridGeometry grid = Layout::Grid(n);

  draw.FillRect(Rect(grid.x0, grid.y0, grid.gridWidth, grid.gridWidth),
                Colors::BACKGROUND);

  for (int i = 0; i <= n; ++i) {
    int x = grid.x0 + i * grid.cellSize;
    int y = grid.y0 + i * grid.cellSize;
    draw.Line(Point(grid.x0, y), Point(grid.x0 + grid.gridWidth, y),
              Colors::GRID_LINE, 2);
    draw.Line(Point(x, grid.y0), Point(x, grid.y0 + grid.gridWidth),
              Colors::GRID_LINE, 2);
  }

  int radius = grid.MarkerRadius();
  for (size_t idx = 0; idx < endpoints.size(); ++idx) {
    Color color = Palette::ForPair(static_cast<int>(idx));
    draw.FillCircle(grid.CellCenter(endpoints[idx].first), radius, color);
    draw.FillCircle(grid.CellCenter(endpoints[idx].second), radius, color);
  }
}

FrameResult SceneMachine::TickRun(const AppState &state,
                                  const FrameInput &input) {
  FrameResult result;
  result.state = state;
  AppState &next = result.state;

  DrawList draw;
  draw.Clear(Colors::BACKGROUND);
  DrawTextCenter(draw,
                 std::to_string(AppState::GRID_SIZE) + "x" +
                     std::to_string(AppState::GRID_SIZE) + " • " +
                     std::to_string(state.numPairs) +
                     " pairs  —  ESC to menu",
                 28, Colors::TEXT_DIM);
  DrawGridAndEndpoints(draw, state.endpoints, AppState::GRID_SIZE);
  draw.Present();
  result.commands = draw.Take();

  for (const InputEvent &event : input.events) {
    if (event.type == InputEventType::QUIT) {
      next.running = false;
    } else if (event.type == InputEventType::KEY_DOWN &&
               event.key == Key::ESCAPE) {
      next.scene = Scene::MENU;
    }
  }

  return result;
}

} // namespace FlowPairs
