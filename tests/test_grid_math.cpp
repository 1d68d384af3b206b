#include <gtest/gtest.h>
#include "GridMath.hpp"
#include "Layout.hpp"

using namespace FlowPairs;

TEST(GridMathTest, ManhattanDistance) {
  EXPECT_EQ(ManhattanDistance(Cell(0, 0), Cell(4, 4)), 8);
  EXPECT_EQ(ManhattanDistance(Cell(2, 3), Cell(2, 3)), 0);
  EXPECT_EQ(ManhattanDistance(Cell(3, 1), Cell(1, 2)), 3);
}

TEST(GridMathTest, PairingScoreSumsPairs) {
  EndpointList pairs = {{Cell(0, 0), Cell(4, 4)}, {Cell(0, 4), Cell(4, 0)},
                        {Cell(2, 1), Cell(2, 2)}};
  EXPECT_EQ(PairingScore(pairs), 8 + 8 + 1);
  EXPECT_EQ(PairingScore(EndpointList()), 0);
}

TEST(GridMathTest, AllCellsDistinctDetectsDuplicates) {
  EndpointList ok = {{Cell(0, 0), Cell(1, 1)}, {Cell(2, 2), Cell(3, 3)}};
  EndpointList samePair = {{Cell(0, 0), Cell(0, 0)}};
  EndpointList acrossPairs = {{Cell(0, 0), Cell(1, 1)},
                              {Cell(1, 1), Cell(3, 3)}};

  EXPECT_TRUE(AllCellsDistinct(ok));
  EXPECT_FALSE(AllCellsDistinct(samePair));
  EXPECT_FALSE(AllCellsDistinct(acrossPairs));
}

TEST(GridMathTest, HitTestIsHalfOpen) {
  std::vector<Rect> rects = {Rect(10, 10, 20, 20), Rect(40, 10, 20, 20)};

  EXPECT_EQ(HitTest(rects, Point(10, 10)), 0);
  EXPECT_EQ(HitTest(rects, Point(29, 29)), 0);
  EXPECT_EQ(HitTest(rects, Point(30, 15)), -1);
  EXPECT_EQ(HitTest(rects, Point(45, 15)), 1);
  EXPECT_EQ(HitTest(rects, Point(0, 0)), -1);
}

TEST(LayoutTest, MenuButtonsStackCentered) {
  std::vector<Rect> rects = Layout::MenuButtons();

  ASSERT_EQ(rects.size(), 3u);
  EXPECT_EQ(rects[0], Rect(230, 280, 260, 60));
  EXPECT_EQ(rects[1], Rect(230, 360, 260, 60));
  EXPECT_EQ(rects[2], Rect(230, 440, 260, 60));
}

TEST(LayoutTest, ConfigButtonsInOneRow) {
  std::vector<Rect> rects = Layout::ConfigButtons();

  ASSERT_EQ(rects.size(), 3u);
  EXPECT_EQ(rects[0], Rect(205, 320, 90, 60));
  EXPECT_EQ(rects[1], Rect(315, 320, 90, 60));
  EXPECT_EQ(rects[2], Rect(425, 320, 90, 60));
}

TEST(LayoutTest, FiveByFiveGridGeometry) {
  GridGeometry grid = Layout::Grid(5);

  EXPECT_EQ(grid.cellSize, 120);
  EXPECT_EQ(grid.gridWidth, 600);
  EXPECT_EQ(grid.x0, 60);
  EXPECT_EQ(grid.y0, 60);
  EXPECT_EQ(grid.MarkerRadius(), 38);

  Point topLeft = grid.CellCenter(Cell(0, 0));
  EXPECT_EQ(topLeft.x, 120);
  EXPECT_EQ(topLeft.y, 120);

  // Row moves y, column moves x
  Point p = grid.CellCenter(Cell(1, 3));
  EXPECT_EQ(p.x, 60 + 3 * 120 + 60);
  EXPECT_EQ(p.y, 60 + 1 * 120 + 60);
}

TEST(PaletteTest, FivePairsNeverRepeatAndIndexWraps) {
  for (int i = 0; i < 5; ++i) {
    for (int j = i + 1; j < 5; ++j) {
      EXPECT_NE(Palette::ForPair(i), Palette::ForPair(j));
    }
  }
  EXPECT_EQ(Palette::ForPair(7), Palette::ForPair(0));
  EXPECT_EQ(Palette::ForPair(0), (Color{244, 67, 54, 255}));
}
