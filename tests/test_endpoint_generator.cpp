#include <gtest/gtest.h>
#include "EndpointGenerator.hpp"
#include "GridMath.hpp"
#include <algorithm>
#include <random>
#include <stdexcept>
#include <vector>

using namespace FlowPairs;

class EndpointGeneratorTest : public ::testing::Test {
protected:
  std::mt19937 rng{12345};
};

TEST_F(EndpointGeneratorTest, ReturnsRequestedPairCountWithDistinctCells) {
  EndpointGenerator generator(rng);

  for (int numPairs : {3, 4, 5}) {
    GenerationResult result = generator.Generate(numPairs, 5);

    ASSERT_TRUE(result.isValid());
    EXPECT_EQ(result.pairs.size(), static_cast<size_t>(numPairs));
    EXPECT_TRUE(AllCellsDistinct(result.pairs)) << "numPairs=" << numPairs;

    for (const EndpointPair &pair : result.pairs) {
      for (const Cell &cell : {pair.first, pair.second}) {
        EXPECT_GE(cell.row, 0);
        EXPECT_LT(cell.row, 5);
        EXPECT_GE(cell.col, 0);
        EXPECT_LT(cell.col, 5);
      }
    }
  }
}

TEST_F(EndpointGeneratorTest, SameSeedGivesSameOutput) {
  std::mt19937 rngA(777);
  std::mt19937 rngB(777);

  EndpointList a = GenerateEndpoints(4, 5, rngA);
  EndpointList b = GenerateEndpoints(4, 5, rngB);

  EXPECT_EQ(a, b);
}

TEST_F(EndpointGeneratorTest, ChosenTrialHasMaximumScore) {
  EndpointGenerator generator(rng);
  std::vector<int> scores;

  GenerationResult result = generator.Generate(
      5, 5, [&scores](int trial, int score) {
        EXPECT_EQ(trial, static_cast<int>(scores.size()));
        scores.push_back(score);
      });

  ASSERT_EQ(scores.size(),
            static_cast<size_t>(EndpointGenerator::DEFAULT_TRIALS));
  EXPECT_EQ(result.trialsRun, EndpointGenerator::DEFAULT_TRIALS);

  int maxScore = *std::max_element(scores.begin(), scores.end());
  EXPECT_EQ(result.score, maxScore);
  EXPECT_EQ(PairingScore(result.pairs), result.score);

  // Ties keep the first trial that reached the maximum
  auto firstMax = std::find(scores.begin(), scores.end(), maxScore);
  EXPECT_EQ(result.bestTrial, static_cast<int>(firstMax - scores.begin()));
}

TEST_F(EndpointGeneratorTest, SingleTrialIsShufflePrefix) {
  std::mt19937 replay(2024);
  std::mt19937 engine(2024);

  EndpointGenerator generator(engine, 1);
  GenerationResult result = generator.Generate(3, 5);

  std::vector<Cell> cells;
  for (int r = 0; r < 5; ++r)
    for (int c = 0; c < 5; ++c)
      cells.emplace_back(r, c);
  std::shuffle(cells.begin(), cells.end(), replay);

  ASSERT_EQ(result.pairs.size(), 3u);
  for (int i = 0; i < 3; ++i) {
    EXPECT_EQ(result.pairs[i].first, cells[2 * i]);
    EXPECT_EQ(result.pairs[i].second, cells[2 * i + 1]);
  }
  EXPECT_EQ(result.bestTrial, 0);
}

TEST_F(EndpointGeneratorTest, FullBoardUsesEveryCell) {
  EndpointGenerator generator(rng, 50);
  GenerationResult result = generator.Generate(8, 4);

  ASSERT_EQ(result.pairs.size(), 8u);
  EXPECT_TRUE(AllCellsDistinct(result.pairs));
}

TEST_F(EndpointGeneratorTest, FivePairsTerminatesWithinTrialBudget) {
  int calls = 0;
  EndpointGenerator generator(rng);
  GenerationResult result =
      generator.Generate(5, 5, [&calls](int, int) { ++calls; });

  EXPECT_EQ(calls, EndpointGenerator::DEFAULT_TRIALS);
  EXPECT_EQ(result.pairs.size(), 5u);
}

TEST_F(EndpointGeneratorTest, SpreadIsBetterThanAverage) {
  EndpointGenerator generator(rng);
  long long total = 0;
  int trials = 0;
  GenerationResult result =
      generator.Generate(3, 5, [&](int, int score) {
        total += score;
        ++trials;
      });

  EXPECT_GE(static_cast<double>(result.score),
            static_cast<double>(total) / trials);
}

TEST_F(EndpointGeneratorTest, RejectsImpossibleRequests) {
  EndpointGenerator generator(rng);

  EXPECT_THROW(generator.Generate(13, 5), std::invalid_argument);
  EXPECT_THROW(generator.Generate(0, 5), std::invalid_argument);
  EXPECT_THROW(generator.Generate(3, 0), std::invalid_argument);
  EXPECT_THROW(EndpointGenerator(rng, 0), std::invalid_argument);
}
