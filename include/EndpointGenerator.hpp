#pragma once

#include "GridData.hpp"
#include <cstdint>
#include <functional>
#include <random>
#include <vector>

namespace FlowPairs {

/**
 * GenerationResult - Best pairing found by one Generate() call
 */
struct GenerationResult {
  EndpointList pairs;
  int score = -1;     // Spread score of `pairs` (sum of Manhattan distances)
  int bestTrial = -1; // Index of the trial that produced `pairs`
  int trialsRun = 0;
  int64_t computation_time_ms = 0;

  bool isValid() const { return !pairs.empty(); }
};

/**
 * Called once per trial with (trialIndex, score) of that trial's pairing
 */
using TrialObserver = std::function<void(int, int)>;

/**
 * EndpointGenerator - Random endpoint placement biased toward spread
 *
 * Algorithm: O(T × N²)
 *   T = number of trials (1000)
 *   N = grid size
 *
 * Each trial shuffles all N² cells and takes the first 2P as P pairs
 * (consecutive slots). The pairing with the largest sum of Manhattan
 * distances wins; ties keep the earlier trial.
 *
 * The result is NOT guaranteed to be a solvable flow puzzle: no path
 * connectivity check is performed.
 */
class EndpointGenerator {
public:
  static constexpr int DEFAULT_TRIALS = 1000;

  explicit EndpointGenerator(std::mt19937 &rng, int trials = DEFAULT_TRIALS);

  /**
   * Generate numPairs non-overlapping endpoint pairs on a gridSize board
   * @param observer Optional per-trial callback
   * @throws std::invalid_argument if 2 * numPairs > gridSize², or any
   *         argument is non-positive
   */
  GenerationResult Generate(int numPairs, int gridSize,
                            const TrialObserver &observer = nullptr);

  int GetTrials() const { return trials_; }

private:
  /**
   * Pick count distinct cells uniformly (full shuffle, then prefix)
   */
  std::vector<Cell> DistinctRandomCells(int count, int gridSize);

  std::mt19937 &rng_;
  int trials_;
};

/**
 * Convenience wrapper: default trial budget, pairs only
 */
EndpointList GenerateEndpoints(int numPairs, int gridSize, std::mt19937 &rng);

} // namespace FlowPairs
