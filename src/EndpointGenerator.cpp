#include "EndpointGenerator.hpp"
#include "GridMath.hpp"
#include <algorithm>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>

namespace FlowPairs {

EndpointGenerator::EndpointGenerator(std::mt19937 &rng, int trials)
    : rng_(rng), trials_(trials) {
  if (trials_ < 1) {
    throw std::invalid_argument("EndpointGenerator: trials must be >= 1, got " +
                                std::to_string(trials_));
  }
}

std::vector<Cell> EndpointGenerator::DistinctRandomCells(int count,
                                                         int gridSize) {
  std::vector<Cell> cells;
  cells.reserve(static_cast<size_t>(gridSize * gridSize));
  for (int r = 0; r < gridSize; ++r) {
    for (int c = 0; c < gridSize; ++c) {
      cells.emplace_back(r, c);
    }
  }

  std::shuffle(cells.begin(), cells.end(), rng_);
  cells.resize(static_cast<size_t>(count));
  return cells;
}

GenerationResult EndpointGenerator::Generate(int numPairs, int gridSize,
                                             const TrialObserver &observer) {
  if (numPairs < 1 || gridSize < 1) {
    throw std::invalid_argument(
        "EndpointGenerator: numPairs and gridSize must be positive");
  }
  if (2 * numPairs > gridSize * gridSize) {
    throw std::invalid_argument(
        "EndpointGenerator: " + std::to_string(numPairs) +
        " pairs do not fit on a " + std::to_string(gridSize) + "x" +
        std::to_string(gridSize) + " grid");
  }

  auto start_time = std::chrono::steady_clock::now();

  GenerationResult best;

  for (int trial = 0; trial < trials_; ++trial) {
    std::vector<Cell> cells = DistinctRandomCells(2 * numPairs, gridSize);

    EndpointList pairs;
    pairs.reserve(static_cast<size_t>(numPairs));
    for (int i = 0; i < numPairs; ++i) {
      pairs.emplace_back(cells[2 * i], cells[2 * i + 1]);
    }

    int score = PairingScore(pairs);
    if (observer) {
      observer(trial, score);
    }

    // Strictly greater: ties keep the first-seen maximum
    if (score > best.score) {
      best.score = score;
      best.bestTrial = trial;
      best.pairs = std::move(pairs);
    }
  }

  best.trialsRun = trials_;

  auto end_time = std::chrono::steady_clock::now();
  best.computation_time_ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(end_time -
                                                            start_time)
          .count();

  std::cout << "[Generator] " << numPairs << " pairs on " << gridSize << "x"
            << gridSize << ": best score " << best.score << " (trial "
            << best.bestTrial << "/" << best.trialsRun << ", "
            << best.computation_time_ms << "ms)" << std::endl;

  return best;
}

EndpointList GenerateEndpoints(int numPairs, int gridSize, std::mt19937 &rng) {
  EndpointGenerator generator(rng);
  return generator.Generate(numPairs, gridSize).pairs;
}

} // namespace FlowPairs
