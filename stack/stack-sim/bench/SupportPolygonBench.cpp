// Ticket: 0003_support_polygon

#include <benchmark/benchmark.h>
#include <chrono>
#include <cstdint>
#include <random>
#include <vector>
#include "stack-sim/src/DataTypes/Coordinate.hpp"
#include "stack-sim/src/Environment/ReferenceFrame.hpp"
#include "stack-sim/src/Environment/TowerModel.hpp"
#include "stack-sim/src/Geometry/SupportPolygon.hpp"
#include "stack-sim/src/Stability/StabilityAnalyzer.hpp"
#include "stack-sim/src/Stability/StabilityMonitor.hpp"

using namespace stack_sim;

// ============================================================================
// Helper Functions
// ============================================================================

namespace
{

// Ground-plane points with a fixed seed for reproducibility
std::vector<Coordinate> generateGroundPoints(size_t count)
{
  static std::mt19937 rng{42};
  std::uniform_real_distribution<double> dist{-10.0, 10.0};

  std::vector<Coordinate> points;
  points.reserve(count);
  for (size_t i = 0; i < count; ++i)
  {
    points.emplace_back(dist(rng), 0.0, dist(rng));
  }
  return points;
}

// Foundation plus a grid of 1 m cubes stacked in layers of 3 x 3
TowerModel buildTower(size_t pieceCount)
{
  TowerModel tower;
  tower.addBase(Coordinate{10.0, 0.5, 10.0},
                ReferenceFrame{Coordinate{0.0, -0.5, 0.0}});

  for (size_t i = 0; i < pieceCount; ++i)
  {
    auto const column = static_cast<double>(i % 3) - 1.0;
    auto const row = static_cast<double>((i / 3) % 3) - 1.0;
    auto const layer = static_cast<double>(i / 9);
    tower.addPiece(Coordinate{0.5, 0.5, 0.5},
                   ReferenceFrame{Coordinate{column, 0.5 + layer, row}},
                   1.0);
  }
  return tower;
}

}  // namespace

// ============================================================================
// Benchmarks
// ============================================================================

/**
 * @brief Monotone-chain hull over random ground points
 */
static void BM_ConvexHull_Construction(benchmark::State& state)
{
  auto points = generateGroundPoints(static_cast<size_t>(state.range(0)));
  for (auto _ : state)
  {
    auto hull = computeConvexHull(points);
    benchmark::DoNotOptimize(hull);
  }
  state.SetComplexityN(state.range(0));
}
BENCHMARK(BM_ConvexHull_Construction)
  ->Args({8})
  ->Args({64})
  ->Args({512})
  ->Args({4096})
  ->Complexity();

/**
 * @brief One full analysis tick: contacts, hull, centroid and scoring
 *
 * Contact collection is pairwise over bodies, so this is the term that
 * bounds the tick budget as towers grow.
 */
static void BM_StabilityAnalyzer_Tick(benchmark::State& state)
{
  auto const tower = buildTower(static_cast<size_t>(state.range(0)));
  StabilityAnalyzer analyzer;
  for (auto _ : state)
  {
    auto info = analyzer.analyze(tower.getObjects());
    benchmark::DoNotOptimize(info);
  }
  state.SetComplexityN(state.range(0));
}
BENCHMARK(BM_StabilityAnalyzer_Tick)
  ->Args({4})
  ->Args({16})
  ->Args({64})
  ->Complexity();

/**
 * @brief Per-frame monitor cost at 60 Hz, analysis every sixth frame or so
 */
static void BM_StabilityMonitor_Frame(benchmark::State& state)
{
  auto const tower = buildTower(16);
  StabilityMonitor monitor;
  std::chrono::milliseconds simTime{0};
  for (auto _ : state)
  {
    monitor.update(simTime, tower.getObjects());
    simTime += std::chrono::milliseconds{16};
    benchmark::DoNotOptimize(monitor.getStability());
  }
}
BENCHMARK(BM_StabilityMonitor_Frame);
