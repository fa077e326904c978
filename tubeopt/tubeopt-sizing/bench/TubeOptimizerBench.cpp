#include <benchmark/benchmark.h>
#include <spdlog/spdlog.h>

#include "tubeopt-sizing/src/Model/StructuralModel.hpp"
#include "tubeopt-sizing/src/Optimization/AnalyticSensitivity.hpp"
#include "tubeopt-sizing/src/Optimization/FiniteDifferenceSensitivity.hpp"
#include "tubeopt-sizing/src/Optimization/TubeOptimizer.hpp"

using namespace tubeopt_sizing;

// ============================================================================
// Structural Model
// ============================================================================

static void BM_StructuralModel_Evaluate(benchmark::State& state)
{
  DesignPoint const point{0.060, 0.100};
  LoadCase const loads{10e3, 5e3};

  for (auto _ : state)
  {
    benchmark::DoNotOptimize(StructuralModel::evaluate(point, loads));
  }
}
BENCHMARK(BM_StructuralModel_Evaluate);

// ============================================================================
// Sensitivities
// ============================================================================

static void BM_Jacobian_ForwardDifference(benchmark::State& state)
{
  DesignPoint const point{0.060, 0.100};
  LoadCase const loads{10e3, 5e3};
  auto const baseline = StructuralModel::evaluate(point, loads);
  FiniteDifferenceSensitivity const strategy{};

  for (auto _ : state)
  {
    benchmark::DoNotOptimize(strategy.computeJacobian(point, loads, baseline));
  }
}
BENCHMARK(BM_Jacobian_ForwardDifference);

static void BM_Jacobian_Analytic(benchmark::State& state)
{
  DesignPoint const point{0.060, 0.100};
  LoadCase const loads{10e3, 5e3};
  auto const baseline = StructuralModel::evaluate(point, loads);
  AnalyticSensitivity const strategy{};

  for (auto _ : state)
  {
    benchmark::DoNotOptimize(strategy.computeJacobian(point, loads, baseline));
  }
}
BENCHMARK(BM_Jacobian_Analytic);

// ============================================================================
// Full Sizing Run
// ============================================================================

/**
 * @brief Reference sizing run, parameterized by SensitivityMethod
 *
 * Reports the number of structural model evaluations per run as a counter.
 */
static void BM_TubeOptimizer_ReferenceLoad(benchmark::State& state)
{
  OptimizationConfig config{};
  config.minimumSafetyMargin = 0.05;
  config.minimumThickness = 3.0;
  config.sensitivityMethod = static_cast<SensitivityMethod>(state.range(0));

  TubeOptimizer const optimizer{};
  LoadCase const loads{10e3, 5e3};
  int modelEvaluations = 0;

  for (auto _ : state)
  {
    auto result = optimizer.optimize(loads, config);
    modelEvaluations = result.modelEvaluations;
    benchmark::DoNotOptimize(result);
  }

  state.counters["model_evals"] = modelEvaluations;
}
BENCHMARK(BM_TubeOptimizer_ReferenceLoad)
  ->Arg(static_cast<int>(SensitivityMethod::ForwardDifference))
  ->Arg(static_cast<int>(SensitivityMethod::CentralDifference))
  ->Arg(static_cast<int>(SensitivityMethod::Analytic))
  ->Unit(benchmark::kMicrosecond);

int main(int argc, char** argv)
{
  // Keep per-run solver summaries out of the timing output
  spdlog::set_level(spdlog::level::warn);

  benchmark::Initialize(&argc, argv);
  if (benchmark::ReportUnrecognizedArguments(argc, argv))
  {
    return 1;
  }
  benchmark::RunSpecifiedBenchmarks();
  benchmark::Shutdown();
  return 0;
}
