// Ticket: 0002_nlopt_tube_optimizer

#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <memory>
#include <numbers>
#include <stdexcept>
#include <vector>

#include "tubeopt-sizing/src/Model/StructuralModel.hpp"
#include "tubeopt-sizing/src/Optimization/AnalyticSensitivity.hpp"
#include "tubeopt-sizing/src/Optimization/FiniteDifferenceSensitivity.hpp"
#include "tubeopt-sizing/src/Optimization/TubeOptimizer.hpp"

namespace tubeopt_sizing
{
namespace test
{

namespace
{

// Area of the default initial guess, Di = 60 mm, Do = 100 mm
double initialGuessArea()
{
  return std::numbers::pi / 4.0 * (0.100 * 0.100 - 0.060 * 0.060);
}

OptimizationConfig referenceConfig()
{
  OptimizationConfig config{};
  config.minimumSafetyMargin = 0.05;
  config.minimumThickness = 3.0;
  return config;
}

// Checks the reported design against every constraint of the config
void expectConstraintsSatisfied(const OptimizationResult& result,
                                const OptimizationConfig& config)
{
  const auto& design = result.design;
  EXPECT_GT(design.innerDiameter, 0.0);
  EXPECT_GT(design.outerDiameter, design.innerDiameter);
  EXPECT_GE(design.thickness, config.minimumThickness * (1.0 - 1e-4) - 1e-3);
  EXPECT_GE(design.safetyMargin,
            config.minimumSafetyMargin - 1e-4 * std::max(1.0, config.minimumSafetyMargin));

  double const ratio = result.finalResponse.diameterOverThickness;
  EXPECT_GE(ratio, config.diameterOverThicknessBounds.lower * (1.0 - 1e-4));
  EXPECT_LE(ratio, config.diameterOverThicknessBounds.upper * (1.0 + 1e-4));
}

// Analytic gradients that count how often they are requested
class CountingSensitivity : public SensitivityStrategy
{
public:
  [[nodiscard]] ResponseJacobian computeJacobian(
    const DesignPoint& point,
    const LoadCase& loads,
    const DerivedQuantities& baseline) const override
  {
    ++calls;
    return AnalyticSensitivity{}.computeJacobian(point, loads, baseline);
  }

  [[nodiscard]] int evaluationsPerJacobian() const override { return 0; }

  mutable int calls{0};
};

}  // namespace

// ========== Problem Setup ==========

TEST(TubeOptimizerTest, DefaultConfigMatchesProblemDefinition)
{
  OptimizationConfig const config{};

  EXPECT_DOUBLE_EQ(config.innerDiameterBounds.lower, 0.005);
  EXPECT_DOUBLE_EQ(config.innerDiameterBounds.upper, 0.5);
  EXPECT_DOUBLE_EQ(config.outerDiameterBounds.lower, 0.01);
  EXPECT_DOUBLE_EQ(config.outerDiameterBounds.upper, 0.6);
  EXPECT_DOUBLE_EQ(config.minimumThickness, 1.0);
  EXPECT_DOUBLE_EQ(config.minimumSafetyMargin, 0.0);
  EXPECT_DOUBLE_EQ(config.diameterOverThicknessBounds.lower, 2.0);
  EXPECT_DOUBLE_EQ(config.diameterOverThicknessBounds.upper, 25.0);
  EXPECT_DOUBLE_EQ(config.initialGuess.innerDiameter, 0.060);
  EXPECT_DOUBLE_EQ(config.initialGuess.outerDiameter, 0.100);
  EXPECT_EQ(config.sensitivityMethod, SensitivityMethod::ForwardDifference);
}

TEST(TubeOptimizerTest, BuildConstraints_ConvertsThicknessToMeters)
{
  auto const constraints = TubeOptimizer::buildConstraints(referenceConfig());

  ASSERT_EQ(constraints.size(), 4u);

  EXPECT_EQ(constraints[0].response, DerivedQuantities::kThickness);
  EXPECT_EQ(constraints[0].side, TubeOptimizer::BoundSide::Lower);
  EXPECT_DOUBLE_EQ(constraints[0].bound, 0.003);

  EXPECT_EQ(constraints[1].response, DerivedQuantities::kSafetyMargin);
  EXPECT_EQ(constraints[1].side, TubeOptimizer::BoundSide::Lower);
  EXPECT_DOUBLE_EQ(constraints[1].bound, 0.05);

  EXPECT_EQ(constraints[2].response, DerivedQuantities::kDiameterOverThickness);
  EXPECT_EQ(constraints[2].side, TubeOptimizer::BoundSide::Lower);
  EXPECT_DOUBLE_EQ(constraints[2].bound, 2.0);

  EXPECT_EQ(constraints[3].response, DerivedQuantities::kDiameterOverThickness);
  EXPECT_EQ(constraints[3].side, TubeOptimizer::BoundSide::Upper);
  EXPECT_DOUBLE_EQ(constraints[3].bound, 25.0);
}

TEST(TubeOptimizerTest, InequalityConstraint_NegativeWhenSatisfied)
{
  auto const constraints = TubeOptimizer::buildConstraints(referenceConfig());

  // t = 20 mm, D/t = 5: thickness and ratio satisfied
  auto const q = StructuralModel::evaluate(0.060, 0.100, 10e3, 5e3);

  EXPECT_NEAR(constraints[0].evaluate(q), 0.003 - 0.020, 1e-15);
  EXPECT_NEAR(constraints[2].evaluate(q), 2.0 - 5.0, 1e-12);
  EXPECT_NEAR(constraints[3].evaluate(q), 5.0 - 25.0, 1e-12);
  EXPECT_LT(constraints[1].evaluate(q), 0.0);
}

TEST(TubeOptimizerTest, IsFeasible_DetectsViolations)
{
  auto const constraints = TubeOptimizer::buildConstraints(referenceConfig());

  auto const thick = StructuralModel::evaluate(0.060, 0.100, 10e3, 5e3);
  EXPECT_TRUE(TubeOptimizer::isFeasible(thick, constraints, 1e-4));

  // t = 1 mm violates the 3 mm minimum and D/t = 100 violates the ratio
  auto const thin = StructuralModel::evaluate(0.098, 0.100, 10e3, 5e3);
  EXPECT_FALSE(TubeOptimizer::isFeasible(thin, constraints, 1e-4));

  auto const degenerate = StructuralModel::evaluate(0.050, 0.050, 10e3, 0.0);
  EXPECT_FALSE(TubeOptimizer::isFeasible(degenerate, constraints, 1e-4));
}

TEST(TubeOptimizerTest, IsFeasible_AcceptsViolationWithinTolerance)
{
  OptimizationConfig config{};
  config.minimumThickness = 3.0;
  auto const constraints = TubeOptimizer::buildConstraints(config);

  // Thickness 1e-8 m short of the 3 mm minimum, allowance is 1e-4 * 3e-3 m
  double const outer = 0.050;
  double const inner = outer - 2.0 * (0.003 - 1e-8);
  auto const q = StructuralModel::evaluate(inner, outer, 0.0, 0.0);

  EXPECT_TRUE(TubeOptimizer::isFeasible(q, constraints, 1e-4));
  EXPECT_FALSE(TubeOptimizer::isFeasible(q, constraints, 1e-7));
}

TEST(TubeOptimizerTest, MakeSensitivityStrategy_FollowsConfig)
{
  OptimizationConfig config{};

  auto forward = TubeOptimizer::makeSensitivityStrategy(config);
  auto* fdForward = dynamic_cast<FiniteDifferenceSensitivity*>(forward.get());
  ASSERT_NE(fdForward, nullptr);
  EXPECT_EQ(fdForward->getScheme(), FiniteDifferenceSensitivity::Scheme::Forward);

  config.sensitivityMethod = SensitivityMethod::CentralDifference;
  config.finiteDifferenceStep = 1e-7;
  auto central = TubeOptimizer::makeSensitivityStrategy(config);
  auto* fdCentral = dynamic_cast<FiniteDifferenceSensitivity*>(central.get());
  ASSERT_NE(fdCentral, nullptr);
  EXPECT_EQ(fdCentral->getScheme(), FiniteDifferenceSensitivity::Scheme::Central);
  EXPECT_DOUBLE_EQ(fdCentral->getStep(), 1e-7);

  config.sensitivityMethod = SensitivityMethod::Analytic;
  auto analytic = TubeOptimizer::makeSensitivityStrategy(config);
  EXPECT_NE(dynamic_cast<AnalyticSensitivity*>(analytic.get()), nullptr);
}

TEST(TubeOptimizerTest, NonPositiveFiniteDifferenceStepThrows)
{
  OptimizationConfig config{};
  config.finiteDifferenceStep = 0.0;

  TubeOptimizer const optimizer{};
  EXPECT_THROW((void)optimizer.optimize(LoadCase{10e3, 5e3}, config),
               std::invalid_argument);
}

// ========== Scenarios ==========

TEST(TubeOptimizerTest, ReferenceLoad_ConvergesToMinimumArea)
{
  // 10 kN axial, 5 kN*m bending, MS >= 0.05, t >= 3 mm
  // The optimum sits where D/t = 25 and MS = 0.05 intersect:
  //   Do = 82.388 mm, Di = 75.797 mm, t = 3.296 mm
  OptimizationConfig const config = referenceConfig();
  TubeOptimizer const optimizer{};

  auto const result = optimizer.optimize(LoadCase{10e3, 5e3}, config);

  ASSERT_TRUE(result.converged) << toString(result.status);
  EXPECT_TRUE(result.feasible);
  EXPECT_TRUE(isSuccess(result.status));
  expectConstraintsSatisfied(result, config);

  EXPECT_LT(result.objectiveValue, initialGuessArea());
  EXPECT_NEAR(result.design.outerDiameter, 82.388, 0.1);
  EXPECT_NEAR(result.design.innerDiameter, 75.797, 0.1);
  EXPECT_NEAR(result.design.thickness, 3.296, 0.01);
  EXPECT_NEAR(result.design.safetyMargin, 0.05, 1e-3);
  EXPECT_NEAR(result.finalResponse.diameterOverThickness, 25.0, 0.01);

  EXPECT_GT(result.solverEvaluations, 0);
  EXPECT_GT(result.modelEvaluations, result.solverEvaluations);
}

TEST(TubeOptimizerTest, ReferenceLoad_ReportIsRoundedFinalPoint)
{
  TubeOptimizer const optimizer{};
  auto const result = optimizer.optimize(LoadCase{10e3, 5e3}, referenceConfig());

  EXPECT_NEAR(result.design.innerDiameter,
              result.finalPoint.innerDiameter * 1000.0,
              0.0005 + 1e-9);
  EXPECT_NEAR(result.design.outerDiameter,
              result.finalPoint.outerDiameter * 1000.0,
              0.0005 + 1e-9);
  EXPECT_NEAR(result.design.thickness,
              result.finalResponse.thickness * 1000.0,
              0.0005 + 1e-9);
  EXPECT_NEAR(result.design.safetyMargin,
              result.finalResponse.safetyMargin,
              0.00005 + 1e-12);
  EXPECT_DOUBLE_EQ(result.objectiveValue, result.finalResponse.area);
}

TEST(TubeOptimizerTest, ZeroLoad_GeometryConstraintsAreActive)
{
  // Margin is ~1.1e10 everywhere, so the smallest admissible section wins:
  // Do at its 10 mm lower bound and t at the 1 mm minimum
  TubeOptimizer const optimizer{};
  OptimizationConfig const config{};

  auto const result = optimizer.optimize(LoadCase{0.0, 0.0}, config);

  ASSERT_TRUE(result.converged) << toString(result.status);
  expectConstraintsSatisfied(result, config);

  EXPECT_GT(result.design.safetyMargin, 1e10);
  EXPECT_NEAR(result.design.thickness, 1.0, 0.01);
  EXPECT_NEAR(result.design.outerDiameter, 10.0, 0.05);
  EXPECT_NEAR(result.design.innerDiameter, 8.0, 0.05);
  EXPECT_LT(result.objectiveValue, initialGuessArea());
}

TEST(TubeOptimizerTest, ExtremeBendingMoment_ReportsNonConvergence)
{
  // No section inside the bounds can carry 1e9 N*m with MS >= 0.5
  OptimizationConfig config{};
  config.minimumSafetyMargin = 0.5;
  TubeOptimizer const optimizer{};

  OptimizationResult result{};
  ASSERT_NO_THROW(result = optimizer.optimize(LoadCase{10e3, 1e9}, config));

  EXPECT_FALSE(result.converged);
  EXPECT_FALSE(result.feasible);
  EXPECT_TRUE(std::isfinite(result.design.innerDiameter));
  EXPECT_TRUE(std::isfinite(result.design.outerDiameter));
  EXPECT_LT(result.finalResponse.safetyMargin, 0.5);
}

TEST(TubeOptimizerTest, InfeasibleByConstructionConfig_ReportsNonConvergence)
{
  // 400 mm minimum wall exceeds (600 - 5) / 2 = 297.5 mm
  OptimizationConfig config{};
  config.minimumThickness = 400.0;
  TubeOptimizer const optimizer{};

  OptimizationResult result{};
  ASSERT_NO_THROW(result = optimizer.optimize(LoadCase{10e3, 5e3}, config));

  EXPECT_FALSE(result.converged);
  EXPECT_LT(result.design.thickness, 400.0);
}

TEST(TubeOptimizerTest, EvaluationBudgetExhausted_ReportsNonConvergence)
{
  OptimizationConfig config = referenceConfig();
  config.maxEvaluations = 2;
  TubeOptimizer const optimizer{};

  auto const result = optimizer.optimize(LoadCase{10e3, 5e3}, config);

  EXPECT_FALSE(result.converged);
  EXPECT_LE(result.solverEvaluations, 2);
  EXPECT_GT(result.design.outerDiameter, 0.0);
}

TEST(TubeOptimizerTest, InitialGuessOutsideBoundsIsClamped)
{
  OptimizationConfig config = referenceConfig();
  config.initialGuess = DesignPoint{0.7, 0.9};
  TubeOptimizer const optimizer{};

  OptimizationResult result{};
  ASSERT_NO_THROW(result = optimizer.optimize(LoadCase{10e3, 5e3}, config));

  EXPECT_LE(result.finalPoint.innerDiameter, config.innerDiameterBounds.upper);
  EXPECT_LE(result.finalPoint.outerDiameter, config.outerDiameterBounds.upper);
}

TEST(TubeOptimizerTest, ConstraintSatisfactionAtConvergence)
{
  struct Scenario
  {
    double force;
    double moment;
    double minimumSafetyMargin;
    double minimumThickness;
  };
  std::vector<Scenario> const scenarios{
    {10e3, 5e3, 0.05, 3.0},
    {50e3, 1e3, 0.0, 1.0},
    {-20e3, 2e3, 0.25, 2.0},
    {1e3, 20e3, 0.1, 4.0},
  };

  TubeOptimizer const optimizer{};
  int convergedCount = 0;
  for (const auto& s : scenarios)
  {
    OptimizationConfig config{};
    config.minimumSafetyMargin = s.minimumSafetyMargin;
    config.minimumThickness = s.minimumThickness;

    auto const result = optimizer.optimize(LoadCase{s.force, s.moment}, config);
    if (result.converged)
    {
      ++convergedCount;
      SCOPED_TRACE(testing::Message() << "F = " << s.force << ", M = " << s.moment);
      expectConstraintsSatisfied(result, config);
    }
  }

  EXPECT_GT(convergedCount, 0);
}

// ========== Sensitivity Strategies ==========

TEST(TubeOptimizerTest, AllSensitivityMethodsReachSameOptimum)
{
  TubeOptimizer const optimizer{};
  LoadCase const loads{10e3, 5e3};

  OptimizationConfig forwardConfig = referenceConfig();
  OptimizationConfig centralConfig = referenceConfig();
  centralConfig.sensitivityMethod = SensitivityMethod::CentralDifference;
  OptimizationConfig analyticConfig = referenceConfig();
  analyticConfig.sensitivityMethod = SensitivityMethod::Analytic;

  auto const forward = optimizer.optimize(loads, forwardConfig);
  auto const central = optimizer.optimize(loads, centralConfig);
  auto const analytic = optimizer.optimize(loads, analyticConfig);

  ASSERT_TRUE(forward.converged);
  ASSERT_TRUE(central.converged);
  ASSERT_TRUE(analytic.converged);

  EXPECT_NEAR(central.design.outerDiameter, analytic.design.outerDiameter, 0.01);
  EXPECT_NEAR(forward.design.outerDiameter, analytic.design.outerDiameter, 0.01);
  EXPECT_NEAR(central.design.thickness, analytic.design.thickness, 0.005);
  EXPECT_NEAR(forward.design.thickness, analytic.design.thickness, 0.005);
}

TEST(TubeOptimizerTest, InjectedStrategyOverridesConfig)
{
  auto strategy = std::make_shared<CountingSensitivity>();
  TubeOptimizer const optimizer{strategy};

  OptimizationConfig config = referenceConfig();
  config.finiteDifferenceStep = -1.0;  // ignored with an injected strategy

  auto const result = optimizer.optimize(LoadCase{10e3, 5e3}, config);

  EXPECT_EQ(optimizer.getStrategy().get(), strategy.get());
  EXPECT_GT(strategy->calls, 0);
  EXPECT_TRUE(result.converged);
  // One model evaluation per distinct trial point plus the final re-evaluation
  EXPECT_LE(strategy->calls, result.modelEvaluations);
}

TEST(TubeOptimizerTest, RepeatedRunsAreIndependent)
{
  TubeOptimizer const optimizer{};
  LoadCase const loads{10e3, 5e3};

  auto const first = optimizer.optimize(loads, referenceConfig());
  auto const second = optimizer.optimize(loads, referenceConfig());

  EXPECT_EQ(first.converged, second.converged);
  EXPECT_EQ(first.finalPoint.innerDiameter, second.finalPoint.innerDiameter);
  EXPECT_EQ(first.finalPoint.outerDiameter, second.finalPoint.outerDiameter);
  EXPECT_EQ(first.solverEvaluations, second.solverEvaluations);
}

}  // namespace test
}  // namespace tubeopt_sizing
