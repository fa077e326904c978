// Ticket: 0002_nlopt_tube_optimizer

#include "tubeopt-sizing/src/Optimization/TubeOptimizer.hpp"

#include <nlopt.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <utility>

#include "tubeopt-sizing/src/Model/StructuralModel.hpp"
#include "tubeopt-sizing/src/Optimization/AnalyticSensitivity.hpp"
#include "tubeopt-sizing/src/Optimization/FiniteDifferenceSensitivity.hpp"
#include "tubeopt-utils/src/Units.hpp"

namespace tubeopt_sizing
{

namespace
{

// Reference magnitudes for the relative feasibility check
constexpr double kThicknessScale = 1e-3;  // [m]
constexpr double kUnitlessScale = 1.0;

SolverStatus toSolverStatus(nlopt::result result)
{
  switch (result)
  {
    case nlopt::SUCCESS:
      return SolverStatus::Success;
    case nlopt::FTOL_REACHED:
      return SolverStatus::ObjectiveToleranceReached;
    case nlopt::XTOL_REACHED:
      return SolverStatus::StepToleranceReached;
    case nlopt::STOPVAL_REACHED:
      return SolverStatus::StopValueReached;
    case nlopt::MAXEVAL_REACHED:
      return SolverStatus::MaxEvaluationsReached;
    case nlopt::MAXTIME_REACHED:
      return SolverStatus::MaxTimeReached;
    case nlopt::ROUNDOFF_LIMITED:
      return SolverStatus::RoundoffLimited;
    case nlopt::FORCED_STOP:
      return SolverStatus::ForcedStop;
    case nlopt::INVALID_ARGS:
      return SolverStatus::InvalidArguments;
    case nlopt::OUT_OF_MEMORY:
      return SolverStatus::OutOfMemory;
    default:
      return SolverStatus::Failure;
  }
}

const char* sideSymbol(TubeOptimizer::BoundSide side)
{
  return side == TubeOptimizer::BoundSide::Lower ? ">=" : "<=";
}

}  // namespace

// ========== ResponseCache ==========

class TubeOptimizer::ResponseCache
{
public:
  ResponseCache(const LoadCase& loads, const SensitivityStrategy& strategy)
    : loads_{loads}, strategy_{strategy}
  {
  }

  const DerivedQuantities& response(const std::vector<double>& x)
  {
    update(x);
    return response_;
  }

  const ResponseJacobian& jacobian(const std::vector<double>& x)
  {
    update(x);
    if (!jacobian_valid_)
    {
      jacobian_ = strategy_.computeJacobian(point_, loads_, response_);
      model_evaluations_ += strategy_.evaluationsPerJacobian();
      jacobian_valid_ = true;
    }
    return jacobian_;
  }

  [[nodiscard]] int modelEvaluations() const { return model_evaluations_; }

private:
  void update(const std::vector<double>& x)
  {
    if (valid_ && x[0] == point_.innerDiameter && x[1] == point_.outerDiameter)
    {
      return;
    }

    point_ = DesignPoint{x[0], x[1]};
    response_ = StructuralModel::evaluate(point_, loads_);
    ++model_evaluations_;
    valid_ = true;
    jacobian_valid_ = false;
  }

  const LoadCase& loads_;
  const SensitivityStrategy& strategy_;

  DesignPoint point_{};
  DerivedQuantities response_{};
  ResponseJacobian jacobian_{ResponseJacobian::Zero()};
  bool valid_{false};
  bool jacobian_valid_{false};
  int model_evaluations_{0};
};

// ========== InequalityConstraint ==========

double TubeOptimizer::InequalityConstraint::evaluate(
  const DerivedQuantities& quantities) const
{
  double const value = quantities.responses()[response];
  return side == BoundSide::Lower ? bound - value : value - bound;
}

double TubeOptimizer::InequalityConstraint::allowedViolation(
  double relativeTolerance) const
{
  return relativeTolerance * std::max(std::abs(bound), scale);
}

// ========== TubeOptimizer ==========

TubeOptimizer::TubeOptimizer(std::shared_ptr<const SensitivityStrategy> strategy)
  : strategy_{std::move(strategy)}
{
}

std::vector<TubeOptimizer::InequalityConstraint> TubeOptimizer::buildConstraints(
  const OptimizationConfig& config)
{
  return {
    InequalityConstraint{"thickness",
                         DerivedQuantities::kThickness,
                         BoundSide::Lower,
                         tubeopt_utils::millimetersToMeters(config.minimumThickness),
                         kThicknessScale},
    InequalityConstraint{"safety_margin",
                         DerivedQuantities::kSafetyMargin,
                         BoundSide::Lower,
                         config.minimumSafetyMargin,
                         kUnitlessScale},
    InequalityConstraint{"diameter_over_thickness",
                         DerivedQuantities::kDiameterOverThickness,
                         BoundSide::Lower,
                         config.diameterOverThicknessBounds.lower,
                         kUnitlessScale},
    InequalityConstraint{"diameter_over_thickness",
                         DerivedQuantities::kDiameterOverThickness,
                         BoundSide::Upper,
                         config.diameterOverThicknessBounds.upper,
                         kUnitlessScale}};
}

std::unique_ptr<SensitivityStrategy> TubeOptimizer::makeSensitivityStrategy(
  const OptimizationConfig& config)
{
  switch (config.sensitivityMethod)
  {
    case SensitivityMethod::CentralDifference:
      return std::make_unique<FiniteDifferenceSensitivity>(
        FiniteDifferenceSensitivity::Scheme::Central, config.finiteDifferenceStep);
    case SensitivityMethod::Analytic:
      return std::make_unique<AnalyticSensitivity>();
    case SensitivityMethod::ForwardDifference:
    default:
      return std::make_unique<FiniteDifferenceSensitivity>(
        FiniteDifferenceSensitivity::Scheme::Forward, config.finiteDifferenceStep);
  }
}

bool TubeOptimizer::isFeasible(const DerivedQuantities& quantities,
                               const std::vector<InequalityConstraint>& constraints,
                               double relativeTolerance)
{
  return std::all_of(constraints.begin(),
                     constraints.end(),
                     [&](const InequalityConstraint& c)
                     {
                       // NaN compares false and counts as a violation
                       return c.evaluate(quantities) <=
                              c.allowedViolation(relativeTolerance);
                     });
}

OptimizationResult TubeOptimizer::optimize(const LoadCase& loads,
                                           const OptimizationConfig& config) const
{
  std::shared_ptr<const SensitivityStrategy> strategy = strategy_;
  if (!strategy)
  {
    strategy = makeSensitivityStrategy(config);
  }

  ResponseCache cache{loads, *strategy};
  std::vector<InequalityConstraint> const constraints = buildConstraints(config);

  std::vector<double> const lowerBounds{config.innerDiameterBounds.lower,
                                        config.outerDiameterBounds.lower};
  std::vector<double> const upperBounds{config.innerDiameterBounds.upper,
                                        config.outerDiameterBounds.upper};

  // Initial guess, clamped to the variable bounds
  std::vector<double> x{config.initialGuess.innerDiameter,
                        config.initialGuess.outerDiameter};
  for (size_t i = 0; i < x.size(); ++i)
  {
    x[i] = std::max(lowerBounds[i], x[i]);
    x[i] = std::min(upperBounds[i], x[i]);
  }

  spdlog::debug("TubeOptimizer: F = {} N, M = {} N*m", loads.getAxialForce(),
                loads.getBendingMoment());
  spdlog::debug("TubeOptimizer: design var inner_diam = {} m in [{}, {}]", x[0],
                lowerBounds[0], upperBounds[0]);
  spdlog::debug("TubeOptimizer: design var outer_diam = {} m in [{}, {}]", x[1],
                lowerBounds[1], upperBounds[1]);
  for (const auto& c : constraints)
  {
    spdlog::debug("TubeOptimizer: constraint {} {} {}", c.name, sideSymbol(c.side),
                  c.bound);
  }

  nlopt::opt opt{nlopt::LD_SLSQP, static_cast<unsigned>(x.size())};

  std::vector<ConstraintData> constraintData;
  constraintData.reserve(constraints.size());

  double finalObjective = std::numeric_limits<double>::quiet_NaN();
  SolverStatus status{SolverStatus::Failure};
  try
  {
    opt.set_lower_bounds(lowerBounds);
    opt.set_upper_bounds(upperBounds);
    opt.set_min_objective(objective, &cache);

    for (const auto& c : constraints)
    {
      constraintData.push_back(ConstraintData{&cache, &c});
      opt.add_inequality_constraint(constraint, &constraintData.back(),
                                    config.constraintTolerance);
    }

    opt.set_ftol_rel(config.objectiveTolerance);
    opt.set_xtol_rel(config.stepTolerance);
    opt.set_maxeval(config.maxEvaluations);

    status = toSolverStatus(opt.optimize(x, finalObjective));
  }
  catch (const nlopt::roundoff_limited& e)
  {
    status = SolverStatus::RoundoffLimited;
    spdlog::warn("TubeOptimizer: solver stopped by roundoff: {}", e.what());
  }
  catch (const nlopt::forced_stop& e)
  {
    status = SolverStatus::ForcedStop;
    spdlog::warn("TubeOptimizer: solver forced to stop: {}", e.what());
  }
  catch (const std::invalid_argument& e)
  {
    status = SolverStatus::InvalidArguments;
    spdlog::warn("TubeOptimizer: solver rejected the problem: {}", e.what());
  }
  catch (const std::runtime_error& e)
  {
    status = SolverStatus::Failure;
    spdlog::warn("TubeOptimizer: solver failed: {}", e.what());
  }

  // Re-evaluate at the final iterate so the report matches the returned point
  DesignPoint const finalPoint{x[0], x[1]};
  DerivedQuantities const finalResponse = StructuralModel::evaluate(finalPoint, loads);
  bool const feasible =
    isFeasible(finalResponse, constraints, config.feasibilityTolerance);

  if (isSuccess(status) && !feasible)
  {
    spdlog::warn("TubeOptimizer: solver reported {} at an infeasible point",
                 toString(status));
  }

  OptimizationResult result{};
  result.converged = isSuccess(status) && feasible;
  result.design = ReportedDesign{
    tubeopt_utils::roundToDecimals(
      tubeopt_utils::metersToMillimeters(finalPoint.innerDiameter), 3),
    tubeopt_utils::roundToDecimals(
      tubeopt_utils::metersToMillimeters(finalPoint.outerDiameter), 3),
    tubeopt_utils::roundToDecimals(
      tubeopt_utils::metersToMillimeters(finalResponse.thickness), 3),
    tubeopt_utils::roundToDecimals(finalResponse.safetyMargin, 4)};
  result.finalPoint = finalPoint;
  result.finalResponse = finalResponse;
  result.objectiveValue = finalResponse.area;
  result.status = status;
  result.feasible = feasible;
  result.solverEvaluations = opt.get_numevals();
  result.modelEvaluations = cache.modelEvaluations() + 1;

  if (result.converged)
  {
    spdlog::info("TubeOptimizer: converged ({}) after {} evaluations, area = {} m^2",
                 toString(status), result.solverEvaluations, result.objectiveValue);
  }
  else
  {
    spdlog::warn("TubeOptimizer: did not converge ({}, feasible = {}) after {} evaluations",
                 toString(status), feasible, result.solverEvaluations);
  }

  return result;
}

double TubeOptimizer::objective(const std::vector<double>& x,
                                std::vector<double>& grad,
                                void* data)
{
  auto* cache = static_cast<ResponseCache*>(data);
  double const area = cache->response(x).area;

  if (!grad.empty())
  {
    const ResponseJacobian& jacobian = cache->jacobian(x);
    grad[0] = jacobian(DerivedQuantities::kArea, 0);
    grad[1] = jacobian(DerivedQuantities::kArea, 1);
  }

  return area;
}

double TubeOptimizer::constraint(const std::vector<double>& x,
                                 std::vector<double>& grad,
                                 void* data)
{
  const auto* constraintData = static_cast<const ConstraintData*>(data);
  const InequalityConstraint& c = *constraintData->constraint;
  ResponseCache& cache = *constraintData->cache;

  double const value = c.evaluate(cache.response(x));

  if (!grad.empty())
  {
    // Lower bound: bound - r <= 0, so the gradient is -dr/dx
    double const sign = c.side == BoundSide::Lower ? -1.0 : 1.0;
    const ResponseJacobian& jacobian = cache.jacobian(x);
    grad[0] = sign * jacobian(c.response, 0);
    grad[1] = sign * jacobian(c.response, 1);
  }

  return value;
}

}  // namespace tubeopt_sizing
