#ifndef TUBEOPT_SIZING_OPTIMIZATION_OPTIMIZATION_RESULT_HPP
#define TUBEOPT_SIZING_OPTIMIZATION_OPTIMIZATION_RESULT_HPP

#include <limits>
#include <string_view>

#include "tubeopt-sizing/src/Model/DerivedQuantities.hpp"
#include "tubeopt-sizing/src/Model/DesignPoint.hpp"

namespace tubeopt_sizing
{

/// Termination reason reported by the NLP solver
enum class SolverStatus
{
  Success,
  ObjectiveToleranceReached,
  StepToleranceReached,
  StopValueReached,
  MaxEvaluationsReached,
  MaxTimeReached,
  RoundoffLimited,
  ForcedStop,
  InvalidArguments,
  OutOfMemory,
  Failure
};

/// Human-readable name of a solver status
[[nodiscard]] std::string_view toString(SolverStatus status);

/// True for the statuses that count as a successful solve
[[nodiscard]] bool isSuccess(SolverStatus status);

/**
 * @brief Final design rounded for reporting
 *
 * Lengths in millimeters rounded to 3 decimals, margin rounded to 4 decimals.
 */
struct ReportedDesign
{
  double innerDiameter{0.0};  // [mm]
  double outerDiameter{0.0};  // [mm]
  double thickness{0.0};      // [mm]
  double safetyMargin{0.0};   // [-]
};

/**
 * @brief Outcome of one TubeOptimizer::optimize call
 *
 * The design fields are populated even when converged is false; they then
 * hold the solver's last iterate.
 */
struct OptimizationResult
{
  bool converged{false};
  ReportedDesign design{};

  DesignPoint finalPoint{};           ///< Unrounded final design [m]
  DerivedQuantities finalResponse{};  ///< Model response at finalPoint
  double objectiveValue{std::numeric_limits<double>::quiet_NaN()};  ///< Area [m^2]
  SolverStatus status{SolverStatus::Failure};
  bool feasible{false};      ///< All constraints hold within feasibilityTolerance
  int solverEvaluations{0};  ///< Objective evaluations requested by the solver
  int modelEvaluations{0};   ///< StructuralModel evaluations, including perturbations
};

}  // namespace tubeopt_sizing

#endif  // TUBEOPT_SIZING_OPTIMIZATION_OPTIMIZATION_RESULT_HPP
