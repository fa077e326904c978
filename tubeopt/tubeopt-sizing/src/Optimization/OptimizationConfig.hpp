// Ticket: 0002_nlopt_tube_optimizer

#ifndef TUBEOPT_SIZING_OPTIMIZATION_OPTIMIZATION_CONFIG_HPP
#define TUBEOPT_SIZING_OPTIMIZATION_OPTIMIZATION_CONFIG_HPP

#include "tubeopt-sizing/src/Model/DesignPoint.hpp"

namespace tubeopt_sizing
{

/// Closed interval [lower, upper]
struct VariableBounds
{
  double lower;
  double upper;
};

/// How the optimizer obtains response sensitivities
enum class SensitivityMethod
{
  ForwardDifference,  ///< Forward finite differences (default)
  CentralDifference,  ///< Central finite differences
  Analytic            ///< Hand-derived gradients of the closed-form model
};

/**
 * @brief Bounds, thresholds and solver settings for one tube sizing run
 *
 * Lengths are in meters except minimumThickness, which is given in
 * millimeters and converted by the optimizer. No validation is performed: a
 * configuration that is infeasible by construction surfaces as a
 * non-converged result.
 */
struct OptimizationConfig
{
  VariableBounds innerDiameterBounds{0.005, 0.5};  // [m]
  VariableBounds outerDiameterBounds{0.01, 0.6};   // [m]

  double minimumThickness{1.0};     // [mm]
  double minimumSafetyMargin{0.0};  // [-]
  VariableBounds diameterOverThicknessBounds{2.0, 25.0};  // [-]

  DesignPoint initialGuess{0.060, 0.100};  // [m]

  double objectiveTolerance{1e-8};    ///< Relative change in area between iterations
  double stepTolerance{1e-8};         ///< Relative change in the design variables
  double constraintTolerance{1e-8};   ///< Per-constraint tolerance handed to SLSQP
  int maxEvaluations{500};            ///< Budget of objective evaluations
  double feasibilityTolerance{1e-4};  ///< Relative slack for the converged flag

  SensitivityMethod sensitivityMethod{SensitivityMethod::ForwardDifference};
  double finiteDifferenceStep{1e-6};  // [m]
};

}  // namespace tubeopt_sizing

#endif  // TUBEOPT_SIZING_OPTIMIZATION_OPTIMIZATION_CONFIG_HPP
