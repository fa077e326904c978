// Ticket: 0003_swappable_sensitivities

#ifndef TUBEOPT_SIZING_OPTIMIZATION_SENSITIVITY_STRATEGY_HPP
#define TUBEOPT_SIZING_OPTIMIZATION_SENSITIVITY_STRATEGY_HPP

#include <Eigen/Dense>

#include "tubeopt-sizing/src/Model/DerivedQuantities.hpp"
#include "tubeopt-sizing/src/Model/DesignPoint.hpp"
#include "tubeopt-sizing/src/Model/LoadCase.hpp"

namespace tubeopt_sizing
{

/// d(response_i)/d(x_j), rows ordered as DerivedQuantities::Response,
/// columns as [innerDiameter, outerDiameter]
using ResponseJacobian = Eigen::Matrix<double, DerivedQuantities::kResponseCount, 2>;

/**
 * @brief Abstract interface for the sensitivities of the structural responses
 *
 * Decouples the optimizer from how derivatives are obtained, so the default
 * finite-difference approximation can be swapped for hand-derived gradients
 * without touching the solver wiring.
 *
 * Thread safety: Implementations should be stateless and thread-safe
 */
class SensitivityStrategy
{
public:
  virtual ~SensitivityStrategy() = default;

  /**
   * @brief Compute the response Jacobian at a design point
   * @param point Design point the Jacobian is taken at
   * @param loads Load case
   * @param baseline Model response already evaluated at point
   * @return 4x2 Jacobian of [area, thickness, D/t, margin] w.r.t. [Di, Do]
   */
  [[nodiscard]] virtual ResponseJacobian computeJacobian(
    const DesignPoint& point,
    const LoadCase& loads,
    const DerivedQuantities& baseline) const = 0;

  /**
   * @brief Additional model evaluations consumed by one computeJacobian call
   * @return Number of StructuralModel evaluations beyond the baseline
   */
  [[nodiscard]] virtual int evaluationsPerJacobian() const = 0;

protected:
  SensitivityStrategy() = default;
  SensitivityStrategy(const SensitivityStrategy&) = default;
  SensitivityStrategy& operator=(const SensitivityStrategy&) = default;
  SensitivityStrategy(SensitivityStrategy&&) noexcept = default;
  SensitivityStrategy& operator=(SensitivityStrategy&&) noexcept = default;
};

}  // namespace tubeopt_sizing

#endif  // TUBEOPT_SIZING_OPTIMIZATION_SENSITIVITY_STRATEGY_HPP
