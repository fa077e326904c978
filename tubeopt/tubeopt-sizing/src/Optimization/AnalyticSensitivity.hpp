#ifndef TUBEOPT_SIZING_OPTIMIZATION_ANALYTIC_SENSITIVITY_HPP
#define TUBEOPT_SIZING_OPTIMIZATION_ANALYTIC_SENSITIVITY_HPP

#include "tubeopt-sizing/src/Optimization/SensitivityStrategy.hpp"

namespace tubeopt_sizing
{

/**
 * @brief Hand-derived response sensitivities of the closed-form tube model
 *
 * With s = F/A + M*(Do/2)/I and sigma = sqrt(s^2 + eps):
 *   dA/dDi = -pi*Di/2           dA/dDo = pi*Do/2
 *   dt/dDi = -1/2               dt/dDo = 1/2
 *   d(Do/t)/dDi = 2*Do/(Do-Di)^2,  d(Do/t)/dDo = -2*Di/(Do-Di)^2
 *   dI/dDi = -pi*Di^3/16        dI/dDo = pi*Do^3/16
 *   dMS = -Fy/sigma^2 * (s/sigma) * ds
 *
 * Uses no model evaluations beyond the baseline.
 */
class AnalyticSensitivity : public SensitivityStrategy
{
public:
  AnalyticSensitivity() = default;
  ~AnalyticSensitivity() override = default;

  [[nodiscard]] ResponseJacobian computeJacobian(
    const DesignPoint& point,
    const LoadCase& loads,
    const DerivedQuantities& baseline) const override;

  [[nodiscard]] int evaluationsPerJacobian() const override { return 0; }

  AnalyticSensitivity(const AnalyticSensitivity&) = default;
  AnalyticSensitivity& operator=(const AnalyticSensitivity&) = default;
  AnalyticSensitivity(AnalyticSensitivity&&) noexcept = default;
  AnalyticSensitivity& operator=(AnalyticSensitivity&&) noexcept = default;
};

}  // namespace tubeopt_sizing

#endif  // TUBEOPT_SIZING_OPTIMIZATION_ANALYTIC_SENSITIVITY_HPP
