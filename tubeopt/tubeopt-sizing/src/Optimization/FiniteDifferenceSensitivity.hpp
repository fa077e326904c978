// Ticket: 0003_swappable_sensitivities

#ifndef TUBEOPT_SIZING_OPTIMIZATION_FINITE_DIFFERENCE_SENSITIVITY_HPP
#define TUBEOPT_SIZING_OPTIMIZATION_FINITE_DIFFERENCE_SENSITIVITY_HPP

#include "tubeopt-sizing/src/Optimization/SensitivityStrategy.hpp"

namespace tubeopt_sizing
{

/**
 * @brief Response sensitivities by finite differencing the structural model
 *
 * Perturbs each design variable by an absolute step h and re-evaluates the
 * model:
 *   forward: dr/dx_j = (r(x + h e_j) - r(x)) / h
 *   central: dr/dx_j = (r(x + h e_j) - r(x - h e_j)) / (2h)
 *
 * Perturbed points are not clipped to the variable bounds.
 */
class FiniteDifferenceSensitivity : public SensitivityStrategy
{
public:
  enum class Scheme
  {
    Forward,  ///< One extra evaluation per variable, O(h) error
    Central   ///< Two extra evaluations per variable, O(h^2) error
  };

  /// Default absolute step [m]
  static constexpr double kDefaultStep = 1e-6;

  /**
   * @brief Construct with a scheme and step
   * @param scheme Difference scheme
   * @param step Absolute perturbation [m]
   * @throws std::invalid_argument if step is not a positive finite number
   */
  explicit FiniteDifferenceSensitivity(Scheme scheme = Scheme::Forward,
                                       double step = kDefaultStep);

  ~FiniteDifferenceSensitivity() override = default;

  [[nodiscard]] ResponseJacobian computeJacobian(
    const DesignPoint& point,
    const LoadCase& loads,
    const DerivedQuantities& baseline) const override;

  [[nodiscard]] int evaluationsPerJacobian() const override;

  [[nodiscard]] Scheme getScheme() const { return scheme_; }
  [[nodiscard]] double getStep() const { return step_; }

  FiniteDifferenceSensitivity(const FiniteDifferenceSensitivity&) = default;
  FiniteDifferenceSensitivity& operator=(const FiniteDifferenceSensitivity&) = default;
  FiniteDifferenceSensitivity(FiniteDifferenceSensitivity&&) noexcept = default;
  FiniteDifferenceSensitivity& operator=(FiniteDifferenceSensitivity&&) noexcept = default;

private:
  Scheme scheme_{Scheme::Forward};
  double step_{kDefaultStep};  // [m]
};

}  // namespace tubeopt_sizing

#endif  // TUBEOPT_SIZING_OPTIMIZATION_FINITE_DIFFERENCE_SENSITIVITY_HPP
