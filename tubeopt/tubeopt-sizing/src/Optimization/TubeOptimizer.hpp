// Ticket: 0002_nlopt_tube_optimizer

#ifndef TUBEOPT_SIZING_OPTIMIZATION_TUBE_OPTIMIZER_HPP
#define TUBEOPT_SIZING_OPTIMIZATION_TUBE_OPTIMIZER_HPP

#include <memory>
#include <string>
#include <vector>

#include "tubeopt-sizing/src/Model/DerivedQuantities.hpp"
#include "tubeopt-sizing/src/Model/LoadCase.hpp"
#include "tubeopt-sizing/src/Optimization/OptimizationConfig.hpp"
#include "tubeopt-sizing/src/Optimization/OptimizationResult.hpp"
#include "tubeopt-sizing/src/Optimization/SensitivityStrategy.hpp"

namespace tubeopt_sizing
{

/**
 * @brief Minimum-area sizing of a hollow tube with NLopt SLSQP
 *
 * Solves:
 *   minimize    A(Di, Do)
 *   subject to  t(Di, Do)    >= t_min
 *               MS(Di, Do)   >= MS_min
 *               2 <= Do/t    <= 25
 *               Di in [0.005, 0.5] m, Do in [0.01, 0.6] m
 *
 * The structural model is treated as a black box. Gradients of the objective
 * and constraints come from a SensitivityStrategy, forward finite differences
 * unless configured otherwise.
 *
 * Each optimize() call builds its own solver instance and response cache, so
 * one TubeOptimizer may be used from several threads at once.
 *
 * Non-convergence is never thrown. It is reported through
 * OptimizationResult::converged, which is true only if the solver reports a
 * success status and the final point satisfies every constraint within
 * OptimizationConfig::feasibilityTolerance.
 */
class TubeOptimizer
{
public:
  /// Which side of a response an inequality constraint bounds
  enum class BoundSide
  {
    Lower,  ///< response >= bound
    Upper   ///< response <= bound
  };

  /**
   * @brief One-sided inequality constraint on a model response
   *
   * evaluate() follows the NLopt convention c(x) <= 0 when satisfied.
   */
  struct InequalityConstraint
  {
    std::string name;
    DerivedQuantities::Response response;
    BoundSide side;
    double bound;
    double scale;  ///< Reference magnitude for the relative feasibility check

    /// Constraint value, <= 0 when satisfied
    [[nodiscard]] double evaluate(const DerivedQuantities& quantities) const;

    /// Largest violation accepted by the feasibility check
    [[nodiscard]] double allowedViolation(double relativeTolerance) const;
  };

  /**
   * @brief Construct an optimizer that picks its sensitivity strategy from
   *        OptimizationConfig::sensitivityMethod
   */
  TubeOptimizer() = default;

  /**
   * @brief Construct an optimizer with a fixed sensitivity strategy
   * @param strategy Strategy used for every run, overriding the config
   */
  explicit TubeOptimizer(std::shared_ptr<const SensitivityStrategy> strategy);

  ~TubeOptimizer() = default;

  /**
   * @brief Size the tube for a load case
   *
   * @param loads Axial force and bending moment
   * @param config Bounds, thresholds and solver settings
   * @return Final design, rounded report and convergence diagnostics
   * @throws std::invalid_argument if the config names a non-positive
   *         finite-difference step and no strategy was injected
   */
  [[nodiscard]] OptimizationResult optimize(const LoadCase& loads,
                                            const OptimizationConfig& config) const;

  /**
   * @brief Build the inequality constraints for a configuration
   *
   * The diameter-over-thickness range becomes two one-sided constraints, so
   * four constraints are returned: thickness, safety margin, D/t lower and
   * D/t upper. The minimum thickness is converted from mm to m.
   */
  [[nodiscard]] static std::vector<InequalityConstraint> buildConstraints(
    const OptimizationConfig& config);

  /// Create the strategy named by config.sensitivityMethod
  [[nodiscard]] static std::unique_ptr<SensitivityStrategy> makeSensitivityStrategy(
    const OptimizationConfig& config);

  /**
   * @brief Check a response against every constraint
   * @param quantities Model response at the point under test
   * @param constraints Constraints from buildConstraints()
   * @param relativeTolerance Accepted violation relative to each bound
   * @return false if any constraint is violated or not finite
   */
  [[nodiscard]] static bool isFeasible(
    const DerivedQuantities& quantities,
    const std::vector<InequalityConstraint>& constraints,
    double relativeTolerance);

  [[nodiscard]] const std::shared_ptr<const SensitivityStrategy>& getStrategy() const
  {
    return strategy_;
  }

  TubeOptimizer(const TubeOptimizer&) = default;
  TubeOptimizer& operator=(const TubeOptimizer&) = default;
  TubeOptimizer(TubeOptimizer&&) noexcept = default;
  TubeOptimizer& operator=(TubeOptimizer&&) noexcept = default;

private:
  /// Model response and Jacobian memoized on the last trial point
  class ResponseCache;

  /// Data passed to the constraint callback
  struct ConstraintData
  {
    ResponseCache* cache;
    const InequalityConstraint* constraint;
  };

  /**
   * @brief Objective callback for NLopt: f(x) = A(x)
   * @param x Current iterate [Di, Do]
   * @param grad Output gradient, filled when non-empty
   * @param data Pointer to ResponseCache
   * @return Cross-sectional area [m^2]
   */
  static double objective(const std::vector<double>& x,
                          std::vector<double>& grad,
                          void* data);

  /**
   * @brief Inequality constraint callback for NLopt
   * @param x Current iterate [Di, Do]
   * @param grad Output gradient, filled when non-empty
   * @param data Pointer to ConstraintData
   * @return Constraint value, <= 0 when satisfied
   */
  static double constraint(const std::vector<double>& x,
                           std::vector<double>& grad,
                           void* data);

  std::shared_ptr<const SensitivityStrategy> strategy_;  ///< Null: chosen per config
};

}  // namespace tubeopt_sizing

#endif  // TUBEOPT_SIZING_OPTIMIZATION_TUBE_OPTIMIZER_HPP
