// Ticket: 0001_closed_form_tube_model

#ifndef TUBEOPT_SIZING_MODEL_DERIVED_QUANTITIES_HPP
#define TUBEOPT_SIZING_MODEL_DERIVED_QUANTITIES_HPP

#include <Eigen/Dense>
#include <limits>

namespace tubeopt_sizing
{

/**
 * @brief Structural response of a tube section under a load case
 *
 * Pure function of DesignPoint and LoadCase, recomputed on every evaluation.
 * Degenerate geometry (thickness <= 0) leaves infinities or NaN in place.
 */
struct DerivedQuantities
{
  double area{std::numeric_limits<double>::quiet_NaN()};                   // [m^2]
  double thickness{std::numeric_limits<double>::quiet_NaN()};              // [m]
  double diameterOverThickness{std::numeric_limits<double>::quiet_NaN()};  // [-]
  double safetyMargin{std::numeric_limits<double>::quiet_NaN()};           // [-]

  double momentOfInertia{std::numeric_limits<double>::quiet_NaN()};  // [m^4]
  double axialStress{std::numeric_limits<double>::quiet_NaN()};      // [Pa]
  double bendingStress{std::numeric_limits<double>::quiet_NaN()};    // [Pa]
  double combinedStress{std::numeric_limits<double>::quiet_NaN()};   // [Pa]

  /// Number of responses seen by the optimizer
  static constexpr int kResponseCount = 4;

  /// Row indices into responses() and into sensitivity Jacobians
  enum Response : int
  {
    kArea = 0,
    kThickness = 1,
    kDiameterOverThickness = 2,
    kSafetyMargin = 3
  };

  /**
   * @brief Responses exposed to the optimizer
   * @return [area, thickness, diameterOverThickness, safetyMargin]
   */
  [[nodiscard]] Eigen::Vector4d responses() const
  {
    return Eigen::Vector4d{area, thickness, diameterOverThickness, safetyMargin};
  }
};

}  // namespace tubeopt_sizing

#endif  // TUBEOPT_SIZING_MODEL_DERIVED_QUANTITIES_HPP
