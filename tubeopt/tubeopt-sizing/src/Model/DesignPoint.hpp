#ifndef TUBEOPT_SIZING_MODEL_DESIGN_POINT_HPP
#define TUBEOPT_SIZING_MODEL_DESIGN_POINT_HPP

#include <Eigen/Dense>

namespace tubeopt_sizing
{

/**
 * @brief The two free design variables of a hollow circular tube
 *
 * outerDiameter > innerDiameter is required for a physical section. The type
 * does not enforce it; the optimizer's constraints keep trial points there.
 */
struct DesignPoint
{
  double innerDiameter{0.0};  // [m]
  double outerDiameter{0.0};  // [m]

  /// Variable ordering used by the solver: [innerDiameter, outerDiameter]
  [[nodiscard]] Eigen::Vector2d toVector() const
  {
    return Eigen::Vector2d{innerDiameter, outerDiameter};
  }

  [[nodiscard]] static DesignPoint fromVector(const Eigen::Vector2d& x)
  {
    return DesignPoint{x[0], x[1]};
  }
};

}  // namespace tubeopt_sizing

#endif  // TUBEOPT_SIZING_MODEL_DESIGN_POINT_HPP
