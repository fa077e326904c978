// Ticket: 0003_swappable_sensitivities

#include "tubeopt-sizing/src/Optimization/FiniteDifferenceSensitivity.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

#include "tubeopt-sizing/src/Model/StructuralModel.hpp"

namespace tubeopt_sizing
{

FiniteDifferenceSensitivity::FiniteDifferenceSensitivity(Scheme scheme,
                                                         double step)
  : scheme_{scheme}, step_{step}
{
  if (!std::isfinite(step) || step <= 0.0)
  {
    throw std::invalid_argument(
      "Finite difference step must be positive, got: " + std::to_string(step));
  }
}

ResponseJacobian FiniteDifferenceSensitivity::computeJacobian(
  const DesignPoint& point,
  const LoadCase& loads,
  const DerivedQuantities& baseline) const
{
  ResponseJacobian jacobian{};
  Eigen::Vector2d const x = point.toVector();
  Eigen::Vector4d const r0 = baseline.responses();

  for (Eigen::Index j = 0; j < x.size(); ++j)
  {
    Eigen::Vector2d xPlus = x;
    xPlus[j] += step_;
    Eigen::Vector4d const rPlus =
      StructuralModel::evaluate(DesignPoint::fromVector(xPlus), loads).responses();

    if (scheme_ == Scheme::Central)
    {
      Eigen::Vector2d xMinus = x;
      xMinus[j] -= step_;
      Eigen::Vector4d const rMinus =
        StructuralModel::evaluate(DesignPoint::fromVector(xMinus), loads)
          .responses();
      jacobian.col(j) = (rPlus - rMinus) / (2.0 * step_);
    }
    else
    {
      jacobian.col(j) = (rPlus - r0) / step_;
    }
  }

  return jacobian;
}

int FiniteDifferenceSensitivity::evaluationsPerJacobian() const
{
  return scheme_ == Scheme::Central ? 4 : 2;
}

}  // namespace tubeopt_sizing
