// Ticket: 0003_swappable_sensitivities

#include "tubeopt-sizing/src/Optimization/AnalyticSensitivity.hpp"

#include <cmath>
#include <numbers>

#include "tubeopt-sizing/src/Model/StructuralModel.hpp"

namespace tubeopt_sizing
{

ResponseJacobian AnalyticSensitivity::computeJacobian(
  const DesignPoint& point,
  const LoadCase& loads,
  const DerivedQuantities& baseline) const
{
  constexpr double pi = std::numbers::pi;
  double const di = point.innerDiameter;
  double const dout = point.outerDiameter;
  double const wall = dout - di;

  // Section property gradients, [d/dDi, d/dDo]
  Eigen::RowVector2d const dArea{-pi * di / 2.0, pi * dout / 2.0};
  Eigen::RowVector2d const dThickness{-0.5, 0.5};
  Eigen::RowVector2d const dRatio{2.0 * dout / (wall * wall),
                                  -2.0 * di / (wall * wall)};
  Eigen::RowVector2d const dInertia{-pi * std::pow(di, 3) / 16.0,
                                    pi * std::pow(dout, 3) / 16.0};

  double const area = baseline.area;
  double const inertia = baseline.momentOfInertia;
  double const force = loads.getAxialForce();
  double const moment = loads.getBendingMoment();

  // sigma_a = F / A
  Eigen::RowVector2d const dAxial = -force / (area * area) * dArea;

  // sigma_b = M * (Do/2) / I
  Eigen::RowVector2d dBending =
    -moment * (dout / 2.0) / (inertia * inertia) * dInertia;
  dBending[1] += moment / (2.0 * inertia);

  double const stressSum = baseline.axialStress + baseline.bendingStress;
  double const sigma = baseline.combinedStress;
  Eigen::RowVector2d const dSigma = (stressSum / sigma) * (dAxial + dBending);
  Eigen::RowVector2d const dMargin =
    -StructuralModel::kYieldStrength / (sigma * sigma) * dSigma;

  ResponseJacobian jacobian{};
  jacobian.row(DerivedQuantities::kArea) = dArea;
  jacobian.row(DerivedQuantities::kThickness) = dThickness;
  jacobian.row(DerivedQuantities::kDiameterOverThickness) = dRatio;
  jacobian.row(DerivedQuantities::kSafetyMargin) = dMargin;
  return jacobian;
}

}  // namespace tubeopt_sizing
