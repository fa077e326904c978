// Ticket: 0001_closed_form_tube_model

#include "tubeopt-sizing/src/Model/StructuralModel.hpp"

#include <cmath>
#include <numbers>

namespace tubeopt_sizing
{

namespace StructuralModel
{

DerivedQuantities evaluate(double innerDiameter,
                           double outerDiameter,
                           double axialForce,
                           double bendingMoment)
{
  DerivedQuantities result{};

  // Section properties
  result.area = 0.25 * std::numbers::pi *
                (outerDiameter * outerDiameter - innerDiameter * innerDiameter);
  result.thickness = (outerDiameter - innerDiameter) / 2.0;
  result.diameterOverThickness = outerDiameter / result.thickness;
  result.momentOfInertia = std::numbers::pi / 4.0 *
                           (std::pow(outerDiameter / 2.0, 4) -
                            std::pow(innerDiameter / 2.0, 4));
  double const radius = outerDiameter / 2.0;

  // Stress components
  result.axialStress = axialForce / result.area;
  result.bendingStress = bendingMoment * radius / result.momentOfInertia;

  double const stressSum = result.axialStress + result.bendingStress;
  result.combinedStress = std::sqrt(stressSum * stressSum + kStressSmoothing);

  result.safetyMargin = kYieldStrength / result.combinedStress - 1.0;

  return result;
}

DerivedQuantities evaluate(const DesignPoint& point, const LoadCase& loads)
{
  return evaluate(point.innerDiameter,
                  point.outerDiameter,
                  loads.getAxialForce(),
                  loads.getBendingMoment());
}

}  // namespace StructuralModel

}  // namespace tubeopt_sizing
