// Ticket: 0001_closed_form_tube_model

#ifndef TUBEOPT_SIZING_MODEL_STRUCTURAL_MODEL_HPP
#define TUBEOPT_SIZING_MODEL_STRUCTURAL_MODEL_HPP

#include "tubeopt-sizing/src/Model/DerivedQuantities.hpp"
#include "tubeopt-sizing/src/Model/DesignPoint.hpp"
#include "tubeopt-sizing/src/Model/LoadCase.hpp"

namespace tubeopt_sizing
{

/**
 * @brief Closed-form stress model of a hollow steel tube
 *
 * Computes section properties and the margin of safety for combined axial
 * force and bending moment:
 *
 *   A     = pi/4 * (Do^2 - Di^2)
 *   t     = (Do - Di) / 2
 *   I     = pi/4 * ((Do/2)^4 - (Di/2)^4)
 *   sigma = sqrt((F/A + M*(Do/2)/I)^2 + eps)
 *   MS    = Fy / sigma - 1
 *
 * eps smooths the kink where axial and bending stress cancel so that finite
 * differences stay bounded. It is in Pa^2 and negligible at real stress levels.
 *
 * The model does not guard against Do <= Di. Division by zero produces
 * infinities or NaN which are returned as-is.
 *
 * Thread safety: Stateless, all functions are reentrant
 */
namespace StructuralModel
{

/// Tensile yield strength of structural steel [Pa]
inline constexpr double kYieldStrength = 350e6;

/// Smoothing term added under the combined-stress square root [Pa^2]
inline constexpr double kStressSmoothing = 0.001;

/**
 * @brief Evaluate the section response
 * @param innerDiameter Inner diameter [m]
 * @param outerDiameter Outer diameter [m]
 * @param axialForce Axial force [N]
 * @param bendingMoment Bending moment [N·m]
 * @return Derived section quantities
 */
[[nodiscard]] DerivedQuantities evaluate(double innerDiameter,
                                         double outerDiameter,
                                         double axialForce,
                                         double bendingMoment);

/**
 * @brief Evaluate the section response
 * @param point Trial design point
 * @param loads Load case
 * @return Derived section quantities
 */
[[nodiscard]] DerivedQuantities evaluate(const DesignPoint& point,
                                         const LoadCase& loads);

}  // namespace StructuralModel

}  // namespace tubeopt_sizing

#endif  // TUBEOPT_SIZING_MODEL_STRUCTURAL_MODEL_HPP
