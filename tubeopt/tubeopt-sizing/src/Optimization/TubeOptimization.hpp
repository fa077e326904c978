#ifndef TUBEOPT_SIZING_OPTIMIZATION_TUBE_OPTIMIZATION_HPP
#define TUBEOPT_SIZING_OPTIMIZATION_TUBE_OPTIMIZATION_HPP

#include <utility>

#include "tubeopt-sizing/src/Model/LoadCase.hpp"
#include "tubeopt-sizing/src/Optimization/OptimizationConfig.hpp"
#include "tubeopt-sizing/src/Optimization/OptimizationResult.hpp"
#include "tubeopt-sizing/src/Optimization/TubeOptimizer.hpp"

namespace tubeopt_sizing
{

/**
 * @brief Sizes a hollow steel tube under an axial force and bending moment
 *        for minimum cross-sectional area
 *
 * Example:
 *   TubeOptimization tube{10e3, 5e3};
 *   auto [converged, design] = tube.optimize(0.05, 3.0);
 */
class TubeOptimization
{
public:
  /**
   * @brief Construct for a load case
   * @param axialForce Axial force [N]
   * @param bendingMoment Bending moment [N·m]
   */
  TubeOptimization(double axialForce, double bendingMoment);

  /**
   * @brief Run the sizing with default bounds and solver settings
   *
   * @param minimumSafetyMargin Lower bound on the margin of safety [-]
   * @param minimumThickness Lower bound on the wall thickness [mm]
   * @return {converged, design} with lengths in mm rounded to 3 decimals and
   *         the margin rounded to 4 decimals
   */
  [[nodiscard]] std::pair<bool, ReportedDesign> optimize(
    double minimumSafetyMargin = 0.0,
    double minimumThickness = 1.0) const;

  /**
   * @brief Run the sizing with a full configuration
   * @param config Bounds, thresholds and solver settings
   * @return Full result including solver diagnostics
   */
  [[nodiscard]] OptimizationResult optimize(const OptimizationConfig& config) const;

  [[nodiscard]] const LoadCase& getLoadCase() const { return loads_; }

private:
  LoadCase loads_;
  TubeOptimizer optimizer_{};
};

}  // namespace tubeopt_sizing

#endif  // TUBEOPT_SIZING_OPTIMIZATION_TUBE_OPTIMIZATION_HPP
