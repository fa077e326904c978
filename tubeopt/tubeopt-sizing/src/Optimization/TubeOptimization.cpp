#include "tubeopt-sizing/src/Optimization/TubeOptimization.hpp"

namespace tubeopt_sizing
{

TubeOptimization::TubeOptimization(double axialForce, double bendingMoment)
  : loads_{axialForce, bendingMoment}
{
}

std::pair<bool, ReportedDesign> TubeOptimization::optimize(
  double minimumSafetyMargin,
  double minimumThickness) const
{
  OptimizationConfig config{};
  config.minimumSafetyMargin = minimumSafetyMargin;
  config.minimumThickness = minimumThickness;

  OptimizationResult const result = optimize(config);
  return {result.converged, result.design};
}

OptimizationResult TubeOptimization::optimize(const OptimizationConfig& config) const
{
  return optimizer_.optimize(loads_, config);
}

}  // namespace tubeopt_sizing
