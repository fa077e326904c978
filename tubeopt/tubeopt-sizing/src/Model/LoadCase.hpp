#ifndef TUBEOPT_SIZING_MODEL_LOAD_CASE_HPP
#define TUBEOPT_SIZING_MODEL_LOAD_CASE_HPP

namespace tubeopt_sizing
{

/**
 * @brief External loads carried by the tube for one optimization run
 *
 * Immutable after construction. Non-positive values are valid (a zero
 * bending moment is a pure axial case) and flow through the model unchanged.
 */
class LoadCase
{
public:
  /**
   * @brief Construct a load case
   * @param axialForce Axial force [N]
   * @param bendingMoment Bending moment [N·m]
   */
  LoadCase(double axialForce, double bendingMoment)
    : axial_force_{axialForce}, bending_moment_{bendingMoment}
  {
  }

  /// Axial force [N]
  [[nodiscard]] double getAxialForce() const { return axial_force_; }

  /// Bending moment [N·m]
  [[nodiscard]] double getBendingMoment() const { return bending_moment_; }

private:
  double axial_force_;
  double bending_moment_;
};

}  // namespace tubeopt_sizing

#endif  // TUBEOPT_SIZING_MODEL_LOAD_CASE_HPP
