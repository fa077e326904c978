#include <spdlog/spdlog.h>
#include <iostream>
#include <stdexcept>
#include <string>

#include "tubeopt-sizing/src/Optimization/TubeOptimization.hpp"

namespace
{

double parseArgument(const char* text, const char* name)
{
  try
  {
    size_t consumed = 0;
    double const value = std::stod(text, &consumed);
    if (consumed != std::string{text}.size())
    {
      throw std::invalid_argument{"trailing characters"};
    }
    return value;
  }
  catch (const std::logic_error&)
  {
    throw std::invalid_argument{std::string{"invalid value for "} + name + ": '" +
                                text + "'"};
  }
}

}  // namespace

int main(int argc, char* argv[])
{
  spdlog::set_level(spdlog::level::info);

  // Reference case
  double axialForce = 10e3;        // N
  double bendingMoment = 5e3;      // N*m
  double minimumSafetyMargin = 0.05;
  double minimumThickness = 3.0;   // mm

  try
  {
    if (argc == 5)
    {
      axialForce = parseArgument(argv[1], "axial_force");
      bendingMoment = parseArgument(argv[2], "bending_moment");
      minimumSafetyMargin = parseArgument(argv[3], "minimum_safety_margin");
      minimumThickness = parseArgument(argv[4], "minimum_thickness");
    }
    else if (argc != 1)
    {
      std::cerr << "Usage: " << argv[0]
                << " [axial_force bending_moment minimum_safety_margin "
                   "minimum_thickness_mm]"
                << std::endl;
      return 1;
    }

    tubeopt_sizing::TubeOptimization const tube{axialForce, bendingMoment};
    auto const [converged, design] =
      tube.optimize(minimumSafetyMargin, minimumThickness);

    std::cout << "Inner Diameter: " << design.innerDiameter << " mm\n";
    std::cout << "Outer Diameter: " << design.outerDiameter << " mm\n";
    std::cout << "Thickness: " << design.thickness << " mm\n";
    std::cout << "Safety Margin: " << design.safetyMargin << "\n";
    std::cout << "Optimization Converged Successfully: " << std::boolalpha
              << converged << std::endl;
    return 0;
  }
  catch (const std::exception& e)
  {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}
