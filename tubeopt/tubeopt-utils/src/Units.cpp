#include "tubeopt-utils/src/Units.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

namespace tubeopt_utils
{

double metersToMillimeters(double meters)
{
  return meters * kMillimetersPerMeter;
}

double millimetersToMeters(double millimeters)
{
  return millimeters / kMillimetersPerMeter;
}

double roundToDecimals(double value, int decimals)
{
  if (decimals < 0)
  {
    throw std::invalid_argument(
      "Decimal places must be non-negative, got: " + std::to_string(decimals));
  }

  if (!std::isfinite(value))
  {
    return value;
  }

  double const scale = std::pow(10.0, decimals);
  double const scaled = value * scale;

  // Values this large have no fractional digits left to round
  if (!std::isfinite(scaled) || std::abs(scaled) >= 1e15)
  {
    return value;
  }

  return std::round(scaled) / scale;
}

}  // namespace tubeopt_utils
