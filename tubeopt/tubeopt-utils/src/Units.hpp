#ifndef TUBEOPT_UTILS_UNITS_HPP
#define TUBEOPT_UTILS_UNITS_HPP

namespace tubeopt_utils
{

/// Millimeters per meter
inline constexpr double kMillimetersPerMeter = 1000.0;

/**
 * Convert a length from meters to millimeters.
 *
 * @param meters Length [m]
 * @return Length [mm]
 */
double metersToMillimeters(double meters);

/**
 * Convert a length from millimeters to meters.
 *
 * @param millimeters Length [mm]
 * @return Length [m]
 */
double millimetersToMeters(double millimeters);

/**
 * Round a value to a fixed number of decimal places, half away from zero.
 *
 * Non-finite values are returned unchanged.
 *
 * Example:
 *   roundToDecimals(3.14159, 3) returns 3.142
 *   roundToDecimals(-0.00005, 4) returns -0.0001
 *
 * @param value The value to round
 * @param decimals Number of digits kept after the decimal point (>= 0)
 * @return The rounded value
 * @throws std::invalid_argument if decimals < 0
 */
double roundToDecimals(double value, int decimals);

}  // namespace tubeopt_utils

#endif  // TUBEOPT_UTILS_UNITS_HPP
