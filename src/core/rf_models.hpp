#pragma once

#include <algorithm>
#include <cmath>

namespace rf_heatmap
{
namespace rf_models
{

// ITU-R P.1238 style exponent for residential/office buildings at 5 GHz
constexpr double INDOOR_PATH_LOSS_EXPONENT = 2.8;

// Free-space exponent, for reference
constexpr double FREE_SPACE_PATH_LOSS_EXPONENT = 2.0;

// Distances below this are clamped to keep log10 finite
constexpr double MIN_DISTANCE_M = 0.1;

// Log-distance indoor path loss
// PL(dB) = 10 * n * log10(d_m) + 20 * log10(f_mhz) - 27.55
inline double calculate_indoor_path_loss(double d_m, double f_mhz, double exponent = INDOOR_PATH_LOSS_EXPONENT)
{
  double d = std::max(d_m, MIN_DISTANCE_M);
  return 10.0 * exponent * std::log10(d) + 20.0 * std::log10(f_mhz) - 27.55;
}

// Slant distance between an AP and a point floor_separation floors away
inline double calculate_3d_distance(double d2d_m, int floor_separation, double floor_height_m)
{
  double vertical = floor_separation * floor_height_m;
  return std::max(std::sqrt(d2d_m * d2d_m + vertical * vertical), MIN_DISTANCE_M);
}

} // namespace rf_models
} // namespace rf_heatmap
