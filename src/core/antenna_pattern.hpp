#pragma once

#include "band.hpp"
#include <algorithm>
#include <array>
#include <cmath>
#include <string>
#include <vector>

namespace rf_heatmap
{

constexpr int PATTERN_SAMPLES = 360;

// Measured radiation pattern of one device model on one band.
// Two principal-plane cuts, one sample per degree, gain in dB relative to peak.
struct antenna_pattern_t
{
  std::string model;
  band_e band = band_e::BAND_5_GHZ;
  std::string mode; // Empty = base pattern

  // Azimuth cut (0 = boresight, clockwise)
  std::array<float, PATTERN_SAMPLES> azimuth_gain_db{};

  // Elevation cut (0 = straight down from a ceiling mount, 90 = horizon)
  std::array<float, PATTERN_SAMPLES> elevation_gain_db{};

  auto get_azimuth_gain(int angle_deg) const -> float
  {
    return azimuth_gain_db[wrap_index(angle_deg)];
  }

  auto get_elevation_gain(int angle_deg) const -> float
  {
    return elevation_gain_db[wrap_index(angle_deg)];
  }

  // Shift both cuts so their peak sits at 0 dB
  auto normalize() -> void
  {
    normalize_cut(azimuth_gain_db);
    normalize_cut(elevation_gain_db);
  }

  // Resample an evenly spaced cut covering 0-360 onto one sample per degree
  static auto resample(const std::vector<float> &samples) -> std::array<float, PATTERN_SAMPLES>
  {
    std::array<float, PATTERN_SAMPLES> out{};
    if (samples.empty())
      return out;

    const size_t n = samples.size();
    for (int deg = 0; deg < PATTERN_SAMPLES; ++deg)
    {
      size_t idx = static_cast<size_t>(std::lround(static_cast<double>(deg) * n / PATTERN_SAMPLES)) % n;
      out[deg] = samples[idx];
    }
    return out;
  }

private:
  static auto wrap_index(int angle_deg) -> int
  {
    int idx = angle_deg % PATTERN_SAMPLES;
    if (idx < 0)
      idx += PATTERN_SAMPLES;
    return idx;
  }

  static auto normalize_cut(std::array<float, PATTERN_SAMPLES> &cut) -> void
  {
    float peak = *std::max_element(cut.begin(), cut.end());
    for (auto &g : cut)
    {
      g -= peak;
    }
  }
};

} // namespace rf_heatmap
