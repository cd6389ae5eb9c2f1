#pragma once

#include "access_point.hpp"
#include "band.hpp"
#include "providers.hpp"
#include <memory>

namespace rf_heatmap
{

// Antenna gain split into its horizontal and vertical contributions
struct antenna_gain_t
{
  float azimuth_db = 0.0f;
  float elevation_db = 0.0f;

  auto total_db() const -> float
  {
    return azimuth_db + elevation_db;
  }
};

// Maps an AP's physical mount onto the orientation its pattern was measured in
class antenna_orientation_t
{
public:
  antenna_orientation_t(const antenna_pattern_provider_t &patterns, const mount_type_resolver_t &mounts);

  // Mount orientation the pattern data was measured in.
  // Directional patterns of switchable models are measured flat (ceiling);
  // their omni patterns wall-mounted. A requested omni variant missing for
  // the band falls back to the base pattern, and so to ceiling.
  auto pattern_native_mount(const std::string &model, band_e band, const std::optional<std::string> &antenna_mode) const -> mount_type_e;

  // actual - native mount offset, in degrees
  auto elevation_offset_deg(const access_point_t &ap, band_e band) const -> int;

  // Pattern multiplication of the two cuts (addition in dB).
  // Wall mounts rotate both planes by 90 degrees, so the horizontal
  // direction is read from the elevation cut and vice versa.
  auto gain(const access_point_t &ap, band_e band, int azimuth_deg, int elevation_deg) const -> antenna_gain_t;

  // Pattern the AP's gains are read from, resolved once per request
  auto resolve_pattern(const access_point_t &ap, band_e band) const -> std::shared_ptr<const antenna_pattern_t>;

  // Same cut selection as gain() on an already resolved pattern; null = flat 0 dB
  static auto pattern_gain(mount_type_e mount, const antenna_pattern_t *pattern, int azimuth_deg, int elevation_deg) -> antenna_gain_t;

  // Elevation index after mount correction
  static auto apply_offset(int raw_elevation_deg, int offset_deg) -> int;

  // {wall: -90, desktop: +180, ceiling: 0}
  static auto mount_offset_deg(mount_type_e mount) -> int;

private:
  const antenna_pattern_provider_t &m_patterns;
  const mount_type_resolver_t &m_mounts;
};

} // namespace rf_heatmap
