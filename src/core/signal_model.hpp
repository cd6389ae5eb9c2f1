#pragma once

#include "access_point.hpp"
#include "antenna_orientation.hpp"
#include "attenuation.hpp"
#include "band.hpp"
#include "engine_config.hpp"
#include "floor_plan.hpp"
#include "providers.hpp"
#include <memory>
#include <vector>

namespace rf_heatmap
{

// Read-only per-request inputs shared by every point evaluation
struct signal_context_t
{
  int active_floor = 0;
  band_e band = band_e::BAND_5_GHZ;
  double frequency_mhz = 5500.0;
  const wall_segment_map_t *segments_by_floor = nullptr;
  const std::vector<building_floor_info_t> *buildings = nullptr;
};

// AP with its mount correction resolved once per request
struct prepared_ap_t
{
  const access_point_t *ap = nullptr;
  int elevation_offset_deg = 0;
  std::shared_ptr<const antenna_pattern_t> pattern; // Null = flat 0 dB
};

// Individual terms of one AP/point evaluation
struct signal_breakdown_t
{
  double distance_2d_m = 0.0;
  double distance_3d_m = 0.0;
  int azimuth_deg = 0;
  int elevation_deg = 0; // After mount correction
  double path_loss_db = 0.0;
  antenna_gain_t antenna_gain;
  double wall_loss_db = 0.0;
  double floor_loss_db = 0.0;
  float signal_dbm = 0.0f;
};

class signal_model_t
{
public:
  signal_model_t(const antenna_pattern_provider_t &patterns, const material_attenuation_provider_t &materials, const mount_type_resolver_t &mounts, const engine_config_t &config);

  auto prepare(const access_point_t &ap, band_e band) const -> prepared_ap_t;

  auto evaluate(const prepared_ap_t &ap, const geo_point_t &point, const signal_context_t &context) const -> signal_breakdown_t;

  auto compute_signal(const prepared_ap_t &ap, const geo_point_t &point, const signal_context_t &context) const -> float
  {
    return evaluate(ap, point, context).signal_dbm;
  }

  // Strongest finite signal over all APs; empty_signal_dbm when there is none
  auto best_signal(const std::vector<prepared_ap_t> &aps, const geo_point_t &point, const signal_context_t &context) const -> float;

  // Raw elevation angle before mount correction: 90 = horizon, 0 = straight down
  static auto raw_elevation_deg(double distance_2d_m, int floor_separation, double floor_height_m) -> int;

  // Bearing relative to the AP's forward direction, truncated to whole degrees
  static auto relative_azimuth_deg(double bearing_deg, double orientation_deg) -> int;

private:
  antenna_orientation_t m_orientation;
  attenuation_model_t m_attenuation;
  engine_config_t m_config;
};

} // namespace rf_heatmap
