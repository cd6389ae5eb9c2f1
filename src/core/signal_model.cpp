#include "signal_model.hpp"
#include "geo_math.hpp"
#include "rf_models.hpp"
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <limits>

namespace rf_heatmap
{

signal_model_t::signal_model_t(const antenna_pattern_provider_t &patterns, const material_attenuation_provider_t &materials, const mount_type_resolver_t &mounts, const engine_config_t &config)
    : m_orientation(patterns, mounts), m_attenuation(materials), m_config(config)
{
}

auto signal_model_t::prepare(const access_point_t &ap, band_e band) const -> prepared_ap_t
{
  prepared_ap_t prepared;
  prepared.ap = &ap;
  prepared.elevation_offset_deg = m_orientation.elevation_offset_deg(ap, band);
  prepared.pattern = m_orientation.resolve_pattern(ap, band);
  return prepared;
}

auto signal_model_t::evaluate(const prepared_ap_t &prepared, const geo_point_t &point, const signal_context_t &context) const -> signal_breakdown_t
{
  const access_point_t &ap = *prepared.ap;
  signal_breakdown_t out;

  out.distance_2d_m = std::max(geo::distance(ap.latitude, ap.longitude, point.lat, point.lon), rf_models::MIN_DISTANCE_M);

  int floor_separation = std::abs(ap.floor - context.active_floor);
  out.distance_3d_m = rf_models::calculate_3d_distance(out.distance_2d_m, floor_separation, m_config.floor_height_m);

  out.path_loss_db = rf_models::calculate_indoor_path_loss(out.distance_3d_m, context.frequency_mhz, m_config.path_loss_exponent);

  double bearing = geo::bearing(ap.latitude, ap.longitude, point.lat, point.lon);
  out.azimuth_deg = relative_azimuth_deg(bearing, ap.orientation_deg);

  int raw_elevation = raw_elevation_deg(out.distance_2d_m, floor_separation, m_config.floor_height_m);
  out.elevation_deg = antenna_orientation_t::apply_offset(raw_elevation, prepared.elevation_offset_deg);

  out.antenna_gain = antenna_orientation_t::pattern_gain(ap.mount_type, prepared.pattern.get(), out.azimuth_deg, out.elevation_deg);

  if (context.segments_by_floor)
  {
    out.wall_loss_db = m_attenuation.wall_loss_between_floors(ap, point, context.active_floor, context.band, *context.segments_by_floor);
  }

  if (floor_separation > 0)
  {
    static const std::vector<building_floor_info_t> no_buildings;
    out.floor_loss_db = m_attenuation.floor_loss(ap, point, context.active_floor, context.band, context.buildings ? *context.buildings : no_buildings);
  }

  double signal = ap.tx_power_dbm + ap.antenna_gain_dbi + out.antenna_gain.total_db() - out.path_loss_db - out.wall_loss_db - out.floor_loss_db;
  out.signal_dbm = static_cast<float>(signal);
  return out;
}

auto signal_model_t::best_signal(const std::vector<prepared_ap_t> &aps, const geo_point_t &point, const signal_context_t &context) const -> float
{
  if (aps.empty())
    return m_config.empty_signal_dbm;

  // Non-finite signals never win
  float best = std::numeric_limits<float>::lowest();
  bool found = false;
  for (const auto &ap : aps)
  {
    float signal = compute_signal(ap, point, context);
    if (std::isfinite(signal) && signal > best)
    {
      best = signal;
      found = true;
    }
  }
  return found ? best : m_config.empty_signal_dbm;
}

auto signal_model_t::raw_elevation_deg(double distance_2d_m, int floor_separation, double floor_height_m) -> int
{
  if (floor_separation == 0)
    return 90; // Horizon

  double vertical = floor_separation * floor_height_m;
  double angle = geo::rad_to_deg(std::atan2(distance_2d_m, vertical));
  if (!std::isfinite(angle))
    return 90;
  return std::clamp(static_cast<int>(angle), 0, 358);
}

auto signal_model_t::relative_azimuth_deg(double bearing_deg, double orientation_deg) -> int
{
  double azimuth = std::fmod(bearing_deg - orientation_deg + 360.0, 360.0);
  if (!std::isfinite(azimuth))
    return 0;
  if (azimuth < 0.0)
    azimuth += 360.0;
  return static_cast<int>(azimuth) % 360;
}

} // namespace rf_heatmap
