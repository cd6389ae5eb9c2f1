#include "antenna_orientation.hpp"

namespace rf_heatmap
{

antenna_orientation_t::antenna_orientation_t(const antenna_pattern_provider_t &patterns, const mount_type_resolver_t &mounts) : m_patterns(patterns), m_mounts(mounts)
{
}

auto antenna_orientation_t::pattern_native_mount(const std::string &model, band_e band, const std::optional<std::string> &antenna_mode) const -> mount_type_e
{
  if (!m_patterns.has_omni_variant(model))
    return m_mounts.default_mount_type(model);

  if (is_omni_mode(antenna_mode))
  {
    auto lookup = m_patterns.resolve_pattern(model, band, std::string("omni"));
    if (!lookup.pattern || lookup.is_fallback)
      return mount_type_e::CEILING; // Base directional pattern was used

    return m_mounts.default_mount_type(model);
  }

  return mount_type_e::CEILING;
}

auto antenna_orientation_t::elevation_offset_deg(const access_point_t &ap, band_e band) const -> int
{
  auto native = pattern_native_mount(ap.model, band, ap.antenna_mode);
  return mount_offset_deg(ap.mount_type) - mount_offset_deg(native);
}

auto antenna_orientation_t::gain(const access_point_t &ap, band_e band, int azimuth_deg, int elevation_deg) const -> antenna_gain_t
{
  antenna_gain_t result;
  if (ap.mount_type == mount_type_e::WALL)
  {
    result.azimuth_db = m_patterns.elevation_gain_db(ap.model, band, azimuth_deg, ap.antenna_mode);
    result.elevation_db = m_patterns.azimuth_gain_db(ap.model, band, elevation_deg, ap.antenna_mode);
  }
  else
  {
    result.azimuth_db = m_patterns.azimuth_gain_db(ap.model, band, azimuth_deg, ap.antenna_mode);
    result.elevation_db = m_patterns.elevation_gain_db(ap.model, band, elevation_deg, ap.antenna_mode);
  }
  return result;
}

auto antenna_orientation_t::resolve_pattern(const access_point_t &ap, band_e band) const -> std::shared_ptr<const antenna_pattern_t>
{
  return m_patterns.resolve_pattern(ap.model, band, ap.antenna_mode).pattern;
}

auto antenna_orientation_t::pattern_gain(mount_type_e mount, const antenna_pattern_t *pattern, int azimuth_deg, int elevation_deg) -> antenna_gain_t
{
  antenna_gain_t result;
  if (!pattern)
    return result;

  if (mount == mount_type_e::WALL)
  {
    result.azimuth_db = pattern->get_elevation_gain(azimuth_deg);
    result.elevation_db = pattern->get_azimuth_gain(elevation_deg);
  }
  else
  {
    result.azimuth_db = pattern->get_azimuth_gain(azimuth_deg);
    result.elevation_db = pattern->get_elevation_gain(elevation_deg);
  }
  return result;
}

auto antenna_orientation_t::apply_offset(int raw_elevation_deg, int offset_deg) -> int
{
  return ((raw_elevation_deg + offset_deg) % 359 + 359) % 359;
}

auto antenna_orientation_t::mount_offset_deg(mount_type_e mount) -> int
{
  switch (mount)
  {
  case mount_type_e::WALL:
    return -90;
  case mount_type_e::DESKTOP:
    return 180;
  case mount_type_e::CEILING:
    break;
  }
  return 0;
}

} // namespace rf_heatmap
