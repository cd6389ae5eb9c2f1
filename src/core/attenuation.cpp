#include "attenuation.hpp"
#include <algorithm>
#include <cstdlib>

namespace rf_heatmap
{

attenuation_model_t::attenuation_model_t(const material_attenuation_provider_t &materials) : m_materials(materials)
{
}

auto attenuation_model_t::wall_loss(const geo_point_t &ap, const geo_point_t &point, band_e band, const std::vector<wall_segment_t> &segments) const -> double
{
  double total_loss = 0.0;
  for (const auto &wall : segments)
  {
    if (geo::segments_intersect(ap, point, wall.start, wall.end))
    {
      total_loss += m_materials.attenuation_db(wall.material, band);
    }
  }
  return total_loss;
}

auto attenuation_model_t::wall_loss_between_floors(const access_point_t &ap, const geo_point_t &point, int active_floor, band_e band, const wall_segment_map_t &segments_by_floor) const -> double
{
  const geo_point_t ap_pos{ap.latitude, ap.longitude};
  double loss = 0.0;

  auto active_it = segments_by_floor.find(active_floor);
  if (active_it != segments_by_floor.end())
  {
    loss += wall_loss(ap_pos, point, band, active_it->second);
  }

  if (ap.floor != active_floor)
  {
    auto ap_it = segments_by_floor.find(ap.floor);
    if (ap_it != segments_by_floor.end())
    {
      loss += wall_loss(ap_pos, point, band, ap_it->second);
    }
  }

  return loss;
}

auto attenuation_model_t::floor_loss(const access_point_t &ap, const geo_point_t &point, int active_floor, band_e band, const std::vector<building_floor_info_t> &buildings) const -> double
{
  if (ap.floor == active_floor)
    return 0.0;

  if (buildings.empty())
  {
    return std::abs(ap.floor - active_floor) * m_materials.attenuation_db(DEFAULT_FLOOR_MATERIAL, band);
  }

  const auto *building = find_smallest_containing_building(buildings, point.lat, point.lon);
  if (!building)
    building = find_smallest_containing_building(buildings, ap.latitude, ap.longitude);

  // Both endpoints outdoors
  if (!building)
    return 0.0;

  int min_floor = std::min(ap.floor, active_floor);
  int max_floor = std::max(ap.floor, active_floor);

  double total_loss = 0.0;
  for (int f = min_floor + 1; f <= max_floor; ++f)
  {
    auto it = building->floor_materials.find(f);
    const std::string &material = it != building->floor_materials.end() ? it->second : std::string(DEFAULT_FLOOR_MATERIAL);
    total_loss += m_materials.attenuation_db(material, band);
  }
  return total_loss;
}

} // namespace rf_heatmap
