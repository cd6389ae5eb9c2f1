#pragma once

#include "access_point.hpp"
#include "band.hpp"
#include "floor_plan.hpp"
#include "providers.hpp"
#include <vector>

namespace rf_heatmap
{

// Slab material used when no building data says otherwise
constexpr const char *DEFAULT_FLOOR_MATERIAL = "floor_wood";

class attenuation_model_t
{
public:
  explicit attenuation_model_t(const material_attenuation_provider_t &materials);

  // Sum of material losses of every segment crossed by the AP -> point line
  auto wall_loss(const geo_point_t &ap, const geo_point_t &point, band_e band, const std::vector<wall_segment_t> &segments) const -> double;

  // Wall loss on the active floor, plus the AP's own floor when it differs
  auto wall_loss_between_floors(const access_point_t &ap, const geo_point_t &point, int active_floor, band_e band, const wall_segment_map_t &segments_by_floor) const -> double;

  // Slab loss between the AP floor and the active floor.
  // The building is resolved from the observation point first, then the AP.
  // Each crossing uses the upper floor's slab material.
  auto floor_loss(const access_point_t &ap, const geo_point_t &point, int active_floor, band_e band, const std::vector<building_floor_info_t> &buildings) const -> double;

private:
  const material_attenuation_provider_t &m_materials;
};

} // namespace rf_heatmap
