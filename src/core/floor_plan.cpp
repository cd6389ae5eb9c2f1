#include "floor_plan.hpp"
#include <limits>

namespace rf_heatmap
{

auto decompose_wall(const wall_polyline_t &wall, std::vector<wall_segment_t> &out_segments) -> void
{
  for (size_t i = 0; i < wall.segment_count(); ++i)
  {
    wall_segment_t segment;
    segment.start = wall.points[i];
    segment.end = wall.points[i + 1];

    if (i < wall.segment_materials.size() && wall.segment_materials[i].has_value() && !wall.segment_materials[i]->empty())
    {
      segment.material = *wall.segment_materials[i];
    }
    else
    {
      segment.material = wall.material;
    }

    out_segments.push_back(std::move(segment));
  }
}

auto build_wall_segments(const wall_polylines_by_floor_t &walls_by_floor) -> wall_segment_map_t
{
  wall_segment_map_t segments_by_floor;
  for (const auto &[floor, walls] : walls_by_floor)
  {
    auto &segments = segments_by_floor[floor];
    for (const auto &wall : walls)
    {
      decompose_wall(wall, segments);
    }
  }
  return segments_by_floor;
}

auto find_smallest_containing_building(const std::vector<building_floor_info_t> &buildings, double lat, double lng) -> const building_floor_info_t *
{
  const building_floor_info_t *best = nullptr;
  double best_area = std::numeric_limits<double>::max();

  for (const auto &building : buildings)
  {
    if (!building.contains(lat, lng))
      continue;

    double area = building.area();
    if (area < best_area)
    {
      best_area = area;
      best = &building;
    }
  }
  return best;
}

} // namespace rf_heatmap
