#pragma once

#include "geo_math.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace rf_heatmap
{

using geo::geo_point_t;

// Drawn wall polyline on one floor
struct wall_polyline_t
{
  int floor = 0;
  std::vector<geo_point_t> points;
  std::string material = "drywall";

  // Optional per-segment override, one entry per segment (points.size() - 1).
  // An empty entry keeps the default material.
  std::vector<std::optional<std::string>> segment_materials;

  auto segment_count() const -> size_t
  {
    return points.size() < 2 ? 0 : points.size() - 1;
  }
};

// Single straight wall piece used for ray casting
struct wall_segment_t
{
  geo_point_t start;
  geo_point_t end;
  std::string material;
};

using wall_polylines_by_floor_t = std::map<int, std::vector<wall_polyline_t>>;

// Immutable per-request decomposition: floor -> segments
using wall_segment_map_t = std::map<int, std::vector<wall_segment_t>>;

// Building outline with per-floor slab materials
struct building_floor_info_t
{
  std::string name; // Display only
  double sw_lat = 0.0;
  double sw_lng = 0.0;
  double ne_lat = 0.0;
  double ne_lng = 0.0;

  // floor -> material of the slab separating that floor from the one below
  std::map<int, std::string> floor_materials;

  auto contains(double lat, double lng) const -> bool
  {
    return lat >= sw_lat && lat <= ne_lat && lng >= sw_lng && lng <= ne_lng;
  }

  // Bounding box area in square degrees, only used for ranking
  auto area() const -> double
  {
    return (ne_lat - sw_lat) * (ne_lng - sw_lng);
  }
};

// Append the segments of one polyline, resolving per-segment materials
auto decompose_wall(const wall_polyline_t &wall, std::vector<wall_segment_t> &out_segments) -> void;

auto build_wall_segments(const wall_polylines_by_floor_t &walls_by_floor) -> wall_segment_map_t;

// Smallest-area building whose bounds contain the point, nullptr if none.
// Prevents a large generic outline from shadowing a more specific one.
auto find_smallest_containing_building(const std::vector<building_floor_info_t> &buildings, double lat, double lng) -> const building_floor_info_t *;

} // namespace rf_heatmap
