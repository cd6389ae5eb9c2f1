#pragma once

#include "access_point.hpp"
#include "band.hpp"
#include "floor_plan.hpp"
#include <string>
#include <vector>

namespace rf_heatmap
{

struct bounding_box_t
{
  double sw_lat = 0.0;
  double sw_lng = 0.0;
  double ne_lat = 0.0;
  double ne_lng = 0.0;
};

struct heatmap_request_t
{
  bounding_box_t bounds;
  band_e band = band_e::BAND_5_GHZ;
  std::vector<access_point_t> access_points;
  wall_polylines_by_floor_t walls_by_floor;
  int active_floor = 0;
  double grid_resolution_m = 1.0;
  std::vector<building_floor_info_t> buildings; // Empty = no building data
};

struct heatmap_grid_t
{
  int width = 1;
  int height = 1;
  bounding_box_t bounds;
  std::vector<float> signal_dbm; // Row-major, row 0 = south edge, column 0 = west edge

  auto at(int x, int y) const -> float
  {
    return signal_dbm[static_cast<size_t>(y) * width + x];
  }
};

struct validation_result_t
{
  bool valid = true;
  std::string error_message;
};

// Caller-side input checks. The engine itself never rejects input.
auto validate_request(const heatmap_request_t &request) -> validation_result_t;

} // namespace rf_heatmap
