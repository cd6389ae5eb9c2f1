#include "heatmap_request.hpp"
#include <cmath>

namespace rf_heatmap
{

namespace
{

auto invalid(const std::string &message) -> validation_result_t
{
  validation_result_t result;
  result.valid = false;
  result.error_message = message;
  return result;
}

auto valid_lat(double lat) -> bool
{
  return std::isfinite(lat) && lat >= -90.0 && lat <= 90.0;
}

auto valid_lng(double lng) -> bool
{
  return std::isfinite(lng) && lng >= -180.0 && lng <= 180.0;
}

} // namespace

auto validate_request(const heatmap_request_t &request) -> validation_result_t
{
  const auto &b = request.bounds;
  if (!valid_lat(b.sw_lat) || !valid_lat(b.ne_lat) || !valid_lng(b.sw_lng) || !valid_lng(b.ne_lng))
    return invalid("bounds: coordinates must be finite latitude/longitude values");
  if (b.sw_lat > b.ne_lat || b.sw_lng > b.ne_lng)
    return invalid("bounds: south-west corner must not lie north or east of the north-east corner");

  if (!std::isfinite(request.grid_resolution_m) || request.grid_resolution_m <= 0.0)
    return invalid("grid_resolution_m: must be a positive number of meters");

  if (request.access_points.empty())
    return invalid("access_points: at least one access point is required");

  for (size_t i = 0; i < request.access_points.size(); ++i)
  {
    const auto &ap = request.access_points[i];
    std::string prefix = "access_points[" + std::to_string(i) + "]: ";

    if (!valid_lat(ap.latitude) || !valid_lng(ap.longitude))
      return invalid(prefix + "invalid coordinates");
    if (!std::isfinite(ap.tx_power_dbm) || !std::isfinite(ap.antenna_gain_dbi))
      return invalid(prefix + "tx power and antenna gain must be finite");
    if (!std::isfinite(ap.orientation_deg) || ap.orientation_deg < 0.0 || ap.orientation_deg >= 360.0)
      return invalid(prefix + "orientation must be in [0, 360)");
    if (ap.model.empty())
      return invalid(prefix + "model is required");
  }

  for (const auto &[floor, walls] : request.walls_by_floor)
  {
    for (size_t i = 0; i < walls.size(); ++i)
    {
      const auto &wall = walls[i];
      std::string prefix = "walls[" + std::to_string(floor) + "][" + std::to_string(i) + "]: ";

      if (wall.points.size() < 2)
        return invalid(prefix + "a wall needs at least two points");
      for (const auto &p : wall.points)
      {
        if (!valid_lat(p.lat) || !valid_lng(p.lon))
          return invalid(prefix + "invalid vertex coordinates");
      }
      if (!wall.segment_materials.empty() && wall.segment_materials.size() != wall.segment_count())
        return invalid(prefix + "per-segment materials must have one entry per segment");
    }
  }

  for (size_t i = 0; i < request.buildings.size(); ++i)
  {
    const auto &building = request.buildings[i];
    std::string prefix = "buildings[" + std::to_string(i) + "]: ";

    if (!valid_lat(building.sw_lat) || !valid_lat(building.ne_lat) || !valid_lng(building.sw_lng) || !valid_lng(building.ne_lng))
      return invalid(prefix + "invalid bounds");
    if (building.sw_lat > building.ne_lat || building.sw_lng > building.ne_lng)
      return invalid(prefix + "inverted bounds");
  }

  return {};
}

} // namespace rf_heatmap
