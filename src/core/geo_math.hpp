#pragma once

#include <cmath>

namespace rf_heatmap
{
namespace geo
{
constexpr double PI = 3.14159265358979323846;
constexpr double EARTH_RADIUS = 6371000.0; // Mean radius (meters)

// Geographic point
struct geo_point_t
{
  double lat;
  double lon;
};

inline auto deg_to_rad(double deg) -> double
{
  return deg * PI / 180.0;
}

inline auto rad_to_deg(double rad) -> double
{
  return rad * 180.0 / PI;
}

// Calculate bearing from point A to point B in degrees
inline auto bearing(double lat1, double lon1, double lat2, double lon2) -> double
{
  double lat1_rad = deg_to_rad(lat1);
  double lat2_rad = deg_to_rad(lat2);
  double delta_lon_rad = deg_to_rad(lon2 - lon1);

  double y = std::sin(delta_lon_rad) * std::cos(lat2_rad);
  double x = std::cos(lat1_rad) * std::sin(lat2_rad) - std::sin(lat1_rad) * std::cos(lat2_rad) * std::cos(delta_lon_rad);
  double theta = std::atan2(y, x);

  // Convert to degrees and normalize to 0-360
  double bearing_deg = std::fmod(rad_to_deg(theta) + 360.0, 360.0);
  if (bearing_deg < 0.0)
    bearing_deg += 360.0;
  return bearing_deg;
}

// Calculate distance between two points in meters (Haversine)
inline auto distance(double lat1, double lon1, double lat2, double lon2) -> double
{
  double lat1_rad = deg_to_rad(lat1);
  double lat2_rad = deg_to_rad(lat2);
  double delta_lat = deg_to_rad(lat2 - lat1);
  double delta_lon = deg_to_rad(lon2 - lon1);

  double a = std::sin(delta_lat / 2.0) * std::sin(delta_lat / 2.0) + std::cos(lat1_rad) * std::cos(lat2_rad) * std::sin(delta_lon / 2.0) * std::sin(delta_lon / 2.0);
  double c = 2.0 * std::atan2(std::sqrt(a), std::sqrt(1.0 - a));
  return EARTH_RADIUS * c;
}

inline auto distance(const geo_point_t &a, const geo_point_t &b) -> double
{
  return distance(a.lat, a.lon, b.lat, b.lon);
}

// Z component of (b - a) x (c - a), lat/lon treated as planar coordinates
inline auto cross_product(const geo_point_t &a, const geo_point_t &b, const geo_point_t &c) -> double
{
  return (b.lat - a.lat) * (c.lon - a.lon) - (b.lon - a.lon) * (c.lat - a.lat);
}

// Proper crossing test for segments a1-a2 and b1-b2.
// Collinear and touching configurations are not crossings.
inline auto segments_intersect(const geo_point_t &a1, const geo_point_t &a2, const geo_point_t &b1, const geo_point_t &b2) -> bool
{
  double d1 = cross_product(b1, b2, a1);
  double d2 = cross_product(b1, b2, a2);
  double d3 = cross_product(a1, a2, b1);
  double d4 = cross_product(a1, a2, b2);

  return ((d1 > 0.0 && d2 < 0.0) || (d1 < 0.0 && d2 > 0.0)) && ((d3 > 0.0 && d4 < 0.0) || (d3 < 0.0 && d4 > 0.0));
}

} // namespace geo
} // namespace rf_heatmap
