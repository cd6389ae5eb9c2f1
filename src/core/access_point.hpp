#pragma once

#include <optional>
#include <string>

namespace rf_heatmap
{

// Physical mount orientation of a device
enum class mount_type_e
{
  CEILING,
  WALL,
  DESKTOP
};

auto parse_mount_type(const std::string &text) -> std::optional<mount_type_e>;
auto mount_type_to_string(mount_type_e mount) -> std::string;

// Access point as supplied by the caller for one heatmap request
struct access_point_t
{
  std::string name; // Display only
  double latitude = 0.0;
  double longitude = 0.0;
  int floor = 0;
  double tx_power_dbm = 20.0;
  double antenna_gain_dbi = 0.0;
  std::string model;
  std::optional<std::string> antenna_mode; // e.g. "omni"; unset = default pattern
  mount_type_e mount_type = mount_type_e::CEILING;
  double orientation_deg = 0.0; // Forward-facing azimuth, 0-359 (North=0, CW)
};

// True when the requested antenna mode is the omni variant
auto is_omni_mode(const std::optional<std::string> &antenna_mode) -> bool;

} // namespace rf_heatmap
