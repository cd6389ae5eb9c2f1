#include "access_point.hpp"
#include "string_utils.hpp"

namespace rf_heatmap
{

auto parse_mount_type(const std::string &text) -> std::optional<mount_type_e>
{
  std::string key = to_lower(trim(text));
  if (key == "ceiling")
    return mount_type_e::CEILING;
  if (key == "wall")
    return mount_type_e::WALL;
  if (key == "desktop")
    return mount_type_e::DESKTOP;
  return std::nullopt;
}

auto mount_type_to_string(mount_type_e mount) -> std::string
{
  switch (mount)
  {
  case mount_type_e::CEILING:
    return "ceiling";
  case mount_type_e::WALL:
    return "wall";
  case mount_type_e::DESKTOP:
    return "desktop";
  }
  return "ceiling";
}

auto is_omni_mode(const std::optional<std::string> &antenna_mode) -> bool
{
  return antenna_mode.has_value() && iequals(*antenna_mode, "omni");
}

} // namespace rf_heatmap
