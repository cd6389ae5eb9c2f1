#include "core/persistence.hpp"
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace rf_heatmap
{
namespace persistence
{

namespace
{

auto read_file(const std::string &filename, std::string &content) -> bool
{
  std::ifstream file(filename);
  if (!file.is_open())
    return false;

  std::stringstream buffer;
  buffer << file.rdbuf();
  content = buffer.str();
  return true;
}

auto require_number(const json &item, const char *key, const std::string &context) -> double
{
  if (!item.contains(key) || !item[key].is_number())
    throw std::runtime_error(context + ": missing numeric field \"" + key + "\"");
  return item[key].get<double>();
}

// Accepts [lat, lng] or {"lat": .., "lng": ..}
auto parse_point(const json &item, const std::string &context) -> geo_point_t
{
  if (item.is_array() && item.size() == 2 && item[0].is_number() && item[1].is_number())
    return {item[0].get<double>(), item[1].get<double>()};
  if (item.is_object())
    return {require_number(item, "lat", context), require_number(item, "lng", context)};
  throw std::runtime_error(context + ": expected [lat, lng] or {\"lat\", \"lng\"}");
}

auto parse_floor_key(const std::string &key, const std::string &context) -> int
{
  try
  {
    size_t used = 0;
    int floor = std::stoi(key, &used);
    if (used == key.size())
      return floor;
  }
  catch (const std::exception &)
  {
  }
  throw std::runtime_error(context + ": floor key '" + key + "' is not an integer");
}

auto parse_access_point(const json &item, const mount_type_resolver_t &mounts, const std::string &context) -> access_point_t
{
  if (!item.is_object())
    throw std::runtime_error(context + ": expected an object");

  access_point_t ap;
  ap.name = item.value("name", "");
  ap.latitude = require_number(item, "latitude", context);
  ap.longitude = require_number(item, "longitude", context);
  ap.floor = item.value("floor", 0);
  ap.tx_power_dbm = item.value("tx_power_dbm", 20.0);
  ap.antenna_gain_dbi = item.value("antenna_gain_dbi", 0.0);
  ap.model = item.value("model", "");
  ap.orientation_deg = item.value("orientation_deg", 0.0);

  if (item.contains("antenna_mode") && item["antenna_mode"].is_string())
    ap.antenna_mode = item["antenna_mode"].get<std::string>();

  if (item.contains("mount_type") && !item["mount_type"].is_null())
  {
    auto mount = parse_mount_type(item["mount_type"].get<std::string>());
    if (!mount)
      throw std::runtime_error(context + ": mount_type must be ceiling, wall or desktop");
    ap.mount_type = *mount;
  }
  else
  {
    ap.mount_type = mounts.default_mount_type(ap.model);
  }

  return ap;
}

auto parse_wall(const json &item, int floor, const std::string &context) -> wall_polyline_t
{
  if (!item.is_object() || !item.contains("points") || !item["points"].is_array())
    throw std::runtime_error(context + ": expected an object with a \"points\" array");

  wall_polyline_t wall;
  wall.floor = floor;
  wall.material = item.value("material", wall.material);

  for (const auto &p : item["points"])
  {
    wall.points.push_back(parse_point(p, context));
  }

  if (item.contains("materials") && item["materials"].is_array())
  {
    for (const auto &m : item["materials"])
    {
      if (m.is_string())
        wall.segment_materials.emplace_back(m.get<std::string>());
      else
        wall.segment_materials.emplace_back(std::nullopt);
    }
  }

  return wall;
}

auto parse_building(const json &item, const std::string &context) -> building_floor_info_t
{
  if (!item.is_object())
    throw std::runtime_error(context + ": expected an object");

  building_floor_info_t building;
  building.name = item.value("name", "");
  building.sw_lat = require_number(item, "sw_lat", context);
  building.sw_lng = require_number(item, "sw_lng", context);
  building.ne_lat = require_number(item, "ne_lat", context);
  building.ne_lng = require_number(item, "ne_lng", context);

  if (item.contains("floor_materials") && item["floor_materials"].is_object())
  {
    for (const auto &[key, material] : item["floor_materials"].items())
    {
      building.floor_materials[parse_floor_key(key, context)] = material.get<std::string>();
    }
  }

  return building;
}

} // namespace

auto load_request(const std::string &filename, const mount_type_resolver_t &mounts, heatmap_request_t &request) -> io_result_t
{
  std::string content;
  if (!read_file(filename, content))
  {
    io_result_t result;
    result.error_message = "Could not open file: " + filename;
    return result;
  }
  return parse_request(content, mounts, request);
}

auto parse_request(const std::string &content, const mount_type_resolver_t &mounts, heatmap_request_t &request) -> io_result_t
{
  io_result_t result;

  json j;
  try
  {
    j = json::parse(content);
  }
  catch (const json::parse_error &e)
  {
    std::cerr << "JSON Parse Error: " << e.what() << std::endl;
    result.error_message = std::string("JSON Parse Error: ") + e.what();
    return result;
  }

  heatmap_request_t parsed;
  try
  {
    if (!j.is_object() || !j.contains("bounds"))
      throw std::runtime_error("missing \"bounds\"");

    const auto &bounds = j["bounds"];
    parsed.bounds.sw_lat = require_number(bounds, "sw_lat", "bounds");
    parsed.bounds.sw_lng = require_number(bounds, "sw_lng", "bounds");
    parsed.bounds.ne_lat = require_number(bounds, "ne_lat", "bounds");
    parsed.bounds.ne_lng = require_number(bounds, "ne_lng", "bounds");

    std::string band_text = j.value("band", "5");
    auto band = parse_band(band_text);
    if (!band)
      throw std::runtime_error("unknown band '" + band_text + "'");
    parsed.band = *band;

    parsed.active_floor = j.value("active_floor", 0);
    parsed.grid_resolution_m = j.value("grid_resolution_m", 1.0);

    if (j.contains("access_points"))
    {
      size_t i = 0;
      for (const auto &item : j["access_points"])
      {
        parsed.access_points.push_back(parse_access_point(item, mounts, "access_points[" + std::to_string(i++) + "]"));
      }
    }

    if (j.contains("walls"))
    {
      for (const auto &[key, walls] : j["walls"].items())
      {
        int floor = parse_floor_key(key, "walls");
        auto &floor_walls = parsed.walls_by_floor[floor];
        size_t i = 0;
        for (const auto &item : walls)
        {
          floor_walls.push_back(parse_wall(item, floor, "walls[" + key + "][" + std::to_string(i++) + "]"));
        }
      }
    }

    if (j.contains("buildings") && !j["buildings"].is_null())
    {
      size_t i = 0;
      for (const auto &item : j["buildings"])
      {
        parsed.buildings.push_back(parse_building(item, "buildings[" + std::to_string(i++) + "]"));
      }
    }
  }
  catch (const json::exception &e)
  {
    result.error_message = std::string("Request: ") + e.what();
    return result;
  }
  catch (const std::runtime_error &e)
  {
    result.error_message = std::string("Request: ") + e.what();
    return result;
  }

  request = std::move(parsed);
  result.items_loaded = request.access_points.size();
  result.success = true;
  return result;
}

auto heatmap_to_json(const heatmap_grid_t &grid) -> std::string
{
  json j;
  j["width"] = grid.width;
  j["height"] = grid.height;
  j["sw_lat"] = grid.bounds.sw_lat;
  j["sw_lng"] = grid.bounds.sw_lng;
  j["ne_lat"] = grid.bounds.ne_lat;
  j["ne_lng"] = grid.bounds.ne_lng;
  j["data"] = grid.signal_dbm;
  return j.dump();
}

auto save_heatmap(const std::string &filename, const heatmap_grid_t &grid) -> bool
{
  std::ofstream file(filename);
  if (!file.is_open())
  {
    std::cerr << "Failed to open output file: " << filename << std::endl;
    return false;
  }

  file << heatmap_to_json(grid);
  return static_cast<bool>(file);
}

auto load_engine_config(const std::string &filename, engine_config_t &config) -> bool
{
  std::string content;
  if (!read_file(filename, content))
  {
    std::cerr << "Failed to open config file: " << filename << std::endl;
    return false;
  }
  return parse_engine_config(content, config);
}

auto parse_engine_config(const std::string &content, engine_config_t &config) -> bool
{
  json j;
  try
  {
    j = json::parse(content);
  }
  catch (const json::parse_error &e)
  {
    std::cerr << "JSON Parse Error: " << e.what() << std::endl;
    return false;
  }

  engine_config_t parsed = config;
  try
  {
    parsed.floor_height_m = j.value("floor_height_m", parsed.floor_height_m);
    parsed.path_loss_exponent = j.value("path_loss_exponent", parsed.path_loss_exponent);
    parsed.max_grid_dimension = j.value("max_grid_dimension", parsed.max_grid_dimension);
    parsed.empty_signal_dbm = j.value("empty_signal_dbm", parsed.empty_signal_dbm);
    parsed.worker_count = j.value("worker_count", parsed.worker_count);
    parsed.log_diagnostics = j.value("log_diagnostics", parsed.log_diagnostics);
  }
  catch (const json::exception &e)
  {
    std::cerr << "Config: " << e.what() << std::endl;
    return false;
  }

  config = parsed;
  return true;
}

} // namespace persistence
} // namespace rf_heatmap
