#include "core/heatmap_request.hpp"
#include "core/mount_type_rules.hpp"
#include "core/persistence.hpp"
#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>
#include <string>

#include <nlohmann/json.hpp>

using namespace rf_heatmap;

namespace
{

const char *SAMPLE_REQUEST = R"({
  "bounds": {"sw_lat": 52.0, "sw_lng": 4.0, "ne_lat": 52.001, "ne_lng": 4.0015},
  "band": "2.4",
  "active_floor": 1,
  "grid_resolution_m": 2.5,
  "access_points": [
    {"name": "Lobby", "latitude": 52.0005, "longitude": 4.0007, "floor": 1,
     "tx_power_dbm": 23, "antenna_gain_dbi": 4, "model": "U6-Pro",
     "antenna_mode": "omni", "mount_type": "wall", "orientation_deg": 90},
    {"latitude": 52.0002, "longitude": 4.0001, "model": "U6-Mesh"}
  ],
  "walls": {
    "1": [
      {"points": [[52.0001, 4.0], {"lat": 52.0001, "lng": 4.001}, [52.0009, 4.001]],
       "material": "brick", "materials": ["glass", null]}
    ],
    "-1": [
      {"points": [[52.0, 4.0], [52.001, 4.0]]}
    ]
  },
  "buildings": [
    {"name": "HQ", "sw_lat": 52.0, "sw_lng": 4.0, "ne_lat": 52.001, "ne_lng": 4.0015,
     "floor_materials": {"0": "floor_concrete", "1": "floor_wood"}}
  ]
})";

auto sample_request() -> heatmap_request_t
{
  mount_type_rules_t mounts;
  heatmap_request_t request;
  auto result = persistence::parse_request(SAMPLE_REQUEST, mounts, request);
  assert(result.success);
  return request;
}

} // namespace

void test_parse_request()
{
  std::cout << "Testing request parsing..." << std::endl;
  mount_type_rules_t mounts;
  heatmap_request_t request;

  auto result = persistence::parse_request(SAMPLE_REQUEST, mounts, request);
  assert(result.success);
  assert(result.items_loaded == 2);

  assert(request.bounds.ne_lng == 4.0015);
  assert(request.band == band_e::BAND_2_4_GHZ);
  assert(request.active_floor == 1);
  assert(request.grid_resolution_m == 2.5);

  const auto &lobby = request.access_points[0];
  assert(lobby.name == "Lobby");
  assert(lobby.tx_power_dbm == 23.0 && lobby.antenna_gain_dbi == 4.0);
  assert(lobby.antenna_mode && *lobby.antenna_mode == "omni");
  assert(lobby.mount_type == mount_type_e::WALL);
  assert(lobby.orientation_deg == 90.0);

  // Defaults, mount from the model name
  const auto &mesh = request.access_points[1];
  assert(mesh.floor == 0);
  assert(mesh.tx_power_dbm == 20.0 && mesh.antenna_gain_dbi == 0.0);
  assert(!mesh.antenna_mode);
  assert(mesh.mount_type == mount_type_e::WALL);

  assert(request.walls_by_floor.size() == 2);
  const auto &wall = request.walls_by_floor.at(1)[0];
  assert(wall.floor == 1);
  assert(wall.points.size() == 3);
  assert(wall.points[1].lat == 52.0001 && wall.points[1].lon == 4.001);
  assert(wall.material == "brick");
  assert(wall.segment_materials.size() == 2);
  assert(wall.segment_materials[0] && *wall.segment_materials[0] == "glass");
  assert(!wall.segment_materials[1]);

  const auto &basement = request.walls_by_floor.at(-1)[0];
  assert(basement.material == "drywall");
  assert(basement.segment_materials.empty());

  assert(request.buildings.size() == 1);
  assert(request.buildings[0].name == "HQ");
  assert(request.buildings[0].floor_materials.at(0) == "floor_concrete");

  assert(validate_request(request).valid);
}

void test_parse_request_errors()
{
  std::cout << "Testing request parse errors..." << std::endl;
  mount_type_rules_t mounts;
  heatmap_request_t request;
  request.active_floor = 7;

  assert(!persistence::parse_request("{", mounts, request).success);
  assert(!persistence::parse_request(R"({"band": "5"})", mounts, request).success);
  assert(!persistence::parse_request(R"({"bounds": {"sw_lat": 0, "sw_lng": 0, "ne_lat": 1}})", mounts, request).success);
  assert(!persistence::parse_request(R"({"bounds": {"sw_lat": 0, "sw_lng": 0, "ne_lat": 1, "ne_lng": 1}, "band": "60"})", mounts, request).success);
  assert(!persistence::parse_request(R"({"bounds": {"sw_lat": 0, "sw_lng": 0, "ne_lat": 1, "ne_lng": 1},
    "access_points": [{"latitude": 0, "longitude": 0, "mount_type": "floor"}]})",
                                     mounts, request)
              .success);
  assert(!persistence::parse_request(R"({"bounds": {"sw_lat": 0, "sw_lng": 0, "ne_lat": 1, "ne_lng": 1},
    "walls": {"ground": []}})",
                                     mounts, request)
              .success);
  assert(!persistence::parse_request(R"({"bounds": {"sw_lat": 0, "sw_lng": 0, "ne_lat": 1, "ne_lng": 1},
    "walls": {"0": [{"points": [[0, 0], [1]]}]}})",
                                     mounts, request)
              .success);

  // Failed loads leave the request untouched
  assert(request.active_floor == 7);

  auto result = persistence::load_request("/nonexistent/request.json", mounts, request);
  assert(!result.success && !result.error_message.empty());
}

void test_validate_request()
{
  std::cout << "Testing request validation..." << std::endl;

  auto request = sample_request();
  request.bounds.sw_lat = 52.002;
  assert(!validate_request(request).valid);

  request = sample_request();
  request.bounds.ne_lng = 181.0;
  assert(!validate_request(request).valid);

  request = sample_request();
  request.access_points[0].latitude = std::numeric_limits<double>::quiet_NaN();
  assert(!validate_request(request).valid);

  request = sample_request();
  request.grid_resolution_m = 0.0;
  assert(!validate_request(request).valid);
  request.grid_resolution_m = std::numeric_limits<double>::quiet_NaN();
  assert(!validate_request(request).valid);

  request = sample_request();
  request.access_points.clear();
  auto result = validate_request(request);
  assert(!result.valid && !result.error_message.empty());

  request = sample_request();
  request.access_points[1].orientation_deg = 360.0;
  result = validate_request(request);
  assert(!result.valid);
  assert(result.error_message.find("access_points[1]") != std::string::npos);

  request = sample_request();
  request.access_points[0].tx_power_dbm = std::numeric_limits<double>::infinity();
  assert(!validate_request(request).valid);

  request = sample_request();
  request.walls_by_floor[1][0].points.resize(1);
  assert(!validate_request(request).valid);

  request = sample_request();
  request.walls_by_floor[1][0].segment_materials.push_back(std::nullopt);
  assert(!validate_request(request).valid);

  request = sample_request();
  request.buildings[0].sw_lng = 4.002;
  assert(!validate_request(request).valid);

  // Degenerate bounds are accepted
  request = sample_request();
  request.bounds.ne_lat = request.bounds.sw_lat;
  assert(validate_request(request).valid);
}

void test_heatmap_json()
{
  std::cout << "Testing heatmap JSON..." << std::endl;
  heatmap_grid_t grid;
  grid.width = 3;
  grid.height = 2;
  grid.bounds = {52.0, 4.0, 52.001, 4.0015};
  grid.signal_dbm = {-40.0f, -50.0f, -60.0f, -70.0f, -80.5f, -100.0f};

  auto j = nlohmann::json::parse(persistence::heatmap_to_json(grid));
  assert(j["width"] == 3);
  assert(j["height"] == 2);
  assert(j["sw_lat"] == 52.0);
  assert(j["ne_lng"] == 4.0015);
  assert(j["data"].is_array());
  assert(j["data"].size() == 6);
  assert(j["data"][4].get<float>() == -80.5f);
  assert(j["data"][5].get<float>() == -100.0f);
}

void test_engine_config()
{
  std::cout << "Testing engine config..." << std::endl;
  engine_config_t config;

  assert(persistence::parse_engine_config(R"({"floor_height_m": 4.0, "worker_count": 2, "log_diagnostics": false})", config));
  assert(config.floor_height_m == 4.0);
  assert(config.worker_count == 2);
  assert(!config.log_diagnostics);
  assert(config.max_grid_dimension == MAX_GRID_DIMENSION);
  assert(config.empty_signal_dbm == -100.0f);

  config.max_grid_dimension = 5000;
  assert(config.effective_max_grid_dimension() == MAX_GRID_DIMENSION);

  engine_config_t untouched;
  assert(!persistence::parse_engine_config(R"({"floor_height_m": "tall"})", untouched));
  assert(untouched.floor_height_m == 3.0);
  assert(!persistence::parse_engine_config("nope", untouched));
  assert(!persistence::load_engine_config("/nonexistent/config.json", untouched));
}

int main()
{
  test_parse_request();
  test_parse_request_errors();
  test_validate_request();
  test_heatmap_json();
  test_engine_config();
  std::cout << "Persistence Verification Passed" << std::endl;
  return 0;
}
