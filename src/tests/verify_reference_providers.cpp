#include "../core/antenna_pattern_io.hpp"
#include "../core/antenna_pattern_library.hpp"
#include "../core/material_table.hpp"
#include "../core/mount_type_rules.hpp"
#include "test_providers.hpp"
#include <cassert>
#include <cmath>
#include <iostream>
#include <string>

using namespace rf_heatmap;

void test_material_table()
{
  std::cout << "Testing material table..." << std::endl;
  material_table_t table;

  assert(table.attenuation_db("concrete", band_e::BAND_5_GHZ) == 20.0);
  assert(table.attenuation_db("Concrete", band_e::BAND_2_4_GHZ) == 12.0);
  assert(table.attenuation_db("metal", band_e::BAND_6_GHZ) == 36.0);
  assert(table.attenuation_db("floor_wood", band_e::BAND_5_GHZ) == 12.0);

  // Higher bands never attenuate less
  for (const char *material : {"drywall", "wood", "glass", "brick", "concrete", "metal", "floor_wood", "floor_concrete"})
  {
    assert(table.has_material(material));
    assert(table.attenuation_db(material, band_e::BAND_2_4_GHZ) <= table.attenuation_db(material, band_e::BAND_5_GHZ));
    assert(table.attenuation_db(material, band_e::BAND_5_GHZ) <= table.attenuation_db(material, band_e::BAND_6_GHZ));
  }

  // Unknown ids get the generic interior wall
  assert(!table.has_material("unobtainium"));
  assert(table.attenuation_db("unobtainium", band_e::BAND_5_GHZ) == material_table_t::default_attenuation(band_e::BAND_5_GHZ));

  assert(table.center_frequency_mhz(band_e::BAND_2_4_GHZ) == 2437.0);
  assert(table.center_frequency_mhz(band_e::BAND_5_GHZ) == 5500.0);
  assert(table.center_frequency_mhz(band_e::BAND_6_GHZ) == 6525.0);
}

void test_material_overrides()
{
  std::cout << "Testing material overrides..." << std::endl;
  material_table_t table;

  auto result = table.parse_overrides(R"({"materials": {
    "Concrete": {"5": 18.5},
    "shoji": {"2.4": 1.0, "6GHz": 2.0},
    "broken": 7,
    "partial": {"9": 1.0, "5": "loud"}
  }})");
  assert(result.success);
  assert(result.items_loaded == 3);

  assert(table.attenuation_db("concrete", band_e::BAND_5_GHZ) == 18.5);
  assert(table.attenuation_db("concrete", band_e::BAND_2_4_GHZ) == 12.0);
  assert(table.has_material("shoji"));
  assert(table.attenuation_db("shoji", band_e::BAND_2_4_GHZ) == 1.0);
  assert(table.attenuation_db("shoji", band_e::BAND_6_GHZ) == 2.0);
  assert(table.attenuation_db("shoji", band_e::BAND_5_GHZ) == material_table_t::default_attenuation(band_e::BAND_5_GHZ));
  assert(!table.has_material("broken"));

  assert(!table.parse_overrides("{not json").success);
  assert(!table.parse_overrides(R"({"walls": {}})").success);
  assert(!table.load_overrides("/nonexistent/materials.json").success);
}

void test_mount_rules()
{
  std::cout << "Testing mount rules..." << std::endl;
  mount_type_rules_t rules;

  assert(rules.default_mount_type("U6-Pro") == mount_type_e::CEILING);
  assert(rules.default_mount_type("U6-Mesh") == mount_type_e::WALL);
  assert(rules.default_mount_type("U7-Outdoor") == mount_type_e::WALL);
  assert(rules.default_mount_type("U6-IW") == mount_type_e::WALL);
  assert(rules.default_mount_type("FlexHD") == mount_type_e::DESKTOP);
  assert(rules.default_mount_type("U6-Express") == mount_type_e::DESKTOP);
  assert(rules.default_mount_type("") == mount_type_e::CEILING);

  rules.set_override("U6-Pro", mount_type_e::WALL);
  assert(rules.default_mount_type("u6-pro") == mount_type_e::WALL);

  auto result = rules.parse_overrides(R"({"mounts": {"U6-Mesh": "ceiling", "Lamp": "desktop", "Odd": "floor"}})");
  assert(result.success);
  assert(result.items_loaded == 2);
  assert(rules.default_mount_type("U6-Mesh") == mount_type_e::CEILING);
  assert(rules.default_mount_type("LAMP") == mount_type_e::DESKTOP);
  assert(rules.default_mount_type("Odd") == mount_type_e::CEILING);

  assert(!rules.parse_overrides("[]").success);
}

void test_pattern_fallback()
{
  std::cout << "Testing pattern fallback..." << std::endl;
  antenna_pattern_library_t library;

  auto flat = [](int) { return 0.0f; };
  library.add_pattern(test::make_pattern("U6-Pro", band_e::BAND_5_GHZ, "", [](int) { return -1.0f; }, flat));
  library.add_pattern(test::make_pattern("U6-Pro", band_e::BAND_5_GHZ, "Omni", [](int) { return -2.0f; }, flat));
  library.add_pattern(test::make_pattern("U6-Pro", band_e::BAND_6_GHZ, "", [](int) { return -3.0f; }, flat));

  assert(library.size() == 3);
  assert(library.has_omni_variant("u6-pro"));
  assert(!library.has_omni_variant("U6-Lite"));

  // Exact, mode ignores case
  auto lookup = library.resolve_pattern("U6-PRO", band_e::BAND_5_GHZ, std::string("omni"));
  assert(lookup.pattern && !lookup.is_fallback);
  assert(library.azimuth_gain_db("U6-Pro", band_e::BAND_5_GHZ, 10, std::string("omni")) == -2.0f);

  // Base pattern requested directly is exact too
  lookup = library.resolve_pattern("U6-Pro", band_e::BAND_5_GHZ, std::nullopt);
  assert(lookup.pattern && !lookup.is_fallback);
  assert(lookup.pattern->get_azimuth_gain(0) == -1.0f);

  // Unknown mode falls back to the base pattern of the band
  lookup = library.resolve_pattern("U6-Pro", band_e::BAND_6_GHZ, std::string("omni"));
  assert(lookup.pattern && lookup.is_fallback);
  assert(lookup.pattern->get_azimuth_gain(0) == -3.0f);

  // Missing band falls back to the nearest band with a base pattern
  lookup = library.resolve_pattern("U6-Pro", band_e::BAND_2_4_GHZ, std::nullopt);
  assert(lookup.pattern && lookup.is_fallback);
  assert(lookup.pattern->band == band_e::BAND_5_GHZ);

  // Unknown model
  lookup = library.resolve_pattern("U6-Lite", band_e::BAND_5_GHZ, std::nullopt);
  assert(!lookup.pattern && !lookup.is_fallback);
  assert(library.azimuth_gain_db("U6-Lite", band_e::BAND_5_GHZ, 90, std::nullopt) == 0.0f);
  assert(library.elevation_gain_db("U6-Lite", band_e::BAND_5_GHZ, 90, std::nullopt) == 0.0f);

  library.clear();
  assert(library.size() == 0);
  assert(!library.has_omni_variant("U6-Pro"));
}

void test_pattern_library_parsing()
{
  std::cout << "Testing pattern library parsing..." << std::endl;
  antenna_pattern_library_t library;

  std::string elevation = "[";
  for (int i = 0; i < 360; ++i)
  {
    elevation += (i ? "," : "") + std::to_string(i == 90 ? 4 : -6);
  }
  elevation += "]";

  std::string content = R"({"patterns": [
    {"model": "U7-Pro", "band": "5GHz", "mode": "omni", "azimuth": [5, -5, -15, -5], "elevation": )" +
                        elevation + R"(},
    {"model": "U7-Pro", "band": "7", "azimuth": [0], "elevation": [0]},
    {"model": "U7-Pro", "band": "6", "azimuth": [], "elevation": [0]},
    {"band": "6", "azimuth": [0], "elevation": [0]},
    "junk"
  ]})";

  auto result = antenna_pattern_io_t::parse_library(content, library);
  assert(result.success);
  assert(result.items_loaded == 1);
  assert(library.size() == 1);
  assert(library.has_omni_variant("U7-Pro"));

  auto lookup = library.resolve_pattern("U7-Pro", band_e::BAND_5_GHZ, std::string("omni"));
  assert(lookup.pattern && !lookup.is_fallback);

  // Four azimuth samples spread over 360 degrees, peak shifted to 0 dB
  const auto &p = *lookup.pattern;
  assert(p.get_azimuth_gain(0) == 0.0f);
  assert(p.get_azimuth_gain(90) == -10.0f);
  assert(p.get_azimuth_gain(180) == -20.0f);
  assert(p.get_azimuth_gain(270) == -10.0f);
  assert(p.get_azimuth_gain(-90) == -10.0f);
  assert(p.get_azimuth_gain(360) == 0.0f);

  assert(p.get_elevation_gain(90) == 0.0f);
  assert(p.get_elevation_gain(0) == -10.0f);
  assert(p.get_elevation_gain(359) == -10.0f);

  assert(!antenna_pattern_io_t::parse_library("{\"patterns\": {}}", library).success);
  assert(!antenna_pattern_io_t::parse_library("garbage", library).success);
  assert(!antenna_pattern_io_t::load_library("/nonexistent/patterns.json", library).success);
}

int main()
{
  test_material_table();
  test_material_overrides();
  test_mount_rules();
  test_pattern_fallback();
  test_pattern_library_parsing();
  std::cout << "Reference Provider Verification Passed" << std::endl;
  return 0;
}
