#include "material_table.hpp"
#include "string_utils.hpp"
#include <fstream>
#include <iostream>
#include <sstream>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace rf_heatmap
{

namespace
{

auto band_index(band_e band) -> size_t
{
  return static_cast<size_t>(band);
}

// Generic interior partition, used for unknown ids
constexpr band_attenuation_t GENERIC_WALL_DB = {3.0, 4.0, 5.0};

} // namespace

material_table_t::material_table_t()
{
  //                          2.4    5     6 GHz
  m_materials["drywall"] = {3.0, 4.0, 5.0};
  m_materials["wood"] = {4.0, 6.0, 7.0};
  m_materials["glass"] = {2.0, 4.0, 5.0};
  m_materials["brick"] = {6.0, 10.0, 12.0};
  m_materials["concrete"] = {12.0, 20.0, 25.0};
  m_materials["metal"] = {26.0, 32.0, 36.0};
  m_materials["floor_wood"] = {8.0, 12.0, 14.0};
  m_materials["floor_concrete"] = {15.0, 25.0, 30.0};
}

material_table_t::~material_table_t()
{
}

auto material_table_t::attenuation_db(const std::string &material, band_e band) const -> double
{
  auto it = m_materials.find(to_lower(material));
  if (it == m_materials.end())
    return default_attenuation(band);
  return it->second[band_index(band)];
}

auto material_table_t::center_frequency_mhz(band_e band) const -> double
{
  switch (band)
  {
  case band_e::BAND_2_4_GHZ:
    return 2437.0; // Channel 6
  case band_e::BAND_5_GHZ:
    return 5500.0;
  case band_e::BAND_6_GHZ:
    return 6525.0;
  }
  return 5500.0;
}

auto material_table_t::set_attenuation(const std::string &material, band_e band, double attenuation_db) -> void
{
  auto key = to_lower(material);
  auto it = m_materials.find(key);
  if (it == m_materials.end())
    it = m_materials.emplace(key, GENERIC_WALL_DB).first;
  it->second[band_index(band)] = attenuation_db;
}

auto material_table_t::has_material(const std::string &material) const -> bool
{
  return m_materials.count(to_lower(material)) > 0;
}

auto material_table_t::default_attenuation(band_e band) -> double
{
  return GENERIC_WALL_DB[band_index(band)];
}

auto material_table_t::load_overrides(const std::string &filepath) -> io_result_t
{
  std::ifstream file(filepath);
  if (!file.is_open())
  {
    io_result_t result;
    result.error_message = "Could not open file: " + filepath;
    return result;
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  return parse_overrides(buffer.str());
}

auto material_table_t::parse_overrides(const std::string &content) -> io_result_t
{
  io_result_t result;

  json j;
  try
  {
    j = json::parse(content);
  }
  catch (const json::parse_error &e)
  {
    result.error_message = std::string("JSON Parse Error: ") + e.what();
    return result;
  }

  if (!j.is_object() || !j.contains("materials") || !j["materials"].is_object())
  {
    result.error_message = "No \"materials\" object found";
    return result;
  }

  for (const auto &[material, bands] : j["materials"].items())
  {
    if (!bands.is_object())
    {
      std::cerr << "Materials: skipping " << material << ": expected an object of band values" << std::endl;
      continue;
    }

    for (const auto &[band_text, value] : bands.items())
    {
      auto band = parse_band(band_text);
      if (!band || !value.is_number())
      {
        std::cerr << "Materials: skipping " << material << "/" << band_text << std::endl;
        continue;
      }
      set_attenuation(material, *band, value.get<double>());
    }
    result.items_loaded++;
  }

  result.success = true;
  return result;
}

} // namespace rf_heatmap
