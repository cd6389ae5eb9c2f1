#include "antenna_pattern_io.hpp"
#include <fstream>
#include <iostream>
#include <sstream>
#include <vector>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace rf_heatmap
{

namespace
{

auto read_cut(const json &entry, const char *key, std::vector<float> &out) -> bool
{
  if (!entry.contains(key) || !entry[key].is_array() || entry[key].empty())
    return false;

  out.clear();
  for (const auto &value : entry[key])
  {
    if (!value.is_number())
      return false;
    out.push_back(value.get<float>());
  }
  return true;
}

// Builds one pattern from a library entry, returns an error message on failure
auto parse_pattern(const json &entry, antenna_pattern_t &pattern) -> std::string
{
  if (!entry.is_object())
    return "entry is not an object";
  if (!entry.contains("model") || !entry["model"].is_string())
    return "missing model";
  if (!entry.contains("band") || !entry["band"].is_string())
    return "missing band";

  auto band = parse_band(entry["band"].get<std::string>());
  if (!band)
    return "unknown band '" + entry["band"].get<std::string>() + "'";

  pattern.model = entry["model"].get<std::string>();
  pattern.band = *band;
  if (entry.contains("mode") && entry["mode"].is_string())
    pattern.mode = entry["mode"].get<std::string>();

  std::vector<float> azimuth, elevation;
  if (!read_cut(entry, "azimuth", azimuth))
    return "missing or invalid azimuth cut";
  if (!read_cut(entry, "elevation", elevation))
    return "missing or invalid elevation cut";

  pattern.azimuth_gain_db = antenna_pattern_t::resample(azimuth);
  pattern.elevation_gain_db = antenna_pattern_t::resample(elevation);
  pattern.normalize();
  return "";
}

} // namespace

auto antenna_pattern_io_t::load_library(const std::string &filepath, antenna_pattern_library_t &library) -> io_result_t
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
  return parse_library(buffer.str(), library);
}

auto antenna_pattern_io_t::parse_library(const std::string &content, antenna_pattern_library_t &library) -> io_result_t
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

  if (!j.is_object() || !j.contains("patterns") || !j["patterns"].is_array())
  {
    result.error_message = "No \"patterns\" array found";
    return result;
  }

  size_t index = 0;
  for (const auto &entry : j["patterns"])
  {
    auto pattern = std::make_shared<antenna_pattern_t>();
    std::string error = parse_pattern(entry, *pattern);
    if (!error.empty())
    {
      std::cerr << "Patterns: skipping entry " << index << ": " << error << std::endl;
    }
    else
    {
      library.add_pattern(pattern);
      result.items_loaded++;
    }
    index++;
  }

  result.success = true;
  return result;
}

} // namespace rf_heatmap
