#pragma once

#include "../core/antenna_pattern.hpp"
#include "../core/geo_math.hpp"
#include "../core/providers.hpp"
#include <functional>
#include <map>
#include <memory>
#include <string>

namespace rf_heatmap
{
namespace test
{

// Material table with explicit values and a fixed center frequency
class fixed_material_provider_t : public material_attenuation_provider_t
{
public:
  std::map<std::string, double> attenuation;
  double unknown_db = 0.0;
  double frequency_mhz = 5000.0;

  auto attenuation_db(const std::string &material, band_e) const -> double override
  {
    auto it = attenuation.find(material);
    return it != attenuation.end() ? it->second : unknown_db;
  }

  auto center_frequency_mhz(band_e) const -> double override
  {
    return frequency_mhz;
  }
};

inline auto make_pattern(const std::string &model, band_e band, const std::string &mode, const std::function<float(int)> &azimuth, const std::function<float(int)> &elevation) -> std::shared_ptr<antenna_pattern_t>
{
  auto pattern = std::make_shared<antenna_pattern_t>();
  pattern->model = model;
  pattern->band = band;
  pattern->mode = mode;
  for (int deg = 0; deg < PATTERN_SAMPLES; ++deg)
  {
    pattern->azimuth_gain_db[deg] = azimuth(deg);
    pattern->elevation_gain_db[deg] = elevation(deg);
  }
  return pattern;
}

// Point offset from (lat, lng) by meters along the meridian
inline auto offset_north(double lat, double meters) -> double
{
  return lat + geo::rad_to_deg(meters / geo::EARTH_RADIUS);
}

} // namespace test
} // namespace rf_heatmap
