#include "band.hpp"
#include "string_utils.hpp"

namespace rf_heatmap
{

auto parse_band(const std::string &text) -> std::optional<band_e>
{
  std::string key = to_lower(trim(text));

  auto pos = key.find("ghz");
  if (pos != std::string::npos && pos + 3 == key.size())
    key = trim(key.substr(0, pos));

  if (key == "2.4")
    return band_e::BAND_2_4_GHZ;
  if (key == "5")
    return band_e::BAND_5_GHZ;
  if (key == "6")
    return band_e::BAND_6_GHZ;

  return std::nullopt;
}

auto band_to_string(band_e band) -> std::string
{
  switch (band)
  {
  case band_e::BAND_2_4_GHZ:
    return "2.4";
  case band_e::BAND_5_GHZ:
    return "5";
  case band_e::BAND_6_GHZ:
    return "6";
  }
  return "unknown";
}

auto band_nominal_ghz(band_e band) -> double
{
  switch (band)
  {
  case band_e::BAND_2_4_GHZ:
    return 2.4;
  case band_e::BAND_5_GHZ:
    return 5.0;
  case band_e::BAND_6_GHZ:
    return 6.0;
  }
  return 0.0;
}

} // namespace rf_heatmap
