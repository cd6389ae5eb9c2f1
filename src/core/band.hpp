#pragma once

#include <optional>
#include <string>

namespace rf_heatmap
{

// Radio bands a heatmap can be computed for
enum class band_e
{
  BAND_2_4_GHZ,
  BAND_5_GHZ,
  BAND_6_GHZ
};

constexpr band_e ALL_BANDS[] = {band_e::BAND_2_4_GHZ, band_e::BAND_5_GHZ, band_e::BAND_6_GHZ};

// "2.4", "5", "6" (optionally suffixed with "GHz", any case)
auto parse_band(const std::string &text) -> std::optional<band_e>;

auto band_to_string(band_e band) -> std::string;

// Nominal band position in GHz, used to pick the nearest band on fallback
auto band_nominal_ghz(band_e band) -> double;

} // namespace rf_heatmap
