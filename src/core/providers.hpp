#pragma once

#include "access_point.hpp"
#include "antenna_pattern.hpp"
#include "band.hpp"
#include <memory>
#include <optional>
#include <string>

namespace rf_heatmap
{

// Result of resolving (model, band, mode) to a pattern.
// is_fallback is set when the provider substituted a different pattern
// (base directional pattern, another band) for the one requested.
struct pattern_lookup_t
{
  std::shared_ptr<const antenna_pattern_t> pattern; // Opaque handle, may be null
  bool is_fallback = false;
};

// Source of per-model radiation patterns
class antenna_pattern_provider_t
{
public:
  virtual ~antenna_pattern_provider_t() = default;

  // Gains are relative to peak (0 dB max). Unknown patterns yield 0 dB.
  // Must agree with the pattern resolve_pattern returns for the same key.
  virtual auto azimuth_gain_db(const std::string &model, band_e band, int angle_deg, const std::optional<std::string> &mode) const -> float = 0;
  virtual auto elevation_gain_db(const std::string &model, band_e band, int angle_deg, const std::optional<std::string> &mode) const -> float = 0;

  // Whether the model has a switchable omni antenna variant
  virtual auto has_omni_variant(const std::string &model) const -> bool = 0;

  virtual auto resolve_pattern(const std::string &model, band_e band, const std::optional<std::string> &mode) const -> pattern_lookup_t = 0;
};

// Material attenuation table and band frequencies
class material_attenuation_provider_t
{
public:
  virtual ~material_attenuation_provider_t() = default;

  // Unknown materials yield a generic interior-wall value
  virtual auto attenuation_db(const std::string &material, band_e band) const -> double = 0;
  virtual auto center_frequency_mhz(band_e band) const -> double = 0;
};

// Default physical mount of a device model
class mount_type_resolver_t
{
public:
  virtual ~mount_type_resolver_t() = default;

  virtual auto default_mount_type(const std::string &model) const -> mount_type_e = 0;
};

} // namespace rf_heatmap
