#pragma once

#include "antenna_pattern.hpp"
#include "providers.hpp"
#include <map>
#include <memory>
#include <set>
#include <string>
#include <tuple>

namespace rf_heatmap
{

// In-memory pattern store keyed by (model, band, mode).
// Lookup falls back from the requested mode to the base pattern, then to
// the base pattern on the nearest band; with nothing found gains are 0 dB.
class antenna_pattern_library_t : public antenna_pattern_provider_t
{
public:
  antenna_pattern_library_t();
  ~antenna_pattern_library_t() override;

  auto add_pattern(std::shared_ptr<const antenna_pattern_t> pattern) -> void;
  auto size() const -> size_t;
  auto clear() -> void;

  auto azimuth_gain_db(const std::string &model, band_e band, int angle_deg, const std::optional<std::string> &mode) const -> float override;
  auto elevation_gain_db(const std::string &model, band_e band, int angle_deg, const std::optional<std::string> &mode) const -> float override;
  auto has_omni_variant(const std::string &model) const -> bool override;
  auto resolve_pattern(const std::string &model, band_e band, const std::optional<std::string> &mode) const -> pattern_lookup_t override;

private:
  using key_t = std::tuple<std::string, band_e, std::string>;

  auto find(const std::string &model, band_e band, const std::string &mode) const -> std::shared_ptr<const antenna_pattern_t>;

  std::map<key_t, std::shared_ptr<const antenna_pattern_t>> m_patterns;
  std::set<std::string> m_omni_models;
};

} // namespace rf_heatmap
