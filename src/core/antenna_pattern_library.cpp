#include "antenna_pattern_library.hpp"
#include "string_utils.hpp"
#include <algorithm>
#include <cmath>
#include <vector>

namespace rf_heatmap
{

antenna_pattern_library_t::antenna_pattern_library_t()
{
}

antenna_pattern_library_t::~antenna_pattern_library_t()
{
}

auto antenna_pattern_library_t::add_pattern(std::shared_ptr<const antenna_pattern_t> pattern) -> void
{
  if (!pattern)
    return;

  std::string model = to_lower(pattern->model);
  std::string mode = to_lower(pattern->mode);
  if (mode == "omni")
    m_omni_models.insert(model);

  m_patterns[{model, pattern->band, mode}] = std::move(pattern);
}

auto antenna_pattern_library_t::size() const -> size_t
{
  return m_patterns.size();
}

auto antenna_pattern_library_t::clear() -> void
{
  m_patterns.clear();
  m_omni_models.clear();
}

auto antenna_pattern_library_t::find(const std::string &model, band_e band, const std::string &mode) const -> std::shared_ptr<const antenna_pattern_t>
{
  auto it = m_patterns.find({model, band, mode});
  return it != m_patterns.end() ? it->second : nullptr;
}

auto antenna_pattern_library_t::resolve_pattern(const std::string &model, band_e band, const std::optional<std::string> &mode) const -> pattern_lookup_t
{
  const std::string model_key = to_lower(model);
  const std::string mode_key = to_lower(mode.value_or(""));

  if (auto exact = find(model_key, band, mode_key))
    return {exact, false};

  if (!mode_key.empty())
  {
    if (auto base = find(model_key, band, ""))
      return {base, true};
  }

  // Nearest band that has a base pattern
  std::vector<band_e> others;
  for (auto candidate : ALL_BANDS)
  {
    if (candidate != band)
      others.push_back(candidate);
  }
  std::sort(others.begin(), others.end(), [band](band_e a, band_e b) { return std::abs(band_nominal_ghz(a) - band_nominal_ghz(band)) < std::abs(band_nominal_ghz(b) - band_nominal_ghz(band)); });

  for (auto candidate : others)
  {
    if (auto base = find(model_key, candidate, ""))
      return {base, true};
  }

  return {};
}

auto antenna_pattern_library_t::azimuth_gain_db(const std::string &model, band_e band, int angle_deg, const std::optional<std::string> &mode) const -> float
{
  auto lookup = resolve_pattern(model, band, mode);
  return lookup.pattern ? lookup.pattern->get_azimuth_gain(angle_deg) : 0.0f;
}

auto antenna_pattern_library_t::elevation_gain_db(const std::string &model, band_e band, int angle_deg, const std::optional<std::string> &mode) const -> float
{
  auto lookup = resolve_pattern(model, band, mode);
  return lookup.pattern ? lookup.pattern->get_elevation_gain(angle_deg) : 0.0f;
}

auto antenna_pattern_library_t::has_omni_variant(const std::string &model) const -> bool
{
  return m_omni_models.count(to_lower(model)) > 0;
}

} // namespace rf_heatmap
