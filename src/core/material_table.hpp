#pragma once

#include "band.hpp"
#include "io_result.hpp"
#include "providers.hpp"
#include <array>
#include <map>
#include <string>

namespace rf_heatmap
{

// Per-band attenuation of one material, indexed by band_e
using band_attenuation_t = std::array<double, 3>;

// Built-in attenuation table for common construction materials.
// Unknown ids get a generic interior-wall value.
class material_table_t : public material_attenuation_provider_t
{
public:
  material_table_t();
  ~material_table_t() override;

  auto attenuation_db(const std::string &material, band_e band) const -> double override;
  auto center_frequency_mhz(band_e band) const -> double override;

  auto set_attenuation(const std::string &material, band_e band, double attenuation_db) -> void;
  auto has_material(const std::string &material) const -> bool;

  // {"materials": {"<id>": {"2.4": 3.0, "5": 4.0, "6": 5.0}}}
  // Bands left out of an entry keep their current value.
  auto load_overrides(const std::string &filepath) -> io_result_t;
  auto parse_overrides(const std::string &content) -> io_result_t;

  static auto default_attenuation(band_e band) -> double;

private:
  std::map<std::string, band_attenuation_t> m_materials;
};

} // namespace rf_heatmap
