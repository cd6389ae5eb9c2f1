#pragma once

#include "access_point.hpp"
#include "io_result.hpp"
#include "providers.hpp"
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace rf_heatmap
{

// Default mount from the model name: explicit per-model overrides first,
// then case-insensitive name fragments, otherwise ceiling.
class mount_type_rules_t : public mount_type_resolver_t
{
public:
  mount_type_rules_t();
  ~mount_type_rules_t() override;

  auto default_mount_type(const std::string &model) const -> mount_type_e override;

  auto set_override(const std::string &model, mount_type_e mount) -> void;

  // {"mounts": {"<model>": "wall"}}
  auto load_overrides(const std::string &filepath) -> io_result_t;
  auto parse_overrides(const std::string &content) -> io_result_t;

private:
  std::map<std::string, mount_type_e> m_overrides;
  std::vector<std::pair<std::string, mount_type_e>> m_fragments;
};

} // namespace rf_heatmap
