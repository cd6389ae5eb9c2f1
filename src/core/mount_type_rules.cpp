#include "mount_type_rules.hpp"
#include "string_utils.hpp"
#include <fstream>
#include <iostream>
#include <sstream>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace rf_heatmap
{

mount_type_rules_t::mount_type_rules_t()
{
  m_fragments = {
      {"outdoor", mount_type_e::WALL},
      {"mesh", mount_type_e::WALL},
      {"-iw", mount_type_e::WALL}, // In-wall plates
      {"flex", mount_type_e::DESKTOP},
      {"desktop", mount_type_e::DESKTOP},
      {"express", mount_type_e::DESKTOP},
  };
}

mount_type_rules_t::~mount_type_rules_t()
{
}

auto mount_type_rules_t::default_mount_type(const std::string &model) const -> mount_type_e
{
  auto it = m_overrides.find(to_lower(model));
  if (it != m_overrides.end())
    return it->second;

  for (const auto &[fragment, mount] : m_fragments)
  {
    if (icontains(model, fragment))
      return mount;
  }
  return mount_type_e::CEILING;
}

auto mount_type_rules_t::set_override(const std::string &model, mount_type_e mount) -> void
{
  m_overrides[to_lower(model)] = mount;
}

auto mount_type_rules_t::load_overrides(const std::string &filepath) -> io_result_t
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

auto mount_type_rules_t::parse_overrides(const std::string &content) -> io_result_t
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

  if (!j.is_object() || !j.contains("mounts") || !j["mounts"].is_object())
  {
    result.error_message = "No \"mounts\" object found";
    return result;
  }

  for (const auto &[model, value] : j["mounts"].items())
  {
    auto mount = value.is_string() ? parse_mount_type(value.get<std::string>()) : std::nullopt;
    if (!mount)
    {
      std::cerr << "Mounts: skipping " << model << ": expected ceiling, wall or desktop" << std::endl;
      continue;
    }
    set_override(model, *mount);
    result.items_loaded++;
  }

  result.success = true;
  return result;
}

} // namespace rf_heatmap
