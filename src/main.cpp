#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <string>

#include "core/antenna_pattern_io.hpp"
#include "core/antenna_pattern_library.hpp"
#include "core/heatmap_engine.hpp"
#include "core/material_table.hpp"
#include "core/mount_type_rules.hpp"
#include "core/persistence.hpp"

namespace
{

struct cli_options_t
{
  std::string request_file;
  std::string output_file;
  std::string patterns_file;
  std::string materials_file;
  std::string mounts_file;
  std::string config_file;
  int threads = -1; // -1 = keep config value
};

auto print_usage(const char *argv0) -> void
{
  std::cerr << "Usage: " << argv0 << " --request <file> [--output <file>] [--patterns <file>] [--materials <file>] [--mounts <file>] [--config <file>] [--threads <n>]" << std::endl;
}

auto parse_args(int argc, char **argv, cli_options_t &options) -> bool
{
  for (int i = 1; i < argc; ++i)
  {
    std::string arg = argv[i];
    if (arg == "-h" || arg == "--help")
      return false;

    if (i + 1 >= argc)
    {
      std::cerr << "Missing value for " << arg << std::endl;
      return false;
    }
    std::string value = argv[++i];

    if (arg == "--request")
      options.request_file = value;
    else if (arg == "--output" || arg == "-o")
      options.output_file = value;
    else if (arg == "--patterns")
      options.patterns_file = value;
    else if (arg == "--materials")
      options.materials_file = value;
    else if (arg == "--mounts")
      options.mounts_file = value;
    else if (arg == "--config")
      options.config_file = value;
    else if (arg == "--threads")
    {
      try
      {
        options.threads = std::stoi(value);
      }
      catch (const std::exception &)
      {
        std::cerr << "Invalid thread count: " << value << std::endl;
        return false;
      }
    }
    else
    {
      std::cerr << "Unknown option: " << arg << std::endl;
      return false;
    }
  }
  return !options.request_file.empty();
}

} // namespace

int main(int argc, char **argv)
{
  cli_options_t options;
  if (!parse_args(argc, argv, options))
  {
    print_usage(argv[0]);
    return 2;
  }

  rf_heatmap::engine_config_t config;
  if (!options.config_file.empty() && !rf_heatmap::persistence::load_engine_config(options.config_file, config))
    return 1;
  if (options.threads >= 0)
    config.worker_count = options.threads;

  rf_heatmap::antenna_pattern_library_t patterns;
  if (!options.patterns_file.empty())
  {
    auto result = rf_heatmap::antenna_pattern_io_t::load_library(options.patterns_file, patterns);
    if (!result.success)
    {
      std::cerr << "Patterns: " << result.error_message << std::endl;
      return 1;
    }
    std::cerr << "Patterns: loaded " << result.items_loaded << " patterns from " << options.patterns_file << std::endl;
  }

  rf_heatmap::material_table_t materials;
  if (!options.materials_file.empty())
  {
    auto result = materials.load_overrides(options.materials_file);
    if (!result.success)
    {
      std::cerr << "Materials: " << result.error_message << std::endl;
      return 1;
    }
  }

  rf_heatmap::mount_type_rules_t mounts;
  if (!options.mounts_file.empty())
  {
    auto result = mounts.load_overrides(options.mounts_file);
    if (!result.success)
    {
      std::cerr << "Mounts: " << result.error_message << std::endl;
      return 1;
    }
  }

  rf_heatmap::heatmap_request_t request;
  auto loaded = rf_heatmap::persistence::load_request(options.request_file, mounts, request);
  if (!loaded.success)
  {
    std::cerr << loaded.error_message << std::endl;
    return 1;
  }

  auto validation = rf_heatmap::validate_request(request);
  if (!validation.valid)
  {
    std::cerr << "Invalid request: " << validation.error_message << std::endl;
    return 1;
  }

  rf_heatmap::heatmap_engine_t engine(patterns, materials, mounts, config);

  // Without --output, stdout carries the grid JSON only
  if (!options.output_file.empty())
    engine.log_request_diagnostics(request);

  auto grid = engine.compute_heatmap(request);
  if (!grid)
  {
    std::cerr << "Heatmap: computation was cancelled" << std::endl;
    return 1;
  }

  if (options.output_file.empty())
  {
    std::cout << rf_heatmap::persistence::heatmap_to_json(*grid) << std::endl;
    return 0;
  }

  if (!rf_heatmap::persistence::save_heatmap(options.output_file, *grid))
    return 1;

  auto [min_it, max_it] = std::minmax_element(grid->signal_dbm.begin(), grid->signal_dbm.end());
  std::cerr << "Heatmap: " << grid->width << "x" << grid->height << " cells, " << *min_it << " to " << *max_it << " dBm -> " << options.output_file << std::endl;
  return 0;
}
