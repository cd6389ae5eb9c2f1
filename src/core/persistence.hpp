#pragma once

#include "core/engine_config.hpp"
#include "core/heatmap_request.hpp"
#include "core/io_result.hpp"
#include "core/providers.hpp"
#include <string>

namespace rf_heatmap
{
namespace persistence
{

// Request file -> heatmap_request_t. APs without a mount_type get the
// resolver's default for their model. Structural errors fail the load;
// semantic checks are left to validate_request.
auto load_request(const std::string &filename, const mount_type_resolver_t &mounts, heatmap_request_t &request) -> io_result_t;
auto parse_request(const std::string &content, const mount_type_resolver_t &mounts, heatmap_request_t &request) -> io_result_t;

auto heatmap_to_json(const heatmap_grid_t &grid) -> std::string;
auto save_heatmap(const std::string &filename, const heatmap_grid_t &grid) -> bool;

// Missing keys keep their current value
auto load_engine_config(const std::string &filename, engine_config_t &config) -> bool;
auto parse_engine_config(const std::string &content, engine_config_t &config) -> bool;

} // namespace persistence
} // namespace rf_heatmap
