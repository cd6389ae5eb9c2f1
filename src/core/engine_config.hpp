#pragma once

#include "rf_models.hpp"
#include <algorithm>

namespace rf_heatmap
{

// Hard cap on either grid dimension, bounds compute cost
constexpr int MAX_GRID_DIMENSION = 500;

struct engine_config_t
{
  double floor_height_m = 3.0;
  double path_loss_exponent = rf_models::INDOOR_PATH_LOSS_EXPONENT;
  int max_grid_dimension = MAX_GRID_DIMENSION;
  float empty_signal_dbm = -100.0f; // Cell value when there are no APs
  int worker_count = 0;             // 0 = hardware concurrency
  bool log_diagnostics = true;

  auto effective_max_grid_dimension() const -> int
  {
    return std::clamp(max_grid_dimension, 1, MAX_GRID_DIMENSION);
  }
};

} // namespace rf_heatmap
