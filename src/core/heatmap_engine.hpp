#pragma once

#include "engine_config.hpp"
#include "heatmap_request.hpp"
#include "providers.hpp"
#include "signal_model.hpp"
#include <atomic>
#include <future>
#include <memory>
#include <utility>

namespace rf_heatmap
{

class heatmap_engine_t
{
public:
  heatmap_engine_t(const antenna_pattern_provider_t &patterns, const material_attenuation_provider_t &materials, const mount_type_resolver_t &mounts, const engine_config_t &config = {});
  ~heatmap_engine_t();

  // Compute the strongest-AP signal grid for the request.
  // Rows are split across worker tasks; cancel is polled at row boundaries.
  // Returns nullptr if the computation was cancelled before every row was done.
  // Non-finite bounds yield a 1x1 grid holding empty_signal_dbm.
  auto compute_heatmap(const heatmap_request_t &request, const std::atomic<bool> *cancel = nullptr) const -> std::shared_ptr<heatmap_grid_t>;

  // Async variant, the request is copied so the caller may discard it.
  // The engine must outlive the returned future.
  auto compute_heatmap_async(const heatmap_request_t &request, std::shared_ptr<std::atomic<bool>> cancel = nullptr) const -> std::future<std::shared_ptr<heatmap_grid_t>>;

  // Logs AP pattern and building info for a request. Called once by the
  // composition root; has no influence on computed values.
  auto log_request_diagnostics(const heatmap_request_t &request) const -> void;

  // {width, height} in cells, each clamped to [1, max_dimension]
  static auto grid_dimensions(const bounding_box_t &bounds, double resolution_m, int max_dimension = MAX_GRID_DIMENSION) -> std::pair<int, int>;

  auto get_config() const -> const engine_config_t &;

private:
  auto resolve_worker_count(int rows) const -> int;

  const antenna_pattern_provider_t &m_patterns;
  const material_attenuation_provider_t &m_materials;
  engine_config_t m_config;
  signal_model_t m_signal_model;
};

} // namespace rf_heatmap
