#include "heatmap_engine.hpp"
#include "geo_math.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <thread>
#include <vector>

namespace rf_heatmap
{

namespace
{

auto clamp_cells(double cells, int max_dimension) -> int
{
  // Also catches NaN
  if (!(cells >= 1.0))
    return 1;
  if (cells >= static_cast<double>(max_dimension))
    return max_dimension;
  return static_cast<int>(cells);
}

} // namespace

heatmap_engine_t::heatmap_engine_t(const antenna_pattern_provider_t &patterns, const material_attenuation_provider_t &materials, const mount_type_resolver_t &mounts, const engine_config_t &config)
    : m_patterns(patterns), m_materials(materials), m_config(config), m_signal_model(patterns, materials, mounts, config)
{
}

heatmap_engine_t::~heatmap_engine_t()
{
}

auto heatmap_engine_t::get_config() const -> const engine_config_t &
{
  return m_config;
}

auto heatmap_engine_t::grid_dimensions(const bounding_box_t &bounds, double resolution_m, int max_dimension) -> std::pair<int, int>
{
  max_dimension = std::clamp(max_dimension, 1, MAX_GRID_DIMENSION);

  double width_m = geo::distance(bounds.sw_lat, bounds.sw_lng, bounds.sw_lat, bounds.ne_lng);
  double height_m = geo::distance(bounds.sw_lat, bounds.sw_lng, bounds.ne_lat, bounds.sw_lng);

  return {clamp_cells(width_m / resolution_m, max_dimension), clamp_cells(height_m / resolution_m, max_dimension)};
}

auto heatmap_engine_t::resolve_worker_count(int rows) const -> int
{
  int workers = m_config.worker_count;
  if (workers <= 0)
    workers = static_cast<int>(std::thread::hardware_concurrency());
  return std::clamp(workers, 1, std::max(rows, 1));
}

auto heatmap_engine_t::compute_heatmap(const heatmap_request_t &request, const std::atomic<bool> *cancel) const -> std::shared_ptr<heatmap_grid_t>
{
  const auto &bounds = request.bounds;
  const auto dimensions = grid_dimensions(bounds, request.grid_resolution_m, m_config.effective_max_grid_dimension());
  const int width = dimensions.first;
  const int height = dimensions.second;

  auto grid = std::make_shared<heatmap_grid_t>();
  grid->width = width;
  grid->height = height;
  grid->bounds = bounds;
  grid->signal_dbm.resize(static_cast<size_t>(width) * height, m_config.empty_signal_dbm);

  // Non-finite bounds degrade to the single empty cell
  if (!std::isfinite(bounds.sw_lat) || !std::isfinite(bounds.sw_lng) || !std::isfinite(bounds.ne_lat) || !std::isfinite(bounds.ne_lng))
  {
    grid->width = 1;
    grid->height = 1;
    grid->signal_dbm.assign(1, m_config.empty_signal_dbm);
    return grid;
  }

  // Wall decomposition happens once per request, independent of resolution
  const wall_segment_map_t segments_by_floor = build_wall_segments(request.walls_by_floor);

  signal_context_t context;
  context.active_floor = request.active_floor;
  context.band = request.band;
  context.frequency_mhz = m_materials.center_frequency_mhz(request.band);
  context.segments_by_floor = &segments_by_floor;
  context.buildings = &request.buildings;

  std::vector<prepared_ap_t> aps;
  aps.reserve(request.access_points.size());
  for (const auto &ap : request.access_points)
  {
    aps.push_back(m_signal_model.prepare(ap, request.band));
  }

  const double lat_step = (bounds.ne_lat - bounds.sw_lat) / height;
  const double lng_step = (bounds.ne_lng - bounds.sw_lng) / width;

  auto is_cancelled = [cancel]() { return cancel && cancel->load(std::memory_order_relaxed); };

  // Each task owns rows [row_begin, row_end) of the output.
  // Returns false if it stopped before its last row.
  auto compute_rows = [&](int row_begin, int row_end) -> bool
  {
    for (int y = row_begin; y < row_end; ++y)
    {
      if (is_cancelled())
        return false;

      double cell_lat = bounds.sw_lat + (y + 0.5) * lat_step;
      float *row = grid->signal_dbm.data() + static_cast<size_t>(y) * width;

      for (int x = 0; x < width; ++x)
      {
        double cell_lng = bounds.sw_lng + (x + 0.5) * lng_step;
        row[x] = m_signal_model.best_signal(aps, {cell_lat, cell_lng}, context);
      }
    }
    return true;
  };

  bool complete = true;
  int workers = resolve_worker_count(height);
  if (workers == 1)
  {
    complete = compute_rows(0, height);
  }
  else
  {
    std::vector<std::future<bool>> tasks;
    tasks.reserve(workers);

    int rows_per_worker = height / workers;
    int remainder = height % workers;
    int row = 0;
    for (int w = 0; w < workers; ++w)
    {
      int count = rows_per_worker + (w < remainder ? 1 : 0);
      tasks.push_back(std::async(std::launch::async, compute_rows, row, row + count));
      row += count;
    }

    for (auto &task : tasks)
    {
      if (!task.get())
        complete = false;
    }
  }

  // Partially filled grids are discarded
  if (!complete)
    return nullptr;

  return grid;
}

auto heatmap_engine_t::compute_heatmap_async(const heatmap_request_t &request, std::shared_ptr<std::atomic<bool>> cancel) const -> std::future<std::shared_ptr<heatmap_grid_t>>
{
  // Copy the request to avoid racing with the caller
  return std::async(std::launch::async, [this, request, cancel]() { return compute_heatmap(request, cancel.get()); });
}

auto heatmap_engine_t::log_request_diagnostics(const heatmap_request_t &request) const -> void
{
  if (!m_config.log_diagnostics)
    return;

  const std::string band = band_to_string(request.band);

  for (const auto &building : request.buildings)
  {
    std::cout << "Heatmap: building " << (building.name.empty() ? "<unnamed>" : building.name) << " bounds=(" << building.sw_lat << "," << building.sw_lng << ")-(" << building.ne_lat << "," << building.ne_lng
              << ") floors=[";
    bool first = true;
    for (const auto &[floor, material] : building.floor_materials)
    {
      std::cout << (first ? "" : ", ") << "F" << floor << "=" << material;
      first = false;
    }
    std::cout << "]" << std::endl;
  }

  for (const auto &ap : request.access_points)
  {
    auto lookup = m_patterns.resolve_pattern(ap.model, request.band, ap.antenna_mode);
    std::cout << "Heatmap: AP " << ap.model << " band=" << band << " txPower=" << ap.tx_power_dbm << "dBm antennaGain=" << ap.antenna_gain_dbi << "dBi antennaMode=" << ap.antenna_mode.value_or("default")
              << " mount=" << mount_type_to_string(ap.mount_type) << " pattern=" << (lookup.pattern ? (lookup.is_fallback ? "fallback" : "yes") : "no") << std::endl;
  }
}

} // namespace rf_heatmap
