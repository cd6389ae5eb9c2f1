#pragma once

#include <cstddef>
#include <string>

namespace rf_heatmap
{

// Result type for file operations
struct io_result_t
{
  bool success = false;
  std::string error_message;
  size_t items_loaded = 0;
};

} // namespace rf_heatmap
