#pragma once

#include "antenna_pattern_library.hpp"
#include "io_result.hpp"
#include <string>

namespace rf_heatmap
{

class antenna_pattern_io_t
{
public:
  // Load every pattern of a JSON library file into the library.
  // Expected format:
  // {"patterns": [{"model": "U7-Pro", "band": "5", "mode": "omni",
  //                "azimuth": [360 gains], "elevation": [360 gains]}]}
  // Malformed entries are skipped; both cuts are normalized to a 0 dB peak.
  static auto load_library(const std::string &filepath, antenna_pattern_library_t &library) -> io_result_t;

  static auto parse_library(const std::string &content, antenna_pattern_library_t &library) -> io_result_t;
};

} // namespace rf_heatmap
