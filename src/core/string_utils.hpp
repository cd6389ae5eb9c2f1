#pragma once

#include <algorithm>
#include <cctype>
#include <string>

namespace rf_heatmap
{

inline auto to_lower(std::string text) -> std::string
{
  std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return text;
}

inline auto trim(const std::string &str) -> std::string
{
  size_t first = str.find_first_not_of(" \t\r\n");
  if (first == std::string::npos)
    return "";
  size_t last = str.find_last_not_of(" \t\r\n");
  return str.substr(first, last - first + 1);
}

inline auto iequals(const std::string &a, const std::string &b) -> bool
{
  return a.size() == b.size() && to_lower(a) == to_lower(b);
}

inline auto icontains(const std::string &haystack, const std::string &needle) -> bool
{
  return to_lower(haystack).find(to_lower(needle)) != std::string::npos;
}

} // namespace rf_heatmap
