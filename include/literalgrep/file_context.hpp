#pragma once
#include <cstddef>
#include <utility>
#include <vector>

using match_range = std::pair<std::size_t, std::size_t>;

struct file_context {
  std::vector<match_range> &matches;
  // Stop the scan after the first occurrence
  bool stop_at_first_match;
};
