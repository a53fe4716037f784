#pragma once
#include <cstdio>
#include <filesystem>
#include <literalgrep/search_options.hpp>
#include <string>
#include <string_view>

class file_search {
public:
  file_search(const search_options &options, std::FILE *out, bool is_stdout);

  /// Prints the selected lines of one file.
  /// Throws std::runtime_error if the file cannot be opened or read.
  void run(const std::filesystem::path &path);

  bool scan_line(std::string_view line, std::size_t current_line_number,
                 std::string_view filename);

private:
  const search_options &options;
  std::FILE *out;
  bool highlight_matches{false};
};

/// Scans every target of options in order, stopping at the first I/O error
void run_search(const search_options &options, std::FILE *out = stdout,
                bool is_stdout = false);
