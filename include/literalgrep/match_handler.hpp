#pragma once
#include <fmt/color.h>
#include <fmt/format.h>
#include <hs/hs.h>
#include <literalgrep/file_context.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

int on_match(unsigned int id, unsigned long long from, unsigned long long to,
             unsigned int flags, void *ctx);

/// Wraps every range in matches with a red foreground color
std::string highlight_line(std::string_view line,
                           const std::vector<match_range> &matches);

/// Returns "filename", "line_number", "filename:line_number" or nothing
std::optional<std::string> format_prefix(std::string_view filename,
                                         std::size_t line_number,
                                         bool print_filename,
                                         bool show_line_numbers);

std::string format_output_line(const std::optional<std::string> &prefix,
                               std::string_view display_line);
