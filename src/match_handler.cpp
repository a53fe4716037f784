#include <literalgrep/match_handler.hpp>

int on_match(unsigned int id, unsigned long long from, unsigned long long to,
             unsigned int flags, void *ctx) {
  file_context *fctx = (file_context *)(ctx);

  // Matches arrive ordered by end offset. Drop any occurrence that overlaps
  // the previous one.
  if (fctx->matches.empty() || from >= fctx->matches.back().second) {
    fctx->matches.push_back(std::make_pair(from, to));
  }

  if (fctx->stop_at_first_match) {
    return HS_SCAN_TERMINATED;
  } else {
    return HS_SUCCESS;
  }
}

std::string highlight_line(std::string_view line,
                           const std::vector<match_range> &matches) {
  std::string result{};
  std::size_t index{0};

  for (auto &[from, to] : matches) {
    result += line.substr(index, from - index);
    result += fmt::format(fg(fmt::color::red), "{}",
                          line.substr(from, to - from));
    index = to;
  }

  if (index <= line.size()) {
    result += line.substr(index);
  }
  return result;
}

std::optional<std::string> format_prefix(std::string_view filename,
                                         std::size_t line_number,
                                         bool print_filename,
                                         bool show_line_numbers) {
  if (print_filename && show_line_numbers) {
    return fmt::format("{}:{}", filename, line_number);
  } else if (print_filename) {
    return std::string{filename};
  } else if (show_line_numbers) {
    return fmt::format("{}", line_number);
  }
  return std::nullopt;
}

std::string format_output_line(const std::optional<std::string> &prefix,
                               std::string_view display_line) {
  if (prefix.has_value()) {
    return fmt::format("{}: {}\n", prefix.value(), display_line);
  }
  return fmt::format("{}\n", display_line);
}
