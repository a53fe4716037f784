#include <cerrno>
#include <cstring>
#include <fmt/format.h>
#include <fstream>
#include <literalgrep/directory_search.hpp>
#include <literalgrep/file_search.hpp>
#include <literalgrep/match_handler.hpp>
#include <stdexcept>

file_search::file_search(const search_options &options, std::FILE *out,
                         bool is_stdout)
    : options(options), out(out) {
  // Escape codes are only written to a terminal
  highlight_matches = options.colored && is_stdout;
}

void file_search::run(const std::filesystem::path &path) {
  const auto filename = path.string();

  errno = 0;
  std::ifstream file(path);
  if (!file.is_open()) {
    const auto error = errno;
    if (error == 0) {
      throw std::runtime_error(fmt::format("{}: cannot open file", filename));
    }
    throw std::runtime_error(fmt::format("{}: {} (os error {})", filename,
                                         std::strerror(error), error));
  }

  std::string line;
  std::size_t current_line_number{1};
  while (true) {
    // errno is only meaningful for the read that just failed
    errno = 0;
    if (!std::getline(file, line)) {
      break;
    }
    // Treat CRLF line endings like LF
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    scan_line(line, current_line_number, filename);
    current_line_number += 1;
  }

  if (file.bad()) {
    const auto error = errno;
    if (error == 0) {
      throw std::runtime_error(
          fmt::format("{}: read failed after line {}", filename,
                      current_line_number - 1));
    }
    throw std::runtime_error(fmt::format("{}: {} (os error {})", filename,
                                         std::strerror(error), error));
  }
}

bool file_search::scan_line(std::string_view line,
                            std::size_t current_line_number,
                            std::string_view filename) {
  const auto is_match = options.matcher->is_match(line);
  const auto should_print = options.invert_match ? !is_match : is_match;
  if (!should_print) {
    return false;
  }

  std::string display_line{};
  if (highlight_matches && is_match && !options.invert_match) {
    display_line = highlight_line(line, options.matcher->find_all(line));
  } else {
    display_line = line;
  }

  const auto prefix =
      format_prefix(filename, current_line_number, options.print_filenames,
                    options.show_line_numbers);
  fmt::print(out, "{}", format_output_line(prefix, display_line));
  return true;
}

void run_search(const search_options &options, std::FILE *out,
                bool is_stdout) {
  if (!options.matcher) {
    throw std::runtime_error("Search started without a compiled pattern");
  }

  file_search s(options, out, is_stdout);
  for (const auto &path : collect_targets(options.inputs, options.recursive)) {
    s.run(path);
  }
}
