#include <literalgrep/constants.hpp>
#include <literalgrep/print_help.hpp>

void print_heading(std::FILE *out, bool is_stdout, std::string_view name) {
  if (is_stdout) {
    fmt::print(out, fmt::emphasis::bold, "{}", name);
  } else {
    fmt::print(out, "{}", name);
  }
}

void print_option(std::FILE *out, bool is_stdout, std::string_view name,
                  std::string_view description) {
  // Pad before styling so escape codes do not count towards the width
  const auto padded = fmt::format("{:<{}}", name, HELP_OPTION_COLUMN_WIDTH);
  if (is_stdout) {
    fmt::print(out, fmt::emphasis::bold, "{}", padded);
  } else {
    fmt::print(out, "{}", padded);
  }
  fmt::print(out, "{}\n", description);
}

void print_help(std::FILE *out, bool is_stdout) {
  print_heading(out, is_stdout, "Usage:");
  fmt::print(out, " {} {}\n\n", NAME, SYNOPSIS);

  print_heading(out, is_stdout, "Options:");
  fmt::print(out, "\n");
  print_option(out, is_stdout, "-i", "Case-insensitive search");
  print_option(out, is_stdout, "-n", "Print line numbers");
  print_option(out, is_stdout, "-v",
               "Invert match (exclude lines that match the pattern)");
  print_option(out, is_stdout, "-r", "Recursive directory search");
  print_option(out, is_stdout, "-f", "Print filenames");
  print_option(out, is_stdout, "-c", "Enable colored output");
  print_option(out, is_stdout, "-h, --help", "Show help information");
}
