#pragma once
#include <cstdio>
#include <literalgrep/literal_matcher.hpp>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

/// Thrown when the command line cannot be turned into a search.
/// what() is the exact message shown to the user.
class usage_error : public std::invalid_argument {
public:
  using std::invalid_argument::invalid_argument;
};

struct search_options {
  std::vector<std::string> inputs{};
  std::string pattern{};
  bool show_line_numbers{false};
  bool invert_match{false};
  bool recursive{false};
  bool print_filenames{false};
  bool colored{false};
  bool ignore_case{false};
  std::shared_ptr<const literal_matcher> matcher{};
};

struct parse_outcome {
  enum class action { help, run };

  action next{action::help};
  std::optional<search_options> options{};
};

/// Classifies args left to right into flags, the pattern and input paths.
///
/// -h/--help prints the usage text to out and stops parsing. "--" makes
/// every later token positional. The first positional token is the pattern,
/// the rest are input paths.
///
/// Throws usage_error when arguments, the pattern or the inputs are missing,
/// and std::runtime_error when the matcher cannot be compiled.
parse_outcome resolve_search_options(const std::vector<std::string> &args,
                                     std::FILE *out = stdout,
                                     bool is_stdout = false);
