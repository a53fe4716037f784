#include <literalgrep/print_help.hpp>
#include <literalgrep/search_options.hpp>
#include <utility>

namespace {

// Returns the flag a token switches on, or nullptr for positional tokens
bool *find_flag(const std::string &arg, search_options &options) {
  if (arg == "-i") {
    return &options.ignore_case;
  } else if (arg == "-n") {
    return &options.show_line_numbers;
  } else if (arg == "-v") {
    return &options.invert_match;
  } else if (arg == "-r") {
    return &options.recursive;
  } else if (arg == "-f") {
    return &options.print_filenames;
  } else if (arg == "-c") {
    return &options.colored;
  }
  return nullptr;
}

} // namespace

parse_outcome resolve_search_options(const std::vector<std::string> &args,
                                     std::FILE *out, bool is_stdout) {
  if (args.empty()) {
    throw usage_error("Missing arguments. Use -h for help.");
  }

  search_options options;
  std::optional<std::string> pattern{};
  bool options_closed{false};

  for (const auto &arg : args) {
    if (!options_closed) {
      if (arg == "-h" || arg == "--help") {
        print_help(out, is_stdout);
        return parse_outcome{parse_outcome::action::help, std::nullopt};
      } else if (arg == "--") {
        options_closed = true;
        continue;
      } else if (auto flag = find_flag(arg, options)) {
        *flag = true;
        continue;
      }
    }

    if (!pattern.has_value()) {
      pattern = arg;
    } else {
      options.inputs.push_back(arg);
    }
  }

  if (!pattern.has_value()) {
    throw usage_error("Missing search pattern.");
  }

  if (options.inputs.empty()) {
    throw usage_error("Missing input files.");
  }

  options.pattern = std::move(pattern.value());
  options.matcher = std::make_shared<literal_matcher>(
      options.pattern, options.ignore_case);

  return parse_outcome{parse_outcome::action::run, std::move(options)};
}
