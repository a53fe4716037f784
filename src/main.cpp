#include <cstdio>
#include <fmt/core.h>
#include <literalgrep/file_search.hpp>
#include <literalgrep/search_options.hpp>
#include <string>
#include <unistd.h>
#include <vector>

int main(int argc, char **argv) {
  const std::vector<std::string> args(argv + 1, argv + argc);
  const auto is_stdout = isatty(STDOUT_FILENO) == 1;

  try {
    const auto outcome = resolve_search_options(args, stdout, is_stdout);
    if (outcome.next == parse_outcome::action::run) {
      run_search(outcome.options.value(), stdout, is_stdout);
    }
  } catch (const usage_error &err) {
    fmt::print(stderr, "{}\n", err.what());
    return 1;
  } catch (const std::runtime_error &err) {
    std::fflush(stdout);
    fmt::print(stderr, "Error: {}\n", err.what());
    return 1;
  }

  return 0;
}
