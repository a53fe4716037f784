#pragma once
#include <hs/hs.h>
#include <literalgrep/file_context.hpp>
#include <string>
#include <string_view>
#include <vector>

/// Hyperscan database compiled from a literal pattern.
///
/// The pattern text is never interpreted as a regular expression, so
/// characters like '.' or '*' only match themselves. An empty pattern
/// occurs in every line and has no occurrences to highlight.
///
/// Case-insensitive matchers fold case by Unicode rules on lines that are
/// valid UTF-8 and by ASCII rules on any other line.
class literal_matcher {
public:
  literal_matcher(std::string pattern, bool ignore_case);
  ~literal_matcher();

  literal_matcher(const literal_matcher &) = delete;
  literal_matcher &operator=(const literal_matcher &) = delete;

  /// Returns true if the pattern occurs anywhere in line
  bool is_match(std::string_view line) const;

  /// Returns the leftmost non-overlapping occurrences of the pattern in line
  std::vector<match_range> find_all(std::string_view line) const;

  const std::string &pattern() const { return literal; }
  bool ignore_case() const { return caseless; }

private:
  void scan(std::string_view line, file_context &ctx) const;
  void release();

  std::string literal;
  bool caseless{false};

  // Byte-wise literal, ASCII case folding when caseless
  hs_database_t *database = NULL;
  hs_scratch_t *scratch = NULL;

  // Escaped UTF-8 pattern with Unicode case folding, only when caseless
  hs_database_t *unicode_database = NULL;
  hs_scratch_t *unicode_scratch = NULL;
};

/// Turns every ASCII byte that is not a letter or digit into a \xHH escape
std::string escape_literal(std::string_view literal);
