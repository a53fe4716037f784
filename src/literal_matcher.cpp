#include <fmt/format.h>
#include <literalgrep/literal_matcher.hpp>
#include <literalgrep/match_handler.hpp>
#include <literalgrep/utf8.hpp>
#include <stdexcept>
#include <utility>

namespace {

void check_compile_result(hs_error_t error_code,
                          hs_compile_error_t *compile_error,
                          const std::string &literal) {
  if (error_code != HS_SUCCESS) {
    const std::string message =
        compile_error ? compile_error->message : "unknown compile error";
    hs_free_compile_error(compile_error);
    throw std::runtime_error(
        fmt::format("cannot compile pattern '{}': {}", literal, message));
  }
}

void allocate_scratch(hs_database_t *database, hs_scratch_t **scratch) {
  auto database_error = hs_alloc_scratch(database, scratch);
  if (database_error != HS_SUCCESS) {
    throw std::runtime_error("Error allocating scratch space");
  }
}

} // namespace

std::string escape_literal(std::string_view literal) {
  std::string result{};
  result.reserve(literal.size() * 4);

  for (const char c : literal) {
    const auto byte = static_cast<unsigned char>(c);
    const auto is_alnum = (byte >= '0' && byte <= '9') ||
                          (byte >= 'a' && byte <= 'z') ||
                          (byte >= 'A' && byte <= 'Z');
    if (is_alnum || byte >= 0x80) {
      result += c;
    } else {
      result += fmt::format("\\x{:02x}", byte);
    }
  }
  return result;
}

literal_matcher::literal_matcher(std::string pattern, bool ignore_case)
    : literal(std::move(pattern)), caseless(ignore_case) {

  // Hyperscan rejects empty literals
  if (literal.empty()) {
    return;
  }

  try {
    hs_compile_error_t *compile_error = NULL;
    auto error_code = hs_compile_lit(
        literal.data(),
        (caseless ? HS_FLAG_CASELESS : 0) | HS_FLAG_SOM_LEFTMOST,
        literal.size(), HS_MODE_BLOCK, NULL, &database, &compile_error);
    check_compile_result(error_code, compile_error, literal);
    allocate_scratch(database, &scratch);

    // hs_compile_lit folds ASCII only; the UTF-8 database folds the rest.
    // A pattern that is not UTF-8 itself can only be matched byte-wise.
    if (caseless && is_valid_utf8(literal)) {
      const auto escaped = escape_literal(literal);
      compile_error = NULL;
      error_code = hs_compile(escaped.c_str(),
                              HS_FLAG_CASELESS | HS_FLAG_UTF8 | HS_FLAG_UCP |
                                  HS_FLAG_SOM_LEFTMOST,
                              HS_MODE_BLOCK, NULL, &unicode_database,
                              &compile_error);
      check_compile_result(error_code, compile_error, literal);
      allocate_scratch(unicode_database, &unicode_scratch);
    }
  } catch (const std::runtime_error &) {
    release();
    throw;
  }
}

literal_matcher::~literal_matcher() { release(); }

void literal_matcher::release() {
  if (unicode_scratch) {
    hs_free_scratch(unicode_scratch);
    unicode_scratch = NULL;
  }
  if (unicode_database) {
    hs_free_database(unicode_database);
    unicode_database = NULL;
  }
  if (scratch) {
    hs_free_scratch(scratch);
    scratch = NULL;
  }
  if (database) {
    hs_free_database(database);
    database = NULL;
  }
}

void literal_matcher::scan(std::string_view line, file_context &ctx) const {
  // HS_FLAG_UTF8 databases must only see valid UTF-8
  const auto use_unicode = unicode_database && is_valid_utf8(line);

  auto error_code =
      hs_scan(use_unicode ? unicode_database : database, line.data(),
              line.size(), 0, use_unicode ? unicode_scratch : scratch,
              on_match, (void *)(&ctx));
  if (error_code != HS_SUCCESS && error_code != HS_SCAN_TERMINATED) {
    throw std::runtime_error(
        fmt::format("Error scanning for pattern '{}'", literal));
  }
}

bool literal_matcher::is_match(std::string_view line) const {
  if (!database) {
    return true;
  }
  // Folded characters can differ in byte length, so only exact matching
  // can rule out short lines
  if (!caseless && line.size() < literal.size()) {
    return false;
  }

  std::vector<match_range> matches{};
  file_context ctx{matches, true};
  scan(line, ctx);
  return !matches.empty();
}

std::vector<match_range>
literal_matcher::find_all(std::string_view line) const {
  std::vector<match_range> matches{};
  if (!database || (!caseless && line.size() < literal.size())) {
    return matches;
  }

  file_context ctx{matches, false};
  scan(line, ctx);
  return matches;
}
