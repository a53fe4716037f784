#pragma once
#include <string_view>

/// Returns true if data is well-formed UTF-8 (no overlongs, no surrogates,
/// nothing above U+10FFFF)
bool is_valid_utf8(std::string_view data);
