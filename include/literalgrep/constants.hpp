#pragma once
#include <cstddef>
#include <string_view>

constexpr static inline std::string_view NAME = "grep";
constexpr static inline std::string_view SYNOPSIS =
    "[OPTIONS] <pattern> <files...>";
constexpr static inline std::size_t HELP_OPTION_COLUMN_WIDTH = 18;
