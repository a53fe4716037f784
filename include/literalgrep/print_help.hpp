#pragma once
#include <cstdio>
#include <fmt/color.h>
#include <fmt/core.h>
#include <string_view>

void print_help(std::FILE *out, bool is_stdout);
