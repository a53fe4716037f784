#pragma once
#include <filesystem>
#include <string>
#include <vector>

/// Expands the input paths into the list of files to scan.
///
/// Directories are descended depth-first when recursive is set and skipped
/// otherwise. Regular files and paths that do not exist are kept as given,
/// so that opening them later reports the real cause.
std::vector<std::filesystem::path>
collect_targets(const std::vector<std::string> &inputs, bool recursive);

void visit_directory(const std::filesystem::path &directory,
                     std::vector<std::filesystem::path> &files);
