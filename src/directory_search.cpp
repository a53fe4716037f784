#include <dirent.h>
#include <literalgrep/directory_search.hpp>
#include <memory>
#include <string_view>
#include <system_error>

namespace {

// Symbolic links are never descended; a link to a regular file is kept
bool is_searchable_link(const std::filesystem::path &path) {
  std::error_code ec;
  return std::filesystem::is_regular_file(path, ec);
}

} // namespace

void visit_directory(const std::filesystem::path &directory,
                     std::vector<std::filesystem::path> &files) {
  std::unique_ptr<DIR, decltype(&closedir)> dir{opendir(directory.c_str()),
                                                 &closedir};
  if (!dir) {
    // Unreadable directories contribute nothing
    return;
  }

  struct dirent *entry;
  while (true) {
    entry = readdir(dir.get());
    if (!entry) {
      break;
    }

    const std::string_view name{entry->d_name};
    if (name == "." || name == "..") {
      continue;
    }

    const auto path = directory / entry->d_name;

    auto type = entry->d_type;
    if (type == DT_UNKNOWN) {
      // Some filesystems do not fill in d_type
      std::error_code ec;
      const auto status = std::filesystem::symlink_status(path, ec);
      if (ec) {
        continue;
      }
      if (std::filesystem::is_directory(status)) {
        type = DT_DIR;
      } else if (std::filesystem::is_regular_file(status)) {
        type = DT_REG;
      } else if (std::filesystem::is_symlink(status)) {
        type = DT_LNK;
      }
    }

    if (type == DT_DIR) {
      // Depth-first: finish the subdirectory before the next entry
      visit_directory(path, files);
    } else if (type == DT_REG) {
      files.push_back(path);
    } else if (type == DT_LNK && is_searchable_link(path)) {
      files.push_back(path);
    }
  }
}

std::vector<std::filesystem::path>
collect_targets(const std::vector<std::string> &inputs, bool recursive) {
  std::vector<std::filesystem::path> files{};

  for (const auto &input : inputs) {
    const std::filesystem::path path{input};

    std::error_code ec;
    if (std::filesystem::is_directory(path, ec)) {
      if (recursive) {
        visit_directory(path, files);
      }
    } else {
      // Regular files and missing paths alike; opening a missing path
      // reports the error later
      files.push_back(path);
    }
  }

  return files;
}
